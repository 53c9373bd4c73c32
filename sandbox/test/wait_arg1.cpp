#include <stdlib.h>
#include <chrono>
#include <thread>

int main(int argc, char** argv) {
  std::this_thread::sleep_for(
      std::chrono::microseconds(static_cast<int64_t>(atof(argv[1]) * 1e6)));
  return 0;
}
