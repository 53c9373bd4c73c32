#include <iostream>
#include <string>

// Copies stdin to stdout, then writes argv[1] to stderr.
int main(int argc, char** argv) {
  std::string line;
  while (std::getline(std::cin, line)) std::cout << line << "\n";
  if (argc > 1) std::cerr << argv[1];
  return 0;
}
