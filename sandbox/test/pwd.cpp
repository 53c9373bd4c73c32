#include <limits.h>
#include <stdio.h>
#include <unistd.h>

int main() {
  char buf[PATH_MAX] = {};
  if (!getcwd(buf, sizeof(buf))) return 1;
  printf("%s", buf);
  return 0;
}
