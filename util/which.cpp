#include "util/which.hpp"

#include <sys/stat.h>
#include <unistd.h>

#include <cstdlib>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "absl/strings/str_split.h"
#include "util/file.hpp"

namespace {
std::unordered_map<std::string, std::string> cmd_cache;
std::mutex cmd_cache_mutex;

bool is_executable(const std::string& path) {
  struct stat buffer {};
  if (stat(path.c_str(), &buffer) != 0) return false;
  return S_ISREG(buffer.st_mode) && access(path.c_str(), X_OK) == 0;
}
}  // namespace

namespace util {

std::string which(const std::string& cmd, bool use_cache) {
  const char* env_path = std::getenv("PATH");
  const std::vector<std::string> dirs =
      absl::StrSplit(env_path ? env_path : "", ':', absl::SkipEmpty());

  std::lock_guard<std::mutex> lck(cmd_cache_mutex);
  if (use_cache && cmd_cache.count(cmd) > 0) return cmd_cache[cmd];

  std::string found;
  for (const std::string& dir : dirs) {
    std::string fullpath = util::File::JoinPath(dir, cmd);
    if (is_executable(fullpath)) {
      found = fullpath;
      break;
    }
  }
  // Misses are not cached, the program may be installed later.
  if (!found.empty()) cmd_cache[cmd] = found;
  return found;
}

}  // namespace util
