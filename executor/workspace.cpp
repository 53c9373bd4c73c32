#include "executor/workspace.hpp"

#include <errno.h>
#include <fcntl.h>
#include <stdlib.h>
#include <string.h>
#include <unistd.h>

#include <vector>

#include "absl/status/status.h"
#include "absl/strings/str_cat.h"
#include "glog/logging.h"
#include "util/file.hpp"

namespace {

const constexpr char* kPrefix = "submission_";

absl::Status ErrnoStatus(int err, const std::string& what) {
  return absl::InternalError(absl::StrCat(what, ": ", strerror(err)));
}

// Returns errno, or 0 on success.
int WriteAll(int fd, const std::string& content) {
  size_t pos = 0;
  while (pos < content.size()) {
    ssize_t written = write(fd, content.data() + pos, content.size() - pos);
    if (written == -1 && errno == EINTR) continue;
    if (written == -1) return errno;
    pos += written;
  }
  return 0;
}

}  // namespace

namespace executor {

void Workspace::Release() noexcept {
  if (path_.empty()) return;
  if (unlink(path_.c_str()) == -1 && errno != ENOENT) {
    LOG(WARNING) << "Failed to delete workspace " << path_ << ": "
                 << strerror(errno);
  } else {
    VLOG(1) << "Released workspace " << path_;
  }
  path_.clear();
}

WorkspaceManager::WorkspaceManager(const std::string& directory)
    : directory_(util::File::AbsolutePath(directory)) {}

absl::StatusOr<Workspace> WorkspaceManager::Acquire(
    const std::string& content, const std::string& suffix) const {
  // Linter output is split on ':', the path it reports must not contain one.
  if (directory_.find(':') != std::string::npos) {
    return absl::InvalidArgumentError(
        absl::StrCat("Workspace directory cannot contain ':': ", directory_));
  }
  try {
    util::File::MakeDirs(directory_);
  } catch (const std::system_error& e) {
    return absl::InternalError(
        absl::StrCat("Cannot create ", directory_, ": ", e.what()));
  }

  std::string pattern = util::File::JoinPath(
      directory_, absl::StrCat(kPrefix, "XXXXXX", suffix));
  std::vector<char> name(pattern.begin(), pattern.end());
  name.push_back('\0');
  int fd = mkostemps(name.data(), static_cast<int>(suffix.size()), O_CLOEXEC);
  if (fd == -1) return ErrnoStatus(errno, "mkostemps " + pattern);

  // From here on the file is owned by the handle, and removed on failure.
  Workspace workspace(name.data());
  int err = WriteAll(fd, content);
  if (!err && fsync(fd) == -1) err = errno;
  if (close(fd) == -1 && !err) err = errno;
  if (err) return ErrnoStatus(err, "write " + workspace.Path());

  VLOG(1) << "Acquired workspace " << workspace.Path();
  return std::move(workspace);
}

}  // namespace executor
