#ifndef EXECUTOR_WORKSPACE_HPP
#define EXECUTOR_WORKSPACE_HPP

#include <string>

#include "absl/status/statusor.h"

namespace executor {

// Scratch file holding the source of one submission. The file is removed when
// the handle is released or destroyed, whichever comes first.
class Workspace {
 public:
  explicit Workspace(std::string path) : path_(std::move(path)) {}
  ~Workspace() { Release(); }

  Workspace(Workspace&& other) noexcept : path_(std::move(other.path_)) {
    other.path_.clear();
  }
  Workspace& operator=(Workspace&& other) noexcept {
    if (this != &other) {
      Release();
      path_ = std::move(other.path_);
      other.path_.clear();
    }
    return *this;
  }
  Workspace(const Workspace&) = delete;
  Workspace& operator=(const Workspace&) = delete;

  // Path of the backing file. Empty once released.
  const std::string& Path() const { return path_; }

  // Removes the backing file. Calling it more than once, or on a file that is
  // already gone, is not an error; other failures are only logged.
  void Release() noexcept;

 private:
  std::string path_;
};

// Creates workspaces inside a directory. A relative directory is resolved
// against the current directory at construction, so that workspace paths stay
// valid for processes running elsewhere.
class WorkspaceManager {
 public:
  explicit WorkspaceManager(const std::string& directory);

  // Creates a new uniquely named file ending in suffix and writes content to
  // it. The handle is returned only after the content has been synced to disk.
  absl::StatusOr<Workspace> Acquire(const std::string& content,
                                    const std::string& suffix) const;

 private:
  std::string directory_;
};

}  // namespace executor

#endif
