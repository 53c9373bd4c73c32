#include "util/file.hpp"

#include <stdlib.h>
#include <string.h>

#include <memory>

#include "glog/logging.h"

#if defined(__unix__) || defined(__linux__) || defined(__APPLE__)
#include <fcntl.h>
#include <ftw.h>
#include <sys/stat.h>
#include <unistd.h>

namespace {

static const constexpr char* kPathSeparators = "/";

bool MkDir(const std::string& dir) {
  return mkdir(dir.c_str(), S_IRWXU | S_IRWXG | S_IXOTH) != -1 ||
         errno == EEXIST;
}

bool OsRemove(const std::string& path) { return remove(path.c_str()) != -1; }

bool OsRemoveTree(const std::string& path) {
  return nftw(path.c_str(),
              [](const char* fpath, const struct stat* sb, int typeflags,
                 struct FTW* ftwbuf) { return remove(fpath); },
              64, FTW_DEPTH | FTW_PHYS | FTW_MOUNT) != -1;
}

std::string OsTempDir(const std::string& path) {
  std::string tmp = util::File::JoinPath(path, "XXXXXX");
  std::unique_ptr<char, decltype(&free)> data{strdup(tmp.c_str()), &free};
  if (mkdtemp(data.get()) == nullptr) {
    return "";
  }
  return data.get();
}

int OsTempFile(const std::string& path, std::string* tmp) {
  *tmp = path + ".XXXXXX";
  std::unique_ptr<char, decltype(&free)> data{strdup(tmp->c_str()), &free};
  int fd = mkostemp(data.get(), O_CLOEXEC);
  *tmp = data.get();
  return fd;
}

// Returns errno, or 0 on success.
int OsAtomicMove(const std::string& src, const std::string& dst,
                 bool overwrite = false) {
  if (overwrite) {
    if (rename(src.c_str(), dst.c_str()) == -1) return errno;
    return 0;
  }
  if (link(src.c_str(), dst.c_str()) == -1) return errno;
  return remove(src.c_str()) != -1 ? 0 : errno;
}

// Returns errno, or 0 on success.
int OsRead(const std::string& path, std::string* content) {
  int fd = open(path.c_str(), O_CLOEXEC | O_RDONLY);
  if (fd == -1) return errno;
  char buf[util::kChunkSize];
  ssize_t amount;
  while ((amount = read(fd, buf, util::kChunkSize))) {
    if (amount == -1 && errno == EINTR) continue;
    if (amount == -1) break;
    content->append(buf, amount);
  }
  if (amount == -1) {
    int error = errno;
    close(fd);
    return error;
  }
  return close(fd) == -1 ? errno : 0;
}

// Returns errno, or 0 on success.
int OsWriteAll(int fd, const std::string& content) {
  size_t pos = 0;
  while (pos < content.size()) {
    ssize_t written = write(fd, content.data() + pos, content.size() - pos);
    if (written == -1 && errno == EINTR) continue;
    if (written == -1) return errno;
    pos += written;
  }
  return 0;
}

int OsWrite(const std::string& path, const std::string& content,
            bool overwrite) {
  std::string temp_file;
  int fd = OsTempFile(path, &temp_file);
  if (fd == -1) return errno;
  int err = OsWriteAll(fd, content);
  if (!err && fsync(fd) == -1) err = errno;
  if (close(fd) == -1 && !err) err = errno;
  if (!err) err = OsAtomicMove(temp_file, path, overwrite);
  if (err) OsRemove(temp_file);
  return err;
}

}  // namespace
#endif

namespace util {

std::string File::Read(const std::string& path) {
  std::string content;
  int err = OsRead(path, &content);
  if (err == ENOENT) throw file_not_found("Read " + path);
  if (err) throw std::system_error(err, std::system_category(), "Read " + path);
  return content;
}

void File::Write(const std::string& path, const std::string& content,
                 bool overwrite) {
  if (!BaseDir(path).empty()) MakeDirs(BaseDir(path));
  if (!overwrite && Size(path) >= 0) throw file_exists("Write " + path);
  int err = OsWrite(path, content, overwrite);
  if (err == EEXIST) throw file_exists("Write " + path);
  if (err) throw std::system_error(err, std::system_category(), path);
}

void File::MakeDirs(const std::string& path) {
  uint64_t pos = 0;
  while (pos != std::string::npos) {
    pos = path.find_first_of(kPathSeparators, pos + 1);
    if (!MkDir(path.substr(0, pos))) {
      throw std::system_error(errno, std::system_category(), "mkdir");
    }
  }
}

std::string File::AbsolutePath(const std::string& path) {
  if (!path.empty() && strchr(kPathSeparators, path[0]) != nullptr) {
    return path;
  }
  std::unique_ptr<char, decltype(&free)> cwd{getcwd(nullptr, 0), &free};
  if (!cwd) throw std::system_error(errno, std::system_category(), "getcwd");
  if (path.empty() || path == ".") return cwd.get();
  return JoinPath(cwd.get(), path);
}

void File::RemoveTree(const std::string& path) {
  if (!OsRemoveTree(path)) {
    throw std::system_error(errno, std::system_category(),
                            "removetree " + path);
  }
}

std::string File::JoinPath(const std::string& first,
                           const std::string& second) {
  if (!second.empty() && strchr(kPathSeparators, second[0]) != nullptr)
    return second;
  return first + kPathSeparators[0] + second;
}

std::string File::BaseDir(const std::string& path) {
  if (path.find_last_of(kPathSeparators) == std::string::npos) return "";
  return path.substr(0, path.find_last_of(kPathSeparators));
}

std::string File::BaseName(const std::string& path) {
  return path.substr(path.find_last_of(kPathSeparators) + 1);
}

int64_t File::Size(const std::string& path) {
  struct stat st {};
  if (stat(path.c_str(), &st) != 0) {
    return -1;
  }
  return st.st_size;
}

TempDir::TempDir(const std::string& base) {
  File::MakeDirs(base);
  path_ = OsTempDir(base);
  if (path_.empty()) {
    throw std::system_error(errno, std::system_category(), "mkdtemp");
  }
}
const std::string& TempDir::Path() const { return path_; }
TempDir::~TempDir() {
  if (moved_) return;
  try {
    File::RemoveTree(path_);
  } catch (const std::system_error& e) {
    LOG(WARNING) << "Failed to remove temporary directory " << path_ << ": "
                 << e.what();
  }
}

}  // namespace util
