#ifndef UTIL_FILE_HPP
#define UTIL_FILE_HPP

#include <cstdint>
#include <string>
#include <system_error>

namespace util {

class file_exists : public std::system_error {
 public:
  explicit file_exists(const std::string& msg)
      : std::system_error(EEXIST, std::system_category(), msg) {}
};

class file_not_found : public std::system_error {
 public:
  explicit file_not_found(const std::string& msg)
      : std::system_error(ENOENT, std::system_category(), msg) {}
};

static const constexpr uint32_t kChunkSize = 32 * 1024;

class File {
 public:
  // Reads the whole file specified by path. Throws file_not_found if the file
  // does not exist.
  static std::string Read(const std::string& path);

  // Writes content to path through a temporary file that is synced and then
  // moved in place.
  static void Write(const std::string& path, const std::string& content,
                    bool overwrite = false);

  // Creates all the folder that are needed to write the specified file
  // or, if path is a directory, creates all the folders.
  static void MakeDirs(const std::string& path);

  // Makes a relative path absolute, relative to the current directory. The
  // path does not need to exist.
  static std::string AbsolutePath(const std::string& path);

  // Recursively removes a tree.
  static void RemoveTree(const std::string& path);

  // Joins two paths.
  static std::string JoinPath(const std::string& first,
                              const std::string& second);

  // Computes the directory name for a path
  static std::string BaseDir(const std::string& path);

  // Computes the file name for a path
  static std::string BaseName(const std::string& path);

  // Computes a file's size. Returns a negative number in case of errors.
  static int64_t Size(const std::string& path);

  // Returns true if a file exists
  static bool Exists(const std::string& path) { return Size(path) >= 0; }
};

// Creates a temporary directory in a given folder. The folder will be
// (recursively) removed on destruction.
class TempDir {
 public:
  // base is the directory in which the temporary directory will be created.
  explicit TempDir(const std::string& base);

  // Returns the path of the temporary folder.
  const std::string& Path() const;

  ~TempDir();

  TempDir(TempDir&& other) noexcept { *this = std::move(other); }
  TempDir& operator=(TempDir&& other) noexcept {
    path_ = std::move(other.path_);
    other.moved_ = true;
    return *this;
  }
  TempDir(const TempDir&) = delete;
  TempDir& operator=(const TempDir&) = delete;

 private:
  std::string path_;
  bool moved_ = false;
};

}  // namespace util

#endif
