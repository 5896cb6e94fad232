#ifndef UTIL_FILE_HPP
#define UTIL_FILE_HPP
#include <cstdint>
#include <functional>
#include <string>
#include <system_error>
#include <vector>

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
  // Receives consecutive pieces of a file.
  using ChunkReceiver = std::function<void(const std::string& chunk)>;

  // Calls the given receiver once per chunk of data to be written.
  using ChunkProducer = std::function<void(const ChunkReceiver&)>;

  // Reads the file specified by path in chunks. At most limit bytes are
  // read, unless limit is negative.
  static void Read(const std::string& path, const ChunkReceiver& chunk_receiver,
                   int64_t limit = -1);

  // Returns the first max_size bytes of the file (the whole file if
  // max_size is negative). If truncated is not null, it is set to whether
  // some bytes were left out.
  static std::string Contents(const std::string& path, int64_t max_size = -1,
                              bool* truncated = nullptr);

  // Atomically writes the data produced by chunk_producer to a file, through
  // a temporary file in the same folder.
  static void Write(const std::string& path,
                    const ChunkProducer& chunk_producer, bool overwrite = false,
                    bool exist_ok = true);
  static void Write(const std::string& path, const std::string& content,
                    bool overwrite = true, bool exist_ok = true);

  // Creates all the folder that are needed to write the specified file
  // or, if path is a directory, creates all the folders.
  static void MakeDirs(const std::string& path);

  // Removes a file. Throws file_not_found if it does not exist.
  static void Remove(const std::string& path);

  // Recursively removes a tree.
  static void RemoveTree(const std::string& path);

  // Lists the names of the entries of a directory. A missing directory has no
  // entries.
  static std::vector<std::string> ListFiles(const std::string& path);

  // Lists every regular file below root, as paths relative to root, sorted.
  static std::vector<std::string> ListTree(const std::string& root);

  // Joins two paths.
  static std::string JoinPath(const std::string& first,
                              const std::string& second);

  // Computes the directory name for a path
  static std::string BaseDir(const std::string& path);

  // Computes the file name for a path
  static std::string BaseName(const std::string& path);

  // Resolves path (which must exist) to an absolute path.
  static std::string AbsolutePath(const std::string& path);

  // Computes a file's size. Returns a negative number in case of errors.
  static int64_t Size(const std::string& path);

  // Returns true if a regular file exists at path.
  static bool Exists(const std::string& path);
};

// Creates a temporary directory in a given folder. The folder will be
// (recursively) removed on destruction.
class TempDir {
 public:
  explicit TempDir(const std::string& base);
  const std::string& Path() const;
  void Keep();
  ~TempDir();

  TempDir(TempDir&& other) noexcept { *this = std::move(other); }
  TempDir& operator=(TempDir&& other) noexcept {
    path_ = std::move(other.path_);
    keep_ = other.keep_;
    other.moved_ = true;
    return *this;
  }
  TempDir(const TempDir&) = delete;
  TempDir& operator=(const TempDir&) = delete;

 private:
  std::string path_;
  bool keep_ = false;
  bool moved_ = false;
};

}  // namespace util

#endif
