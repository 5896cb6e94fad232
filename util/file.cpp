#include "util/file.hpp"

#include <dirent.h>
#include <fcntl.h>
#include <ftw.h>
#include <limits.h>
#include <stdlib.h>
#include <string.h>
#include <sys/stat.h>
#include <unistd.h>

#include <algorithm>
#include <memory>

#include "glog/logging.h"

namespace {

static const constexpr char* kPathSeparators = "/";

bool MkDir(const std::string& dir) {
  return mkdir(dir.c_str(), S_IRWXU | S_IRWXG | S_IROTH | S_IXOTH) != -1 ||
         errno == EEXIST;
}

bool OsRemove(const std::string& path) { return unlink(path.c_str()) != -1; }

bool OsRemoveTree(const std::string& path) {
  return nftw(path.c_str(),
              [](const char* fpath, const struct stat* sb, int typeflags,
                 struct FTW* ftwbuf) { return remove(fpath); },
              64, FTW_DEPTH | FTW_PHYS | FTW_MOUNT) != -1;
}

// Returns errno, or 0 on success. A missing root is not an error.
int OsListTree(const std::string& root, std::vector<std::string>* out) {
  thread_local std::vector<std::string> files;
  files.clear();
  int ret = nftw(root.c_str(),
                 [](const char* fpath, const struct stat* sb, int typeflags,
                    struct FTW* ftwbuf) {
                   if (typeflags == FTW_F) files.emplace_back(fpath);
                   return 0;
                 },
                 64, FTW_PHYS);
  if (ret == -1 && errno != ENOENT) return errno;
  std::string prefix = root;
  if (prefix.empty() || prefix.back() != kPathSeparators[0])
    prefix += kPathSeparators[0];
  out->clear();
  for (const std::string& file : files) {
    if (file.compare(0, prefix.size(), prefix) == 0) {
      out->push_back(file.substr(prefix.size()));
    } else {
      out->push_back(file);
    }
  }
  files.clear();
  std::sort(out->begin(), out->end());
  return 0;
}

std::string OsTempDir(const std::string& path) {
  std::string tmp = util::File::JoinPath(path, "XXXXXX");
  std::unique_ptr<char[]> data{strdup(tmp.c_str())};
  if (mkdtemp(data.get()) == nullptr) {
    return "";
  }
  return data.get();
}

int OsTempFile(const std::string& path, std::string* tmp) {
  *tmp = path + ".XXXXXX";
  std::unique_ptr<char[]> data{strdup(tmp->c_str())};
  int fd = mkostemp(data.get(), O_CLOEXEC);
  *tmp = data.get();
  return fd;
}

// Returns errno, or 0 on success.
int OsAtomicMove(const std::string& src, const std::string& dst,
                 bool overwrite = false, bool exist_ok = true) {
  if (overwrite) {
    if (rename(src.c_str(), dst.c_str()) == -1) return errno;
    return 0;
  }
  if (link(src.c_str(), dst.c_str()) == -1) {
    int error = errno;
    remove(src.c_str());
    if (!exist_ok || error != EEXIST) return error;
    return 0;
  }
  return remove(src.c_str()) != -1 ? 0 : errno;
}

int OsRead(const std::string& path,
           const util::File::ChunkReceiver& chunk_receiver, int64_t limit) {
  int fd = open(path.c_str(), O_CLOEXEC | O_RDONLY);
  if (fd == -1) return errno;
  std::unique_ptr<char[]> buf{new char[util::kChunkSize]};
  ssize_t amount = 0;
  int64_t total = 0;
  try {
    while (limit < 0 || total < limit) {
      size_t want = util::kChunkSize;
      if (limit >= 0 && limit - total < static_cast<int64_t>(want))
        want = limit - total;
      amount = read(fd, buf.get(), want);
      if (amount == -1 && errno == EINTR) continue;
      if (amount <= 0) break;
      total += amount;
      chunk_receiver(std::string(buf.get(), amount));
    }
  } catch (...) {
    close(fd);
    throw;
  }
  if (amount == -1) {
    int error = errno;
    close(fd);
    return error;
  }
  return close(fd) == -1 ? errno : 0;
}

int OsWrite(const std::string& path,
            const util::File::ChunkProducer& chunk_producer, bool overwrite,
            bool exist_ok) {
  std::string temp_file;
  int fd = OsTempFile(path, &temp_file);
  if (fd == -1) return errno;
  // Keep the permissions of the file being replaced.
  mode_t mode = S_IRUSR | S_IWUSR | S_IRGRP | S_IROTH;
  struct stat st {};
  if (stat(path.c_str(), &st) == 0) mode = st.st_mode & 07777;
  if (fchmod(fd, mode) == -1) {
    int error = errno;
    close(fd);
    remove(temp_file.c_str());
    return error;
  }
  try {
    chunk_producer([&fd, &temp_file](const std::string& chunk) {
      size_t pos = 0;
      while (pos < chunk.size()) {
        ssize_t written = write(fd, chunk.data() + pos, chunk.size() - pos);
        if (written == -1 && errno == EINTR) continue;
        if (written == -1) {
          throw std::system_error(errno, std::system_category(),
                                  "write " + temp_file);
        }
        pos += written;
      }
    });
  } catch (...) {
    close(fd);
    remove(temp_file.c_str());
    throw;
  }
  if (close(fd) == -1) {
    int error = errno;
    remove(temp_file.c_str());
    return error;
  }
  return OsAtomicMove(temp_file, path, overwrite, exist_ok);
}

}  // namespace

namespace util {

void File::Read(const std::string& path,
                const File::ChunkReceiver& chunk_receiver, int64_t limit) {
  int err = OsRead(path, chunk_receiver, limit);
  if (err == ENOENT) throw file_not_found("Read " + path);
  if (err) throw std::system_error(err, std::system_category(), "Read " + path);
}

std::string File::Contents(const std::string& path, int64_t max_size,
                           bool* truncated) {
  std::string content;
  Read(path, [&content](const std::string& chunk) { content += chunk; },
       max_size);
  if (truncated != nullptr) {
    *truncated = max_size >= 0 && Size(path) > max_size;
  }
  return content;
}

void File::Write(const std::string& path, const ChunkProducer& chunk_producer,
                 bool overwrite, bool exist_ok) {
  MakeDirs(BaseDir(path));
  if (!overwrite && Size(path) >= 0) {
    if (exist_ok) return;
    throw file_exists("Write " + path);
  }
  int err = OsWrite(path, chunk_producer, overwrite, exist_ok);
  if (err) throw std::system_error(err, std::system_category(), path);
}

void File::Write(const std::string& path, const std::string& content,
                 bool overwrite, bool exist_ok) {
  Write(path,
        [&content](const ChunkReceiver& receiver) {
          if (!content.empty()) receiver(content);
        },
        overwrite, exist_ok);
}

void File::MakeDirs(const std::string& path) {
  if (path.empty()) return;
  uint64_t pos = 0;
  while (pos != std::string::npos) {
    pos = path.find_first_of(kPathSeparators, pos + 1);
    if (!MkDir(path.substr(0, pos))) {
      throw std::system_error(errno, std::system_category(), "mkdir " + path);
    }
  }
}

void File::Remove(const std::string& path) {
  if (!OsRemove(path)) {
    if (errno == ENOENT) throw file_not_found("remove " + path);
    throw std::system_error(errno, std::system_category(), "remove " + path);
  }
}

void File::RemoveTree(const std::string& path) {
  if (!OsRemoveTree(path))
    throw std::system_error(errno, std::system_category(), "removetree");
}

std::vector<std::string> File::ListFiles(const std::string& path) {
  std::vector<std::string> names;
  DIR* dir = opendir(path.c_str());
  if (dir == nullptr) {
    if (errno == ENOENT) return names;
    throw std::system_error(errno, std::system_category(), "opendir " + path);
  }
  while (struct dirent* entry = readdir(dir)) {
    std::string name = entry->d_name;
    if (name == "." || name == "..") continue;
    names.push_back(std::move(name));
  }
  closedir(dir);
  std::sort(names.begin(), names.end());
  return names;
}

std::vector<std::string> File::ListTree(const std::string& root) {
  std::vector<std::string> files;
  int err = OsListTree(root, &files);
  if (err) throw std::system_error(err, std::system_category(), "nftw " + root);
  return files;
}

std::string File::JoinPath(const std::string& first,
                           const std::string& second) {
  if (first.empty()) return second;
  if (!second.empty() && strchr(kPathSeparators, second[0])) return second;
  if (first.back() == kPathSeparators[0]) return first + second;
  return first + kPathSeparators[0] + second;
}

std::string File::BaseDir(const std::string& path) {
  size_t pos = path.find_last_of(kPathSeparators);
  if (pos == std::string::npos) return ".";
  if (pos == 0) return path.substr(0, 1);
  return path.substr(0, pos);
}

std::string File::BaseName(const std::string& path) {
  return path.substr(path.find_last_of(kPathSeparators) + 1);
}

std::string File::AbsolutePath(const std::string& path) {
  char buf[PATH_MAX] = {};
  if (realpath(path.c_str(), buf) == nullptr)
    throw std::system_error(errno, std::system_category(), "realpath " + path);
  return buf;
}

int64_t File::Size(const std::string& path) {
  struct stat st {};
  if (stat(path.c_str(), &st) != 0) {
    return -1;
  }
  return st.st_size;
}

bool File::Exists(const std::string& path) {
  struct stat st {};
  return stat(path.c_str(), &st) == 0 && S_ISREG(st.st_mode);
}

TempDir::TempDir(const std::string& base) {
  File::MakeDirs(base);
  path_ = OsTempDir(base);
  if (path_ == "")
    throw std::system_error(errno, std::system_category(), "mkdtemp");
}
void TempDir::Keep() { keep_ = true; }
const std::string& TempDir::Path() const { return path_; }
TempDir::~TempDir() {
  if (keep_ || moved_) return;
  if (!OsRemoveTree(path_)) {
    LOG(WARNING) << "Could not remove " << path_ << ": " << strerror(errno);
  }
}

}  // namespace util
