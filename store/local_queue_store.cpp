#include "store/local_queue_store.hpp"

#include <ctype.h>

#include <algorithm>

#include "absl/strings/match.h"
#include "glog/logging.h"
#include "util/file.hpp"
#include "util/misc.hpp"

namespace {
const constexpr char* kCommandDir = "command";
const constexpr char* kResultDir = "result";

bool IsIllegalChar(char c) {
  return !isalnum(c) && c != '.' && c != '-' && c != '_';
}

bool IsValidName(const std::string& filename) {
  return !filename.empty() && filename != "." && filename != ".." &&
         std::find_if(filename.begin(), filename.end(), IsIllegalChar) ==
             filename.end();
}

proto::StoreResponse Failure(const std::string& error) {
  proto::StoreResponse response;
  response.set_success(false);
  response.set_error(error);
  return response;
}

proto::StoreResponse Success() {
  proto::StoreResponse response;
  response.set_success(true);
  return response;
}
}  // namespace

namespace store {

LocalQueueStore::LocalQueueStore(std::string root, std::string suffix)
    : root_(std::move(root)), suffix_(std::move(suffix)) {
  util::File::MakeDirs(DirFor(proto::COMMAND));
  util::File::MakeDirs(DirFor(proto::RESULT));
}

std::string LocalQueueStore::DirFor(proto::Collection collection) const {
  switch (collection) {
    case proto::COMMAND:
      return util::File::JoinPath(root_, kCommandDir);
    case proto::RESULT:
      return util::File::JoinPath(root_, kResultDir);
    default:
      return "";
  }
}

std::string LocalQueueStore::PathFor(proto::Collection collection,
                                     const std::string& filename,
                                     std::string* error) const {
  std::string dir = DirFor(collection);
  if (dir.empty()) {
    *error = "Invalid file type";
    return "";
  }
  if (!IsValidName(filename)) {
    *error = "Invalid file name";
    return "";
  }
  return util::File::JoinPath(dir, filename);
}

proto::StoreResponse LocalQueueStore::ReadFile(proto::Collection collection,
                                               const std::string& filename) {
  std::string error;
  std::string path = PathFor(collection, filename, &error);
  if (path.empty()) return Failure(error);
  if (!util::File::Exists(path)) return Failure("File not found");
  try {
    proto::StoreResponse response = Success();
    response.set_content(util::DropInvalidUtf8(util::File::Contents(path)));
    return response;
  } catch (const std::system_error& e) {
    LOG(WARNING) << "ReadFile " << path << ": " << e.what();
    return Failure(e.what());
  }
}

proto::StoreResponse LocalQueueStore::SaveFile(proto::Collection collection,
                                               const std::string& filename,
                                               const std::string& content) {
  std::string error;
  std::string path = PathFor(collection, filename, &error);
  if (path.empty()) return Failure(error);
  try {
    util::File::Write(path, content, /*overwrite=*/true);
    return Success();
  } catch (const std::system_error& e) {
    LOG(WARNING) << "SaveFile " << path << ": " << e.what();
    return Failure(e.what());
  }
}

proto::StoreResponse LocalQueueStore::DeleteFile(proto::Collection collection,
                                                 const std::string& filename) {
  std::string error;
  std::string path = PathFor(collection, filename, &error);
  if (path.empty()) return Failure(error);
  try {
    util::File::Remove(path);
  } catch (const util::file_not_found&) {
    // Already gone.
  } catch (const std::system_error& e) {
    LOG(WARNING) << "DeleteFile " << path << ": " << e.what();
    return Failure(e.what());
  }
  return Success();
}

proto::StoreResponse LocalQueueStore::ListFiles(proto::Collection collection) {
  std::string dir = DirFor(collection);
  if (dir.empty()) return Failure("Unknown file type");
  try {
    proto::StoreResponse response = Success();
    for (const std::string& name : util::File::ListFiles(dir)) {
      if (!absl::EndsWith(name, suffix_)) continue;
      // Names that ReadFile and DeleteFile would reject are never listed.
      if (!IsValidName(name)) {
        VLOG(1) << "Skipping " << name << " in " << dir;
        continue;
      }
      if (!util::File::Exists(util::File::JoinPath(dir, name))) continue;
      response.add_files(name);
    }
    return response;
  } catch (const std::system_error& e) {
    LOG(WARNING) << "ListFiles " << dir << ": " << e.what();
    return Failure(e.what());
  }
}

}  // namespace store
