#ifndef STORE_QUEUE_STORE_HPP
#define STORE_QUEUE_STORE_HPP
#include <stdexcept>
#include <string>

#include "proto/queue.pb.h"

namespace store {

// The queue could not be reached. Nothing was read or changed.
class transport_error : public std::runtime_error {
 public:
  explicit transport_error(const std::string& msg) : std::runtime_error(msg) {}
};

// A set of documents partitioned in the command and the result collections,
// keyed by file name. Store-side failures are reported with success = false
// and an error message; implementations that talk to a remote store throw
// transport_error when the store cannot be reached.
class QueueStore {
 public:
  // Returns the content of a document.
  virtual proto::StoreResponse ReadFile(proto::Collection collection,
                                        const std::string& filename) = 0;

  // Creates or replaces a document.
  virtual proto::StoreResponse SaveFile(proto::Collection collection,
                                        const std::string& filename,
                                        const std::string& content) = 0;

  // Removes a document. Removing a missing document succeeds.
  virtual proto::StoreResponse DeleteFile(proto::Collection collection,
                                          const std::string& filename) = 0;

  // Lists the names of the documents of a collection.
  virtual proto::StoreResponse ListFiles(proto::Collection collection) = 0;

  QueueStore() = default;
  virtual ~QueueStore() = default;
  QueueStore(const QueueStore&) = delete;
  QueueStore& operator=(const QueueStore&) = delete;
  QueueStore(QueueStore&&) = delete;
  QueueStore& operator=(QueueStore&&) = delete;
};

}  // namespace store

#endif
