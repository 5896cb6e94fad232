#ifndef STORE_LOCAL_QUEUE_STORE_HPP
#define STORE_LOCAL_QUEUE_STORE_HPP

#include "store/queue_store.hpp"

namespace store {

// Queue store backed by two folders, <root>/command and <root>/result.
// Writes are atomic: a reader sees either the old or the new document.
class LocalQueueStore : public QueueStore {
 public:
  explicit LocalQueueStore(std::string root, std::string suffix = ".json");
  ~LocalQueueStore() override = default;

  proto::StoreResponse ReadFile(proto::Collection collection,
                                const std::string& filename) override;
  proto::StoreResponse SaveFile(proto::Collection collection,
                                const std::string& filename,
                                const std::string& content) override;
  proto::StoreResponse DeleteFile(proto::Collection collection,
                                  const std::string& filename) override;
  proto::StoreResponse ListFiles(proto::Collection collection) override;

  const std::string& Root() const { return root_; }

 private:
  // Returns the path of the document, or an empty string and sets error if
  // the collection or the name are not valid.
  std::string PathFor(proto::Collection collection, const std::string& filename,
                      std::string* error) const;
  std::string DirFor(proto::Collection collection) const;

  std::string root_;
  std::string suffix_;
};

}  // namespace store

#endif
