#ifndef STORE_REMOTE_QUEUE_STORE_HPP
#define STORE_REMOTE_QUEUE_STORE_HPP
#include <chrono>
#include <memory>

#include "grpc++/channel.h"
#include "proto/queue.grpc.pb.h"
#include "store/queue_store.hpp"

namespace store {

// Client of a queue server. Every call that does not reach the server, or
// that the server refuses, throws transport_error.
class RemoteQueueStore : public QueueStore {
 public:
  RemoteQueueStore(std::string remote_address, std::string token,
                   std::chrono::seconds list_timeout,
                   std::chrono::seconds call_timeout)
      : remote_address_(std::move(remote_address)),
        token_(std::move(token)),
        list_timeout_(list_timeout),
        call_timeout_(call_timeout) {}
  ~RemoteQueueStore() override = default;

  proto::StoreResponse ReadFile(proto::Collection collection,
                                const std::string& filename) override;
  proto::StoreResponse SaveFile(proto::Collection collection,
                                const std::string& filename,
                                const std::string& content) override;
  proto::StoreResponse DeleteFile(proto::Collection collection,
                                  const std::string& filename) override;
  proto::StoreResponse ListFiles(proto::Collection collection) override;

 private:
  void MaybeGetNewChannelAndStub();

  std::string remote_address_;
  std::string token_;
  std::chrono::seconds list_timeout_;
  std::chrono::seconds call_timeout_;
  std::shared_ptr<grpc::Channel> channel_;
  std::unique_ptr<proto::QueueStore::Stub> stub_;
};

}  // namespace store

#endif
