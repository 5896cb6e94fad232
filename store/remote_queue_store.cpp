#include "store/remote_queue_store.hpp"

#include "grpc++/client_context.h"
#include "grpc++/create_channel.h"
#include "grpc++/security/credentials.h"
#include "grpc/grpc.h"
#include "remote/common.hpp"

namespace {
void CheckStatus(const grpc::Status& status, const char* call) {
  if (status.ok()) return;
  throw store::transport_error(std::string(call) + ": " +
                               status.error_message());
}
}  // namespace

namespace store {

proto::StoreResponse RemoteQueueStore::ReadFile(proto::Collection collection,
                                                const std::string& filename) {
  MaybeGetNewChannelAndStub();
  grpc::ClientContext context;
  remote::SetupContext(&context, token_, call_timeout_);
  proto::ReadFileRequest request;
  request.set_collection(collection);
  request.set_filename(filename);
  proto::StoreResponse response;
  CheckStatus(stub_->ReadFile(&context, request, &response), "ReadFile");
  return response;
}

proto::StoreResponse RemoteQueueStore::SaveFile(proto::Collection collection,
                                                const std::string& filename,
                                                const std::string& content) {
  MaybeGetNewChannelAndStub();
  grpc::ClientContext context;
  remote::SetupContext(&context, token_, call_timeout_);
  proto::SaveFileRequest request;
  request.set_collection(collection);
  request.set_filename(filename);
  request.set_content(content);
  proto::StoreResponse response;
  CheckStatus(stub_->SaveFile(&context, request, &response), "SaveFile");
  return response;
}

proto::StoreResponse RemoteQueueStore::DeleteFile(proto::Collection collection,
                                                  const std::string& filename) {
  MaybeGetNewChannelAndStub();
  grpc::ClientContext context;
  remote::SetupContext(&context, token_, call_timeout_);
  proto::DeleteFileRequest request;
  request.set_collection(collection);
  request.set_filename(filename);
  proto::StoreResponse response;
  CheckStatus(stub_->DeleteFile(&context, request, &response), "DeleteFile");
  return response;
}

proto::StoreResponse RemoteQueueStore::ListFiles(proto::Collection collection) {
  MaybeGetNewChannelAndStub();
  grpc::ClientContext context;
  remote::SetupContext(&context, token_, list_timeout_);
  proto::ListFilesRequest request;
  request.set_collection(collection);
  proto::StoreResponse response;
  CheckStatus(stub_->ListFiles(&context, request, &response), "ListFiles");
  return response;
}

void RemoteQueueStore::MaybeGetNewChannelAndStub() {
  if (channel_ &&
      channel_->GetState(/* try_to_connect = */ true) != GRPC_CHANNEL_SHUTDOWN)
    return;
  channel_ =
      grpc::CreateChannel(remote_address_, grpc::InsecureChannelCredentials());
  stub_ = proto::QueueStore::NewStub(channel_);
}

}  // namespace store
