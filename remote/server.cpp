#include <memory>
#include <string>

#include "gflags/gflags.h"
#include "glog/logging.h"
#include "grpc++/security/server_credentials.h"
#include "grpc++/server.h"
#include "grpc++/server_builder.h"
#include "grpc++/server_context.h"
#include "grpc/grpc.h"
#include "proto/queue.grpc.pb.h"
#include "remote/common.hpp"
#include "store/local_queue_store.hpp"
#include "util/flags.hpp"

class QueueStoreImpl : public proto::QueueStore::Service {
 public:
  QueueStoreImpl(const std::string& store_dir, const std::string& suffix,
                 std::string token)
      : store_(store_dir, suffix), token_(std::move(token)) {}

  grpc::Status ReadFile(grpc::ServerContext* context,
                        const proto::ReadFileRequest* request,
                        proto::StoreResponse* response) override {
    if (!Authorized(context)) return Unauthorized();
    *response = store_.ReadFile(request->collection(), request->filename());
    return grpc::Status::OK;
  }

  grpc::Status SaveFile(grpc::ServerContext* context,
                        const proto::SaveFileRequest* request,
                        proto::StoreResponse* response) override {
    if (!Authorized(context)) return Unauthorized();
    LOG(INFO) << "Saving " << proto::Collection_Name(request->collection())
              << "/" << request->filename();
    *response = store_.SaveFile(request->collection(), request->filename(),
                                request->content());
    return grpc::Status::OK;
  }

  grpc::Status DeleteFile(grpc::ServerContext* context,
                          const proto::DeleteFileRequest* request,
                          proto::StoreResponse* response) override {
    if (!Authorized(context)) return Unauthorized();
    LOG(INFO) << "Deleting " << proto::Collection_Name(request->collection())
              << "/" << request->filename();
    *response = store_.DeleteFile(request->collection(), request->filename());
    return grpc::Status::OK;
  }

  grpc::Status ListFiles(grpc::ServerContext* context,
                         const proto::ListFilesRequest* request,
                         proto::StoreResponse* response) override {
    if (!Authorized(context)) return Unauthorized();
    *response = store_.ListFiles(request->collection());
    return grpc::Status::OK;
  }

 private:
  bool Authorized(grpc::ServerContext* context) {
    if (remote::IsAuthorized(context->client_metadata(), token_)) return true;
    LOG(WARNING) << "Rejected unauthorized call from " << context->peer();
    return false;
  }

  static grpc::Status Unauthorized() {
    return grpc::Status(grpc::StatusCode::UNAUTHENTICATED,
                        "Unauthorized access");
  }

  store::LocalQueueStore store_;
  std::string token_;
};

int main(int argc, char** argv) {
  gflags::ParseCommandLineFlags(&argc, &argv, true);
  google::InitGoogleLogging(argv[0]);
  google::InstallFailureSignalHandler();
  CHECK_NE(FLAGS_token, "") << "You need to specify a token!";
  std::string server_address = FLAGS_address + ":" + std::to_string(FLAGS_port);
  QueueStoreImpl service(FLAGS_store_directory, FLAGS_document_suffix,
                         FLAGS_token);
  grpc::ServerBuilder builder;
  builder.AddListeningPort(server_address, grpc::InsecureServerCredentials());
  builder.RegisterService(&service);
  std::unique_ptr<grpc::Server> server(builder.BuildAndStart());
  CHECK(server) << "Cannot listen on " << server_address;
  LOG(INFO) << "Server listening on " << server_address;
  server->Wait();
}
