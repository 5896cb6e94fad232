#include "executor/config.hpp"
#include "executor/dispatcher.hpp"
#include "executor/package_manager.hpp"
#include "executor/poller.hpp"
#include "gflags/gflags.h"
#include "glog/logging.h"
#include "store/remote_queue_store.hpp"
#include "util/flags.hpp"

int main(int argc, char** argv) {
  gflags::ParseCommandLineFlags(&argc, &argv, true);
  google::InitGoogleLogging(argv[0]);
  google::InstallFailureSignalHandler();
  CHECK_NE(FLAGS_server, "") << "You need to specify a server!";

  executor::Config config = executor::Config::FromFlags();
  store::RemoteQueueStore queue(config.server, config.token,
                                config.list_timeout, config.rpc_timeout);
  executor::PipPackageManager package_manager(
      config.package_tool, config.temp_directory, config.action_timeout);

  executor::ActionContext context;
  context.config = &config;
  context.package_manager = &package_manager;
  executor::Dispatcher dispatcher(&queue, context);
  executor::Poller poller(&queue, &dispatcher, config.poll_interval);

  LOG(INFO) << "Executor started. Monitoring server at: " << config.server;
  LOG(INFO) << "Base directory: " << config.sandbox_root;
  if (FLAGS_once) {
    poller.PollOnce();
    return 0;
  }
  poller.Run();
}
