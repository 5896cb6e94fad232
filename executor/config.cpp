#include "executor/config.hpp"

#include "util/file.hpp"
#include "util/flags.hpp"

namespace executor {

Config Config::FromFlags() {
  Config config;
  config.server = FLAGS_server;
  config.token = FLAGS_token;
  util::File::MakeDirs(FLAGS_sandbox_root);
  config.sandbox_root = util::File::AbsolutePath(FLAGS_sandbox_root);
  config.interpreter = FLAGS_interpreter;
  config.package_tool = FLAGS_package_tool;
  util::File::MakeDirs(FLAGS_temp_directory);
  config.temp_directory = util::File::AbsolutePath(FLAGS_temp_directory);
  config.poll_interval = std::chrono::milliseconds(FLAGS_poll_interval_ms);
  config.list_timeout = std::chrono::seconds(FLAGS_list_timeout);
  config.rpc_timeout = std::chrono::seconds(FLAGS_rpc_timeout);
  config.action_timeout = std::chrono::seconds(FLAGS_action_timeout);
  return config;
}

}  // namespace executor
