#ifndef EXECUTOR_CONFIG_HPP
#define EXECUTOR_CONFIG_HPP
#include <chrono>
#include <string>

namespace executor {

// Settings of an executor. Built once at startup and shared, read-only, by
// the poller, the dispatcher and the actions.
struct Config {
  // Queue server address, as host:port, and the token to present to it.
  std::string server;
  std::string token;

  // Directory under which file actions run. Paths in commands are joined to
  // it without any containment check.
  std::string sandbox_root;

  // Programs used by executeFile and by the package actions. Bare names are
  // looked up in PATH.
  std::string interpreter = "python3";
  std::string package_tool = "pip";

  // Where the outputs of the started processes are captured.
  std::string temp_directory = "temp";

  std::chrono::milliseconds poll_interval{1000};
  std::chrono::seconds list_timeout{10};
  // Deadline of the queue calls other than listing; zero means none.
  std::chrono::seconds rpc_timeout{30};
  // Wall time limit of executeFile and of the package actions.
  std::chrono::seconds action_timeout{300};

  // Builds the configuration from the command line flags. Creates the
  // sandbox root and makes it absolute.
  static Config FromFlags();
};

}  // namespace executor

#endif
