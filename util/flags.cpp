#include "util/flags.hpp"

DEFINE_string(token, "", "Bearer token shared by the server and the executor");

DEFINE_string(server, "", "Queue server to connect to, as host:port");
DEFINE_string(sandbox_root, "project",
              "Directory under which the executor runs file actions");
DEFINE_string(interpreter, "python3", "Interpreter used by executeFile");
DEFINE_string(package_tool, "pip",
              "Package manager used by installPackage/uninstallPackage");
DEFINE_string(temp_directory, "temp",
              "Where captured process outputs are stored");
DEFINE_int32(poll_interval_ms, 1000, "Delay between two polls of the queue");
DEFINE_int32(list_timeout, 10, "Deadline for listing commands, in seconds");
DEFINE_int32(rpc_timeout, 30,
             "Deadline for the other queue calls, in seconds. 0 disables it");
DEFINE_int32(action_timeout, 300,
             "Wall time limit for processes started by actions, in seconds");
DEFINE_bool(once, false, "Poll the queue once, process the commands and exit");

DEFINE_string(address, "0.0.0.0", "Address to listen on");
DEFINE_int32(port, 8000, "Port to listen on");
DEFINE_string(store_directory, "storage",
              "Where the command and result queues are stored");
DEFINE_string(document_suffix, ".json",
              "Only files with this suffix are listed");
