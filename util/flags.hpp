#ifndef UTIL_FLAGS_HPP
#define UTIL_FLAGS_HPP

#include "gflags/gflags.h"

// Common flags
DECLARE_string(token);

// Executor-only flags
DECLARE_string(server);
DECLARE_string(sandbox_root);
DECLARE_string(interpreter);
DECLARE_string(package_tool);
DECLARE_string(temp_directory);
DECLARE_int32(poll_interval_ms);
DECLARE_int32(list_timeout);
DECLARE_int32(rpc_timeout);
DECLARE_int32(action_timeout);
DECLARE_bool(once);

// Server-only flags
DECLARE_string(address);
DECLARE_int32(port);
DECLARE_string(store_directory);
DECLARE_string(document_suffix);

#endif
