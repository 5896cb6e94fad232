#ifndef EXECUTOR_ACTIONS_HPP
#define EXECUTOR_ACTIONS_HPP

#include "executor/config.hpp"
#include "executor/package_manager.hpp"
#include "proto/command.pb.h"

namespace executor {

// What the actions need from the executor. Not owned.
struct ActionContext {
  const Config* config = nullptr;
  PackageManager* package_manager = nullptr;
};

// Handlers of the supported actions. Each of them expects the matching field
// of command to be set; paths are relative to the sandbox root. Failures
// that the action can describe are returned as results, other faults are
// thrown.
proto::Result InstallPackage(const proto::Command& command,
                             const ActionContext& context);
proto::Result UninstallPackage(const proto::Command& command,
                               const ActionContext& context);
proto::Result CreateFile(const proto::Command& command,
                         const ActionContext& context);
proto::Result DeleteFile(const proto::Command& command,
                         const ActionContext& context);
proto::Result UpdateFile(const proto::Command& command,
                         const ActionContext& context);
proto::Result ReadFile(const proto::Command& command,
                       const ActionContext& context);
proto::Result ExecuteFile(const proto::Command& command,
                          const ActionContext& context);
proto::Result ListExecutorTree(const proto::Command& command,
                               const ActionContext& context);

}  // namespace executor

#endif
