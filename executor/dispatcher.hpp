#ifndef EXECUTOR_DISPATCHER_HPP
#define EXECUTOR_DISPATCHER_HPP
#include <functional>
#include <map>
#include <string>

#include "executor/actions.hpp"
#include "nlohmann/json.hpp"
#include "proto/command.pb.h"
#include "store/queue_store.hpp"

namespace executor {

// Runs the commands of a queue store, one at a time, and writes back their
// results.
class Dispatcher {
 public:
  using Handler = std::function<proto::Result(const proto::Command& command,
                                              const ActionContext& context)>;

  // Registers the handlers of every supported action. store and the
  // pointers in context must outlive the dispatcher.
  Dispatcher(store::QueueStore* store, ActionContext context);

  // Replaces the handler of an action.
  void Register(proto::Action action, Handler handler);

  // Fetches the command stored as id, runs it, saves its result and removes
  // the command. Commands that are not JSON objects are removed without a
  // result. If the command cannot be fetched, it is left in the store.
  void Process(const std::string& id);

  // Runs a decoded command document and returns its result. Never throws:
  // faults of the action are reported in the result.
  proto::Result Dispatch(const std::string& id, const nlohmann::json& document);

 private:
  void Finalize(const std::string& id, const proto::Result& result);
  void RemoveCommand(const std::string& id);

  store::QueueStore* store_;
  ActionContext context_;
  std::map<proto::Action, Handler> handlers_;
};

}  // namespace executor

#endif
