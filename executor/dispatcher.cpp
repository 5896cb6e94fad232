#include "executor/dispatcher.hpp"

#include "executor/command.hpp"
#include "glog/logging.h"

namespace {
proto::Result Failure(const std::string& id, const std::string& error) {
  proto::Result result;
  result.set_id(id);
  result.set_success(false);
  result.set_error(error);
  return result;
}
}  // namespace

namespace executor {

Dispatcher::Dispatcher(store::QueueStore* store, ActionContext context)
    : store_(store), context_(context) {
  Register(proto::INSTALL_PACKAGE, InstallPackage);
  Register(proto::UNINSTALL_PACKAGE, UninstallPackage);
  Register(proto::CREATE_FILE, CreateFile);
  Register(proto::DELETE_FILE, DeleteFile);
  Register(proto::UPDATE_FILE, UpdateFile);
  Register(proto::READ_FILE, ReadFile);
  Register(proto::EXECUTE_FILE, ExecuteFile);
  Register(proto::LIST_EXECUTOR_TREE, ListExecutorTree);
}

void Dispatcher::Register(proto::Action action, Handler handler) {
  handlers_[action] = std::move(handler);
}

void Dispatcher::Process(const std::string& id) {
  proto::StoreResponse response;
  try {
    response = store_->ReadFile(proto::COMMAND, id);
  } catch (const store::transport_error& e) {
    LOG(ERROR) << "Cannot fetch command " << id << ": " << e.what();
    return;
  }
  if (!response.success()) {
    LOG(WARNING) << "Cannot read command " << id << ": " << response.error();
    return;
  }

  nlohmann::json document =
      nlohmann::json::parse(response.content(), nullptr, false);
  if (document.is_discarded() || !document.is_object() || document.empty()) {
    LOG(WARNING) << "Skipping undecodable command " << id;
    RemoveCommand(id);
    return;
  }
  Finalize(id, Dispatch(id, document));
}

proto::Result Dispatcher::Dispatch(const std::string& id,
                                   const nlohmann::json& document) {
  auto verb_it = document.find("action");
  if (verb_it == document.end() || !verb_it->is_string() ||
      verb_it->get_ref<const std::string&>().empty()) {
    LOG(WARNING) << "Command " << id << " has no action";
    return Failure(id, "missing action");
  }
  const std::string& verb = verb_it->get_ref<const std::string&>();
  proto::Action action = ParseAction(verb);
  auto handler = handlers_.find(action);
  if (handler == handlers_.end()) {
    LOG(WARNING) << "Command " << id << " has unknown action " << verb;
    return Failure(id, "Unknown action: " + verb);
  }

  LOG(INFO) << "Running " << verb << " for " << id;
  try {
    proto::Result result =
        handler->second(DecodeCommand(id, action, document), context_);
    result.set_id(id);
    return result;
  } catch (const std::exception& e) {
    LOG(WARNING) << "Command " << id << " failed: " << e.what();
    return Failure(id, ActionLabel(action) + " error: " + e.what());
  }
}

void Dispatcher::Finalize(const std::string& id, const proto::Result& result) {
  try {
    proto::StoreResponse response =
        store_->SaveFile(proto::RESULT, id, EncodeResult(result));
    if (!response.success()) {
      LOG(ERROR) << "Cannot save result " << id << ": " << response.error();
    }
  } catch (const store::transport_error& e) {
    // The command stays in the queue and will run again.
    LOG(ERROR) << "Finalization failed for " << id << ": " << e.what();
    return;
  }
  RemoveCommand(id);
}

void Dispatcher::RemoveCommand(const std::string& id) {
  try {
    proto::StoreResponse response = store_->DeleteFile(proto::COMMAND, id);
    if (!response.success()) {
      LOG(ERROR) << "Cannot delete command " << id << ": " << response.error();
    }
  } catch (const store::transport_error& e) {
    LOG(ERROR) << "Cannot delete command " << id << ": " << e.what();
  }
}

}  // namespace executor
