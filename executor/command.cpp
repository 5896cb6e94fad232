#include "executor/command.hpp"

#include <map>

#include "absl/strings/str_split.h"

namespace {

const std::map<std::string, proto::Action>& Verbs() {
  static const std::map<std::string, proto::Action> verbs = {
      {"installPackage", proto::INSTALL_PACKAGE},
      {"install_pip", proto::INSTALL_PACKAGE},
      {"uninstallPackage", proto::UNINSTALL_PACKAGE},
      {"uninstall_pip", proto::UNINSTALL_PACKAGE},
      {"createFile", proto::CREATE_FILE},
      {"create_file", proto::CREATE_FILE},
      {"deleteFile", proto::DELETE_FILE},
      {"delete_file", proto::DELETE_FILE},
      {"updateFile", proto::UPDATE_FILE},
      {"update_file", proto::UPDATE_FILE},
      {"readFile", proto::READ_FILE},
      {"read_file", proto::READ_FILE},
      {"executeFile", proto::EXECUTE_FILE},
      {"execute", proto::EXECUTE_FILE},
      {"listExecutorTree", proto::LIST_EXECUTOR_TREE},
      {"list_executor_dir", proto::LIST_EXECUTOR_TREE},
  };
  return verbs;
}

std::string RequiredString(const nlohmann::json& document,
                           const std::string& name) {
  auto it = document.find(name);
  if (it == document.end() || !it->is_string()) {
    throw executor::missing_parameter(name);
  }
  return it->get<std::string>();
}

bool OptionalString(const nlohmann::json& document, const std::string& name,
                    std::string* value) {
  auto it = document.find(name);
  if (it == document.end() || it->is_null()) return false;
  if (!it->is_string()) {
    throw std::invalid_argument("parameter '" + name + "' is not a string");
  }
  *value = it->get<std::string>();
  return true;
}

// Arguments are either a single string, split on whitespace, or a list of
// strings passed as they are.
void DecodeArgs(const nlohmann::json& document, proto::ExecuteFile* command) {
  auto it = document.find("args");
  if (it == document.end() || it->is_null()) return;
  if (it->is_array()) {
    for (const nlohmann::json& arg : *it) {
      if (!arg.is_string()) {
        throw std::invalid_argument(
            "parameter 'args' is not a list of strings");
      }
      command->add_args(arg.get<std::string>());
    }
    return;
  }
  std::string args;
  OptionalString(document, "args", &args);
  for (absl::string_view arg : absl::StrSplit(
           args, absl::ByAnyChar(" \t\n\r\f\v"), absl::SkipEmpty())) {
    command->add_args(std::string(arg));
  }
}

}  // namespace

namespace executor {

proto::Action ParseAction(const std::string& verb) {
  auto it = Verbs().find(verb);
  if (it == Verbs().end()) return proto::UNKNOWN_ACTION;
  return it->second;
}

std::string ActionLabel(proto::Action action) {
  switch (action) {
    case proto::INSTALL_PACKAGE:
      return "Pip install";
    case proto::UNINSTALL_PACKAGE:
      return "Pip uninstall";
    case proto::CREATE_FILE:
      return "Create file";
    case proto::DELETE_FILE:
      return "Delete file";
    case proto::UPDATE_FILE:
      return "Update file";
    case proto::READ_FILE:
      return "Read file";
    case proto::EXECUTE_FILE:
      return "Execution";
    case proto::LIST_EXECUTOR_TREE:
      return "Directory listing";
    default:
      return "Action";
  }
}

proto::Command DecodeCommand(const std::string& id, proto::Action action,
                             const nlohmann::json& document) {
  proto::Command command;
  command.set_id(id);
  std::string value;
  switch (action) {
    case proto::INSTALL_PACKAGE:
      command.mutable_install_package()->set_package(
          RequiredString(document, "package"));
      break;
    case proto::UNINSTALL_PACKAGE:
      command.mutable_uninstall_package()->set_package(
          RequiredString(document, "package"));
      break;
    case proto::CREATE_FILE: {
      proto::CreateFile* create = command.mutable_create_file();
      create->set_file(RequiredString(document, "file"));
      if (OptionalString(document, "content", &value))
        create->set_content(value);
      break;
    }
    case proto::DELETE_FILE:
      command.mutable_delete_file()->set_file(RequiredString(document, "file"));
      break;
    case proto::UPDATE_FILE: {
      proto::UpdateFile* update = command.mutable_update_file();
      update->set_file(RequiredString(document, "file"));
      update->set_range(RequiredString(document, "range"));
      if (OptionalString(document, "content", &value))
        update->set_content(value);
      break;
    }
    case proto::READ_FILE: {
      proto::ReadFile* read = command.mutable_read_file();
      read->set_file(RequiredString(document, "file"));
      if (OptionalString(document, "range", &value)) read->set_range(value);
      break;
    }
    case proto::EXECUTE_FILE: {
      proto::ExecuteFile* execute = command.mutable_execute_file();
      execute->set_file(RequiredString(document, "file"));
      DecodeArgs(document, execute);
      break;
    }
    case proto::LIST_EXECUTOR_TREE:
      command.mutable_list_executor_tree();
      break;
    default:
      throw std::invalid_argument("unknown action");
  }
  return command;
}

std::string EncodeResult(const proto::Result& result) {
  nlohmann::json document = nlohmann::json::object();
  document["success"] = result.success();
  if (result.has_message()) document["message"] = result.message();
  if (result.has_content()) document["content"] = result.content();
  if (result.has_truncated()) document["truncated"] = result.truncated();
  if (result.has_error()) document["error"] = result.error();
  if (result.has_stdout_text()) document["stdout"] = result.stdout_text();
  if (result.has_stderr_text()) document["stderr"] = result.stderr_text();
  if (result.has_exit_code()) document["exit_code"] = result.exit_code();
  if (result.has_signal()) document["signal"] = result.signal();
  if (result.has_files()) {
    document["files"] = nlohmann::json::array();
    for (const std::string& name : result.files().names()) {
      document["files"].push_back(name);
    }
  }
  return document.dump(2, ' ', false,
                       nlohmann::json::error_handler_t::replace);
}

}  // namespace executor
