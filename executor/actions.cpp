#include "executor/actions.hpp"

#include <vector>

#include "absl/strings/str_cat.h"
#include "executor/file_reader.hpp"
#include "executor/line_editor.hpp"
#include "executor/subprocess.hpp"
#include "glog/logging.h"
#include "util/file.hpp"

namespace {

proto::Result MessageResult(bool success, const std::string& message) {
  proto::Result result;
  result.set_success(success);
  result.set_message(message);
  return result;
}

proto::Result ErrorResult(const std::string& error) {
  proto::Result result;
  result.set_success(false);
  result.set_error(error);
  return result;
}

std::string SandboxPath(const executor::ActionContext& context,
                        const std::string& file) {
  return util::File::JoinPath(context.config->sandbox_root, file);
}

proto::Result RunPackageManager(executor::PackageManager::Operation operation,
                                const std::string& package,
                                const executor::ActionContext& context) {
  std::string output;
  if (!context.package_manager->Run(operation, package, &output)) {
    return MessageResult(false, "Pip execution failed: " + output);
  }
  return MessageResult(true, output);
}

}  // namespace

namespace executor {

proto::Result InstallPackage(const proto::Command& command,
                             const ActionContext& context) {
  return RunPackageManager(PackageManager::Operation::INSTALL,
                           command.install_package().package(), context);
}

proto::Result UninstallPackage(const proto::Command& command,
                               const ActionContext& context) {
  return RunPackageManager(PackageManager::Operation::UNINSTALL,
                           command.uninstall_package().package(), context);
}

proto::Result CreateFile(const proto::Command& command,
                         const ActionContext& context) {
  const proto::CreateFile& create = command.create_file();
  try {
    util::File::Write(SandboxPath(context, create.file()), create.content(),
                      /*overwrite=*/true);
  } catch (const std::system_error& e) {
    return MessageResult(false,
                         std::string("Failed to create file: ") + e.what());
  }
  return MessageResult(true,
                       "File '" + create.file() + "' created successfully.");
}

proto::Result DeleteFile(const proto::Command& command,
                         const ActionContext& context) {
  const std::string& file = command.delete_file().file();
  std::string path = SandboxPath(context, file);
  if (!util::File::Exists(path)) {
    return MessageResult(false, "Delete failed: File not found.");
  }
  try {
    util::File::Remove(path);
  } catch (const util::file_not_found&) {
    return MessageResult(false, "Delete failed: File not found.");
  } catch (const std::system_error& e) {
    return MessageResult(false, std::string("Delete failed: ") + e.what());
  }
  return MessageResult(true, "File '" + file + "' deleted successfully.");
}

proto::Result UpdateFile(const proto::Command& command,
                         const ActionContext& context) {
  const proto::UpdateFile& update = command.update_file();
  std::string message;
  bool success = EditLines(SandboxPath(context, update.file()),
                           update.range(), update.content(), &message);
  return MessageResult(success, message);
}

proto::Result ReadFile(const proto::Command& command,
                       const ActionContext& context) {
  const proto::ReadFile& read = command.read_file();
  absl::optional<std::string> range;
  if (read.has_range()) range = read.range();
  std::string text;
  bool truncated = false;
  if (!ReadText(SandboxPath(context, read.file()), range, &text, &truncated)) {
    return ErrorResult(text);
  }
  if (truncated) {
    LOG(WARNING) << read.file() << " is larger than " << kReadLimit
                 << " bytes, the rest was dropped";
  }
  proto::Result result;
  result.set_success(true);
  result.set_content(text);
  result.set_truncated(truncated);
  return result;
}

proto::Result ExecuteFile(const proto::Command& command,
                          const ActionContext& context) {
  const proto::ExecuteFile& execute = command.execute_file();
  std::string path = SandboxPath(context, execute.file());
  if (!util::File::Exists(path)) return ErrorResult("File not found.");

  std::vector<std::string> args{path};
  args.insert(args.end(), execute.args().begin(), execute.args().end());
  const Config& config = *context.config;
  ProcessOutput output =
      RunProcess(config.interpreter, args, config.sandbox_root,
                 config.action_timeout, config.temp_directory);
  switch (output.outcome) {
    case ProcessOutput::TIMED_OUT:
      return ErrorResult(absl::StrCat("Execution failed: Script timed out ",
                                      "(limit: ", config.action_timeout.count(),
                                      "s)."));
    case ProcessOutput::NOT_STARTED:
      return ErrorResult("Execution error: " + output.error);
    case ProcessOutput::COMPLETED:
    default:
      break;
  }
  proto::Result result;
  result.set_success(true);
  result.set_stdout_text(output.stdout_text);
  result.set_stderr_text(output.stderr_text);
  result.set_exit_code(output.status_code);
  result.set_signal(output.signal);
  return result;
}

proto::Result ListExecutorTree(const proto::Command& command,
                               const ActionContext& context) {
  proto::Result result;
  result.set_success(true);
  proto::FileList* files = result.mutable_files();
  for (const std::string& file :
       util::File::ListTree(context.config->sandbox_root)) {
    files->add_names(file);
  }
  return result;
}

}  // namespace executor
