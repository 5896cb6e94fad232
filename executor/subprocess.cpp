#include "executor/subprocess.hpp"

#include <memory>

#include "glog/logging.h"
#include "sandbox/sandbox.hpp"
#include "util/file.hpp"
#include "util/misc.hpp"
#include "util/which.hpp"

namespace {
std::string CapturedOutput(const std::string& path) {
  if (!util::File::Exists(path)) return "";
  return util::DropInvalidUtf8(util::File::Contents(path));
}
}  // namespace

namespace executor {

ProcessOutput RunProcess(const std::string& executable,
                         const std::vector<std::string>& args,
                         const std::string& cwd, std::chrono::seconds timeout,
                         const std::string& temp_directory) {
  ProcessOutput output;
  std::string program = util::which(executable);
  if (program.empty()) {
    output.error = executable + ": command not found";
    return output;
  }

  try {
    // The child changes directory before exec. The last component is left
    // unresolved, it may be a virtualenv symlink.
    if (program[0] != '/') {
      program = util::File::JoinPath(
          util::File::AbsolutePath(util::File::BaseDir(program)),
          util::File::BaseName(program));
    }
    util::TempDir tmp(temp_directory);
    sandbox::ExecutionOptions exec_options(cwd, program);
    exec_options.args = args;
    exec_options.wall_limit_millis =
        std::chrono::duration_cast<std::chrono::milliseconds>(timeout).count();
    exec_options.stdout_file = util::File::JoinPath(tmp.Path(), "stdout");
    exec_options.stderr_file = util::File::JoinPath(tmp.Path(), "stderr");

    std::unique_ptr<sandbox::Sandbox> sb = sandbox::Sandbox::Create();
    sandbox::ExecutionInfo info;
    if (!sb->Execute(exec_options, &info, &output.error)) {
      return output;
    }
    VLOG(1) << program << " ran for " << info.wall_time_millis << "ms";

    if (info.timed_out) {
      output.outcome = ProcessOutput::TIMED_OUT;
      return output;
    }
    output.outcome = ProcessOutput::COMPLETED;
    output.status_code = info.status_code;
    output.signal = info.signal;
    output.stdout_text = CapturedOutput(exec_options.stdout_file);
    output.stderr_text = CapturedOutput(exec_options.stderr_file);
  } catch (const std::system_error& e) {
    output = ProcessOutput();
    output.error = e.what();
  }
  return output;
}

}  // namespace executor
