#include "executor/package_manager.hpp"

#include <vector>

#include "absl/strings/str_cat.h"
#include "executor/subprocess.hpp"
#include "glog/logging.h"

namespace executor {

bool PipPackageManager::Run(Operation operation, const std::string& package,
                            std::string* output) {
  std::vector<std::string> args;
  if (operation == Operation::INSTALL) {
    args = {"install", package};
  } else {
    args = {"uninstall", package, "-y"};
  }
  LOG(INFO) << tool_ << " " << args[0] << " " << package;

  ProcessOutput result = RunProcess(tool_, args, "", timeout_, temp_directory_);
  switch (result.outcome) {
    case ProcessOutput::COMPLETED:
      *output = result.stdout_text + result.stderr_text;
      return true;
    case ProcessOutput::TIMED_OUT:
      *output = absl::StrCat("timed out (limit: ", timeout_.count(), "s).");
      return false;
    case ProcessOutput::NOT_STARTED:
    default:
      *output = result.error;
      return false;
  }
}

}  // namespace executor
