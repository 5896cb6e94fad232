#ifndef EXECUTOR_SUBPROCESS_HPP
#define EXECUTOR_SUBPROCESS_HPP
#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

namespace executor {

// What happened to a process started by RunProcess.
struct ProcessOutput {
  enum Outcome { COMPLETED, TIMED_OUT, NOT_STARTED };
  Outcome outcome = NOT_STARTED;
  int32_t status_code = 0;
  int32_t signal = 0;
  // Captured output, without invalid UTF-8 sequences.
  std::string stdout_text;
  std::string stderr_text;
  // Why the process could not be started.
  std::string error;
};

// Runs executable with the given arguments in cwd, killing it after timeout
// (zero means no limit). Bare executable names are looked up in PATH. Output
// is captured through files in a temporary folder of temp_directory.
ProcessOutput RunProcess(const std::string& executable,
                         const std::vector<std::string>& args,
                         const std::string& cwd, std::chrono::seconds timeout,
                         const std::string& temp_directory);

}  // namespace executor

#endif
