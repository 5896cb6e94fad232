#ifndef EXECUTOR_FILE_READER_HPP
#define EXECUTOR_FILE_READER_HPP
#include <cstdint>
#include <string>

#include "absl/types/optional.h"

namespace executor {

// Maximum number of bytes of a file that a read returns.
static const constexpr int64_t kReadLimit = 5 * 1024 * 1024;

// Reads at most limit bytes of the file at path, dropping invalid UTF-8
// sequences. If range is set and not empty, only the lines it selects
// ("start-end" or a single line number, 1-based and inclusive) are returned.
// On success, sets text and truncated (whether the file is longer than
// limit) and returns true; otherwise sets text to the error message.
bool ReadText(const std::string& path, const absl::optional<std::string>& range,
              std::string* text, bool* truncated, int64_t limit = kReadLimit);

}  // namespace executor

#endif
