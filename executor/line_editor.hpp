#ifndef EXECUTOR_LINE_EDITOR_HPP
#define EXECUTOR_LINE_EDITOR_HPP
#include <cstdint>
#include <string>
#include <vector>

namespace executor {

// The lines of a file addressed by an update or a read.
struct LineRange {
  enum Mode {
    // Replace the whole file with the new content, as it is.
    OVERWRITE,
    // Add the new lines at the end of the file.
    APPEND,
    // Replace lines start to end, 1-based and inclusive.
    LINES
  };
  Mode mode = APPEND;
  int64_t start = 0;
  int64_t end = 0;

  // Parses the range of an update: "0-999999" (overwrite), "" or "append"
  // in any case (append), "start-end" or a single line number. Returns false
  // if spec has none of these forms.
  static bool Parse(const std::string& spec, LineRange* range);

  // Parses "start-end" or a single line number only.
  static bool ParseLines(const std::string& spec, LineRange* range);
};

// Splits content into lines and terminates each of them, the last one
// included, with exactly one "\n".
std::vector<std::string> NormalizeLines(const std::string& content);

// Replaces the lines [range.start, range.end] of lines with new_lines. The
// range is clamped to the existing lines; if range.end < range.start,
// new_lines are inserted before range.start. The line preceding the
// insertion point gets a terminator if it lacks one.
void SpliceLines(const LineRange& range, std::vector<std::string> new_lines,
                 std::vector<std::string>* lines);

// Applies an update to the existing file at path and writes it back. Returns
// true on success; message is set in both cases.
bool EditLines(const std::string& path, const std::string& range_spec,
               const std::string& content, std::string* message);

}  // namespace executor

#endif
