#include "executor/line_editor.hpp"

#include <algorithm>

#include "absl/strings/ascii.h"
#include "absl/strings/numbers.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_split.h"
#include "absl/strings/string_view.h"
#include "util/file.hpp"
#include "util/misc.hpp"

namespace {
// Range sent by clients that want to replace the whole file.
const constexpr char* kOverwriteSpec = "0-999999";

// Splits data after every "\n". The last line may lack the terminator.
std::vector<std::string> SplitAfterNewlines(const std::string& data) {
  std::vector<std::string> lines;
  size_t start = 0;
  while (start < data.size()) {
    size_t pos = data.find('\n', start);
    if (pos == std::string::npos) {
      lines.push_back(data.substr(start));
      break;
    }
    lines.push_back(data.substr(start, pos + 1 - start));
    start = pos + 1;
  }
  return lines;
}

void Terminate(std::string* line) {
  if (line->empty() || line->back() != '\n') *line += '\n';
}
}  // namespace

namespace executor {

bool LineRange::ParseLines(const std::string& spec, LineRange* range) {
  int64_t start = 0;
  int64_t end = 0;
  if (spec.find('-') != std::string::npos) {
    std::vector<absl::string_view> parts = absl::StrSplit(spec, '-');
    if (parts.size() != 2) return false;
    if (!absl::SimpleAtoi(parts[0], &start)) return false;
    if (!absl::SimpleAtoi(parts[1], &end)) return false;
  } else {
    if (!absl::SimpleAtoi(spec, &start)) return false;
    end = start;
  }
  range->mode = LINES;
  range->start = start;
  range->end = end;
  return true;
}

bool LineRange::Parse(const std::string& spec, LineRange* range) {
  if (spec == kOverwriteSpec) {
    range->mode = OVERWRITE;
    return true;
  }
  if (spec.empty() || absl::AsciiStrToLower(spec) == "append") {
    range->mode = APPEND;
    return true;
  }
  return ParseLines(spec, range);
}

std::vector<std::string> NormalizeLines(const std::string& content) {
  std::vector<std::string> lines = util::SplitLines(content, false);
  for (std::string& line : lines) line += '\n';
  return lines;
}

void SpliceLines(const LineRange& range, std::vector<std::string> new_lines,
                 std::vector<std::string>* lines) {
  const int64_t size = lines->size();
  int64_t begin = std::min(std::max<int64_t>(range.start - 1, 0), size);
  int64_t end = std::min(std::max(range.end, begin), size);
  if (begin > 0) Terminate(&(*lines)[begin - 1]);
  lines->erase(lines->begin() + begin, lines->begin() + end);
  lines->insert(lines->begin() + begin,
                std::make_move_iterator(new_lines.begin()),
                std::make_move_iterator(new_lines.end()));
}

bool EditLines(const std::string& path, const std::string& range_spec,
               const std::string& content, std::string* message) {
  if (!util::File::Exists(path)) {
    *message = "File not found.";
    return false;
  }
  LineRange range;
  if (!LineRange::Parse(range_spec, &range)) {
    *message = "Invalid line range. Use 'start-end' or 'append'.";
    return false;
  }
  try {
    if (range.mode == LineRange::OVERWRITE) {
      util::File::Write(path, content, /*overwrite=*/true);
      *message = "File overwritten successfully.";
      return true;
    }

    std::vector<std::string> lines =
        SplitAfterNewlines(util::File::Contents(path));
    if (range.mode == LineRange::APPEND) {
      LineRange tail;
      tail.start = lines.size() + 1;
      tail.end = lines.size();
      SpliceLines(tail, NormalizeLines(content), &lines);
      *message = "Content successfully appended to end of file.";
    } else {
      SpliceLines(range, NormalizeLines(content), &lines);
      *message = absl::StrCat("Lines ", range.start, "-", range.end,
                              " updated.");
    }

    util::File::Write(path,
                      [&lines](const util::File::ChunkReceiver& receiver) {
                        for (const std::string& line : lines) receiver(line);
                      },
                      /*overwrite=*/true);
    return true;
  } catch (const std::system_error& e) {
    *message = e.what();
    return false;
  }
}

}  // namespace executor
