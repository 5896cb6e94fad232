#include "executor/file_reader.hpp"

#include <algorithm>
#include <vector>

#include "executor/line_editor.hpp"
#include "util/file.hpp"
#include "util/misc.hpp"

namespace executor {

bool ReadText(const std::string& path, const absl::optional<std::string>& range,
              std::string* text, bool* truncated, int64_t limit) {
  if (!util::File::Exists(path)) {
    *text = "File not found.";
    return false;
  }
  std::string data;
  try {
    data = util::DropInvalidUtf8(util::File::Contents(path, limit, truncated));
  } catch (const util::file_not_found&) {
    *text = "File not found.";
    return false;
  } catch (const std::system_error& e) {
    *text = std::string("Read error: ") + e.what();
    return false;
  }

  if (!range || range->empty()) {
    *text = std::move(data);
    return true;
  }

  LineRange lines_range;
  if (!LineRange::ParseLines(*range, &lines_range)) {
    *text = "Invalid range format. Use 'start-end'.";
    return false;
  }
  std::vector<std::string> lines = util::SplitLines(data, true);
  const int64_t size = lines.size();
  int64_t begin = std::min(std::max<int64_t>(lines_range.start - 1, 0), size);
  int64_t end = std::min(std::max(lines_range.end, begin), size);
  text->clear();
  for (int64_t i = begin; i < end; i++) *text += lines[i];
  return true;
}

}  // namespace executor
