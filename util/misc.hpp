#ifndef UTIL_MISC_HPP
#define UTIL_MISC_HPP
#include <string>
#include <vector>

namespace util {

// Returns data without the byte sequences that are not valid UTF-8. A
// sequence cut at the end of data counts as invalid.
std::string DropInvalidUtf8(const std::string& data);

// Splits text into lines. A line ends with "\n", "\r\n" or "\r"; the
// terminator is kept in the line if keep_ends is true. A terminator at the end
// of text does not start a new, empty line.
std::vector<std::string> SplitLines(const std::string& text, bool keep_ends);

}  // namespace util
#endif
