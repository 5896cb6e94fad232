#include "util/misc.hpp"

namespace util {

namespace {
bool InRange(unsigned char c, unsigned char lo, unsigned char hi) {
  return c >= lo && c <= hi;
}
}  // namespace

std::string DropInvalidUtf8(const std::string& data) {
  std::string out;
  out.reserve(data.size());
  size_t i = 0;
  while (i < data.size()) {
    unsigned char lead = data[i];
    if (lead < 0x80) {
      out += data[i++];
      continue;
    }
    size_t length = 0;
    unsigned char lo = 0x80;
    unsigned char hi = 0xBF;
    if (InRange(lead, 0xC2, 0xDF)) {
      length = 2;
    } else if (InRange(lead, 0xE0, 0xEF)) {
      length = 3;
      if (lead == 0xE0) lo = 0xA0;
      if (lead == 0xED) hi = 0x9F;
    } else if (InRange(lead, 0xF0, 0xF4)) {
      length = 4;
      if (lead == 0xF0) lo = 0x90;
      if (lead == 0xF4) hi = 0x8F;
    } else {
      i++;
      continue;
    }
    // The second byte has a restricted range, the following ones do not.
    size_t j = i + 1;
    while (j < data.size() && j < i + length) {
      unsigned char c = data[j];
      bool ok = j == i + 1 ? InRange(c, lo, hi) : InRange(c, 0x80, 0xBF);
      if (!ok) break;
      j++;
    }
    if (j == i + length) out.append(data, i, length);
    i = j;
  }
  return out;
}

std::vector<std::string> SplitLines(const std::string& text, bool keep_ends) {
  std::vector<std::string> lines;
  size_t start = 0;
  size_t i = 0;
  while (i < text.size()) {
    if (text[i] != '\n' && text[i] != '\r') {
      i++;
      continue;
    }
    size_t end = i;
    if (text[i] == '\r' && i + 1 < text.size() && text[i + 1] == '\n') i++;
    i++;
    lines.push_back(text.substr(start, (keep_ends ? i : end) - start));
    start = i;
  }
  if (start < text.size()) lines.push_back(text.substr(start));
  return lines;
}

}  // namespace util
