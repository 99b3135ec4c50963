#include "utf16.hpp"

namespace Opaque {

namespace {

// Number of UTF-16 code units for the character starting at `i`, advancing
// `i` past it. Truncated or stray bytes count as one unit each.
unsigned int consumeUtf16Units(const std::string &s, size_t &i, size_t end) {
  unsigned char c = static_cast<unsigned char>(s[i]);
  size_t len = 1;
  if ((c >> 5) == 0x6)
    len = 2;
  else if ((c >> 4) == 0xE)
    len = 3;
  else if ((c >> 3) == 0x1E)
    len = 4;

  if (len == 1 || i + len > end) {
    ++i;
    return 1;
  }
  for (size_t j = 1; j < len; ++j) {
    if ((static_cast<unsigned char>(s[i + j]) & 0xC0) != 0x80) {
      ++i;
      return 1;
    }
  }

  i += len;
  // Only 4-byte sequences lie outside the BMP
  return len == 4 ? 2 : 1;
}

} // namespace

std::vector<size_t> computeLineStarts(const std::string &text) {
  std::vector<size_t> lineStarts;
  lineStarts.reserve(64);
  lineStarts.push_back(0);
  for (size_t i = 0; i < text.size(); ++i)
    if (text[i] == '\n')
      lineStarts.push_back(i + 1);
  return lineStarts;
}

Position byteOffsetToPosition(const std::string &text,
                              const std::vector<size_t> &lineStarts,
                              size_t offset) {
  if (offset > text.size())
    offset = text.size();

  // Last line start at or before the offset
  size_t lo = 0, hi = lineStarts.size();
  while (lo + 1 < hi) {
    size_t mid = (lo + hi) / 2;
    if (lineStarts[mid] <= offset)
      lo = mid;
    else
      hi = mid;
  }

  size_t i = lineStarts[lo];
  unsigned int col16 = 0;
  while (i < offset && text[i] != '\n') {
    col16 += consumeUtf16Units(text, i, offset);
  }

  return Position{static_cast<int>(lo), static_cast<int>(col16)};
}

size_t utf8ToUtf16Length(const std::string &utf8Str) {
  size_t i = 0;
  size_t utf16Length = 0;
  while (i < utf8Str.size()) {
    utf16Length += consumeUtf16Units(utf8Str, i, utf8Str.size());
  }
  return utf16Length;
}

} // namespace Opaque
