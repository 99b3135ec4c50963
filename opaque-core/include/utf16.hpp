#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace Opaque {

// Zero-based line and UTF-16 code unit column, as editors report them
struct Position {
  int line{0};
  int character{0};
};

std::vector<size_t> computeLineStarts(const std::string &text);

Position byteOffsetToPosition(const std::string &text,
                              const std::vector<size_t> &lineStarts,
                              size_t offset);

size_t utf8ToUtf16Length(const std::string &utf8Str);

} // namespace Opaque
