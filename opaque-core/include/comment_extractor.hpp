#pragma once

#include <cstddef>
#include <string>
#include <vector>

struct TSLanguage;

namespace Opaque {
namespace comments {

struct CommentSegment {
  size_t startByte{0};
  size_t endByte{0};
  std::string text;
};

bool isLanguageSupported(const std::string &languageId);

// Language id for a file name by extension ("src/a.py" -> "python"), or an
// empty string when no grammar covers it
std::string languageForPath(const std::string &path);

// Comment nodes in source order
std::vector<CommentSegment> extractComments(const std::string &languageId,
                                            const std::string &text);

// Copy of `text` with every comment byte blanked to a space. Newlines stay,
// so line numbers and byte offsets still match the input.
std::string maskComments(const std::string &languageId,
                         const std::string &text);

// nullptr when unsupported
const TSLanguage *resolveLanguage(const std::string &languageId);

} // namespace comments
} // namespace Opaque
