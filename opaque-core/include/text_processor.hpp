#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace Opaque {
namespace text {

class TextProcessor {
public:
  // Strict UTF-8 check (rejects overlong forms, surrogates and > U+10FFFF)
  static bool isValidUTF8(const std::string &input);

  static std::string digitsOnly(const std::string &input);

  // Keeps ASCII letters and digits, letters upper-cased
  static std::string alnumUpper(const std::string &input);

  static bool isAllDigits(const std::string &input);

  static bool allSameChar(const std::string &input);

  static std::string toLower(std::string input);

  static std::vector<std::string> splitLines(const std::string &text);

  // Replaces every occurrence of `from`, returns the number of replacements
  static size_t replaceAll(std::string &text, const std::string &from,
                           const std::string &to);

private:
  static size_t sequenceLength(unsigned char lead);

  static bool isValidUtf8Sequence(const std::string &input, size_t pos,
                                  size_t seqLen);
};

} // namespace text
} // namespace Opaque
