#include "text_processor.hpp"

#include <algorithm>
#include <cctype>

namespace Opaque {
namespace text {

bool TextProcessor::isValidUTF8(const std::string &input) {
  size_t i = 0;
  while (i < input.size()) {
    unsigned char c = static_cast<unsigned char>(input[i]);

    // ASCII, including control characters
    if (c < 0x80) {
      ++i;
      continue;
    }

    size_t seqLen = sequenceLength(c);
    if (seqLen == 0 || !isValidUtf8Sequence(input, i, seqLen))
      return false;

    unsigned char c1 = static_cast<unsigned char>(input[i + 1]);
    if (seqLen == 3) {
      // Overlong (E0 80..9F) and UTF-16 surrogates (ED A0..BF)
      if (c == 0xE0 && c1 < 0xA0)
        return false;
      if (c == 0xED && c1 >= 0xA0)
        return false;
    } else if (seqLen == 4) {
      // Overlong (F0 80..8F) and above U+10FFFF (F4 90.., F5..)
      if (c == 0xF0 && c1 < 0x90)
        return false;
      if (c == 0xF4 && c1 >= 0x90)
        return false;
    }

    i += seqLen;
  }
  return true;
}

std::string TextProcessor::digitsOnly(const std::string &input) {
  std::string result;
  result.reserve(input.size());
  for (char c : input) {
    if (c >= '0' && c <= '9')
      result += c;
  }
  return result;
}

std::string TextProcessor::alnumUpper(const std::string &input) {
  std::string result;
  result.reserve(input.size());
  for (char c : input) {
    unsigned char uc = static_cast<unsigned char>(c);
    if (uc < 0x80 && std::isalnum(uc))
      result += static_cast<char>(std::toupper(uc));
  }
  return result;
}

bool TextProcessor::isAllDigits(const std::string &input) {
  if (input.empty())
    return false;
  return std::all_of(input.begin(), input.end(),
                     [](char c) { return c >= '0' && c <= '9'; });
}

bool TextProcessor::allSameChar(const std::string &input) {
  if (input.empty())
    return true;
  return input.find_first_not_of(input[0]) == std::string::npos;
}

std::string TextProcessor::toLower(std::string input) {
  std::transform(
      input.begin(), input.end(), input.begin(),
      [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return input;
}

std::vector<std::string> TextProcessor::splitLines(const std::string &text) {
  std::vector<std::string> lines;
  size_t start = 0;
  while (start < text.size()) {
    size_t end = text.find('\n', start);
    if (end == std::string::npos)
      end = text.size();

    std::string line = text.substr(start, end - start);
    if (!line.empty() && line.back() == '\r')
      line.pop_back();
    lines.push_back(std::move(line));

    start = end + 1;
  }
  return lines;
}

size_t TextProcessor::replaceAll(std::string &text, const std::string &from,
                                 const std::string &to) {
  if (from.empty())
    return 0;

  size_t count = 0;
  size_t pos = 0;
  while ((pos = text.find(from, pos)) != std::string::npos) {
    text.replace(pos, from.size(), to);
    pos += to.size();
    ++count;
  }
  return count;
}

size_t TextProcessor::sequenceLength(unsigned char lead) {
  // C0/C1 are always overlong, F5..FF never start a sequence
  if (lead >= 0xC2 && lead <= 0xDF)
    return 2; // 110xxxxx
  if ((lead & 0xF0) == 0xE0)
    return 3; // 1110xxxx
  if (lead >= 0xF0 && lead <= 0xF4)
    return 4; // 11110xxx
  return 0;
}

bool TextProcessor::isValidUtf8Sequence(const std::string &input, size_t pos,
                                        size_t seqLen) {
  if (pos + seqLen > input.size())
    return false;

  for (size_t j = 1; j < seqLen; ++j) {
    if ((static_cast<unsigned char>(input[pos + j]) & 0xC0) != 0x80) {
      return false; // Invalid continuation byte
    }
  }
  return true;
}

} // namespace text
} // namespace Opaque
