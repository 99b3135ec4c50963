#include "algorithms.hpp"
#include "text_processor.hpp"

#include <algorithm>
#include <cstddef>

namespace Opaque {
namespace algorithms {

namespace {

// Multiplication table of D5
const int kVerhoeffD[10][10] = {
    {0, 1, 2, 3, 4, 5, 6, 7, 8, 9}, {1, 2, 3, 4, 0, 6, 7, 8, 9, 5},
    {2, 3, 4, 0, 1, 7, 8, 9, 5, 6}, {3, 4, 0, 1, 2, 8, 9, 5, 6, 7},
    {4, 0, 1, 2, 3, 9, 5, 6, 7, 8}, {5, 9, 8, 7, 6, 0, 4, 3, 2, 1},
    {6, 5, 9, 8, 7, 1, 0, 4, 3, 2}, {7, 6, 5, 9, 8, 2, 1, 0, 4, 3},
    {8, 7, 6, 5, 9, 3, 2, 1, 0, 4}, {9, 8, 7, 6, 5, 4, 3, 2, 1, 0}};

// Position permutation table
const int kVerhoeffP[8][10] = {
    {0, 1, 2, 3, 4, 5, 6, 7, 8, 9}, {1, 5, 7, 6, 2, 8, 3, 0, 9, 4},
    {5, 8, 0, 3, 7, 9, 6, 1, 4, 2}, {8, 9, 1, 6, 0, 4, 3, 5, 2, 7},
    {9, 4, 5, 3, 1, 2, 6, 8, 7, 0}, {4, 2, 8, 6, 5, 7, 3, 9, 0, 1},
    {2, 7, 9, 3, 8, 0, 6, 4, 1, 5}, {7, 0, 4, 6, 9, 1, 3, 2, 5, 8}};

const int kVerhoeffInv[10] = {0, 4, 3, 2, 1, 5, 6, 7, 8, 9};

int verhoeffChecksum(const std::string &num, size_t shift) {
  int c = 0;
  size_t i = 0;
  for (auto it = num.rbegin(); it != num.rend(); ++it, ++i) {
    c = kVerhoeffD[c][kVerhoeffP[(i + shift) % 8][*it - '0']];
  }
  return c;
}

} // namespace

bool Verhoeff::validate(const std::string &num) {
  if (!text::TextProcessor::isAllDigits(num))
    return false;
  return verhoeffChecksum(num, 0) == 0;
}

std::string Verhoeff::generate(const std::string &num) {
  if (!num.empty() && !text::TextProcessor::isAllDigits(num))
    return "";
  // The check digit will occupy position 0, so every digit shifts by one
  return std::string(1, static_cast<char>('0' + kVerhoeffInv[verhoeffChecksum(
                                                    num, 1)]));
}

bool Luhn::validate(const std::string &num) {
  if (!text::TextProcessor::isAllDigits(num))
    return false;

  int checksum = 0;
  size_t i = 0;
  for (auto it = num.rbegin(); it != num.rend(); ++it, ++i) {
    int d = *it - '0';
    if (i % 2 == 1) {
      int doubled = d * 2;
      checksum += doubled < 10 ? doubled : doubled - 9;
    } else {
      checksum += d;
    }
  }
  return checksum % 10 == 0;
}

bool ISO7064::mod97_10(const std::string &num) {
  if (!text::TextProcessor::isAllDigits(num))
    return false;

  // Long division keeps the running remainder below 97 * 10 + 9
  int remainder = 0;
  for (char c : num) {
    remainder = (remainder * 10 + (c - '0')) % 97;
  }
  return remainder == 1;
}

bool ISO7064::mod11_2(const std::string &num) {
  std::string compact;
  for (char c : num) {
    if (c == '-' || c == ' ')
      continue;
    compact += c;
  }
  if (compact.size() < 2)
    return false;

  std::string body = compact.substr(0, compact.size() - 1);
  char check = compact.back();
  if (!text::TextProcessor::isAllDigits(body))
    return false;

  int total = 0;
  for (char c : body) {
    total = ((total + (c - '0')) * 2) % 11;
  }
  int expected = (12 - total) % 11;

  if (check == 'X' || check == 'x')
    return expected == 10;
  if (check < '0' || check > '9')
    return false;
  return expected == check - '0';
}

int Mod11::calculateCheckDigit(const std::vector<int> &digits,
                               const std::vector<int> &weights) {
  int sum = 0;
  size_t n = std::min(digits.size(), weights.size());
  for (size_t i = 0; i < n; ++i) {
    sum += digits[i] * weights[i];
  }
  int rem = sum % 11;
  if (rem < 2)
    return 0;
  return 11 - rem;
}

} // namespace algorithms
} // namespace Opaque
