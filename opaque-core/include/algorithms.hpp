#pragma once

#include <string>
#include <vector>

namespace Opaque {
namespace algorithms {

// Dihedral group D5 checksum. Catches every single-digit error and every
// adjacent transposition (Aadhaar, partial German Steuer-ID).
class Verhoeff {
public:
  static bool validate(const std::string &num);

  // Check digit to append to `num`, as a one-character string
  static std::string generate(const std::string &num);
};

// Mod 10 (credit cards, IMEI, NPI, Canadian SIN)
class Luhn {
public:
  static bool validate(const std::string &num);
};

class ISO7064 {
public:
  // Mod 97-10 over a decimal string of any length (IBAN, LEI)
  static bool mod97_10(const std::string &num);

  // Mod 11-2 with 'X' standing for 10 (ORCID, ISNI). Hyphens and spaces are
  // ignored.
  static bool mod11_2(const std::string &num);
};

// Weighted modulo 11 as used by most South American document numbers
class Mod11 {
public:
  static int calculateCheckDigit(const std::vector<int> &digits,
                                 const std::vector<int> &weights);
};

} // namespace algorithms
} // namespace Opaque
