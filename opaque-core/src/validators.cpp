#include "validators.hpp"
#include "algorithms.hpp"
#include "text_processor.hpp"

#include <stdexcept>

namespace Opaque {
namespace validators {

namespace {

using text::TextProcessor;

// 64 byte local part, '@', 255 byte domain
const size_t kMaxEmailLength = 320;

// Removes the separators documents are usually printed with. Returns an
// empty string when anything other than digits and separators is present.
std::string compactDigits(const std::string &value) {
  std::string digits;
  digits.reserve(value.size());
  for (char c : value) {
    if (c >= '0' && c <= '9') {
      digits += c;
    } else if (c == '.' || c == '-' || c == '/' || c == ' ') {
      continue;
    } else {
      return "";
    }
  }
  return digits;
}

bool digitCountBetween(const std::string &value, size_t minLen,
                       size_t maxLen) {
  std::string digits = compactDigits(value);
  return digits.size() >= minLen && digits.size() <= maxLen;
}

bool hasPrefix(const std::string &value, const char *const *prefixes,
               size_t count) {
  for (size_t i = 0; i < count; ++i) {
    if (value.compare(0, 2, prefixes[i]) == 0)
      return true;
  }
  return false;
}

// Letter prefix (optionally followed by '-') and a run of digits
bool prefixedDigits(const std::string &value, const std::string &letters,
                    size_t minLen, size_t maxLen) {
  std::string compact = TextProcessor::alnumUpper(value);
  if (compact.empty() || letters.find(compact[0]) == std::string::npos)
    return false;
  std::string digits = compact.substr(1);
  return TextProcessor::isAllDigits(digits) && digits.size() >= minLen &&
         digits.size() <= maxLen;
}

int brazilCheckDigit(const std::string &digits, size_t count, int weightStart) {
  int sum = 0;
  for (size_t i = 0; i < count; ++i) {
    sum += (digits[i] - '0') * (weightStart - static_cast<int>(i));
  }
  int digit = 11 - (sum % 11);
  return digit > 9 ? 0 : digit;
}

int weightedCheckDigit(const std::string &digits, const int *weights,
                       size_t count) {
  int sum = 0;
  for (size_t i = 0; i < count; ++i) {
    sum += (digits[i] - '0') * weights[i];
  }
  int digit = 11 - (sum % 11);
  return digit > 9 ? 0 : digit;
}

std::vector<Rule> buildCatalog() {
  const auto icase = std::regex::ECMAScript | std::regex::icase;
  const auto ecma = std::regex::ECMAScript;

  std::vector<Rule> rules;
  rules.push_back({"BR.CPF", "CPF",
                   std::regex(R"(\b\d{3}\.?\d{3}\.?\d{3}-?\d{2}\b)", ecma),
                   validateCPF});
  rules.push_back({"BR.CNPJ", "CNPJ",
                   std::regex(R"(\b\d{2}\.?\d{3}\.?\d{3}/?\d{4}-?\d{2}\b)",
                              ecma),
                   validateCNPJ});
  rules.push_back(
      {"BR.PIX", "PIX",
       std::regex(R"(\b[0-9a-f]{8}-[0-9a-f]{4}-[0-9a-f]{4}-[0-9a-f]{4}-)"
                  R"([0-9a-f]{12}\b|\+55\d{10,11}\b|)"
                  R"(\b[\w.-]{1,64}@[\w.-]{1,255}\.\w{1,63}\b)",
                  icase),
       validatePix});
  rules.push_back({"BR.RG", "RG",
                   std::regex(R"(\b\d{1,2}\.?\d{3}\.?\d{3}-?[\dXx]?\b)", ecma),
                   validateRG});
  rules.push_back({"BR.CNH", "CNH", std::regex(R"(\b\d{11}\b)", ecma),
                   validateCNH});
  rules.push_back({"BR.RENAVAM", "RENAVAM",
                   std::regex(R"(\b\d{9}(?:\d{2})?\b)", ecma),
                   validateRenavam});
  rules.push_back({"BR.PLACA_MERCOSUL", "PLACA_MERCOSUL",
                   std::regex(R"(\b[A-Z]{3}\d[A-Z]\d{2}\b)", ecma),
                   validatePlacaMercosul});
  rules.push_back({"BR.PLACA_ANTIGA", "PLACA_ANTIGA",
                   std::regex(R"(\b[A-Z]{3}-?\d{4}\b)", ecma),
                   validatePlacaAntiga});
  rules.push_back({"AR.CUIL", "CUIL",
                   std::regex(R"(\b(?:20|23|24|27|30|33|34)-?\d{8}-?\d\b)",
                              ecma),
                   validateCUIL});
  rules.push_back({"AR.DNI", "DNI_AR",
                   std::regex(R"(\b\d{1,2}\.?\d{3}\.?\d{3}\b)", ecma),
                   validateArgentinaDNI});
  rules.push_back({"CL.RUT", "RUT_CL",
                   std::regex(R"(\b\d{1,2}\.?\d{3}\.?\d{3}-[\dkK]\b)", ecma),
                   validateChileRUT});
  rules.push_back({"CO.CEDULA", "CEDULA_CO",
                   std::regex(R"(\b\d{6,10}\b)", ecma),
                   validateColombiaCedula});
  rules.push_back({"CO.NIT", "NIT_CO",
                   std::regex(R"(\b\d{9}(?:-\d)?\b)", ecma),
                   validateColombiaNIT});
  rules.push_back({"PE.DNI", "DNI_PE", std::regex(R"(\b\d{8}\b)", ecma),
                   validatePeruDNI});
  rules.push_back({"PE.RUC", "RUC_PE",
                   std::regex(R"(\b(?:10|15|17|20)\d{9}\b)", ecma),
                   validatePeruRUC});
  rules.push_back({"UY.CI", "CI_UY",
                   std::regex(R"(\b\d\.?\d{3}\.?\d{3}-?\d\b|\b\d{6,8}\b)",
                              ecma),
                   validateUruguayCI});
  rules.push_back({"UY.RUT", "RUT_UY", std::regex(R"(\b\d{12}\b)", ecma),
                   validateUruguayRUT});
  rules.push_back({"VE.CI", "CI_VE", std::regex(R"(\b[VE]-?\d{6,9}\b)", icase),
                   validateVenezuelaCI});
  rules.push_back({"VE.RIF", "RIF_VE",
                   std::regex(R"(\b[VEJPG]-?\d{8,9}\b)", icase),
                   validateVenezuelaRIF});
  rules.push_back({"EC.CEDULA", "CEDULA_EC", std::regex(R"(\b\d{10}\b)", ecma),
                   validateEcuadorCedula});
  rules.push_back({"EC.RUC", "RUC_EC", std::regex(R"(\b\d{10}001\b)", ecma),
                   validateEcuadorRUC});
  rules.push_back({"BO.CI", "CI_BO", std::regex(R"(\b\d{6,9}\b)", ecma),
                   validateBoliviaCI});
  rules.push_back({"BO.NIT", "NIT_BO", std::regex(R"(\b\d{7,12}\b)", ecma),
                   validateBoliviaNIT});
  rules.push_back({"PY.CI", "CI_PY", std::regex(R"(\b\d{6,8}\b)", ecma),
                   validateParaguayCI});
  rules.push_back({"PY.RUC", "RUC_PY", std::regex(R"(\b\d{6,8}-\d\b)", ecma),
                   validateParaguayRUC});
  rules.push_back({"FINANCE.CREDIT_CARD", "CREDIT_CARD",
                   std::regex(R"(\b(?:\d[ -]{0,2}?){13,16}\b)", ecma),
                   validateCreditCard});
  rules.push_back(
      {"FINANCE.IBAN", "IBAN",
       std::regex(R"(\b[A-Z]{2}\d{2}(?: ?[A-Z0-9]{4}){2,7}(?: ?[A-Z0-9]{1,4})?\b)",
                  ecma),
       validateIBAN});
  rules.push_back(
      {"INTERNATIONAL.EMAIL", "EMAIL",
       std::regex(
           R"(\b[A-Za-z0-9._%+-]{1,64}@[A-Za-z0-9-]{1,63})"
           R"((?:\.[A-Za-z0-9-]{1,63}){0,8}\.[A-Za-z]{2,24}\b)",
           ecma),
       validateEmail});
  rules.push_back(
      {"INTERNATIONAL.PHONE", "PHONE",
       std::regex(
           R"((?:\+\d{1,3}[ .-]?|\b|(?=\())\(?\d{2,4}\)?[ .-]?\d{3,5}[ .-]?)"
           R"(\d{4}\b)",
           ecma),
       validatePhone});
  rules.push_back({"INTERNATIONAL.PASSPORT", "PASSPORT",
                   std::regex(R"(\b[A-Z]{1,2}\d{6,8}\b)", ecma),
                   validatePassport});
  rules.push_back({"ASIA.AADHAAR_IN", "AADHAAR",
                   std::regex(R"(\b[2-9]\d{3}[ -]?\d{4}[ -]?\d{4}\b)", ecma),
                   validateAadhaar});
  rules.push_back(
      {"TECH.STRIPE", "STRIPE_KEY",
       std::regex(R"(\b(?:sk|pk|rk)_(?:test|live)_[0-9A-Za-z]{24,99}\b)", ecma),
       validateStripeKey});
  rules.push_back({"TECH.GOOGLE_OAUTH", "GOOGLE_OAUTH",
                   std::regex(R"(\bya29\.[0-9A-Za-z_-]{20,2048})", ecma),
                   validateGoogleOAuth});
  rules.push_back({"TECH.AWS", "AWS_ACCESS_KEY",
                   std::regex(R"(\b(?:AKIA|ASIA)[0-9A-Z]{16}\b)", ecma),
                   validateAwsAccessKey});
  // Body capped at 4 KiB, which holds an RSA-4096 key
  rules.push_back(
      {"TECH.PRIVATE_KEY", "PRIVATE_KEY",
       std::regex(R"(-----BEGIN (?:[A-Z]{1,16} )?PRIVATE KEY-----)"
                  R"([\s\S]{0,4096}?-----END (?:[A-Z]{1,16} )?PRIVATE KEY-----)",
                  ecma),
       validatePrivateKey});
  return rules;
}

} // namespace

const std::vector<Rule> &catalog() {
  static const std::vector<Rule> rules = buildCatalog();
  return rules;
}

const Rule *find(const std::string &id) {
  for (const auto &rule : catalog()) {
    if (rule.id == id)
      return &rule;
  }
  return nullptr;
}

bool validate(const std::string &id, const std::string &value) {
  const Rule *rule = find(id);
  if (!rule)
    throw std::out_of_range("unknown rule: " + id);
  return rule->validate(value);
}

// ==================== Brazil ====================

bool validateCPF(const std::string &value) {
  std::string cpf = TextProcessor::digitsOnly(value);
  if (cpf.size() != 11 || TextProcessor::allSameChar(cpf))
    return false;

  if (cpf[9] - '0' != brazilCheckDigit(cpf, 9, 10))
    return false;
  return cpf[10] - '0' == brazilCheckDigit(cpf, 10, 11);
}

bool validateCNPJ(const std::string &value) {
  static const int weights1[12] = {5, 4, 3, 2, 9, 8, 7, 6, 5, 4, 3, 2};
  static const int weights2[13] = {6, 5, 4, 3, 2, 9, 8, 7, 6, 5, 4, 3, 2};

  std::string cnpj = TextProcessor::digitsOnly(value);
  if (cnpj.size() != 14 || TextProcessor::allSameChar(cnpj))
    return false;

  if (cnpj[12] - '0' != weightedCheckDigit(cnpj, weights1, 12))
    return false;
  return cnpj[13] - '0' == weightedCheckDigit(cnpj, weights2, 13);
}

bool validatePix(const std::string &value) {
  static const std::regex uuid(
      R"(^[0-9a-f]{8}-[0-9a-f]{4}-[0-9a-f]{4}-[0-9a-f]{4}-[0-9a-f]{12}$)",
      std::regex::ECMAScript | std::regex::icase);
  static const std::regex email(R"(^[\w.-]{1,64}@[\w.-]{1,255}\.\w{1,63}$)");
  static const std::regex phone(R"(^\+55\d{10,11}$)");

  if (value.size() > kMaxEmailLength)
    return false;

  return std::regex_match(value, uuid) || std::regex_match(value, email) ||
         std::regex_match(value, phone);
}

bool validateRG(const std::string &value) {
  std::string rg = TextProcessor::alnumUpper(value);
  if (rg.size() < 7 || rg.size() > 9 || TextProcessor::allSameChar(rg))
    return false;

  std::string body = rg.substr(0, rg.size() - 1);
  char last = rg.back();
  return TextProcessor::isAllDigits(body) &&
         ((last >= '0' && last <= '9') || last == 'X');
}

bool validateCNH(const std::string &value) {
  std::string cnh = compactDigits(value);
  return cnh.size() == 11 && !TextProcessor::allSameChar(cnh);
}

bool validateRenavam(const std::string &value) {
  std::string renavam = compactDigits(value);
  return (renavam.size() == 9 || renavam.size() == 11) &&
         !TextProcessor::allSameChar(renavam);
}

bool validatePlacaMercosul(const std::string &value) {
  static const std::regex placa(R"(^[A-Z]{3}[0-9][A-Z][0-9]{2}$)");
  return std::regex_match(value, placa);
}

bool validatePlacaAntiga(const std::string &value) {
  static const std::regex placa(R"(^[A-Z]{3}-?[0-9]{4}$)");
  return std::regex_match(value, placa);
}

// ==================== Argentina ====================

bool validateCUIL(const std::string &value) {
  static const char *const prefixes[] = {"20", "23", "24", "27",
                                         "30", "33", "34"};
  std::string cuil = compactDigits(value);
  return cuil.size() == 11 && hasPrefix(cuil, prefixes, 7);
}

bool validateArgentinaDNI(const std::string &value) {
  return digitCountBetween(value, 7, 8);
}

// ==================== Chile ====================

bool validateChileRUT(const std::string &value) {
  std::string rut = TextProcessor::alnumUpper(value);
  if (rut.size() < 8 || rut.size() > 9)
    return false;

  std::string body = rut.substr(0, rut.size() - 1);
  char verifier = rut.back();
  if (!TextProcessor::isAllDigits(body))
    return false;

  int sum = 0;
  int weight = 2;
  for (auto it = body.rbegin(); it != body.rend(); ++it) {
    sum += (*it - '0') * weight;
    weight = weight == 7 ? 2 : weight + 1;
  }

  int result = 11 - (sum % 11);
  char expected;
  if (result == 11)
    expected = '0';
  else if (result == 10)
    expected = 'K';
  else
    expected = static_cast<char>('0' + result);
  return verifier == expected;
}

// ==================== Colombia ====================

bool validateColombiaCedula(const std::string &value) {
  return digitCountBetween(value, 6, 10);
}

bool validateColombiaNIT(const std::string &value) {
  return digitCountBetween(value, 9, 10);
}

// ==================== Peru ====================

bool validatePeruDNI(const std::string &value) {
  return digitCountBetween(value, 8, 8);
}

bool validatePeruRUC(const std::string &value) {
  static const char *const prefixes[] = {"10", "15", "17", "20"};
  std::string ruc = compactDigits(value);
  return ruc.size() == 11 && hasPrefix(ruc, prefixes, 4);
}

// ==================== Uruguay ====================

bool validateUruguayCI(const std::string &value) {
  return digitCountBetween(value, 6, 8);
}

bool validateUruguayRUT(const std::string &value) {
  return digitCountBetween(value, 12, 12);
}

// ==================== Venezuela ====================

bool validateVenezuelaCI(const std::string &value) {
  return prefixedDigits(value, "VE", 6, 9);
}

bool validateVenezuelaRIF(const std::string &value) {
  return prefixedDigits(value, "VEJPG", 8, 9);
}

// ==================== Ecuador ====================

bool validateEcuadorCedula(const std::string &value) {
  std::string cedula = compactDigits(value);
  if (cedula.size() != 10)
    return false;

  int province = (cedula[0] - '0') * 10 + (cedula[1] - '0');
  if ((province < 1 || province > 24) && province != 30)
    return false;
  if (cedula[2] - '0' >= 6)
    return false;

  int sum = 0;
  for (size_t i = 0; i < 9; ++i) {
    int product = (cedula[i] - '0') * (i % 2 == 0 ? 2 : 1);
    sum += product > 9 ? product - 9 : product;
  }
  int expected = (10 - sum % 10) % 10;
  return cedula[9] - '0' == expected;
}

bool validateEcuadorRUC(const std::string &value) {
  std::string ruc = compactDigits(value);
  return ruc.size() == 13 && ruc.compare(10, 3, "001") == 0;
}

// ==================== Bolivia ====================

bool validateBoliviaCI(const std::string &value) {
  return digitCountBetween(value, 6, 9);
}

bool validateBoliviaNIT(const std::string &value) {
  return digitCountBetween(value, 7, 12);
}

// ==================== Paraguay ====================

bool validateParaguayCI(const std::string &value) {
  return digitCountBetween(value, 6, 8);
}

bool validateParaguayRUC(const std::string &value) {
  size_t dash = value.find('-');
  std::string body = value.substr(0, dash);
  if (!TextProcessor::isAllDigits(body) || body.size() < 6 || body.size() > 8)
    return false;
  if (dash == std::string::npos)
    return true;
  std::string verifier = value.substr(dash + 1);
  return verifier.size() == 1 && TextProcessor::isAllDigits(verifier);
}

// ==================== Finance ====================

bool validateCreditCard(const std::string &value) {
  std::string number = TextProcessor::digitsOnly(value);
  if (number.size() < 12 || number.size() > 19)
    return false;
  return algorithms::Luhn::validate(number);
}

bool validateIBAN(const std::string &value) {
  std::string iban = TextProcessor::alnumUpper(value);
  if (iban.size() < 15 || iban.size() > 34)
    return false;
  if (iban[0] < 'A' || iban[0] > 'Z' || iban[1] < 'A' || iban[1] > 'Z')
    return false;
  if (!TextProcessor::isAllDigits(iban.substr(2, 2)))
    return false;

  // Country code and check digits move to the end, letters become 10..35
  std::string rearranged = iban.substr(4) + iban.substr(0, 4);
  std::string numeric;
  numeric.reserve(rearranged.size() * 2);
  for (char c : rearranged) {
    if (c >= 'A' && c <= 'Z')
      numeric += std::to_string(c - 'A' + 10);
    else
      numeric += c;
  }
  return algorithms::ISO7064::mod97_10(numeric);
}

// ==================== International ====================

bool validateEmail(const std::string &value) {
  static const std::regex email(
      R"(^[A-Za-z0-9._%+-]{1,64}@[A-Za-z0-9-]{1,63}(\.[A-Za-z0-9-]{1,63}){0,8})"
      R"(\.[A-Za-z]{2,24}$)");
  if (value.size() > kMaxEmailLength)
    return false;
  return std::regex_match(value, email);
}

bool validatePhone(const std::string &value) {
  std::string digits;
  for (size_t i = 0; i < value.size(); ++i) {
    char c = value[i];
    if (c >= '0' && c <= '9') {
      digits += c;
    } else if (c == '+' && i == 0) {
      continue;
    } else if (c == ' ' || c == '-' || c == '.' || c == '(' || c == ')') {
      continue;
    } else {
      return false;
    }
  }
  return digits.size() >= 8 && digits.size() <= 15;
}

bool validatePassport(const std::string &value) {
  static const std::regex passport(R"(^[A-Z0-9]{6,9}$)");
  if (!std::regex_match(value, passport))
    return false;
  return value.find_first_of("0123456789") != std::string::npos;
}

// ==================== Asia ====================

bool validateAadhaar(const std::string &value) {
  std::string aadhaar = compactDigits(value);
  if (aadhaar.size() != 12 || aadhaar[0] < '2')
    return false;
  return algorithms::Verhoeff::validate(aadhaar);
}

// ==================== Credentials ====================

bool validateStripeKey(const std::string &value) {
  static const std::regex stripe(R"(^(sk|pk|rk)_(test|live)_[0-9A-Za-z]{24,99}$)");
  return std::regex_match(value, stripe);
}

bool validateGoogleOAuth(const std::string &value) {
  static const std::regex token(R"(^ya29\.[0-9A-Za-z_-]{20,2048}$)");
  return std::regex_match(value, token);
}

bool validateAwsAccessKey(const std::string &value) {
  static const std::regex key(R"(^(AKIA|ASIA)[0-9A-Z]{16}$)");
  return std::regex_match(value, key);
}

bool validatePrivateKey(const std::string &value) {
  static const std::regex pem(
      R"(^-----BEGIN (?:[A-Z]{1,16} )?PRIVATE KEY-----)"
      R"([\s\S]{0,4096}-----END (?:[A-Z]{1,16} )?PRIVATE KEY-----$)");
  return std::regex_match(value, pem);
}

} // namespace validators
} // namespace Opaque
