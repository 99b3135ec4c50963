#pragma once

#include <regex>
#include <string>
#include <vector>

namespace Opaque {
namespace validators {

using ValidateFn = bool (*)(const std::string &);

// A detection rule: the regex finds candidates in free text, the validation
// function confirms them.
struct Rule {
  std::string id;     // "BR.CPF"
  std::string entity; // "CPF"
  std::regex pattern;
  ValidateFn validate;
};

// All rules, in a stable order
const std::vector<Rule> &catalog();

// nullptr when the id is unknown
const Rule *find(const std::string &id);

// Throws std::out_of_range for unknown ids
bool validate(const std::string &id, const std::string &value);

// Brazil
bool validateCPF(const std::string &value);
bool validateCNPJ(const std::string &value);
bool validatePix(const std::string &value);
bool validateRG(const std::string &value);
bool validateCNH(const std::string &value);
bool validateRenavam(const std::string &value);
bool validatePlacaMercosul(const std::string &value);
bool validatePlacaAntiga(const std::string &value);

// Argentina
bool validateCUIL(const std::string &value);
bool validateArgentinaDNI(const std::string &value);

// Chile
bool validateChileRUT(const std::string &value);

// Colombia
bool validateColombiaCedula(const std::string &value);
bool validateColombiaNIT(const std::string &value);

// Peru
bool validatePeruDNI(const std::string &value);
bool validatePeruRUC(const std::string &value);

// Uruguay
bool validateUruguayCI(const std::string &value);
bool validateUruguayRUT(const std::string &value);

// Venezuela
bool validateVenezuelaCI(const std::string &value);
bool validateVenezuelaRIF(const std::string &value);

// Ecuador
bool validateEcuadorCedula(const std::string &value);
bool validateEcuadorRUC(const std::string &value);

// Bolivia
bool validateBoliviaCI(const std::string &value);
bool validateBoliviaNIT(const std::string &value);

// Paraguay
bool validateParaguayCI(const std::string &value);
bool validateParaguayRUC(const std::string &value);

// Finance
bool validateCreditCard(const std::string &value);
bool validateIBAN(const std::string &value);

// International
bool validateEmail(const std::string &value);
bool validatePhone(const std::string &value);
bool validatePassport(const std::string &value);

// Asia
bool validateAadhaar(const std::string &value);

// Credentials
bool validateStripeKey(const std::string &value);
bool validateGoogleOAuth(const std::string &value);
bool validateAwsAccessKey(const std::string &value);
bool validatePrivateKey(const std::string &value);

} // namespace validators
} // namespace Opaque
