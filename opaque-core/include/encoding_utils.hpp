#pragma once

#include <stdexcept>
#include <string>

namespace Opaque {
namespace encoding {

class EncodingError : public std::runtime_error {
public:
  explicit EncodingError(const std::string &message)
      : std::runtime_error(message) {}
};

// Throws EncodingError when the charset is unknown or the input does not
// decode in `fromCharset`.
std::string convertEncoding(const std::string &input,
                            const std::string &fromCharset,
                            const std::string &toCharset = "UTF-8");

std::string toUtf8(const std::string &input, const std::string &charset);

} // namespace encoding
} // namespace Opaque
