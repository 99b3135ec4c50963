#include "encoding_utils.hpp"
#include "text_processor.hpp"

#include <cerrno>
#include <cstring>
#include <iconv.h>

namespace Opaque {
namespace encoding {

namespace {

bool isUtf8Name(const std::string &charset) {
  std::string lower = text::TextProcessor::toLower(charset);
  return lower.empty() || lower == "utf-8" || lower == "utf8";
}

} // namespace

std::string convertEncoding(const std::string &input,
                            const std::string &fromCharset,
                            const std::string &toCharset) {
  if (input.empty())
    return input;

  iconv_t cd = iconv_open(toCharset.c_str(), fromCharset.c_str());
  if (cd == (iconv_t)-1) {
    throw EncodingError("unsupported conversion " + fromCharset + " -> " +
                        toCharset);
  }

  size_t inBytesLeft = input.size();
  size_t outBytesLeft = input.size() * 4; // Conservative estimate

  std::string result(outBytesLeft, '\0');

  char *inBuf = const_cast<char *>(input.data());
  char *outBuf = &result[0];

  if (iconv(cd, &inBuf, &inBytesLeft, &outBuf, &outBytesLeft) == (size_t)-1) {
    int err = errno;
    iconv_close(cd);
    throw EncodingError("cannot decode input as " + fromCharset + ": " +
                        std::strerror(err));
  }

  iconv_close(cd);

  // Resize result to actual converted size
  result.resize(result.size() - outBytesLeft);
  return result;
}

std::string toUtf8(const std::string &input, const std::string &charset) {
  if (isUtf8Name(charset)) {
    if (!text::TextProcessor::isValidUTF8(input))
      throw EncodingError("input is not valid UTF-8");
    return input;
  }
  return convertEncoding(input, charset, "UTF-8");
}

} // namespace encoding
} // namespace Opaque
