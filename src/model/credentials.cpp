#include "scapi/model/credentials.hpp"

#include <algorithm>
#include <string_view>

namespace scapi::model {

namespace {

// CR, LF and the other control characters would split the header line
bool hasControlCharacters(std::string_view value) {
  return std::any_of(value.begin(), value.end(), [](char c) {
    const auto byte = static_cast<unsigned char>(c);
    return byte < 0x20 || byte == 0x7f;
  });
}

}  // namespace

Credentials::Credentials(std::string username, std::string password, bool encrypt_headers)
    : username_(std::move(username)),
      password_(std::move(password)),
      encrypt_headers_(encrypt_headers) {}

Result<void> Credentials::validate() const {
  if (util::Security::isBlank(username_)) {
    return std::unexpected(makeError(ErrorCode::kValidationError,
                                     "The username cannot be null or empty"));
  }
  if (util::Security::isBlank(password_.value())) {
    return std::unexpected(makeError(ErrorCode::kValidationError,
                                     "The password cannot be null or empty"));
  }
  if (hasControlCharacters(username_)) {
    return std::unexpected(makeError(ErrorCode::kValidationError,
                                     "The username cannot contain control characters"));
  }
  if (hasControlCharacters(password_.value())) {
    return std::unexpected(makeError(ErrorCode::kValidationError,
                                     "The password cannot contain control characters"));
  }
  return {};
}

std::string Credentials::describe() const {
  return username_ + " (password: " + password_.masked() + ", encrypted headers: " +
         (encrypt_headers_ ? "yes" : "no") + ")";
}

} // namespace scapi::model
