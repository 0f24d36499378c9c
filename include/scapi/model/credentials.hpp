#pragma once

#include <string>

#include "scapi/common.hpp"
#include "scapi/util/security.hpp"

namespace scapi::model {

// Username/password pair sent with authenticated requests. The password is
// wiped from memory when the credentials are destroyed.
class Credentials {
public:
  Credentials(std::string username, std::string password, bool encrypt_headers = false);

  Credentials(Credentials&&) noexcept = default;
  Credentials& operator=(Credentials&&) noexcept = default;

  const std::string& userName() const { return username_; }
  const std::string& password() const { return password_.value(); }
  bool encryptHeaders() const { return encrypt_headers_; }

  // kValidationError naming the missing part when username or password is blank
  Result<void> validate() const;

  // "user (password: ab****yz)" for log output
  std::string describe() const;

private:
  std::string username_;
  util::SensitiveString password_;
  bool encrypt_headers_;
};

} // namespace scapi::model
