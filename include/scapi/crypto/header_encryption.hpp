#pragma once

#include <optional>
#include <string>
#include <string_view>

#include "scapi/common.hpp"
#include "scapi/model/public_key_response.hpp"

namespace scapi::crypto {

/**
 * @brief RSA encryption of authentication header values
 *
 * The server publishes its key as a modulus/exponent string pair. The bytes
 * of those strings are used as the big-endian key components verbatim,
 * without base64 or hex decoding.
 */
class HeaderEncryption {
public:
  /**
   * @brief Encrypt a header value with the server's public key
   * @param value Plaintext header value, must not be blank
   * @param key Public key fetched from the server
   * @return Base64 PKCS#1 v1.5 ciphertext, kInvalidArgument for a blank value
   *         or missing key, kEncryptionError when OpenSSL fails
   */
  static Result<std::string> encryptHeaderValue(std::string_view value,
                                                const std::optional<model::PublicKeyResponse>& key);

  /**
   * @brief Standard base64 with padding, no line breaks
   */
  static std::string base64Encode(std::string_view data);

private:
  HeaderEncryption() = default;
};

} // namespace scapi::crypto
