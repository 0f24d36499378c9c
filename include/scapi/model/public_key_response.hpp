#pragma once

#include <string>

#include "scapi/model/response.hpp"

namespace scapi::model {

// RSA public key returned by the "getpublickey" action.
// Modulus and exponent are kept exactly as the server sent them.
class PublicKeyResponse : public BaseResponse {
public:
  std::string modulus;
  std::string exponent;

  // Both key components present
  bool validate() const;
};

// {"Modulus": "...", "Exponent": "..."}; lower-case keys are accepted too
void from_json(const nlohmann::json& j, PublicKeyResponse& response);
void to_json(nlohmann::json& j, const PublicKeyResponse& response);

// <RSAKeyValue><Modulus>...</Modulus><Exponent>...</Exponent></RSAKeyValue>
void fromXml(const util::XmlNode& node, PublicKeyResponse& response);

} // namespace scapi::model
