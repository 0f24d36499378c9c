#include "scapi/model/public_key_response.hpp"

#include "scapi/util/security.hpp"

namespace scapi::model {

namespace {

std::string memberOf(const nlohmann::json& j, const char* upper, const char* lower) {
  for (const char* key : {upper, lower}) {
    if (j.contains(key) && j[key].is_string()) {
      return j[key].get<std::string>();
    }
  }
  return {};
}

}  // namespace

bool PublicKeyResponse::validate() const {
  return !util::Security::isBlank(modulus) && !util::Security::isBlank(exponent);
}

void from_json(const nlohmann::json& j, PublicKeyResponse& response) {
  readBaseJson(j, response);
  if (!j.is_object()) {
    return;
  }

  // Some servers wrap the key in the usual "result" envelope
  const nlohmann::json& source = j.contains("result") && j["result"].is_object() ? j["result"] : j;
  response.modulus = memberOf(source, "Modulus", "modulus");
  response.exponent = memberOf(source, "Exponent", "exponent");
}

void to_json(nlohmann::json& j, const PublicKeyResponse& response) {
  to_json(j, static_cast<const BaseResponse&>(response));
  j["modulus"] = response.modulus;
  j["exponent"] = response.exponent;
}

void fromXml(const util::XmlNode& node, PublicKeyResponse& response) {
  readBaseXml(node, response);

  util::XmlNode key = node;
  if (!key.child("Modulus")) {
    key = node.child("RSAKeyValue");
  }
  response.modulus = key.childText("Modulus");
  response.exponent = key.childText("Exponent");
}

} // namespace scapi::model
