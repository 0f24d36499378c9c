#pragma once

#include <functional>
#include <optional>
#include <string>

#include "scapi/common.hpp"
#include "scapi/model/credentials.hpp"
#include "scapi/model/public_key_response.hpp"
#include "scapi/model/query.hpp"
#include "scapi/net/http.hpp"

namespace scapi::data {

// Authentication headers understood by the item web API
struct AuthHeaders {
  static constexpr const char* USERNAME = "X-Scitemwebapi-Username";
  static constexpr const char* PASSWORD = "X-Scitemwebapi-Password";
  static constexpr const char* ENCRYPTED = "X-Scitemwebapi-Encrypted";
  static constexpr const char* ENCRYPTED_VALUE = "1";
};

// Fetches the server's public key; std::nullopt when unavailable
using PublicKeySource = std::function<std::optional<model::PublicKeyResponse>()>;

// Turns a target URI and query type into a ready-to-send request
class RequestStrategy {
public:
  virtual ~RequestStrategy() = default;

  virtual bool isAuthenticated() const = 0;

  virtual Result<net::Request> buildRequest(const std::string& uri, model::QueryType type) const = 0;

  // Same as above, with a form-encoded request body
  virtual Result<net::Request> buildRequest(const std::string& uri, model::QueryType type,
                                            const std::string& body) const = 0;

  // Verb from the query type, persistent connections disabled
  static net::Request buildBaseRequest(const std::string& uri, model::QueryType type);
};

// Plain requests without credentials. Bodies are refused.
class AnonymousRequestStrategy final : public RequestStrategy {
public:
  bool isAuthenticated() const override { return false; }

  Result<net::Request> buildRequest(const std::string& uri, model::QueryType type) const override;
  Result<net::Request> buildRequest(const std::string& uri, model::QueryType type,
                                    const std::string& body) const override;
};

// Adds credential headers, RSA-encrypted with the server's public key when
// the credentials ask for it.
class AuthenticatedRequestStrategy final : public RequestStrategy {
public:
  AuthenticatedRequestStrategy(model::Credentials credentials, PublicKeySource public_key_source);

  bool isAuthenticated() const override { return true; }

  Result<net::Request> buildRequest(const std::string& uri, model::QueryType type) const override;
  Result<net::Request> buildRequest(const std::string& uri, model::QueryType type,
                                    const std::string& body) const override;

  Result<void> applyHeaders(net::Request& request) const;
  Result<void> applyEncryptedHeaders(net::Request& request) const;

  const model::Credentials& credentials() const { return credentials_; }

private:
  model::Credentials credentials_;
  PublicKeySource public_key_source_;
};

} // namespace scapi::data
