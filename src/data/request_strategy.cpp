#include "scapi/data/request_strategy.hpp"

#include <spdlog/spdlog.h>

#include "scapi/crypto/header_encryption.hpp"

namespace scapi::data {

net::Request RequestStrategy::buildBaseRequest(const std::string& uri, model::QueryType type) {
  net::Request request;
  request.url = uri;
  request.method = model::toHttpMethod(type);
  request.keep_alive = false;
  return request;
}

Result<net::Request> AnonymousRequestStrategy::buildRequest(const std::string& uri,
                                                            model::QueryType type) const {
  return buildBaseRequest(uri, type);
}

Result<net::Request> AnonymousRequestStrategy::buildRequest(const std::string& uri,
                                                            model::QueryType type,
                                                            const std::string& body) const {
  (void)uri;
  (void)body;
  return makeErrorResult<net::Request>(
      ErrorCode::kInvalidOperation,
      std::string("A ") + std::string(model::queryTypeToString(type)) +
          " request with a body must be sent through an authenticated data context");
}

AuthenticatedRequestStrategy::AuthenticatedRequestStrategy(model::Credentials credentials,
                                                           PublicKeySource public_key_source)
    : credentials_(std::move(credentials)),
      public_key_source_(std::move(public_key_source)) {}

Result<net::Request> AuthenticatedRequestStrategy::buildRequest(const std::string& uri,
                                                                model::QueryType type) const {
  auto request = buildBaseRequest(uri, type);

  auto applied = applyHeaders(request);
  if (!applied) {
    return std::unexpected(applied.error());
  }

  if (request.method == net::HttpMethod::POST || request.method == net::HttpMethod::PUT) {
    request.content_type = std::string(net::kFormUrlEncoded);
  }
  return request;
}

Result<net::Request> AuthenticatedRequestStrategy::buildRequest(const std::string& uri,
                                                                model::QueryType type,
                                                                const std::string& body) const {
  auto request = buildRequest(uri, type);
  if (!request) {
    return request;
  }
  request->body = body;
  return request;
}

Result<void> AuthenticatedRequestStrategy::applyHeaders(net::Request& request) const {
  if (credentials_.encryptHeaders()) {
    return applyEncryptedHeaders(request);
  }

  spdlog::debug("Applying plain credential headers for {}", credentials_.describe());
  request.setHeader(AuthHeaders::USERNAME, credentials_.userName());
  request.setHeader(AuthHeaders::PASSWORD, credentials_.password());
  return {};
}

Result<void> AuthenticatedRequestStrategy::applyEncryptedHeaders(net::Request& request) const {
  if (!public_key_source_) {
    return std::unexpected(makeError(ErrorCode::kInvalidOperation,
                                     "No public key source configured for encrypted headers"));
  }

  spdlog::debug("Applying encrypted credential headers for {}", credentials_.describe());
  const auto public_key = public_key_source_();
  if (!public_key) {
    return std::unexpected(makeError(ErrorCode::kEncryptionError,
                                     "Unable to retrieve the public key from the server"));
  }

  auto username = crypto::HeaderEncryption::encryptHeaderValue(credentials_.userName(), public_key);
  if (!username) {
    return std::unexpected(username.error());
  }
  auto password = crypto::HeaderEncryption::encryptHeaderValue(credentials_.password(), public_key);
  if (!password) {
    return std::unexpected(password.error());
  }

  request.setHeader(AuthHeaders::USERNAME, *username);
  request.setHeader(AuthHeaders::PASSWORD, *password);
  request.setHeader(AuthHeaders::ENCRYPTED, AuthHeaders::ENCRYPTED_VALUE);
  return {};
}

} // namespace scapi::data
