#pragma once

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include "scapi/common.hpp"
#include "scapi/data/request_strategy.hpp"
#include "scapi/data/serialization.hpp"
#include "scapi/model/credentials.hpp"
#include "scapi/model/public_key_response.hpp"
#include "scapi/model/query.hpp"
#include "scapi/model/response.hpp"
#include "scapi/net/http_transport.hpp"
#include "scapi/util/error_handler.hpp"
#include "scapi/util/host_name.hpp"
#include "scapi/util/security.hpp"
#include "scapi/util/url.hpp"

namespace scapi::data {

// Result of one send: the raw response when one arrived, the failure when
// the exchange did not complete.
struct Exchange {
  std::string uri;
  std::chrono::milliseconds elapsed{0};
  std::optional<net::Response> response;
  std::optional<util::ContextualError> error;
  model::ExchangeOutcome outcome = model::ExchangeOutcome::kCompleted;
};

/**
 * @brief Entry point for talking to one item web API host
 *
 * A context is bound to a single host for its lifetime. Anonymous contexts
 * can only read and delete; authenticated contexts attach credential
 * headers and may create and update items.
 *
 * Network and deserialization failures never surface as errors from
 * getResponse(): they are recorded in the returned response's status code
 * and ResponseInfo instead.
 */
class DataContext final {
public:
  // Public key action used for header encryption
  static constexpr const char* PUBLIC_KEY_ACTION = "getpublickey";

  /**
   * @brief Create an anonymous context
   * @param host_name Host with or without scheme, optionally with a port
   * @param secure Use https regardless of the scheme given
   * @param transport Transport to send through; a CurlTransport when null
   * @return The context, or kInvalidArgument for an unusable host name
   */
  static Result<DataContext> create(std::string_view host_name, bool secure = false,
                                    std::shared_ptr<net::HttpTransport> transport = nullptr);

  /**
   * @brief Create a context that authenticates every request
   * @return kInvalidArgument for an unusable host name or invalid
   *         credentials, kInvalidOperation when encrypted headers are
   *         requested over a secure transport
   */
  static Result<DataContext> createAuthenticated(std::string_view host_name,
                                                 model::Credentials credentials,
                                                 bool secure = false,
                                                 std::shared_ptr<net::HttpTransport> transport = nullptr);

  DataContext(DataContext&&) noexcept = default;
  DataContext& operator=(DataContext&&) noexcept = default;
  DataContext(const DataContext&) = delete;
  DataContext& operator=(const DataContext&) = delete;

  // Scheme-prefixed host, e.g. "https://cms.example.com"
  const std::string& hostName() const { return host_.url; }
  bool isSecure() const { return host_.secure; }
  bool isAuthenticated() const { return strategy_->isAuthenticated(); }

  Result<net::Request> buildRequest(const std::string& uri, model::QueryType type) const;
  Result<net::Request> buildRequest(const std::string& uri, model::QueryType type,
                                    const std::string& body) const;

  /**
   * @brief Run a query and deserialize the response into T
   *
   * Create and Update on an anonymous context fail with kInvalidOperation
   * before anything is sent. Every other outcome is a T whose status code
   * and info describe what happened.
   */
  template<typename T>
  Result<T> getResponse(const model::BaseQuery& query) const {
    const auto type = query.queryType();
    if (model::isMutating(type) && !isAuthenticated()) {
      return makeErrorResult<T>(ErrorCode::kInvalidOperation,
                                "A create or update query must be used with an authenticated data context");
    }

    const std::string uri = query.buildUri(host_.url);
    auto request = model::isMutating(type)
                       ? buildRequest(uri, type, util::toQueryString(query.fieldsToUpdate()))
                       : buildRequest(uri, type);
    if (!request) {
      T response{};
      recordBuildFailure(response, uri, request.error());
      return response;
    }
    return execute<T>(*request, query.responseFormat());
  }

  /**
   * @brief Send a prepared request and deserialize the body into T
   * @param seed Returned with status and info filled in when the body is
   *        blank or cannot be parsed
   */
  template<typename T>
  T execute(const net::Request& request, model::ResponseFormat format, T seed = T{}) const {
    Exchange exchange = dispatch(request);

    if (exchange.response && exchange.outcome == model::ExchangeOutcome::kCompleted &&
        !util::Security::isBlank(exchange.response->body)) {
      auto parsed = deserialize<T>(exchange.response->body, format);
      if (parsed) {
        seed = std::move(*parsed);
      } else {
        exchange.error = util::makeContextualError(
            parsed.error().code(), parsed.error().message(),
            SCAPI_REQUEST_ERROR_CONTEXT(exchange.uri).push("DataContext::execute").push("deserialize"));
        exchange.outcome = model::ExchangeOutcome::kUnexpectedError;
      }
    }

    recordOutcome(seed, exchange);
    return seed;
  }

  // Server public key, std::nullopt when the response lacks one. Always
  // fetched anonymously.
  std::optional<model::PublicKeyResponse> getPublicKey() const;

private:
  DataContext(util::HostName host, std::shared_ptr<net::HttpTransport> transport,
              std::unique_ptr<RequestStrategy> strategy);

  // Send and time one request
  Exchange dispatch(const net::Request& request) const;

  // Copy status and info from the exchange onto the response
  static void recordOutcome(model::BaseResponse& response, const Exchange& exchange);

  static void recordBuildFailure(model::BaseResponse& response, const std::string& uri,
                                 const Error& error);

  util::HostName host_;
  std::shared_ptr<net::HttpTransport> transport_;
  std::unique_ptr<RequestStrategy> strategy_;
};

} // namespace scapi::data
