#include "scapi/data/data_context.hpp"

#include <spdlog/spdlog.h>

#include "scapi/net/curl_transport.hpp"
#include "scapi/util/logging.hpp"

namespace scapi::data {

namespace {

std::shared_ptr<net::HttpTransport> orDefaultTransport(std::shared_ptr<net::HttpTransport> transport) {
  if (transport) {
    return transport;
  }
  return std::make_shared<net::CurlTransport>();
}

}  // namespace

DataContext::DataContext(util::HostName host, std::shared_ptr<net::HttpTransport> transport,
                         std::unique_ptr<RequestStrategy> strategy)
    : host_(std::move(host)),
      transport_(std::move(transport)),
      strategy_(std::move(strategy)) {}

Result<DataContext> DataContext::create(std::string_view host_name, bool secure,
                                        std::shared_ptr<net::HttpTransport> transport) {
  auto host = util::normalizeHostName(host_name, secure);
  if (!host) {
    return std::unexpected(host.error());
  }

  spdlog::debug("Created anonymous data context for {}", host->url);
  return DataContext(std::move(*host), orDefaultTransport(std::move(transport)),
                     std::make_unique<AnonymousRequestStrategy>());
}

Result<DataContext> DataContext::createAuthenticated(std::string_view host_name,
                                                     model::Credentials credentials,
                                                     bool secure,
                                                     std::shared_ptr<net::HttpTransport> transport) {
  auto host = util::normalizeHostName(host_name, secure);
  if (!host) {
    return std::unexpected(host.error());
  }

  if (host->secure && credentials.encryptHeaders()) {
    return makeErrorResult<DataContext>(
        ErrorCode::kInvalidOperation,
        "Encrypted headers cannot be used over a secure transport");
  }

  if (auto valid = credentials.validate(); !valid) {
    return makeErrorResult<DataContext>(ErrorCode::kInvalidArgument, valid.error().message());
  }

  transport = orDefaultTransport(std::move(transport));

  // The key is always fetched through a fresh anonymous context so that
  // the key request never needs the key itself.
  PublicKeySource key_source = [url = host->url, is_secure = host->secure, transport]()
      -> std::optional<model::PublicKeyResponse> {
    auto anonymous = DataContext::create(url, is_secure, transport);
    if (!anonymous) {
      spdlog::warn("Cannot create public key context for {}: {}", url, anonymous.error().message());
      return std::nullopt;
    }
    return anonymous->getPublicKey();
  };

  spdlog::debug("Created authenticated data context for {} as {}", host->url, credentials.describe());
  auto strategy = std::make_unique<AuthenticatedRequestStrategy>(std::move(credentials),
                                                                  std::move(key_source));
  return DataContext(std::move(*host), std::move(transport), std::move(strategy));
}

Result<net::Request> DataContext::buildRequest(const std::string& uri, model::QueryType type) const {
  return strategy_->buildRequest(uri, type);
}

Result<net::Request> DataContext::buildRequest(const std::string& uri, model::QueryType type,
                                               const std::string& body) const {
  return strategy_->buildRequest(uri, type, body);
}

std::optional<model::PublicKeyResponse> DataContext::getPublicKey() const {
  if (isAuthenticated()) {
    auto anonymous = create(host_.url, host_.secure, transport_);
    if (!anonymous) {
      return std::nullopt;
    }
    return anonymous->getPublicKey();
  }

  const model::ActionQuery query(PUBLIC_KEY_ACTION, model::ResponseFormat::kXml);
  auto response = getResponse<model::PublicKeyResponse>(query);
  if (!response || !response->validate()) {
    spdlog::warn("No usable public key returned by {}", host_.url);
    return std::nullopt;
  }
  return std::move(*response);
}

Exchange DataContext::dispatch(const net::Request& request) const {
  Exchange exchange;
  exchange.uri = request.url;

  spdlog::debug("{} {}", request.method, request.url);
  const auto start = std::chrono::steady_clock::now();
  const auto elapsed = [&start] {
    return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start);
  };

  try {
    auto result = transport_->send(request);
    exchange.elapsed = elapsed();

    if (result) {
      spdlog::debug("{} {} -> {} in {}ms", request.method, request.url, result->status_code,
                    exchange.elapsed.count());
      exchange.response = std::move(*result);
      return exchange;
    }

    auto& failure = result.error();
    exchange.outcome = failure.response ? model::ExchangeOutcome::kHttpError
                                        : model::ExchangeOutcome::kTransportError;
    exchange.response = std::move(failure.response);
    exchange.error = util::makeContextualError(
        failure.code, failure.message,
        SCAPI_REQUEST_ERROR_CONTEXT(request.url).push("DataContext::dispatch").push("HttpTransport::send"));
  } catch (const std::exception& e) {
    exchange.elapsed = elapsed();
    exchange.outcome = model::ExchangeOutcome::kUnexpectedError;
    exchange.error = util::makeContextualError(
        ErrorCode::kUnknownError, e.what(),
        SCAPI_REQUEST_ERROR_CONTEXT(request.url).push("DataContext::dispatch"));
  }
  return exchange;
}

void DataContext::recordOutcome(model::BaseResponse& response, const Exchange& exchange) {
  model::ResponseInfo info;
  info.uri = exchange.uri;
  info.response_time = exchange.elapsed;
  info.outcome = exchange.outcome;

  // Status from the HTTP response whenever one arrived, parse failures
  // included; 500 otherwise
  if (exchange.response) {
    response.status_code = exchange.response->status_code;
    response.status_description = exchange.response->status_description;
  } else {
    response.status_code = static_cast<int>(net::HttpStatusCode::INTERNAL_SERVER_ERROR);
    response.status_description = std::string(net::reasonPhrase(response.status_code));
  }

  if (exchange.error) {
    info.error_message = exchange.error->message();
    info.stack_trace = exchange.error->stackTrace();
    util::logContextualError(*exchange.error);
  }

  response.info = std::move(info);
}

void DataContext::recordBuildFailure(model::BaseResponse& response, const std::string& uri,
                                     const Error& error) {
  Exchange exchange;
  exchange.uri = uri;
  exchange.outcome = model::ExchangeOutcome::kUnexpectedError;
  exchange.error = util::makeContextualError(
      error.code(), error.message(),
      SCAPI_REQUEST_ERROR_CONTEXT(uri).push("DataContext::getResponse").push("RequestStrategy::buildRequest"));
  recordOutcome(response, exchange);
}

} // namespace scapi::data
