#include "scapi/util/error_handler.hpp"

#include <sstream>
#include <nlohmann/json.hpp>

namespace scapi::util {

std::string ContextualError::fullDescription() const {
  std::ostringstream oss;
  oss << errorCodeToString(code_) << ": " << message_;

  if (context_) {
    if (!context_->operation.empty()) {
      oss << " (during " << context_->operation << ")";
    }
    if (!context_->uri.empty()) {
      oss << " [uri: " << context_->uri << "]";
    }
    if (!context_->stack.empty()) {
      oss << " [stack: " << stackTrace() << "]";
    }
  }

  return oss.str();
}

std::string ContextualError::stackTrace() const {
  if (!context_ || context_->stack.empty()) {
    return {};
  }

  std::ostringstream oss;
  for (size_t i = 0; i < context_->stack.size(); ++i) {
    if (i > 0) oss << " -> ";
    oss << context_->stack[i];
  }
  return oss.str();
}

ContextualError ContextualError::create(ErrorCode code, const std::string& message,
                                       const ErrorContext& context, ErrorSeverity severity) {
  return ContextualError(code, message, context, severity);
}

namespace {

const char* suggestionFor(ErrorCode code) {
  switch (code) {
    case ErrorCode::kNetworkError:
      return "Check that the host is reachable and the scheme is correct";
    case ErrorCode::kEncryptionError:
      return "Check that the server exposes the getpublickey action";
    case ErrorCode::kConfigError:
    case ErrorCode::kFileNotFound:
      return "Run with --config pointing at a valid config.toml";
    default:
      return nullptr;
  }
}

}  // namespace

std::string ErrorHandler::formatUserError(const ContextualError& error, bool json_format) {
  const char* suggestion = suggestionFor(error.code());

  if (json_format) {
    nlohmann::json out;
    out["error"] = error.message();
    out["code"] = static_cast<int>(error.code());
    out["kind"] = std::string(errorCodeToString(error.code()));
    if (error.context()) {
      const auto& ctx = *error.context();
      if (!ctx.operation.empty()) {
        out["operation"] = ctx.operation;
      }
      if (!ctx.uri.empty()) {
        out["uri"] = ctx.uri;
      }
      if (!ctx.stack.empty()) {
        out["stack"] = ctx.stack;
      }
    }
    if (suggestion) {
      out["suggestion"] = suggestion;
    }
    return out.dump();
  }

  std::ostringstream oss;
  oss << "Error: " << error.message();
  if (error.context()) {
    const auto& ctx = *error.context();
    if (!ctx.uri.empty()) {
      oss << "\n  Uri: " << ctx.uri;
    }
    if (!ctx.operation.empty()) {
      oss << "\n  Command: " << ctx.operation;
    }
  }
  if (suggestion) {
    oss << "\n  Suggestion: " << suggestion;
  }
  return oss.str();
}

ContextualError makeContextualError(ErrorCode code, const std::string& message,
                                  const ErrorContext& context, ErrorSeverity severity) {
  return ContextualError::create(code, message, context, severity);
}

} // namespace scapi::util
