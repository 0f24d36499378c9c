#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <vector>

#include "scapi/common.hpp"

namespace scapi::util {

// Error severity levels
enum class ErrorSeverity {
  kInfo,     // Informational messages
  kWarning,  // Recoverable issues
  kError,    // Serious errors that prevent operation
  kCritical  // Errors that leave the client unusable
};

// Error context for providing additional debugging information
struct ErrorContext {
  std::string uri;                // Request target, if any
  std::string operation;          // Operation being performed
  std::vector<std::string> stack; // Operation stack, outermost first
  std::chrono::system_clock::time_point timestamp;

  ErrorContext() : timestamp(std::chrono::system_clock::now()) {}

  ErrorContext& withUri(const std::string& target) {
    uri = target;
    return *this;
  }

  ErrorContext& withOperation(const std::string& op) {
    operation = op;
    return *this;
  }

  ErrorContext& push(const std::string& frame) {
    stack.push_back(frame);
    return *this;
  }
};

// Error with context and severity
class ContextualError {
public:
  ContextualError(ErrorCode code, std::string message, ErrorSeverity severity = ErrorSeverity::kError)
    : code_(code), message_(std::move(message)), severity_(severity) {}

  ContextualError(ErrorCode code, std::string message, ErrorContext context, ErrorSeverity severity = ErrorSeverity::kError)
    : code_(code), message_(std::move(message)), context_(std::move(context)), severity_(severity) {}

  ErrorCode code() const { return code_; }
  const std::string& message() const { return message_; }
  const std::optional<ErrorContext>& context() const { return context_; }
  ErrorSeverity severity() const { return severity_; }

  // Get full error description with context
  std::string fullDescription() const;

  // Operation stack rendered as "outer -> inner", empty without context
  std::string stackTrace() const;

  static ContextualError create(ErrorCode code, const std::string& message,
                                const ErrorContext& context, ErrorSeverity severity = ErrorSeverity::kError);

private:
  ErrorCode code_;
  std::string message_;
  std::optional<ErrorContext> context_;
  ErrorSeverity severity_;
};

// Formatting of errors for display
class ErrorHandler {
public:
  // Format error for the command line, as a single JSON object when
  // json_format is set
  static std::string formatUserError(const ContextualError& error, bool json_format = false);

private:
  ErrorHandler() = default;
};

// Convenience function for creating contextual errors
ContextualError makeContextualError(ErrorCode code, const std::string& message,
                                  const ErrorContext& context = {},
                                  ErrorSeverity severity = ErrorSeverity::kError);

// Error context for an operation against a request target
#define SCAPI_REQUEST_ERROR_CONTEXT(target) \
  ::scapi::util::ErrorContext{}.withUri(target).withOperation(__FUNCTION__)

} // namespace scapi::util
