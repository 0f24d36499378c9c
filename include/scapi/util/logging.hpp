#pragma once

#include <string>

#include "scapi/util/error_handler.hpp"

namespace scapi::config {
struct LoggingConfig;
}

namespace scapi::util {

// Install the scapi logger as spdlog's default logger.
// Safe to call more than once; later calls replace the sinks.
void initializeLogging(const config::LoggingConfig& config);

// Log a contextual error at the level matching its severity
void logContextualError(const ContextualError& error);

} // namespace scapi::util
