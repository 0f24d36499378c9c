#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

#include "scapi/common.hpp"

namespace scapi::config {

// Logging configuration
struct LoggingConfig {
  std::string level = "info";     // trace, debug, info, warn, error, critical, off
  std::filesystem::path file;     // Rotating log file, console only when empty
};

// Credentials used for authenticated contexts
struct CredentialsConfig {
  std::string username;
  std::string password;           // Can be "env:VARNAME" reference
  bool encrypt_headers = false;   // RSA-encrypt the credential headers
};

// Defaults applied to item queries
struct ItemApiConfig {
  int version = 1;
  std::string database;
  std::string language;
};

// Configuration for the scapi client
class Config {
public:
  Config() = default;

  // Target host, with or without scheme
  std::string host;
  bool secure = false;

  std::optional<CredentialsConfig> credentials;
  ItemApiConfig item_api;
  LoggingConfig logging;

  // Load configuration from file
  Result<void> load(const std::filesystem::path& config_path);

  // Load configuration from TOML text
  Result<void> parse(std::string_view content);

  // Validate configuration
  Result<void> validate() const;

  // Username and password both set
  bool hasCredentials() const;

  // Get default configuration file path ($XDG_CONFIG_HOME/scapi/config.toml)
  static std::filesystem::path defaultConfigPath();

  // Environment variable resolution
  std::string resolveEnvVar(const std::string& value) const;

  const std::filesystem::path& path() const { return config_path_; }

private:
  std::filesystem::path config_path_;
};

} // namespace scapi::config
