#include "scapi/config/config.hpp"

#include <array>
#include <cstdlib>
#include <fstream>
#include <sstream>

#include <toml++/toml.hpp>

#include "scapi/util/security.hpp"

namespace scapi::config {

namespace {

constexpr std::array<std::string_view, 7> kLogLevels = {
  "trace", "debug", "info", "warn", "error", "critical", "off"
};

std::string getEnvVar(const char* name, const std::string& default_value) {
  const char* value = std::getenv(name);
  return (value && *value) ? std::string(value) : default_value;
}

}  // namespace

Result<void> Config::load(const std::filesystem::path& config_path) {
  config_path_ = config_path;

  if (!std::filesystem::exists(config_path)) {
    return std::unexpected(makeError(ErrorCode::kFileNotFound,
                                     "Config file not found: " + config_path.string()));
  }

  std::ifstream file(config_path, std::ios::binary);
  if (!file) {
    return std::unexpected(makeError(ErrorCode::kFileReadError,
                                     "Cannot read config file: " + config_path.string()));
  }
  std::stringstream buffer;
  buffer << file.rdbuf();
  return parse(buffer.str());
}

Result<void> Config::parse(std::string_view content) {
  try {
    auto config_data = toml::parse(content);

    if (auto value = config_data["host"].value<std::string>()) {
      host = *value;
    }
    if (auto value = config_data["secure"].value<bool>()) {
      secure = *value;
    }

    // Credentials
    if (auto creds_table = config_data["credentials"].as_table()) {
      CredentialsConfig creds;
      if (auto value = (*creds_table)["username"].value<std::string>()) {
        creds.username = *value;
      }
      if (auto value = (*creds_table)["password"].value<std::string>()) {
        creds.password = resolveEnvVar(*value);
      }
      if (auto value = (*creds_table)["encrypt_headers"].value<bool>()) {
        creds.encrypt_headers = *value;
      }
      credentials = std::move(creds);
    }

    // Item API defaults
    if (auto api_table = config_data["item_api"].as_table()) {
      if (auto value = (*api_table)["version"].value<int>()) {
        item_api.version = *value;
      }
      if (auto value = (*api_table)["database"].value<std::string>()) {
        item_api.database = *value;
      }
      if (auto value = (*api_table)["language"].value<std::string>()) {
        item_api.language = *value;
      }
    }

    // Logging
    if (auto log_table = config_data["logging"].as_table()) {
      if (auto value = (*log_table)["level"].value<std::string>()) {
        logging.level = *value;
      }
      if (auto value = (*log_table)["file"].value<std::string>()) {
        logging.file = *value;
      }
    }

    return {};

  } catch (const toml::parse_error& e) {
    return std::unexpected(makeError(ErrorCode::kConfigError,
                                     "TOML parse error: " + std::string(e.what())));
  }
}

Result<void> Config::validate() const {
  if (util::Security::isBlank(host)) {
    return std::unexpected(makeError(ErrorCode::kConfigError,
                                     "No host configured"));
  }

  if (item_api.version < 1) {
    return std::unexpected(makeError(ErrorCode::kConfigError,
                                     "Invalid item_api.version: " + std::to_string(item_api.version)));
  }

  bool known_level = false;
  for (auto level : kLogLevels) {
    if (logging.level == level) {
      known_level = true;
      break;
    }
  }
  if (!known_level) {
    return std::unexpected(makeError(ErrorCode::kConfigError,
                                     "Invalid logging.level: " + logging.level));
  }

  if (credentials) {
    if (util::Security::isBlank(credentials->username) ||
        util::Security::isBlank(credentials->password)) {
      return std::unexpected(makeError(ErrorCode::kConfigError,
                                       "Credentials need both a username and a password"));
    }
    if (secure && credentials->encrypt_headers) {
      return std::unexpected(makeError(ErrorCode::kConfigError,
                                       "encrypt_headers cannot be combined with secure = true"));
    }
  }

  return {};
}

bool Config::hasCredentials() const {
  return credentials.has_value() &&
         !util::Security::isBlank(credentials->username) &&
         !util::Security::isBlank(credentials->password);
}

std::filesystem::path Config::defaultConfigPath() {
  std::string home = getEnvVar("HOME", "/tmp");
  std::filesystem::path config_home = getEnvVar("XDG_CONFIG_HOME", home + "/.config");
  return config_home / "scapi" / "config.toml";
}

std::string Config::resolveEnvVar(const std::string& value) const {
  if (value.substr(0, 4) == "env:") {
    std::string var_name = value.substr(4);
    const char* env_value = std::getenv(var_name.c_str());
    return env_value ? std::string(env_value) : "";
  }
  return value;
}

} // namespace scapi::config
