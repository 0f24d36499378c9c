#pragma once

#include <cstddef>
#include <string>

namespace scapi::util {

/**
 * @brief Utilities for secure handling of sensitive data
 */
class Security {
public:
  /**
   * @brief Mask sensitive strings for logging/debug output
   * @param sensitive The sensitive string to mask
   * @param reveal_chars Number of characters to reveal at start/end (default: 2)
   * @return Masked string showing only first/last few characters
   */
  static std::string maskSensitive(const std::string& sensitive, size_t reveal_chars = 2);

  /**
   * @brief Check whether a string is empty or whitespace only
   */
  static bool isBlank(const std::string& value);

  /**
   * @brief Securely zero out memory containing sensitive data
   * @param data Pointer to sensitive data
   * @param size Size of data in bytes
   */
  static void secureZero(void* data, size_t size);

  /**
   * @brief Clear sensitive string contents securely
   * @param sensitive String containing sensitive data
   */
  static void clearSensitiveString(std::string& sensitive);

private:
  Security() = default;
};

/**
 * @brief RAII wrapper for sensitive strings that auto-clears on destruction
 */
class SensitiveString {
public:
  SensitiveString() = default;
  explicit SensitiveString(std::string value);
  SensitiveString(const SensitiveString&) = delete;
  SensitiveString& operator=(const SensitiveString&) = delete;
  SensitiveString(SensitiveString&& other) noexcept;
  SensitiveString& operator=(SensitiveString&& other) noexcept;
  ~SensitiveString();

  const std::string& value() const { return value_; }
  std::string masked() const { return Security::maskSensitive(value_); }
  bool empty() const { return value_.empty(); }
  size_t size() const { return value_.size(); }

  void clear();

private:
  std::string value_;
};

} // namespace scapi::util
