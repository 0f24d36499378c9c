#include "scapi/util/security.hpp"

#include <algorithm>
#include <cctype>

namespace scapi::util {

std::string Security::maskSensitive(const std::string& sensitive, size_t reveal_chars) {
  if (sensitive.empty()) {
    return "[empty]";
  }

  if (sensitive.length() <= reveal_chars * 2) {
    // If string is too short, just show asterisks
    return std::string(std::min(sensitive.length(), size_t(8)), '*');
  }

  std::string masked;
  masked.reserve(sensitive.length());

  masked.append(sensitive.substr(0, reveal_chars));

  size_t middle_length = sensitive.length() - (reveal_chars * 2);
  masked.append(std::string(std::min(middle_length, size_t(12)), '*'));

  masked.append(sensitive.substr(sensitive.length() - reveal_chars));

  return masked;
}

bool Security::isBlank(const std::string& value) {
  return std::all_of(value.begin(), value.end(),
                     [](unsigned char c) { return std::isspace(c) != 0; });
}

void Security::secureZero(void* data, size_t size) {
  if (!data || size == 0) {
    return;
  }

  // Use volatile to prevent compiler optimization
  volatile unsigned char* ptr = static_cast<volatile unsigned char*>(data);
  for (size_t i = 0; i < size; ++i) {
    ptr[i] = 0;
  }

  // Memory barrier to prevent reordering
  __asm__ __volatile__("" : : "r"(ptr) : "memory");
}

void Security::clearSensitiveString(std::string& sensitive) {
  if (!sensitive.empty()) {
    secureZero(sensitive.data(), sensitive.size());
    sensitive.clear();
    sensitive.shrink_to_fit();
  }
}

// SensitiveString implementation

SensitiveString::SensitiveString(std::string value) : value_(std::move(value)) {}

SensitiveString::SensitiveString(SensitiveString&& other) noexcept : value_(std::move(other.value_)) {
  other.clear();
}

SensitiveString& SensitiveString::operator=(SensitiveString&& other) noexcept {
  if (this != &other) {
    clear();
    value_ = std::move(other.value_);
    other.clear();
  }
  return *this;
}

SensitiveString::~SensitiveString() {
  clear();
}

void SensitiveString::clear() {
  Security::clearSensitiveString(value_);
}

} // namespace scapi::util
