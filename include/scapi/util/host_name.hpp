#pragma once

#include <string>
#include <string_view>

#include "scapi/common.hpp"

namespace scapi::util {

// Kind of host a bare host string parsed as
enum class HostNameType {
  kDns,
  kIPv4,
  kIPv6
};

// A validated, scheme-prefixed host such as "https://cms.example.com:8443"
struct HostName {
  std::string url;       // scheme + authority, no trailing slash
  std::string authority; // host[:port] without scheme
  HostNameType type = HostNameType::kDns;
  bool secure = false;
};

// Strip any leading http:// or https:// and trailing slashes
std::string stripScheme(std::string_view host_name);

// Classify a bare host[:port]; kInvalidArgument when it is not a host name
Result<HostNameType> checkHostName(std::string_view authority);

// Validate and normalize a host name. The result is https when `secure` is
// set or the input already carries an https:// prefix, http otherwise.
Result<HostName> normalizeHostName(std::string_view host_name, bool secure);

} // namespace scapi::util
