#include "scapi/util/host_name.hpp"

#include <arpa/inet.h>

#include <algorithm>
#include <cctype>
#include <regex>

namespace scapi::util {

namespace {

constexpr std::string_view kHttpPrefix = "http://";
constexpr std::string_view kHttpsPrefix = "https://";
constexpr size_t kMaxDnsLength = 255;
constexpr long kMaxPort = 65535;

bool startsWithNoCase(std::string_view value, std::string_view prefix) {
  if (value.size() < prefix.size()) {
    return false;
  }
  return std::equal(prefix.begin(), prefix.end(), value.begin(),
                    [](char a, char b) {
                      return std::tolower(static_cast<unsigned char>(a)) ==
                             std::tolower(static_cast<unsigned char>(b));
                    });
}

bool isValidPort(std::string_view port) {
  if (port.empty() || port.size() > 5) {
    return false;
  }
  if (!std::all_of(port.begin(), port.end(),
                   [](unsigned char c) { return std::isdigit(c) != 0; })) {
    return false;
  }
  long value = std::stol(std::string(port));
  return value > 0 && value <= kMaxPort;
}

bool isIPv4(const std::string& host) {
  in_addr addr{};
  return inet_pton(AF_INET, host.c_str(), &addr) == 1;
}

bool isIPv6(const std::string& host) {
  in6_addr addr{};
  return inet_pton(AF_INET6, host.c_str(), &addr) == 1;
}

bool isDnsName(const std::string& host) {
  if (host.empty() || host.size() > kMaxDnsLength) {
    return false;
  }

  static const std::regex label(R"([A-Za-z0-9_]([A-Za-z0-9_\-]{0,61}[A-Za-z0-9_])?)");

  size_t start = 0;
  while (start <= host.size()) {
    size_t dot = host.find('.', start);
    std::string part = host.substr(start, dot == std::string::npos ? std::string::npos : dot - start);
    if (!std::regex_match(part, label)) {
      return false;
    }
    if (dot == std::string::npos) {
      break;
    }
    start = dot + 1;
  }
  return true;
}

bool looksNumeric(const std::string& host) {
  return std::all_of(host.begin(), host.end(),
                     [](unsigned char c) { return std::isdigit(c) != 0 || c == '.'; });
}

}  // namespace

std::string stripScheme(std::string_view host_name) {
  if (startsWithNoCase(host_name, kHttpsPrefix)) {
    host_name.remove_prefix(kHttpsPrefix.size());
  } else if (startsWithNoCase(host_name, kHttpPrefix)) {
    host_name.remove_prefix(kHttpPrefix.size());
  }

  while (!host_name.empty() && host_name.back() == '/') {
    host_name.remove_suffix(1);
  }

  return std::string(host_name);
}

Result<HostNameType> checkHostName(std::string_view authority) {
  const std::string value(authority);
  auto invalid = [&value]() {
    return makeErrorResult<HostNameType>(
        ErrorCode::kInvalidArgument,
        "hostName cannot be null, empty or an un-recognized type: '" + value + "'");
  };

  if (value.empty()) {
    return invalid();
  }

  // Bracketed IPv6 literal, optionally with a port
  if (value.front() == '[') {
    auto close = value.find(']');
    if (close == std::string::npos || !isIPv6(value.substr(1, close - 1))) {
      return invalid();
    }
    std::string rest = value.substr(close + 1);
    if (rest.empty()) {
      return HostNameType::kIPv6;
    }
    if (rest.front() != ':' || !isValidPort(std::string_view(rest).substr(1))) {
      return invalid();
    }
    return HostNameType::kIPv6;
  }

  // Bare IPv6 literal cannot carry a port
  if (std::count(value.begin(), value.end(), ':') > 1) {
    if (!isIPv6(value)) {
      return invalid();
    }
    return HostNameType::kIPv6;
  }

  std::string host = value;
  auto colon = value.find(':');
  if (colon != std::string::npos) {
    host = value.substr(0, colon);
    if (!isValidPort(std::string_view(value).substr(colon + 1))) {
      return invalid();
    }
  }

  if (looksNumeric(host)) {
    if (!isIPv4(host)) {
      return invalid();
    }
    return HostNameType::kIPv4;
  }

  if (!isDnsName(host)) {
    return invalid();
  }
  return HostNameType::kDns;
}

Result<HostName> normalizeHostName(std::string_view host_name, bool secure) {
  const bool https_requested = startsWithNoCase(host_name, kHttpsPrefix);
  std::string authority = stripScheme(host_name);

  auto type = checkHostName(authority);
  if (!type.has_value()) {
    return std::unexpected(type.error());
  }

  HostName result;
  result.secure = secure || https_requested;
  result.type = *type;
  result.url = std::string(result.secure ? kHttpsPrefix : kHttpPrefix) + authority;
  result.authority = std::move(authority);
  return result;
}

} // namespace scapi::util
