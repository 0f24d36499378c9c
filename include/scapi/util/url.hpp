#pragma once

#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace scapi::util {

// Ordered name/value pairs; order is preserved on the wire
using QueryParameters = std::vector<std::pair<std::string, std::string>>;

// Percent-encode a single URL component
std::string urlEncode(std::string_view value);

// "a=1&b=two%20words"; pairs with an empty name are skipped
std::string toQueryString(const QueryParameters& parameters);

// Append "?query" or "&query" to a URI; no-op for an empty query
std::string appendQuery(const std::string& uri, const std::string& query);

} // namespace scapi::util
