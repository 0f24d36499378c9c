#pragma once

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "scapi/common.hpp"

struct _xmlDoc;
struct _xmlNode;

namespace scapi::util {

// Non-owning view of an element in an XmlDocument. A default-constructed
// node is "missing": every accessor returns empty values.
class XmlNode {
public:
  XmlNode() = default;
  explicit XmlNode(_xmlNode* node) : node_(node) {}

  explicit operator bool() const { return node_ != nullptr; }

  // Local name, without namespace prefix
  std::string name() const;

  // Concatenated text content of the element and its descendants
  std::string text() const;

  // Attribute value, if present
  std::optional<std::string> attribute(std::string_view name) const;

  // First child element with the given local name (case-insensitive)
  XmlNode child(std::string_view name) const;

  // Text of the first matching child, or `fallback` when absent
  std::string childText(std::string_view name, const std::string& fallback = {}) const;

  // All child elements, or those matching `name` when given
  std::vector<XmlNode> children(std::string_view name = {}) const;

private:
  _xmlNode* node_ = nullptr;
};

// Owning wrapper around a parsed libxml2 document
class XmlDocument {
public:
  static Result<XmlDocument> parse(std::string_view content);

  XmlNode root() const;

private:
  struct Deleter {
    void operator()(_xmlDoc* doc) const;
  };

  explicit XmlDocument(_xmlDoc* doc) : doc_(doc) {}

  std::unique_ptr<_xmlDoc, Deleter> doc_;
};

} // namespace scapi::util
