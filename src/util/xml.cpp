#include "scapi/util/xml.hpp"

#include <libxml/parser.h>
#include <libxml/tree.h>
#include <libxml/xmlerror.h>

#include <algorithm>
#include <cctype>

namespace scapi::util {

namespace {

struct XmlCharDeleter {
  void operator()(xmlChar* value) const { xmlFree(value); }
};

using XmlString = std::unique_ptr<xmlChar, XmlCharDeleter>;

std::string toString(const xmlChar* value) {
  return value ? std::string(reinterpret_cast<const char*>(value)) : std::string{};
}

bool equalsNoCase(std::string_view a, std::string_view b) {
  return a.size() == b.size() &&
         std::equal(a.begin(), a.end(), b.begin(), [](char x, char y) {
           return std::tolower(static_cast<unsigned char>(x)) ==
                  std::tolower(static_cast<unsigned char>(y));
         });
}

}  // namespace

std::string XmlNode::name() const {
  return node_ ? toString(node_->name) : std::string{};
}

std::string XmlNode::text() const {
  if (!node_) {
    return {};
  }
  XmlString content(xmlNodeGetContent(node_));
  return toString(content.get());
}

std::optional<std::string> XmlNode::attribute(std::string_view name) const {
  if (!node_) {
    return std::nullopt;
  }
  const std::string key(name);
  XmlString value(xmlGetProp(node_, reinterpret_cast<const xmlChar*>(key.c_str())));
  if (!value) {
    return std::nullopt;
  }
  return toString(value.get());
}

XmlNode XmlNode::child(std::string_view name) const {
  if (!node_) {
    return XmlNode{};
  }
  for (xmlNode* cur = node_->children; cur != nullptr; cur = cur->next) {
    if (cur->type == XML_ELEMENT_NODE && equalsNoCase(toString(cur->name), name)) {
      return XmlNode(cur);
    }
  }
  return XmlNode{};
}

std::string XmlNode::childText(std::string_view name, const std::string& fallback) const {
  XmlNode node = child(name);
  return node ? node.text() : fallback;
}

std::vector<XmlNode> XmlNode::children(std::string_view name) const {
  std::vector<XmlNode> result;
  if (!node_) {
    return result;
  }
  for (xmlNode* cur = node_->children; cur != nullptr; cur = cur->next) {
    if (cur->type != XML_ELEMENT_NODE) {
      continue;
    }
    if (name.empty() || equalsNoCase(toString(cur->name), name)) {
      result.emplace_back(cur);
    }
  }
  return result;
}

void XmlDocument::Deleter::operator()(_xmlDoc* doc) const {
  if (doc) {
    xmlFreeDoc(doc);
  }
}

Result<XmlDocument> XmlDocument::parse(std::string_view content) {
  constexpr int kOptions = XML_PARSE_NONET | XML_PARSE_NOERROR | XML_PARSE_NOWARNING | XML_PARSE_NOBLANKS;

  xmlDoc* doc = xmlReadMemory(content.data(), static_cast<int>(content.size()),
                              "response.xml", nullptr, kOptions);
  if (doc == nullptr) {
    std::string message = "Failed to parse XML response";
    if (const auto* error = xmlGetLastError(); error != nullptr && error->message != nullptr) {
      std::string detail(error->message);
      while (!detail.empty() && std::isspace(static_cast<unsigned char>(detail.back()))) {
        detail.pop_back();
      }
      message += ": " + detail;
    }
    return makeErrorResult<XmlDocument>(ErrorCode::kParseError, message);
  }

  XmlDocument document(doc);
  if (!document.root()) {
    return makeErrorResult<XmlDocument>(ErrorCode::kParseError, "XML response has no root element");
  }
  return document;
}

XmlNode XmlDocument::root() const {
  return XmlNode(doc_ ? xmlDocGetRootElement(doc_.get()) : nullptr);
}

} // namespace scapi::util
