#include "scapi/model/item_response.hpp"

namespace scapi::model {

namespace {

std::string stringMember(const nlohmann::json& j, const char* key) {
  if (j.contains(key) && j[key].is_string()) {
    return j[key].get<std::string>();
  }
  return {};
}

int intMember(const nlohmann::json& j, const char* key, int fallback = 0) {
  if (j.contains(key) && j[key].is_number_integer()) {
    return j[key].get<int>();
  }
  return fallback;
}

int parseInt(const std::string& text, int fallback = 0) {
  if (text.empty()) {
    return fallback;
  }
  try {
    return std::stoi(text);
  } catch (const std::exception&) {
    return fallback;
  }
}

Item itemFromXml(const util::XmlNode& node) {
  Item item;
  item.id = node.childText("ID");
  item.display_name = node.childText("DisplayName");
  item.name = node.childText("Name", item.display_name);
  item.path = node.childText("Path");
  item.template_id = node.childText("TemplateId");
  item.template_name = node.childText("TemplateName");
  item.database = node.childText("Database");
  item.language = node.childText("Language");
  item.version = parseInt(node.childText("Version"));
  item.has_children = node.childText("HasChildren") == "true";

  for (const auto& field_node : node.child("Fields").children("Field")) {
    ItemField field;
    field.id = field_node.attribute("id").value_or(field_node.childText("ID"));
    field.name = field_node.childText("Name");
    field.type = field_node.childText("Type");
    field.value = field_node.childText("Value");
    item.fields.push_back(std::move(field));
  }
  return item;
}

}  // namespace

std::string Item::fieldValue(const std::string& field_name) const {
  for (const auto& field : fields) {
    if (field.name == field_name) {
      return field.value;
    }
  }
  return {};
}

void from_json(const nlohmann::json& j, ItemField& field) {
  field.name = stringMember(j, "Name");
  field.type = stringMember(j, "Type");
  field.value = stringMember(j, "Value");
}

void from_json(const nlohmann::json& j, Item& item) {
  item.id = stringMember(j, "ID");
  item.display_name = stringMember(j, "DisplayName");
  item.name = j.contains("Name") ? stringMember(j, "Name") : item.display_name;
  item.path = stringMember(j, "Path");
  item.template_id = stringMember(j, "TemplateId");
  item.template_name = stringMember(j, "TemplateName");
  item.database = stringMember(j, "Database");
  item.language = stringMember(j, "Language");
  item.version = intMember(j, "Version");
  item.has_children = j.contains("HasChildren") && j["HasChildren"].is_boolean() &&
                      j["HasChildren"].get<bool>();

  // Fields are keyed by field id
  if (j.contains("Fields") && j["Fields"].is_object()) {
    for (const auto& [id, value] : j["Fields"].items()) {
      ItemField field = value.get<ItemField>();
      field.id = id;
      item.fields.push_back(std::move(field));
    }
  }
}

void from_json(const nlohmann::json& j, ItemResponse& response) {
  readBaseJson(j, response);
  if (!j.is_object()) {
    return;
  }

  if (j.contains("error") && j["error"].is_object()) {
    response.server_error = stringMember(j["error"], "message");
  }

  if (j.contains("result") && j["result"].is_object()) {
    const auto& result = j["result"];
    response.total_count = intMember(result, "totalCount");
    response.result_count = intMember(result, "resultCount");
    if (result.contains("items") && result["items"].is_array()) {
      response.items = result["items"].get<std::vector<Item>>();
    }
  }
}

void to_json(nlohmann::json& j, const ItemField& field) {
  j = nlohmann::json{{"id", field.id}, {"name", field.name}, {"type", field.type}, {"value", field.value}};
}

void to_json(nlohmann::json& j, const Item& item) {
  j = nlohmann::json{
      {"id", item.id},
      {"name", item.name},
      {"display_name", item.display_name},
      {"path", item.path},
      {"template_id", item.template_id},
      {"template_name", item.template_name},
      {"database", item.database},
      {"language", item.language},
      {"version", item.version},
      {"has_children", item.has_children},
      {"fields", item.fields},
  };
}

void to_json(nlohmann::json& j, const ItemResponse& response) {
  to_json(j, static_cast<const BaseResponse&>(response));
  j["total_count"] = response.total_count;
  j["result_count"] = response.result_count;
  j["items"] = response.items;
  if (!response.server_error.empty()) {
    j["server_error"] = response.server_error;
  }
}

void fromXml(const util::XmlNode& node, ItemResponse& response) {
  readBaseXml(node, response);

  if (auto error = node.child("error")) {
    response.server_error = error.childText("message");
  }

  auto result = node.child("result");
  if (!result) {
    return;
  }
  response.total_count = parseInt(result.childText("totalCount"));
  response.result_count = parseInt(result.childText("resultCount"));
  for (const auto& item_node : result.child("items").children("item")) {
    response.items.push_back(itemFromXml(item_node));
  }
}

} // namespace scapi::model
