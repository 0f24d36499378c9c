#include "scapi/cli/commands/get_command.hpp"

namespace scapi::cli {

GetCommand::GetCommand(Application& app) : app_(app) {
}

void GetCommand::setupCommand(CLI::App* cmd) {
  cmd->add_option("target", target_, "Item path or {id}")->required();
  cmd->add_option("--scope", scope_, "Scope, e.g. s|c|p (self, children, parent)");
  cmd->add_option("--payload", payload_, "Field payload")
      ->check(CLI::IsMember({"min", "content", "full"}));
  cmd->add_flag("--xml", xml_, "Request an XML response");
}

Result<int> GetCommand::execute(const GlobalOptions& options) {
  (void)options;
  auto query = app_.newItemQuery(target_, model::QueryType::kRead);
  if (!scope_.empty()) {
    query.withScope(scope_);
  }
  if (payload_ == "min") {
    query.withPayload(model::Payload::kMin);
  } else if (payload_ == "content") {
    query.withPayload(model::Payload::kContent);
  } else if (payload_ == "full") {
    query.withPayload(model::Payload::kFull);
  }
  if (xml_) {
    query.withFormat(model::ResponseFormat::kXml);
  }

  auto response = app_.dataContext().getResponse<model::ItemResponse>(query);
  if (!response) {
    return std::unexpected(response.error());
  }
  return app_.report(*response);
}

} // namespace scapi::cli
