#include "scapi/cli/commands/create_command.hpp"

namespace scapi::cli {

CreateCommand::CreateCommand(Application& app) : app_(app) {
}

void CreateCommand::setupCommand(CLI::App* cmd) {
  cmd->add_option("parent", parent_, "Parent item path or {id}")->required();
  cmd->add_option("--name", item_name_, "Name of the new item")->required();
  cmd->add_option("--template", template_, "Template path or {id}")->required();
  cmd->add_option("--field", fields_, "Initial field value as name=value (repeatable)");
}

Result<int> CreateCommand::execute(const GlobalOptions& options) {
  (void)options;
  auto fields = parseFieldAssignments(fields_);
  if (!fields) {
    return std::unexpected(fields.error());
  }

  auto query = app_.newItemQuery(parent_, model::QueryType::kCreate);
  query.withName(item_name_).withTemplate(template_);
  for (auto& [field_name, value] : *fields) {
    query.withField(field_name, value);
  }

  auto response = app_.dataContext().getResponse<model::ItemResponse>(query);
  if (!response) {
    return std::unexpected(response.error());
  }
  return app_.report(*response);
}

} // namespace scapi::cli
