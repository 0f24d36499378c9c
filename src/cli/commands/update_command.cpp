#include "scapi/cli/commands/update_command.hpp"

namespace scapi::cli {

UpdateCommand::UpdateCommand(Application& app) : app_(app) {
}

void UpdateCommand::setupCommand(CLI::App* cmd) {
  cmd->add_option("target", target_, "Item path or {id}")->required();
  cmd->add_option("--field", fields_, "Field value as name=value (repeatable)")->required();
}

Result<int> UpdateCommand::execute(const GlobalOptions& options) {
  (void)options;
  auto fields = parseFieldAssignments(fields_);
  if (!fields) {
    return std::unexpected(fields.error());
  }

  auto query = app_.newItemQuery(target_, model::QueryType::kUpdate);
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
