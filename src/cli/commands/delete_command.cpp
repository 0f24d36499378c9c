#include "scapi/cli/commands/delete_command.hpp"

namespace scapi::cli {

DeleteCommand::DeleteCommand(Application& app) : app_(app) {
}

void DeleteCommand::setupCommand(CLI::App* cmd) {
  cmd->add_option("target", target_, "Item path or {id}")->required();
}

Result<int> DeleteCommand::execute(const GlobalOptions& options) {
  (void)options;
  auto query = app_.newItemQuery(target_, model::QueryType::kDelete);

  auto response = app_.dataContext().getResponse<model::ItemResponse>(query);
  if (!response) {
    return std::unexpected(response.error());
  }
  return app_.report(*response);
}

} // namespace scapi::cli
