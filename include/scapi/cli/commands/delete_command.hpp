#pragma once

#include <string>
#include <CLI/CLI.hpp>
#include "scapi/cli/application.hpp"

namespace scapi::cli {

class DeleteCommand : public Command {
public:
  explicit DeleteCommand(Application& app);

  Result<int> execute(const GlobalOptions& options) override;
  std::string name() const override { return "delete"; }
  std::string description() const override { return "Delete an item"; }
  void setupCommand(CLI::App* cmd) override;

private:
  Application& app_;
  std::string target_;
};

} // namespace scapi::cli
