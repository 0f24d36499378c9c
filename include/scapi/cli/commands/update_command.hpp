#pragma once

#include <string>
#include <vector>
#include <CLI/CLI.hpp>
#include "scapi/cli/application.hpp"

namespace scapi::cli {

class UpdateCommand : public Command {
public:
  explicit UpdateCommand(Application& app);

  Result<int> execute(const GlobalOptions& options) override;
  std::string name() const override { return "update"; }
  std::string description() const override { return "Update fields of an item"; }
  void setupCommand(CLI::App* cmd) override;

private:
  Application& app_;
  std::string target_;
  std::vector<std::string> fields_;
};

} // namespace scapi::cli
