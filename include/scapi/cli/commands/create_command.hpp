#pragma once

#include <string>
#include <vector>
#include <CLI/CLI.hpp>
#include "scapi/cli/application.hpp"

namespace scapi::cli {

class CreateCommand : public Command {
public:
  explicit CreateCommand(Application& app);

  Result<int> execute(const GlobalOptions& options) override;
  std::string name() const override { return "create"; }
  std::string description() const override { return "Create a child item"; }
  void setupCommand(CLI::App* cmd) override;

private:
  Application& app_;
  std::string parent_;
  std::string item_name_;
  std::string template_;
  std::vector<std::string> fields_;
};

} // namespace scapi::cli
