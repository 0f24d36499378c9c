#pragma once

#include <string>
#include <CLI/CLI.hpp>
#include "scapi/cli/application.hpp"

namespace scapi::cli {

class GetCommand : public Command {
public:
  explicit GetCommand(Application& app);

  Result<int> execute(const GlobalOptions& options) override;
  std::string name() const override { return "get"; }
  std::string description() const override { return "Read an item by path or id"; }
  void setupCommand(CLI::App* cmd) override;

private:
  Application& app_;
  std::string target_;
  std::string scope_;
  std::string payload_;
  bool xml_ = false;
};

} // namespace scapi::cli
