#pragma once

#include <string>
#include <CLI/CLI.hpp>
#include "scapi/cli/application.hpp"

namespace scapi::cli {

class PubkeyCommand : public Command {
public:
  explicit PubkeyCommand(Application& app);

  Result<int> execute(const GlobalOptions& options) override;
  std::string name() const override { return "pubkey"; }
  std::string description() const override { return "Show the server's public key"; }

private:
  Application& app_;
};

} // namespace scapi::cli
