#include "scapi/cli/commands/pubkey_command.hpp"

#include <iostream>
#include <nlohmann/json.hpp>

namespace scapi::cli {

PubkeyCommand::PubkeyCommand(Application& app) : app_(app) {
}

Result<int> PubkeyCommand::execute(const GlobalOptions& options) {
  auto key = app_.dataContext().getPublicKey();
  if (!key) {
    return makeErrorResult<int>(ErrorCode::kHttpError,
                                "No public key available from " + app_.dataContext().hostName());
  }

  if (options.json) {
    nlohmann::json out = *key;
    std::cout << out.dump(2) << std::endl;
  } else if (!options.quiet) {
    std::cout << "Modulus:  " << key->modulus << std::endl;
    std::cout << "Exponent: " << key->exponent << std::endl;
  }
  return 0;
}

} // namespace scapi::cli
