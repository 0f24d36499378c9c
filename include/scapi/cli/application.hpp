#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <CLI/CLI.hpp>

#include "scapi/common.hpp"
#include "scapi/config/config.hpp"
#include "scapi/data/data_context.hpp"
#include "scapi/model/item_query.hpp"
#include "scapi/model/item_response.hpp"
#include "scapi/net/http_transport.hpp"

namespace scapi::cli {

/**
 * @brief Global CLI options that are available to all commands
 */
struct GlobalOptions {
  bool json = false;           // --json: Output in JSON format
  int verbose = 0;             // --verbose: Verbose output level (can be repeated: -v, -vv)
  bool quiet = false;          // --quiet: Suppress normal output
  std::string config_file;     // --config: Path to config file
  std::string host;            // --host: Override configured host
  bool secure = false;         // --secure: Force https
};

/**
 * @brief Base class for all CLI commands
 */
class Command {
public:
  virtual ~Command() = default;

  /**
   * @brief Execute the command with the given arguments
   * @param options Global CLI options
   * @return Result with exit code (0 = success)
   */
  virtual Result<int> execute(const GlobalOptions& options) = 0;

  virtual std::string name() const = 0;
  virtual std::string description() const = 0;

  /**
   * @brief Setup command-specific CLI options (optional override)
   */
  virtual void setupCommand(CLI::App* cmd) { (void)cmd; }
};

/**
 * @brief Main CLI application
 */
class Application {
public:
  /**
   * @param transport Transport used by the data context; libcurl when null
   */
  explicit Application(std::shared_ptr<net::HttpTransport> transport = nullptr);
  ~Application() = default;

  /**
   * @brief Run the application with command line arguments
   * @return Exit code (0 = success)
   */
  int run(int argc, char* argv[]);

  // Loads configuration, sets up logging and creates the data context
  Result<void> initialize();

  const GlobalOptions& globalOptions() const;
  const config::Config& config() const;
  data::DataContext& dataContext();

  // New item query addressing `target` (an id in braces, or a path), with
  // the configured database, language and API version applied
  model::ItemQuery newItemQuery(const std::string& target, model::QueryType type) const;

  // Print a response and map its status onto an exit code
  int report(const model::ItemResponse& response) const;

private:
  void setupGlobalOptions();
  void setupCommands();
  void setupHelp();

  void registerCommand(std::unique_ptr<Command> command);

  CLI::App app_;
  GlobalOptions global_options_;

  std::shared_ptr<net::HttpTransport> transport_;
  config::Config config_;
  std::optional<data::DataContext> context_;

  std::vector<std::unique_ptr<Command>> commands_;
};

// Split "name=value" pairs given with --field
Result<model::FieldMap> parseFieldAssignments(const std::vector<std::string>& assignments);

} // namespace scapi::cli
