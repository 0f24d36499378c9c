#include "scapi/cli/application.hpp"

#include <filesystem>
#include <iostream>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "scapi/util/error_handler.hpp"
#include "scapi/util/logging.hpp"

// Command includes
#include "scapi/cli/commands/create_command.hpp"
#include "scapi/cli/commands/delete_command.hpp"
#include "scapi/cli/commands/get_command.hpp"
#include "scapi/cli/commands/pubkey_command.hpp"
#include "scapi/cli/commands/update_command.hpp"

namespace scapi::cli {

Application::Application(std::shared_ptr<net::HttpTransport> transport)
    : app_("scapi", "Command line client for the item web API")
    , transport_(std::move(transport)) {

  app_.set_version_flag("--version", scapi::getVersion().toString());
  app_.require_subcommand(1);

  setupGlobalOptions();
  setupCommands();
  setupHelp();
}

int Application::run(int argc, char* argv[]) {
  try {
    app_.parse(argc, argv);
  } catch (const CLI::ParseError& e) {
    return app_.exit(e);
  } catch (const std::exception& e) {
    std::cerr << "Error: " << e.what() << std::endl;
    return 1;
  }

  // The command has already been executed by CLI11's callback system
  return 0;
}

Result<void> Application::initialize() {
  if (context_) {
    return {};
  }

  std::filesystem::path config_path = global_options_.config_file.empty()
      ? config::Config::defaultConfigPath()
      : std::filesystem::path(global_options_.config_file);

  // A missing default config is fine when --host is given
  if (!global_options_.config_file.empty() || std::filesystem::exists(config_path)) {
    auto loaded = config_.load(config_path);
    if (!loaded) {
      return std::unexpected(loaded.error());
    }
  }

  // Command line overrides
  if (!global_options_.host.empty()) {
    config_.host = global_options_.host;
  }
  if (global_options_.secure) {
    config_.secure = true;
  }
  if (global_options_.verbose > 0) {
    config_.logging.level = global_options_.verbose > 1 ? "trace" : "debug";
  } else if (global_options_.quiet) {
    config_.logging.level = "error";
  }

  util::initializeLogging(config_.logging);

  auto valid = config_.validate();
  if (!valid) {
    return std::unexpected(valid.error());
  }

  auto context = config_.hasCredentials()
      ? data::DataContext::createAuthenticated(
            config_.host,
            model::Credentials(config_.credentials->username, config_.credentials->password,
                               config_.credentials->encrypt_headers),
            config_.secure, transport_)
      : data::DataContext::create(config_.host, config_.secure, transport_);
  if (!context) {
    return std::unexpected(context.error());
  }

  spdlog::debug("Using {} context for {}", context->isAuthenticated() ? "authenticated" : "anonymous",
                context->hostName());
  context_.emplace(std::move(*context));
  return {};
}

void Application::setupGlobalOptions() {
  app_.add_flag("--json", global_options_.json, "Output in JSON format");
  app_.add_flag("-v,--verbose", global_options_.verbose, "Verbose output");
  app_.add_flag("-q,--quiet", global_options_.quiet, "Suppress normal output");
  app_.add_option("--config", global_options_.config_file, "Path to config file");
  app_.add_option("--host", global_options_.host, "Override the configured host");
  app_.add_flag("--secure", global_options_.secure, "Use https");
}

void Application::setupCommands() {
  registerCommand(std::make_unique<GetCommand>(*this));
  registerCommand(std::make_unique<CreateCommand>(*this));
  registerCommand(std::make_unique<UpdateCommand>(*this));
  registerCommand(std::make_unique<DeleteCommand>(*this));
  registerCommand(std::make_unique<PubkeyCommand>(*this));
}

void Application::setupHelp() {
  app_.get_formatter()->column_width(40);

  app_.footer(R"(Examples:
  scapi --host cms.example.com get /sitecore/content/Home
  scapi get "{110D559F-DEA5-42EA-9C1C-8A5DF7E70EF9}" --json
  scapi create /sitecore/content/Home --name News --template "Sample/Sample Item"
  scapi update /sitecore/content/Home/News --field Title=Latest
  scapi delete /sitecore/content/Home/News
  scapi pubkey

For more information on a specific command, run:
  scapi <command> --help)");
}

void Application::registerCommand(std::unique_ptr<Command> command) {
  auto* cmd_ptr = command.get();

  // Create CLI11 subcommand
  auto* sub = app_.add_subcommand(cmd_ptr->name(), cmd_ptr->description());

  // Let the command setup its specific options
  cmd_ptr->setupCommand(sub);

  // Set callback to execute the command
  sub->callback([this, cmd_ptr]() {
    auto fail = [this, cmd_ptr](const Error& error) {
      auto contextual = util::makeContextualError(
          error.code(), error.message(), util::ErrorContext{}.withOperation(cmd_ptr->name()));
      std::cout << util::ErrorHandler::formatUserError(contextual, global_options_.json) << "\n";
      throw CLI::RuntimeError(1);
    };

    auto init_result = initialize();
    if (!init_result.has_value()) {
      fail(init_result.error());
    }

    auto result = cmd_ptr->execute(global_options_);
    if (!result.has_value()) {
      fail(result.error());
    }
    if (*result != 0) {
      throw CLI::RuntimeError(*result);
    }
  });

  commands_.push_back(std::move(command));
}

const GlobalOptions& Application::globalOptions() const {
  return global_options_;
}

const config::Config& Application::config() const {
  return config_;
}

data::DataContext& Application::dataContext() {
  if (!context_) {
    throw std::runtime_error("Data context not initialized");
  }
  return *context_;
}

model::ItemQuery Application::newItemQuery(const std::string& target, model::QueryType type) const {
  auto query = (!target.empty() && target.front() == '{')
      ? model::ItemQuery::byId(target, type)
      : model::ItemQuery::byPath(target, type);

  query.withApiVersion(config_.item_api.version);
  if (!config_.item_api.database.empty()) {
    query.withDatabase(config_.item_api.database);
  }
  if (!config_.item_api.language.empty()) {
    query.withLanguage(config_.item_api.language);
  }
  return query;
}

int Application::report(const model::ItemResponse& response) const {
  if (global_options_.json) {
    nlohmann::json out = response;
    std::cout << out.dump(2) << std::endl;
  } else if (!global_options_.quiet) {
    std::cout << response.status_code << " " << response.status_description << std::endl;
    if (!response.server_error.empty()) {
      std::cout << "Server error: " << response.server_error << std::endl;
    }
    if (!response.errorMessage().empty()) {
      std::cout << "Error: " << response.errorMessage() << std::endl;
    }
    for (const auto& item : response.items) {
      std::cout << item.id << "  " << item.path << "  [" << item.template_name << "]" << std::endl;
      if (global_options_.verbose > 0) {
        for (const auto& field : item.fields) {
          std::cout << "    " << field.name << " = " << field.value << std::endl;
        }
      }
    }
    if (response.succeeded()) {
      std::cout << response.result_count << " of " << response.total_count << " item(s)" << std::endl;
    }
  }
  return response.succeeded() ? 0 : 1;
}

Result<model::FieldMap> parseFieldAssignments(const std::vector<std::string>& assignments) {
  model::FieldMap fields;
  for (const auto& assignment : assignments) {
    auto pos = assignment.find('=');
    if (pos == std::string::npos || pos == 0) {
      return makeErrorResult<model::FieldMap>(ErrorCode::kInvalidArgument,
                                              "Expected name=value, got: " + assignment);
    }
    fields.emplace_back(assignment.substr(0, pos), assignment.substr(pos + 1));
  }
  return fields;
}

} // namespace scapi::cli
