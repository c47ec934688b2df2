#include "hrec/cli/application.hpp"

#include <filesystem>
#include <iostream>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "hrec/di/service_configuration.hpp"
#include "hrec/util/logging.hpp"

// Command includes
#include "hrec/cli/commands/user_command.hpp"
#include "hrec/cli/commands/visit_command.hpp"
#include "hrec/cli/commands/attach_command.hpp"
#include "hrec/cli/commands/export_command.hpp"
#include "hrec/cli/commands/history_command.hpp"
#include "hrec/cli/commands/doctor_command.hpp"
#include "hrec/cli/commands/config_command.hpp"

namespace hrec::cli {

namespace {

constexpr const char* kAppDescription = "Personal health record organizer";

}  // namespace

Application::Application()
    : app_("hrec", kAppDescription)
    , services_initialized_(false) {

  app_.set_version_flag("--version", hrec::getVersion().toString());
  app_.set_help_all_flag("--help-all", "Expand all help");
  app_.require_subcommand(1);

  setupGlobalOptions();
  setupCommands();
  setupHelp();
}

Application::Application(std::shared_ptr<hrec::di::IServiceContainer> container)
    : app_("hrec", kAppDescription)
    , service_container_(std::move(container))
    , services_initialized_(false) {

  app_.set_version_flag("--version", hrec::getVersion().toString());
  app_.set_help_all_flag("--help-all", "Expand all help");
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

void Application::setupGlobalOptions() {
  app_.add_flag("--json", global_options_.json, "Output in JSON format");
  app_.add_flag("-v,--verbose", global_options_.verbose, "Show log output on stderr");
  app_.add_flag("-q,--quiet", global_options_.quiet, "Suppress normal output");
  app_.add_option("--config", global_options_.config_file, "Path to config file");
  app_.add_option("-u,--user", global_options_.user, "User whose records to use");
}

void Application::setupCommands() {
  // Users and records
  registerCommand(std::make_unique<UserCommand>(*this));
  registerCommand(std::make_unique<VisitCommand>(*this));
  registerCommand(std::make_unique<AttachCommand>(*this));

  // Export and lookups
  registerCommand(std::make_unique<ExportCommand>(*this));
  registerCommand(std::make_unique<HistoryCommand>(*this));

  // Maintenance
  registerCommand(std::make_unique<DoctorCommand>(*this));
  registerCommand(std::make_unique<ConfigCommand>(*this));
}

void Application::setupHelp() {
  app_.get_formatter()->column_width(40);

  app_.footer(R"(Examples:
  hrec user create alice
  hrec --user alice visit add --date 2024-03-01 --hospital "City Hospital" --doctor Wang
  hrec --user alice attach add 1 ~/scans/blood_test.pdf
  hrec --user alice visit list --since 2024-01-01
  hrec --user alice export --output records.json --attachments-dir ./attachments
  hrec --user alice doctor --fix

For more information on a specific command, run:
  hrec <command> --help)");
}

void Application::registerCommand(std::unique_ptr<Command> command) {
  auto* cmd_ptr = command.get();

  auto* sub = app_.add_subcommand(cmd_ptr->name(), cmd_ptr->description());
  cmd_ptr->setupCommand(sub);

  sub->callback([this, cmd_ptr]() {
    auto init_result = initializeServices();
    if (!init_result.has_value()) {
      printError(init_result.error());
      throw CLI::RuntimeError(1);
    }

    Result<int> result;
    try {
      result = cmd_ptr->execute(global_options_);
    } catch (const hrec::di::ServiceResolutionException& e) {
      result = std::unexpected(makeError(ErrorCode::kInvalidState, e.what()));
    }

    if (!result.has_value()) {
      spdlog::info("Command '{}' failed: [{}] {}", cmd_ptr->name(),
                   errorCodeToString(result.error().code()), result.error().message());
      printError(result.error());
      throw CLI::RuntimeError(1);
    }
    if (*result != 0) {
      throw CLI::RuntimeError(*result);
    }
  });

  commands_.push_back(std::move(command));
}

Result<void> Application::initializeServices() {
  if (services_initialized_) {
    return {};
  }

  if (!service_container_) {
    std::optional<std::filesystem::path> config_path;
    if (!global_options_.config_file.empty()) {
      config_path = global_options_.config_file;
    }

    auto container_result = hrec::di::ServiceContainerFactory::createProductionContainer(config_path);
    if (!container_result.has_value()) {
      return std::unexpected(container_result.error());
    }
    service_container_ = *container_result;
  }

  auto logging_result = configureLogging();
  if (!logging_result.has_value()) {
    return logging_result;
  }

  services_initialized_ = true;
  return {};
}

Result<void> Application::configureLogging() {
  auto config = service_container_->tryResolve<hrec::config::Config>();
  if (!config.has_value()) {
    return std::unexpected(config.error());
  }

  hrec::util::LogSettings settings;
  settings.file = (*config)->logging.file;
  settings.level = global_options_.verbose > 0 ? std::string("debug") : (*config)->logging.level;
  settings.max_size_mb = (*config)->logging.max_size_mb;
  settings.max_files = (*config)->logging.max_files;
  settings.verbose_console = global_options_.verbose > 0;

  return hrec::util::initializeLogging(settings);
}

void Application::printError(const Error& error) const {
  if (global_options_.json) {
    nlohmann::json output = {
      {"error", error.message()},
      {"code", std::string(errorCodeToString(error.code()))}
    };
    std::cout << output.dump(2) << std::endl;
  } else {
    std::cerr << "Error: " << error.message() << std::endl;
  }
}

// Getters for services (to be used by commands)
hrec::config::Config& Application::config() {
  if (!services_initialized_) {
    throw std::runtime_error("Services not initialized");
  }
  return *service_container_->resolve<hrec::config::Config>();
}

hrec::store::AttachmentStore& Application::attachmentStore() {
  if (!services_initialized_) {
    throw std::runtime_error("Services not initialized");
  }
  return *service_container_->resolve<hrec::store::AttachmentStore>();
}

hrec::store::UserDirectory& Application::userDirectory() {
  if (!services_initialized_) {
    throw std::runtime_error("Services not initialized");
  }
  return *service_container_->resolve<hrec::store::UserDirectory>();
}

Result<std::string> Application::selectedUser() {
  if (!global_options_.user.empty()) {
    return global_options_.user;
  }

  const auto& default_user = config().default_user;
  if (!default_user.empty()) {
    return default_user;
  }

  return std::unexpected(makeError(ErrorCode::kInvalidArgument,
                                   "No user selected; pass --user or set defaults.user"));
}

Result<std::unique_ptr<hrec::store::RecordRepository>> Application::openRepository() {
  auto user = selectedUser();
  if (!user.has_value()) {
    return std::unexpected(user.error());
  }
  return userDirectory().open(*user);
}

} // namespace hrec::cli
