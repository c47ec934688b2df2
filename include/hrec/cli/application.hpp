#pragma once

#include <memory>
#include <string>
#include <vector>

#include <CLI/CLI.hpp>

#include "hrec/common.hpp"
#include "hrec/config/config.hpp"
#include "hrec/di/service_container.hpp"
#include "hrec/store/attachment_store.hpp"
#include "hrec/store/record_repository.hpp"
#include "hrec/store/user_directory.hpp"

namespace hrec::cli {

/**
 * @brief Global CLI options that are available to all commands
 */
struct GlobalOptions {
  bool json = false;           // --json: Output in JSON format
  int verbose = 0;             // --verbose: Mirror log output to stderr
  bool quiet = false;          // --quiet: Suppress normal output
  std::string config_file;     // --config: Path to config file
  std::string user;            // --user: Record owner, defaults.user when empty
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
  Application();
  explicit Application(std::shared_ptr<hrec::di::IServiceContainer> container);
  ~Application() = default;

  /**
   * @brief Run the application with command line arguments
   * @return Exit code (0 = success)
   */
  int run(int argc, char* argv[]);

  // Service accessors for commands
  hrec::config::Config& config();
  hrec::store::AttachmentStore& attachmentStore();
  hrec::store::UserDirectory& userDirectory();

  /**
   * @brief Name of the user the command acts on (--user, then defaults.user)
   */
  Result<std::string> selectedUser();

  /**
   * @brief Open the record repository of the selected user
   */
  Result<std::unique_ptr<hrec::store::RecordRepository>> openRepository();

  /**
   * @brief Print a failure as "Error: ..." or as a JSON object
   */
  void printError(const Error& error) const;

private:
  // Setup methods
  void setupGlobalOptions();
  void setupCommands();
  void setupHelp();

  // Command registration
  void registerCommand(std::unique_ptr<Command> command);

  // Initialization
  Result<void> initializeServices();
  Result<void> configureLogging();

  // CLI framework
  CLI::App app_;
  GlobalOptions global_options_;

  // Dependency injection container
  std::shared_ptr<hrec::di::IServiceContainer> service_container_;
  bool services_initialized_;

  // Registered commands
  std::vector<std::unique_ptr<Command>> commands_;
};

} // namespace hrec::cli
