#pragma once

#include <cstddef>
#include <string>

#include "hrec/cli/application.hpp"
#include "hrec/common.hpp"

namespace hrec::cli {

/**
 * @brief Recently used values of a visit field, for autocompletion
 */
class HistoryCommand : public Command {
public:
  explicit HistoryCommand(Application& app);

  Result<int> execute(const GlobalOptions& options) override;
  std::string name() const override;
  std::string description() const override;
  void setupCommand(CLI::App* cmd) override;

private:
  Application& app_;

  std::string field_;
  std::string hospital_;
  std::size_t limit_ = 5;
};

} // namespace hrec::cli
