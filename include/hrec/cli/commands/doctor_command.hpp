#pragma once

#include <string>

#include "hrec/cli/application.hpp"
#include "hrec/common.hpp"

namespace hrec::cli {

/**
 * @brief Check that attachment rows and archive files agree
 *
 * Reports managed files without a row and rows whose file is gone. With
 * --fix, files without a row are deleted.
 */
class DoctorCommand : public Command {
public:
  explicit DoctorCommand(Application& app);

  Result<int> execute(const GlobalOptions& options) override;
  std::string name() const override;
  std::string description() const override;
  void setupCommand(CLI::App* cmd) override;

private:
  Application& app_;
  bool fix_ = false;
};

} // namespace hrec::cli
