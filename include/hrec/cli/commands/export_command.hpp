#pragma once

#include <string>
#include <vector>

#include "hrec/cli/application.hpp"
#include "hrec/common.hpp"
#include "hrec/core/visit_record.hpp"

namespace hrec::cli {

/**
 * @brief Export visits to JSON, optionally with copies of their attachments
 */
class ExportCommand : public Command {
public:
  explicit ExportCommand(Application& app);

  Result<int> execute(const GlobalOptions& options) override;
  std::string name() const override;
  std::string description() const override;
  void setupCommand(CLI::App* cmd) override;

private:
  Application& app_;

  std::vector<core::VisitRecordId> visit_ids_;
  std::string output_path_;
  std::string attachments_dir_;
};

} // namespace hrec::cli
