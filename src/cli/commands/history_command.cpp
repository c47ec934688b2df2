#include "hrec/cli/commands/history_command.hpp"

#include <iostream>

#include <nlohmann/json.hpp>

namespace hrec::cli {

HistoryCommand::HistoryCommand(Application& app) : app_(app) {}

std::string HistoryCommand::name() const {
  return "history";
}

std::string HistoryCommand::description() const {
  return "Show recently used hospitals, departments, doctors or organ systems";
}

void HistoryCommand::setupCommand(CLI::App* cmd) {
  cmd->add_option("field", field_, "hospital, department, doctor or organ_system")->required();
  cmd->add_option("--hospital", hospital_, "Doctors seen at this hospital (field must be doctor)");
  cmd->add_option("-n,--limit", limit_, "Maximum number of values")
      ->check(CLI::PositiveNumber);
}

Result<int> HistoryCommand::execute(const GlobalOptions& options) {
  auto field = store::historyFieldFromString(field_);
  if (!field) {
    return std::unexpected(makeError(ErrorCode::kInvalidArgument,
                                     "Unknown history field: " + field_));
  }
  if (!hospital_.empty() && *field != store::HistoryField::kDoctor) {
    return std::unexpected(makeError(ErrorCode::kInvalidArgument,
                                     "--hospital only applies to the doctor field"));
  }

  auto repo = app_.openRepository();
  if (!repo.has_value()) {
    return std::unexpected(repo.error());
  }

  auto values = hospital_.empty() ? (*repo)->fieldHistory(*field, limit_)
                                  : (*repo)->doctorsByHospital(hospital_, limit_);
  if (!values.has_value()) {
    return std::unexpected(values.error());
  }

  if (options.json) {
    nlohmann::json output = {
      {"field", std::string(store::historyFieldToString(*field))},
      {"values", *values}
    };
    if (!hospital_.empty()) {
      output["hospital"] = hospital_;
    }
    std::cout << output.dump(2) << std::endl;
    return 0;
  }

  for (const auto& value : *values) {
    std::cout << value << std::endl;
  }
  return 0;
}

} // namespace hrec::cli
