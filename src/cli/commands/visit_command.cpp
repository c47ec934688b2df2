#include "hrec/cli/commands/visit_command.hpp"

#include <iomanip>
#include <iostream>

#include <nlohmann/json.hpp>

#include "hrec/import_export/exporter.hpp"
#include "hrec/util/time.hpp"

namespace hrec::cli {

VisitCommand::VisitCommand(Application& app) : app_(app) {}

Result<int> VisitCommand::execute(const GlobalOptions& options) {
  switch (sub_command_) {
    case SubCommand::Add:
      return executeAdd(options);
    case SubCommand::Edit:
      return executeEdit(options);
    case SubCommand::Show:
      return executeShow(options);
    case SubCommand::List:
      return executeList(options);
    case SubCommand::Delete:
      return executeDelete(options);
  }
  return std::unexpected(makeError(ErrorCode::kInvalidArgument, "Invalid subcommand"));
}

std::string VisitCommand::name() const {
  return "visit";
}

std::string VisitCommand::description() const {
  return "Record and browse clinic visits";
}

void VisitCommand::addFieldOptions(CLI::App* cmd, FieldOptions& fields) {
  cmd->add_option("--date", fields.date, "Visit date (YYYY-MM-DD)");
  cmd->add_option("--hospital", fields.hospital, "Hospital");
  cmd->add_option("--department", fields.department, "Department");
  cmd->add_option("--doctor", fields.doctor, "Doctor");
  cmd->add_option("--organ-system", fields.organ_system, "Organ system");
  cmd->add_option("--reason", fields.reason, "Reason for the visit");
  cmd->add_option("--diagnosis", fields.diagnosis, "Diagnosis");
  cmd->add_option("--medication", fields.medication, "Prescribed medication");
  cmd->add_option("--remark", fields.remark, "Free-form remark");
}

void VisitCommand::applyFields(const FieldOptions& fields, core::VisitRecord& visit) {
  auto apply = [](const std::optional<std::string>& value, std::string& target) {
    if (value) {
      target = *value;
    }
  };

  apply(fields.date, visit.date);
  apply(fields.hospital, visit.hospital);
  apply(fields.department, visit.department);
  apply(fields.doctor, visit.doctor);
  apply(fields.organ_system, visit.organ_system);
  apply(fields.reason, visit.reason);
  apply(fields.diagnosis, visit.diagnosis);
  apply(fields.medication, visit.medication);
  apply(fields.remark, visit.remark);
}

void VisitCommand::setupCommand(CLI::App* cmd) {
  auto add_cmd = cmd->add_subcommand("add", "Record a new visit");
  addFieldOptions(add_cmd, add_fields_);
  add_cmd->callback([this]() { sub_command_ = SubCommand::Add; });

  auto edit_cmd = cmd->add_subcommand("edit", "Edit fields of a visit");
  edit_cmd->add_option("id", visit_id_, "Visit record ID")->required();
  addFieldOptions(edit_cmd, edit_fields_);
  edit_cmd->callback([this]() { sub_command_ = SubCommand::Edit; });

  auto show_cmd = cmd->add_subcommand("show", "Show a visit and its attachments");
  show_cmd->add_option("id", visit_id_, "Visit record ID")->required();
  show_cmd->callback([this]() { sub_command_ = SubCommand::Show; });

  auto list_cmd = cmd->add_subcommand("list", "List visits, newest first");
  list_cmd->add_option("--since", since_, "Only visits on or after this date");
  list_cmd->add_option("--until", until_, "Only visits on or before this date");
  list_cmd->add_option("--hospital", hospital_filter_, "Only visits at this hospital");
  list_cmd->add_option("--limit", limit_, "Maximum number of visits");
  list_cmd->callback([this]() { sub_command_ = SubCommand::List; });

  auto delete_cmd = cmd->add_subcommand("delete", "Delete a visit and its attachments");
  delete_cmd->add_option("id", visit_id_, "Visit record ID")->required();
  delete_cmd->callback([this]() { sub_command_ = SubCommand::Delete; });

  cmd->require_subcommand(1, 1);
}

Result<int> VisitCommand::executeAdd(const GlobalOptions& options) {
  auto repo = app_.openRepository();
  if (!repo.has_value()) {
    return std::unexpected(repo.error());
  }

  core::VisitRecord visit;
  visit.date = util::Time::today();
  applyFields(add_fields_, visit);

  auto created = (*repo)->createVisit(visit);
  if (!created.has_value()) {
    return std::unexpected(created.error());
  }

  if (options.json) {
    import_export::RecordExporter exporter;
    std::cout << exporter.visitToJson(*created, {}).dump(2) << std::endl;
  } else if (!options.quiet) {
    std::cout << "Created visit " << created->id << " on " << created->date << std::endl;
  }
  return 0;
}

Result<int> VisitCommand::executeEdit(const GlobalOptions& options) {
  auto repo = app_.openRepository();
  if (!repo.has_value()) {
    return std::unexpected(repo.error());
  }

  auto visit = (*repo)->getVisit(visit_id_);
  if (!visit.has_value()) {
    return std::unexpected(visit.error());
  }

  applyFields(edit_fields_, *visit);

  auto updated = (*repo)->updateVisit(*visit);
  if (!updated.has_value()) {
    return std::unexpected(updated.error());
  }

  if (options.json) {
    auto attachments = (*repo)->listAttachments(updated->id);
    if (!attachments.has_value()) {
      return std::unexpected(attachments.error());
    }
    import_export::RecordExporter exporter;
    std::cout << exporter.visitToJson(*updated, *attachments).dump(2) << std::endl;
  } else if (!options.quiet) {
    std::cout << "Updated visit " << updated->id << std::endl;
  }
  return 0;
}

Result<int> VisitCommand::executeShow(const GlobalOptions& options) {
  auto repo = app_.openRepository();
  if (!repo.has_value()) {
    return std::unexpected(repo.error());
  }

  auto visit = (*repo)->getVisit(visit_id_);
  if (!visit.has_value()) {
    return std::unexpected(visit.error());
  }

  auto attachments = (*repo)->listAttachments(visit_id_);
  if (!attachments.has_value()) {
    return std::unexpected(attachments.error());
  }

  if (options.json) {
    import_export::RecordExporter exporter;
    std::cout << exporter.visitToJson(*visit, *attachments).dump(2) << std::endl;
  } else {
    printVisit(*visit, *attachments);
  }
  return 0;
}

Result<int> VisitCommand::executeList(const GlobalOptions& options) {
  auto repo = app_.openRepository();
  if (!repo.has_value()) {
    return std::unexpected(repo.error());
  }

  store::VisitFilter filter;
  if (!since_.empty()) {
    filter.since = since_;
  }
  if (!until_.empty()) {
    filter.until = until_;
  }
  if (!hospital_filter_.empty()) {
    filter.hospital = hospital_filter_;
  }
  if (limit_ > 0) {
    filter.limit = limit_;
  }

  auto visits = (*repo)->listVisits(filter);
  if (!visits.has_value()) {
    return std::unexpected(visits.error());
  }

  if (options.json) {
    import_export::RecordExporter exporter;
    nlohmann::json output = nlohmann::json::array();
    for (const auto& visit : *visits) {
      auto attachments = (*repo)->listAttachments(visit.id);
      if (!attachments.has_value()) {
        return std::unexpected(attachments.error());
      }
      output.push_back(exporter.visitToJson(visit, *attachments));
    }
    std::cout << output.dump(2) << std::endl;
    return 0;
  }

  if (visits->empty()) {
    if (!options.quiet) {
      std::cout << "No visits found." << std::endl;
    }
    return 0;
  }

  std::cout << std::left
            << std::setw(6) << "ID"
            << std::setw(12) << "DATE"
            << std::setw(24) << "HOSPITAL"
            << std::setw(16) << "DEPARTMENT"
            << "DIAGNOSIS" << std::endl;
  for (const auto& visit : *visits) {
    std::cout << std::left
              << std::setw(6) << visit.id
              << std::setw(12) << visit.date
              << std::setw(24) << visit.hospital
              << std::setw(16) << visit.department
              << visit.diagnosis << std::endl;
  }
  return 0;
}

Result<int> VisitCommand::executeDelete(const GlobalOptions& options) {
  auto repo = app_.openRepository();
  if (!repo.has_value()) {
    return std::unexpected(repo.error());
  }

  auto result = (*repo)->deleteVisit(visit_id_);
  if (!result.has_value()) {
    return std::unexpected(result.error());
  }

  if (options.json) {
    nlohmann::json output = {
      {"success", true},
      {"id", visit_id_}
    };
    std::cout << output.dump(2) << std::endl;
  } else if (!options.quiet) {
    std::cout << "Deleted visit " << visit_id_ << std::endl;
  }
  return 0;
}

void VisitCommand::printVisit(const core::VisitRecord& visit,
                              const std::vector<core::AttachmentRecord>& attachments) const {
  auto field = [](const char* label, const std::string& value) {
    if (!value.empty()) {
      std::cout << std::left << std::setw(14) << label << value << std::endl;
    }
  };

  std::cout << std::left << std::setw(14) << "ID:" << visit.id << std::endl;
  field("Date:", visit.date);
  field("Hospital:", visit.hospital);
  field("Department:", visit.department);
  field("Doctor:", visit.doctor);
  field("Organ system:", visit.organ_system);
  field("Reason:", visit.reason);
  field("Diagnosis:", visit.diagnosis);
  field("Medication:", visit.medication);
  field("Remark:", visit.remark);
  field("Created:", visit.created_at);
  field("Updated:", visit.updated_at);

  if (!attachments.empty()) {
    std::cout << "Attachments:" << std::endl;
    for (const auto& attachment : attachments) {
      std::cout << "  [" << attachment.id << "] " << attachment.displayName() << std::endl;
    }
  }
}

} // namespace hrec::cli
