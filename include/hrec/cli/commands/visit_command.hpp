#pragma once

#include <optional>
#include <string>

#include "hrec/cli/application.hpp"
#include "hrec/common.hpp"
#include "hrec/core/visit_record.hpp"

namespace hrec::cli {

/**
 * @brief Visit record command
 *
 * Supports subcommands:
 * - add: Record a new visit
 * - edit: Change fields of an existing visit
 * - show: Display one visit with its attachments
 * - list: List visits, newest first
 * - delete: Delete a visit together with its attachments
 */
class VisitCommand : public Command {
public:
  explicit VisitCommand(Application& app);

  Result<int> execute(const GlobalOptions& options) override;
  std::string name() const override;
  std::string description() const override;
  void setupCommand(CLI::App* cmd) override;

private:
  Application& app_;

  enum class SubCommand {
    Add,
    Edit,
    Show,
    List,
    Delete
  };

  SubCommand sub_command_ = SubCommand::List;

  // Field values; unset fields are left alone by edit
  struct FieldOptions {
    std::optional<std::string> date;
    std::optional<std::string> hospital;
    std::optional<std::string> department;
    std::optional<std::string> doctor;
    std::optional<std::string> organ_system;
    std::optional<std::string> reason;
    std::optional<std::string> diagnosis;
    std::optional<std::string> medication;
    std::optional<std::string> remark;
  };

  FieldOptions add_fields_;
  FieldOptions edit_fields_;
  core::VisitRecordId visit_id_ = 0;

  // list filters
  std::string since_;
  std::string until_;
  std::string hospital_filter_;
  std::size_t limit_ = 0;

  static void addFieldOptions(CLI::App* cmd, FieldOptions& fields);
  static void applyFields(const FieldOptions& fields, core::VisitRecord& visit);

  Result<int> executeAdd(const GlobalOptions& options);
  Result<int> executeEdit(const GlobalOptions& options);
  Result<int> executeShow(const GlobalOptions& options);
  Result<int> executeList(const GlobalOptions& options);
  Result<int> executeDelete(const GlobalOptions& options);

  void printVisit(const core::VisitRecord& visit,
                  const std::vector<core::AttachmentRecord>& attachments) const;
};

} // namespace hrec::cli
