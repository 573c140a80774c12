// core/repair.cpp - Per-player save file repair implementation
#include "repair.hpp"
#include "../defs.hpp"
#include "../utils.hpp"
#include "error.hpp"
#include <algorithm>

namespace uuidfix {

std::string repair_outcome_to_string(RepairOutcome outcome) {
  switch (outcome) {
  case RepairOutcome::Missing:
    return "missing";
  case RepairOutcome::Renamed:
    return "renamed";
  case RepairOutcome::AlreadyNamed:
    return "already_named";
  case RepairOutcome::UnexpectedFileKind:
    return "unexpected_file_kind";
  case RepairOutcome::RenameFailed:
    return "rename_failed";
  }
  return "unknown";
}

static size_t count_outcomes(const std::vector<CategoryResult> &categories,
                             std::initializer_list<RepairOutcome> outcomes) {
  return static_cast<size_t>(std::count_if(
      categories.begin(), categories.end(), [&](const CategoryResult &r) {
        return std::find(outcomes.begin(), outcomes.end(), r.outcome) !=
               outcomes.end();
      }));
}

size_t RepairReport::renamed() const {
  return count_outcomes(categories, {RepairOutcome::Renamed});
}

size_t RepairReport::skipped() const {
  return count_outcomes(categories, {RepairOutcome::AlreadyNamed,
                                     RepairOutcome::UnexpectedFileKind});
}

size_t RepairReport::failed() const {
  return count_outcomes(categories, {RepairOutcome::RenameFailed});
}

size_t RepairReport::warnings() const {
  return count_outcomes(categories, {RepairOutcome::UnexpectedFileKind});
}

json::Value RepairReport::to_json() const {
  json::Value root = json::Value::object();
  root["save"] = json::Value(save_name);
  root["path"] = json::Value(save_path.string());
  root["uuid"] = json::Value(uuid);

  json::Value list = json::Value::array();
  for (const auto &result : categories) {
    json::Value item = json::Value::object();
    item["category"] = json::Value(result.category);
    item["outcome"] = json::Value(repair_outcome_to_string(result.outcome));
    if (!result.from.empty())
      item["from"] = json::Value(result.from.string());
    if (!result.to.empty())
      item["to"] = json::Value(result.to.string());
    if (!result.message.empty())
      item["message"] = json::Value(result.message);
    list.push_back(item);
  }
  root["categories"] = list;

  root["renamed"] = json::Value(static_cast<double>(renamed()));
  root["skipped"] = json::Value(static_cast<double>(skipped()));
  root["failed"] = json::Value(static_cast<double>(failed()));
  return root;
}

static CategoryResult repair_category(const fs::path &save_path,
                                      const RepairCategory &category,
                                      const std::string &uuid) {
  CategoryResult result;
  result.category = category.name;

  auto latest = latest_modified(save_path / category.name);
  if (!latest) {
    LOG_DEBUG("Nothing to repair in " + std::string(category.name));
    return result;
  }
  result.from = *latest;

  if (latest->extension() != category.extension) {
    result.outcome = RepairOutcome::UnexpectedFileKind;
    result.message = "Save may contain a personal file, skipped";
    LOG_WARN("Save may contain a personal file, skipped (" +
             latest->string() + ")");
    return result;
  }

  if (latest->stem() == uuid) {
    result.outcome = RepairOutcome::AlreadyNamed;
    LOG_DEBUG(latest->string() + " is already named for " + uuid);
    return result;
  }

  fs::path target = latest->parent_path() / (uuid + category.extension);
  result.to = target;

  std::error_code ec;
  if (fs::exists(target, ec) || fs::is_symlink(target, ec)) {
    result.outcome = RepairOutcome::RenameFailed;
    result.message = "Target already exists: " + target.string();
    LOG_ERROR("Cannot rename " + latest->string() + " in " + category.name +
              ": " + result.message);
    return result;
  }

  fs::rename(*latest, target, ec);
  if (ec) {
    result.outcome = RepairOutcome::RenameFailed;
    result.message = ec.message();
    LOG_ERROR("Cannot rename " + latest->string() + " in " + category.name +
              ": " + ec.message());
    return result;
  }

  result.outcome = RepairOutcome::Renamed;
  LOG_INFO(latest->string() + " -> " + target.filename().string());
  return result;
}

RepairReport fix_save(const SaveEntry &save, const std::string &uuid) {
  std::error_code ec;
  if (!fs::is_directory(save.path, ec)) {
    throw FixError(ErrorKind::NotFound,
                   "Save folder not found: " + save.path.string());
  }

  LOG_INFO("Repairing save: " + save.path.string());

  RepairReport report;
  report.save_name = save.name;
  report.save_path = save.path;
  report.uuid = uuid;

  for (const auto &category : REPAIR_CATEGORIES) {
    report.categories.push_back(repair_category(save.path, category, uuid));
  }

  LOG_INFO("Repair finished: " + std::to_string(report.renamed()) +
           " renamed, " + std::to_string(report.skipped()) + " skipped, " +
           std::to_string(report.failed()) + " failed");
  return report;
}

} // namespace uuidfix
