// core/repair.hpp - Per-player save file repair
#pragma once

#include "installation.hpp"
#include "json.hpp"
#include <filesystem>
#include <string>
#include <vector>

namespace fs = std::filesystem;

namespace uuidfix {

enum class RepairOutcome {
  Missing,            // category folder absent or empty
  Renamed,
  AlreadyNamed,
  UnexpectedFileKind, // latest file has the wrong extension, left alone
  RenameFailed,
};

std::string repair_outcome_to_string(RepairOutcome outcome);

struct CategoryResult {
  std::string category;
  RepairOutcome outcome = RepairOutcome::Missing;
  fs::path from;
  fs::path to;
  std::string message;
};

struct RepairReport {
  std::string save_name;
  fs::path save_path;
  std::string uuid;
  std::vector<CategoryResult> categories;

  size_t renamed() const;
  size_t skipped() const;
  size_t failed() const;
  size_t warnings() const;

  json::Value to_json() const;
};

// Renames the newest file of each category to <uuid>.<ext>. Destructive:
// no backup is taken and earlier categories are not rolled back when a later
// one fails. Throws FixError(NotFound) if the save folder is missing.
RepairReport fix_save(const SaveEntry &save, const std::string &uuid);

} // namespace uuidfix
