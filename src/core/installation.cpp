// core/installation.cpp - Minecraft installation layout implementation
#include "installation.hpp"
#include "../defs.hpp"
#include "../utils.hpp"
#include "error.hpp"
#include <algorithm>

namespace uuidfix {

template <typename Entry>
static void sort_by_name(std::vector<Entry> &entries) {
  std::sort(entries.begin(), entries.end(),
            [](const Entry &a, const Entry &b) { return a.name < b.name; });
}

SaveCollection::SaveCollection(const fs::path &path) : path_(path) {
  if (path_.filename() != SAVES_DIR_NAME) {
    throw FixError(ErrorKind::InvalidLayout,
                   "Not a valid saves folder: " + path_.string());
  }
}

bool SaveCollection::exists() const {
  std::error_code ec;
  return fs::is_directory(path_, ec);
}

std::vector<SaveEntry> SaveCollection::saves() const {
  std::vector<SaveEntry> result;

  if (!exists()) {
    LOG_WARN("Saves folder not found: " + path_.string());
    return result;
  }

  try {
    for (const auto &entry : fs::directory_iterator(path_)) {
      if (!entry.is_directory()) {
        continue;
      }
      result.push_back({entry.path().filename().string(), entry.path()});
    }
  } catch (const fs::filesystem_error &e) {
    LOG_ERROR("Failed to list saves in " + path_.string() + ": " + e.what());
  }

  sort_by_name(result);
  return result;
}

SaveCollection VersionEntry::saves() const {
  std::error_code ec;
  if (!fs::is_directory(path, ec)) {
    throw FixError(ErrorKind::NotFound,
                   "Version folder not found: " + path.string());
  }
  return SaveCollection(path / SAVES_DIR_NAME);
}

Installation::Installation(const fs::path &root) : root_(root) {
  std::error_code ec;
  if (root_.empty() || !fs::is_directory(root_, ec)) {
    throw FixError(ErrorKind::NotFound,
                   ".minecraft folder not found: " + root_.string());
  }
}

std::vector<VersionEntry> Installation::versions() const {
  std::vector<VersionEntry> result;
  fs::path versions_dir = root_ / VERSIONS_DIR_NAME;

  std::error_code ec;
  if (!fs::is_directory(versions_dir, ec)) {
    return result;
  }

  try {
    for (const auto &entry : fs::directory_iterator(versions_dir)) {
      if (!entry.is_directory()) {
        continue;
      }
      result.push_back({entry.path().filename().string(), entry.path()});
    }
  } catch (const fs::filesystem_error &e) {
    LOG_ERROR("Failed to list versions: " + std::string(e.what()));
  }

  sort_by_name(result);
  return result;
}

SaveCollection Installation::non_isolated_saves() const {
  return SaveCollection(root_ / SAVES_DIR_NAME);
}

std::string CollectionChoice::label() const {
  if (kind == CollectionKind::NonIsolated) {
    return "Shared saves (version isolation off)";
  }
  return version_name;
}

std::vector<CollectionChoice> enumerate_collections(const Installation &mc) {
  std::vector<CollectionChoice> choices;

  for (const auto &version : mc.versions()) {
    try {
      SaveCollection saves = version.saves();
      if (saves.exists()) {
        choices.push_back({CollectionKind::Isolated, version.name, saves});
      } else {
        LOG_DEBUG("Version " + version.name + " has no saves folder");
      }
    } catch (const FixError &e) {
      // Folder vanished between listing and inspection
      LOG_WARN(e.what());
    }
  }

  SaveCollection shared = mc.non_isolated_saves();
  if (shared.exists()) {
    choices.push_back({CollectionKind::NonIsolated, "", shared});
  }

  return choices;
}

CollectionChoice find_collection(const Installation &mc,
                                 const std::string &version_name) {
  if (version_name.empty()) {
    return {CollectionKind::NonIsolated, "", mc.non_isolated_saves()};
  }

  VersionEntry version{version_name,
                       mc.root() / VERSIONS_DIR_NAME / version_name};
  return {CollectionKind::Isolated, version_name, version.saves()};
}

} // namespace uuidfix
