// core/session.cpp - Interactive repair orchestration implementation
#include "session.hpp"
#include "../utils.hpp"
#include "error.hpp"

namespace uuidfix {

EvidenceContext make_evidence_context(const Config &config,
                                      const Installation &mc,
                                      const CollectionChoice &choice,
                                      const std::string &player_name) {
  EvidenceContext ctx;
  ctx.installation_root = mc.root();
  ctx.launcher_scripts = config.launcher_scripts;
  ctx.player_name = player_name;
  ctx.script_encoding = config.script_encoding;

  fs::path local_cache =
      choice.saves.path().parent_path() / config.usercache_name;
  ctx.usercache_files.push_back(local_cache);

  if (config.include_root_usercache) {
    fs::path root_cache = mc.root() / config.usercache_name;
    if (root_cache.lexically_normal() != local_cache.lexically_normal()) {
      ctx.usercache_files.push_back(root_cache);
    }
  }

  return ctx;
}

SessionResult RepairSession::run_once(Operator &op) {
  last_report_.reset();
  LOG_INFO("Start the game once and quit after it has loaded before "
           "repairing, it makes the UUID lookup more accurate.");

  fs::path root = config_.minecraft_dir;
  const bool preset_root = !root.empty();
  if (!preset_root) {
    auto line =
        op.read_line("Drag the .minecraft folder here, then press Enter");
    if (!line) {
      return SessionResult::EndOfInput;
    }
    root = strip_quotes(*line);
  }

  std::optional<Installation> mc;
  try {
    mc.emplace(root);
  } catch (const FixError &e) {
    LOG_ERROR(error_kind_to_string(e.kind()) + ": " + e.what());
    forget_preset_root(preset_root);
    return SessionResult::Aborted;
  }

  try {
    std::vector<CollectionChoice> choices = enumerate_collections(*mc);
    if (choices.empty()) {
      LOG_WARN("No game versions found in " + mc->root().string());
      forget_preset_root(preset_root);
      return SessionResult::Aborted;
    }

    std::vector<std::string> labels;
    for (const auto &choice : choices) {
      labels.push_back(choice.label());
    }
    auto version_index = op.select(labels, "Select the game version");
    if (!version_index || *version_index >= choices.size()) {
      LOG_WARN("Unknown game version");
      return SessionResult::Aborted;
    }
    const CollectionChoice &choice = choices[*version_index];

    std::vector<SaveEntry> saves = choice.saves.saves();
    if (saves.empty()) {
      LOG_WARN("No saves in " + choice.saves.path().string());
      return SessionResult::Aborted;
    }

    std::vector<std::string> names;
    for (const auto &save : saves) {
      names.push_back(save.name);
    }
    auto save_index = op.select(names, "Select the save");
    if (!save_index || *save_index >= saves.size()) {
      LOG_WARN("Unknown save");
      return SessionResult::Aborted;
    }
    const SaveEntry &save = saves[*save_index];

    std::string player = config_.player_name;
    if (player.empty()) {
      auto line = op.read_line("Enter your in-game name");
      if (!line) {
        return SessionResult::EndOfInput;
      }
      player = trim(*line);
    }
    if (player.empty()) {
      LOG_WARN("In-game name cannot be empty");
      return SessionResult::Aborted;
    }

    Resolution resolution =
        resolve(make_evidence_context(config_, *mc, choice, player), op);

    LOG_WARN("Renaming player files in " + save.name +
             " in place, no backup is kept");
    last_report_ = fix_save(save, resolution.uuid);
    return SessionResult::Completed;
  } catch (const FixError &e) {
    LOG_ERROR(error_kind_to_string(e.kind()) + ": " + e.what());
    return SessionResult::Aborted;
  }
}

void RepairSession::forget_preset_root(bool preset_root) {
  if (preset_root) {
    LOG_WARN("Configured .minecraft folder is unusable, asking for it instead");
    config_.minecraft_dir.clear();
  }
}

size_t RepairSession::run(
    Operator &op,
    const std::function<void(const RepairReport &)> &on_completed) {
  size_t completed = 0;
  while (!op.at_eof()) {
    SessionResult result = run_once(op);
    if (result == SessionResult::EndOfInput) {
      break;
    }
    if (result == SessionResult::Completed && last_report_) {
      ++completed;
      if (on_completed) {
        on_completed(*last_report_);
      }
    }
  }
  return completed;
}

} // namespace uuidfix
