// core/session.hpp - Interactive repair orchestration
#pragma once

#include "../conf/config.hpp"
#include "evidence.hpp"
#include "installation.hpp"
#include "operator.hpp"
#include "repair.hpp"
#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <utility>

namespace uuidfix {

enum class SessionResult { Completed, Aborted, EndOfInput };

// Player caches live next to the chosen saves folder: the version folder for
// isolated collections, the installation root otherwise.
EvidenceContext make_evidence_context(const Config &config,
                                      const Installation &mc,
                                      const CollectionChoice &choice,
                                      const std::string &player_name);

class RepairSession {
public:
  explicit RepairSession(Config config) : config_(std::move(config)) {}

  // One pass: installation, collection, save, player, UUID, repair.
  // Layout and UUID errors are logged and reported as Aborted.
  SessionResult run_once(Operator &op);

  // Repeats run_once until the operator's input ends. A preset .minecraft
  // folder that turns out unusable is dropped, so later passes prompt for
  // it. Returns the number of completed repairs.
  size_t run(Operator &op,
             const std::function<void(const RepairReport &)> &on_completed);

  const std::optional<RepairReport> &last_report() const {
    return last_report_;
  }

private:
  void forget_preset_root(bool preset_root);

  Config config_;
  std::optional<RepairReport> last_report_;
};

} // namespace uuidfix
