// core/evidence.hpp - UUID evidence collection and resolution
#pragma once

#include "../defs.hpp"
#include "operator.hpp"
#include <chrono>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace fs = std::filesystem;

namespace uuidfix {

enum class EvidenceSource { LauncherScript, PlayerCache, Manual };

std::string evidence_source_to_string(EvidenceSource source);

struct UuidCandidate {
  std::string uuid;
  EvidenceSource source;
  fs::path origin;
};

// Everything one resolution needs, passed in explicitly.
struct EvidenceContext {
  fs::path installation_root;
  std::vector<std::string> launcher_scripts; // relative to installation_root
  std::vector<fs::path> usercache_files;
  std::string player_name; // empty disables the name filter
  std::string script_encoding = DEFAULT_SCRIPT_ENCODING;
  std::chrono::system_clock::time_point now = std::chrono::system_clock::now();
};

struct Resolution {
  std::string uuid;
  std::vector<UuidCandidate> candidates;
  bool manual = false;
};

// Value of the first "--uuid <value>" argument in a launch script.
std::optional<std::string> extract_script_uuid(const std::string &text);

// Player cache expiry stamps, "2024-06-01 12:00:00 +0800" or ISO-8601.
// Stamps without an offset are local time.
std::optional<std::chrono::system_clock::time_point>
parse_expiry(const std::string &stamp);

// Raw values, in source order. Unreadable or unmatched sources add nothing.
std::vector<UuidCandidate>
collect_from_launcher_scripts(const EvidenceContext &ctx);
std::vector<UuidCandidate> collect_from_usercache(const EvidenceContext &ctx);

// Both sources, normalized. Values that are not UUIDs are dropped.
std::vector<UuidCandidate> collect(const EvidenceContext &ctx);

// Most frequent value; ties go to the one seen first.
std::optional<std::string> majority_vote(const std::vector<std::string> &values);

// Falls back to asking the operator when there is no evidence. Throws
// FixError(InvalidUuid) if input ends before a valid UUID is entered.
Resolution resolve(const EvidenceContext &ctx, Operator &op);

} // namespace uuidfix
