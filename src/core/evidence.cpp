// core/evidence.cpp - UUID evidence collection and resolution implementation
#include "evidence.hpp"
#include "../utils.hpp"
#include "error.hpp"
#include "json.hpp"
#include "uuid.hpp"
#include <cstdio>
#include <ctime>
#include <regex>

namespace uuidfix {

std::string evidence_source_to_string(EvidenceSource source) {
  switch (source) {
  case EvidenceSource::LauncherScript:
    return "launcher_script";
  case EvidenceSource::PlayerCache:
    return "usercache";
  case EvidenceSource::Manual:
    return "manual";
  }
  return "unknown";
}

std::optional<std::string> extract_script_uuid(const std::string &text) {
  static const std::regex uuid_arg(R"re(--uuid\s+"?([0-9A-Za-z{}:\-]+)"?)re");

  std::smatch match;
  if (std::regex_search(text, match, uuid_arg)) {
    return match[1].str();
  }
  return std::nullopt;
}

// Seconds east of UTC from "Z", "+0800" or "+08:00"
static std::optional<long> parse_utc_offset(const std::string &text) {
  if (text == "Z" || text == "z") {
    return 0L;
  }
  if (text.size() < 3 || (text[0] != '+' && text[0] != '-')) {
    return std::nullopt;
  }

  std::string digits;
  for (size_t i = 1; i < text.size(); ++i) {
    if (text[i] == ':')
      continue;
    if (text[i] < '0' || text[i] > '9')
      return std::nullopt;
    digits += text[i];
  }
  if (digits.size() != 2 && digits.size() != 4) {
    return std::nullopt;
  }

  long hours = std::stol(digits.substr(0, 2));
  long minutes = digits.size() == 4 ? std::stol(digits.substr(2, 2)) : 0;
  if (hours > 23 || minutes > 59) {
    return std::nullopt;
  }

  long seconds = hours * 3600 + minutes * 60;
  return text[0] == '-' ? -seconds : seconds;
}

std::optional<std::chrono::system_clock::time_point>
parse_expiry(const std::string &stamp) {
  std::string value = trim(stamp);

  std::tm tm{};
  char sep = 0;
  int consumed = 0;
  if (std::sscanf(value.c_str(), "%4d-%2d-%2d%c%2d:%2d:%2d%n", &tm.tm_year,
                  &tm.tm_mon, &tm.tm_mday, &sep, &tm.tm_hour, &tm.tm_min,
                  &tm.tm_sec, &consumed) != 7 ||
      (sep != ' ' && sep != 'T' && sep != 't')) {
    return std::nullopt;
  }
  if (tm.tm_mon < 1 || tm.tm_mon > 12 || tm.tm_mday < 1 || tm.tm_mday > 31 ||
      tm.tm_hour > 23 || tm.tm_min > 59 || tm.tm_sec > 60) {
    return std::nullopt;
  }
  tm.tm_year -= 1900;
  tm.tm_mon -= 1;

  std::string rest = value.substr(static_cast<size_t>(consumed));
  // Fractional seconds carry no weight for expiry checks
  if (!rest.empty() && rest[0] == '.') {
    size_t end = rest.find_first_not_of("0123456789", 1);
    rest = end == std::string::npos ? "" : rest.substr(end);
  }
  rest = trim(rest);

  std::time_t epoch;
  if (rest.empty()) {
    tm.tm_isdst = -1;
    epoch = std::mktime(&tm);
  } else {
    auto offset = parse_utc_offset(rest);
    if (!offset) {
      return std::nullopt;
    }
    epoch = timegm(&tm) - *offset;
  }
  if (epoch == static_cast<std::time_t>(-1)) {
    return std::nullopt;
  }

  return std::chrono::system_clock::from_time_t(epoch);
}

std::vector<UuidCandidate>
collect_from_launcher_scripts(const EvidenceContext &ctx) {
  std::vector<UuidCandidate> candidates;

  for (const auto &relative : ctx.launcher_scripts) {
    fs::path script = (ctx.installation_root / relative).lexically_normal();

    std::error_code ec;
    if (!fs::is_regular_file(script, ec)) {
      LOG_DEBUG("Launcher script not found: " + script.string());
      continue;
    }

    auto raw = read_file(script);
    if (!raw) {
      LOG_WARN("Cannot read launcher script: " + script.string());
      continue;
    }

    auto text = decode_legacy_text(*raw, ctx.script_encoding);
    if (!text) {
      // The argument itself is ASCII, so the raw bytes still work
      LOG_DEBUG("Could not decode " + script.string() + " as " +
                ctx.script_encoding + ", scanning raw bytes");
      text = raw;
    }

    auto uuid = extract_script_uuid(*text);
    if (!uuid) {
      LOG_DEBUG("No --uuid argument in " + script.string());
      continue;
    }

    LOG_DEBUG("Launcher script " + script.string() + " names UUID " + *uuid);
    candidates.push_back({*uuid, EvidenceSource::LauncherScript, script});
  }

  return candidates;
}

static void collect_usercache_record(const json::Value &record,
                                     const fs::path &origin,
                                     const EvidenceContext &ctx,
                                     std::vector<UuidCandidate> &candidates) {
  const json::Value *name = record.find("name");
  const json::Value *uuid = record.find("uuid");
  const json::Value *expires = record.find("expiresOn");

  if (!name || !uuid || !expires || !name->is_string() || !uuid->is_string() ||
      !expires->is_string()) {
    LOG_DEBUG("Skipping malformed usercache record in " + origin.string());
    return;
  }

  if (!ctx.player_name.empty() && name->as_string() != ctx.player_name) {
    return;
  }

  auto expiry = parse_expiry(expires->as_string());
  if (!expiry) {
    LOG_DEBUG("Unreadable expiresOn \"" + expires->as_string() + "\" in " +
              origin.string());
    return;
  }
  if (*expiry <= ctx.now) {
    LOG_DEBUG("Ignoring expired usercache entry for " + name->as_string());
    return;
  }

  candidates.push_back(
      {uuid->as_string(), EvidenceSource::PlayerCache, origin});
}

std::vector<UuidCandidate> collect_from_usercache(const EvidenceContext &ctx) {
  std::vector<UuidCandidate> candidates;

  for (const auto &cache : ctx.usercache_files) {
    std::error_code ec;
    if (!fs::is_regular_file(cache, ec)) {
      LOG_DEBUG("Player cache not found: " + cache.string());
      continue;
    }

    auto content = read_file(cache);
    if (!content) {
      LOG_WARN("Cannot read player cache: " + cache.string());
      continue;
    }

    json::Value root;
    try {
      root = json::parse(*content);
    } catch (const json::ParseError &e) {
      LOG_WARN("Malformed player cache " + cache.string() + ": " + e.what());
      continue;
    }

    if (root.is_array()) {
      for (const auto &record : root.items()) {
        if (record.is_object()) {
          collect_usercache_record(record, cache, ctx, candidates);
        }
      }
    } else if (root.is_object()) {
      collect_usercache_record(root, cache, ctx, candidates);
    } else {
      LOG_WARN("Unexpected player cache layout in " + cache.string());
    }
  }

  return candidates;
}

std::vector<UuidCandidate> collect(const EvidenceContext &ctx) {
  std::vector<UuidCandidate> raw = collect_from_launcher_scripts(ctx);
  std::vector<UuidCandidate> cached = collect_from_usercache(ctx);
  raw.insert(raw.end(), cached.begin(), cached.end());

  std::vector<UuidCandidate> candidates;
  for (auto &candidate : raw) {
    auto normalized = try_normalize_uuid(candidate.uuid);
    if (!normalized) {
      LOG_WARN("Ignoring invalid UUID \"" + candidate.uuid + "\" from " +
               candidate.origin.string());
      continue;
    }
    candidate.uuid = *normalized;
    candidates.push_back(std::move(candidate));
  }

  return candidates;
}

std::optional<std::string> majority_vote(const std::vector<std::string> &values) {
  std::vector<std::pair<std::string, size_t>> counts;
  for (const auto &value : values) {
    bool found = false;
    for (auto &entry : counts) {
      if (entry.first == value) {
        ++entry.second;
        found = true;
        break;
      }
    }
    if (!found) {
      counts.emplace_back(value, 1);
    }
  }

  if (counts.empty()) {
    return std::nullopt;
  }

  const auto *best = &counts.front();
  for (const auto &entry : counts) {
    if (entry.second > best->second) {
      best = &entry;
    }
  }
  return best->first;
}

Resolution resolve(const EvidenceContext &ctx, Operator &op) {
  Resolution resolution;
  resolution.candidates = collect(ctx);

  std::vector<std::string> values;
  for (const auto &candidate : resolution.candidates) {
    LOG_INFO("[UUID] " + evidence_source_to_string(candidate.source) + ": " +
             candidate.uuid + " (" + candidate.origin.string() + ")");
    values.push_back(candidate.uuid);
  }

  if (auto winner = majority_vote(values)) {
    resolution.uuid = *winner;
    LOG_INFO("[UUID] Resolved " + resolution.uuid + " from " +
             std::to_string(values.size()) + " candidate(s)");
    return resolution;
  }

  LOG_WARN("[UUID] No UUID evidence found, asking for manual input");
  while (true) {
    auto line = op.read_line("Could not read the UUID automatically, enter it "
                             "manually");
    if (!line) {
      throw FixError(ErrorKind::InvalidUuid, "No UUID entered");
    }

    auto normalized = try_normalize_uuid(*line);
    if (normalized) {
      resolution.uuid = *normalized;
      resolution.manual = true;
      resolution.candidates.push_back(
          {resolution.uuid, EvidenceSource::Manual, fs::path()});
      return resolution;
    }
    LOG_WARN("Not a valid UUID: " + *line);
  }
}

} // namespace uuidfix
