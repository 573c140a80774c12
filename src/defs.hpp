// Constants and definitions
#pragma once

#include <string>
#include <vector>

namespace uuidfix {

// Installation layout
constexpr const char *VERSIONS_DIR_NAME = "versions";
constexpr const char *SAVES_DIR_NAME = "saves";

// Evidence sources
constexpr const char *USERCACHE_FILE_NAME = "usercache.json";
constexpr const char *DEFAULT_SCRIPT_ENCODING = "GB18030";

// Launch scripts are resolved relative to the installation root
const std::vector<std::string> DEFAULT_LAUNCHER_SCRIPTS = {
    "../PCL/LatestLaunch.bat"};

// Config
constexpr const char *CONFIG_FILENAME = "uuidfix.conf";

// Per-player repair categories, in repair order
struct RepairCategory {
  const char *name;
  const char *extension;
};

const std::vector<RepairCategory> REPAIR_CATEGORIES = {
    {"advancements", ".json"}, {"stats", ".json"}, {"playerdata", ".dat"}};

} // namespace uuidfix
