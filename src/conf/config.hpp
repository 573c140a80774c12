// conf/config.hpp - Configuration management
#pragma once

#include "../defs.hpp"
#include <filesystem>
#include <string>
#include <vector>

namespace fs = std::filesystem;

namespace uuidfix {

struct Config {
  fs::path minecraft_dir;
  std::string player_name;
  std::vector<std::string> launcher_scripts = DEFAULT_LAUNCHER_SCRIPTS;
  std::string usercache_name = USERCACHE_FILE_NAME;
  bool include_root_usercache = false;
  std::string script_encoding = DEFAULT_SCRIPT_ENCODING;
  bool verbose = false;
  fs::path log_file;

  static Config load_default();
  static Config from_file(const fs::path &path);
  bool save_to_file(const fs::path &path) const;

  void merge_with_cli(const fs::path &minecraft_dir_override,
                      const std::string &player_override,
                      bool verbose_override);
};

} // namespace uuidfix
