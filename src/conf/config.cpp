// conf/config.cpp - Configuration implementation
#include "config.hpp"
#include "../utils.hpp"
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace uuidfix {

Config Config::load_default() {
  Config config;
  // Try to load from default location if exists
  fs::path default_path = CONFIG_FILENAME;
  if (fs::exists(default_path)) {
    try {
      return from_file(default_path);
    } catch (const std::exception &e) {
      LOG_WARN("Failed to load default config, using defaults: " +
               std::string(e.what()));
    }
  }
  return config;
}

Config Config::from_file(const fs::path &path) {
  Config config;

  std::ifstream file(path);
  if (!file.is_open()) {
    throw std::runtime_error("Cannot open config file " + path.string());
  }

  std::string line;
  while (std::getline(file, line)) {
    line = trim(line);
    if (line.empty() || line[0] == '#')
      continue;

    auto eq_pos = line.find('=');
    if (eq_pos == std::string::npos)
      continue;

    std::string key = trim(line.substr(0, eq_pos));
    std::string value = strip_quotes(line.substr(eq_pos + 1));

    if (key == "minecraft_dir")
      config.minecraft_dir = value;
    else if (key == "player_name")
      config.player_name = value;
    else if (key == "usercache_name")
      config.usercache_name = value;
    else if (key == "include_root_usercache")
      config.include_root_usercache = (value == "true");
    else if (key == "script_encoding")
      config.script_encoding = value;
    else if (key == "verbose")
      config.verbose = (value == "true");
    else if (key == "log_file")
      config.log_file = value;
    else if (key == "launcher_scripts") {
      config.launcher_scripts.clear();
      std::stringstream ss(value);
      std::string script;
      while (std::getline(ss, script, ',')) {
        script = trim(script);
        if (!script.empty()) {
          config.launcher_scripts.push_back(script);
        }
      }
    }
  }

  return config;
}

bool Config::save_to_file(const fs::path &path) const {
  std::ofstream file(path);
  if (!file.is_open()) {
    return false;
  }

  file << "# uuidfix configuration\n";
  if (!minecraft_dir.empty()) {
    file << "minecraft_dir = \"" << minecraft_dir.string() << "\"\n";
  }
  if (!player_name.empty()) {
    file << "player_name = \"" << player_name << "\"\n";
  }

  file << "launcher_scripts = \"";
  for (size_t i = 0; i < launcher_scripts.size(); ++i) {
    file << launcher_scripts[i];
    if (i < launcher_scripts.size() - 1)
      file << ",";
  }
  file << "\"\n";

  file << "usercache_name = \"" << usercache_name << "\"\n";
  file << "include_root_usercache = "
       << (include_root_usercache ? "true" : "false") << "\n";
  file << "script_encoding = \"" << script_encoding << "\"\n";
  file << "verbose = " << (verbose ? "true" : "false") << "\n";
  if (!log_file.empty()) {
    file << "log_file = \"" << log_file.string() << "\"\n";
  }

  return static_cast<bool>(file);
}

void Config::merge_with_cli(const fs::path &minecraft_dir_override,
                            const std::string &player_override,
                            bool verbose_override) {
  if (!minecraft_dir_override.empty()) {
    minecraft_dir = minecraft_dir_override;
  }
  if (!player_override.empty()) {
    player_name = player_override;
  }
  if (verbose_override) {
    verbose = true;
  }
}

} // namespace uuidfix
