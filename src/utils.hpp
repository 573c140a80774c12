// utils.hpp - Utility functions
#pragma once

#include <filesystem>
#include <fstream>
#include <memory>
#include <optional>
#include <string>

namespace fs = std::filesystem;

namespace uuidfix {

// Logging
class Logger {
public:
  static Logger &getInstance();
  void init(bool verbose, const fs::path &log_path);
  void log(const std::string &level, const std::string &message);

private:
  Logger() = default;
  bool verbose_ = false;
  std::unique_ptr<std::ofstream> log_file_;
};

#define LOG_INFO(msg) Logger::getInstance().log("INFO", msg)
#define LOG_WARN(msg) Logger::getInstance().log("WARN", msg)
#define LOG_ERROR(msg) Logger::getInstance().log("ERROR", msg)
#define LOG_DEBUG(msg) Logger::getInstance().log("DEBUG", msg)

// File system utilities
bool ensure_dir_exists(const fs::path &path);

// Most recently modified regular file below dir. Symlinks are not followed
// and never returned. Returns nullopt for a missing or empty directory.
std::optional<fs::path> latest_modified(const fs::path &dir);

std::optional<std::string> read_file(const fs::path &path);

// Text utilities
bool is_valid_utf8(const std::string &bytes);

// Returns bytes unchanged when they are already UTF-8, otherwise converts from
// `encoding` with iconv. Returns nullopt if the conversion fails.
std::optional<std::string> decode_legacy_text(const std::string &bytes,
                                              const std::string &encoding);

std::string trim(const std::string &s);
std::string to_lower(std::string s);

// Drag-and-drop into a terminal wraps paths in quotes
std::string strip_quotes(const std::string &s);

} // namespace uuidfix
