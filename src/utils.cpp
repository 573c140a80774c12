// utils.cpp - Utility functions implementation
#include "utils.hpp"
#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstring>
#include <ctime>
#include <iconv.h>
#include <iostream>
#include <iterator>

namespace uuidfix {

// Logger implementation
Logger &Logger::getInstance() {
  static Logger instance;
  return instance;
}

void Logger::init(bool verbose, const fs::path &log_path) {
  verbose_ = verbose;
  log_file_.reset();

  if (!log_path.empty()) {
    if (log_path.has_parent_path()) {
      ensure_dir_exists(log_path.parent_path());
    }
    log_file_ = std::make_unique<std::ofstream>(log_path, std::ios::app);
  }
}

void Logger::log(const std::string &level, const std::string &message) {
  // Skip DEBUG messages if not in verbose mode
  if (level == "DEBUG" && !verbose_) {
    return;
  }

  auto now = std::time(nullptr);
  char time_buf[64];
  std::strftime(time_buf, sizeof(time_buf), "%Y-%m-%d %H:%M:%S",
                std::localtime(&now));

  std::string log_line =
      std::string("[") + time_buf + "] [" + level + "] " + message + "\n";

  if (log_file_ && log_file_->is_open()) {
    *log_file_ << log_line;
    log_file_->flush();
  }

  std::cerr << log_line;
}

// File system utilities
bool ensure_dir_exists(const fs::path &path) {
  try {
    if (!fs::exists(path)) {
      fs::create_directories(path);
    }
    return true;
  } catch (const std::exception &e) {
    LOG_ERROR("Failed to create directory " + path.string() + ": " + e.what());
    return false;
  }
}

std::optional<fs::path> latest_modified(const fs::path &dir) {
  std::error_code ec;
  if (!fs::is_directory(dir, ec)) {
    return std::nullopt;
  }

  std::optional<fs::path> latest;
  fs::file_time_type latest_time = fs::file_time_type::min();

  // Directory symlinks are not followed by default, so link cycles are safe
  fs::recursive_directory_iterator it(
      dir, fs::directory_options::skip_permission_denied, ec);
  if (ec) {
    LOG_WARN("Cannot scan " + dir.string() + ": " + ec.message());
    return std::nullopt;
  }

  for (; it != fs::recursive_directory_iterator(); it.increment(ec)) {
    if (ec) {
      LOG_WARN("Scan of " + dir.string() + " stopped: " + ec.message());
      break;
    }

    const auto &entry = *it;
    if (entry.is_symlink(ec) || !entry.is_regular_file(ec)) {
      continue;
    }

    auto mtime = entry.last_write_time(ec);
    if (ec) {
      LOG_DEBUG("Skipping " + entry.path().string() + ": " + ec.message());
      continue;
    }

    if (!latest || mtime > latest_time) {
      latest_time = mtime;
      latest = entry.path();
    }
  }

  return latest;
}

std::optional<std::string> read_file(const fs::path &path) {
  std::ifstream file(path, std::ios::binary);
  if (!file.is_open()) {
    return std::nullopt;
  }

  std::string content((std::istreambuf_iterator<char>(file)),
                      std::istreambuf_iterator<char>());
  if (file.bad()) {
    LOG_WARN("Read error on " + path.string());
    return std::nullopt;
  }
  return content;
}

// Text utilities
bool is_valid_utf8(const std::string &bytes) {
  size_t i = 0;
  while (i < bytes.size()) {
    unsigned char c = bytes[i];
    size_t len;
    if (c < 0x80)
      len = 1;
    else if ((c & 0xE0) == 0xC0 && c >= 0xC2)
      len = 2;
    else if ((c & 0xF0) == 0xE0)
      len = 3;
    else if ((c & 0xF8) == 0xF0 && c <= 0xF4)
      len = 4;
    else
      return false;

    if (i + len > bytes.size())
      return false;
    for (size_t k = 1; k < len; ++k) {
      if ((static_cast<unsigned char>(bytes[i + k]) & 0xC0) != 0x80)
        return false;
    }
    i += len;
  }
  return true;
}

std::optional<std::string> decode_legacy_text(const std::string &bytes,
                                              const std::string &encoding) {
  if (is_valid_utf8(bytes)) {
    return bytes;
  }

  iconv_t cd = iconv_open("UTF-8", encoding.c_str());
  if (cd == reinterpret_cast<iconv_t>(-1)) {
    LOG_WARN("Unsupported text encoding " + encoding + ": " +
             strerror(errno));
    return std::nullopt;
  }

  std::string in = bytes;
  std::string out(in.size() * 4 + 4, '\0');
  char *in_buf = in.data();
  size_t in_left = in.size();
  char *out_buf = out.data();
  size_t out_left = out.size();

  size_t ret = iconv(cd, &in_buf, &in_left, &out_buf, &out_left);
  int saved_errno = errno;
  iconv_close(cd);

  if (ret == static_cast<size_t>(-1)) {
    LOG_DEBUG("Text is not valid " + encoding + ": " + strerror(saved_errno));
    return std::nullopt;
  }

  out.resize(out.size() - out_left);
  return out;
}

std::string trim(const std::string &s) {
  auto start = s.find_first_not_of(" \t\r\n");
  if (start == std::string::npos)
    return "";
  auto end = s.find_last_not_of(" \t\r\n");
  return s.substr(start, end - start + 1);
}

std::string to_lower(std::string s) {
  for (char &c : s) {
    c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  }
  return s;
}

std::string strip_quotes(const std::string &s) {
  std::string value = trim(s);
  if (value.size() >= 2) {
    char first = value.front();
    char last = value.back();
    if ((first == '"' || first == '\'') && first == last) {
      return value.substr(1, value.size() - 2);
    }
  }
  return value;
}

} // namespace uuidfix
