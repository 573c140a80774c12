// console.cpp - Terminal operator implementation
#include "console.hpp"
#include "utils.hpp"
#include <string>

namespace uuidfix {

std::optional<size_t>
ConsoleOperator::select(const std::vector<std::string> &options,
                        const std::string &hint) {
  for (size_t i = 0; i < options.size(); ++i) {
    out_ << "[" << (i + 1) << "] " << options[i] << "\n";
  }

  auto line = read_line(hint + " (type the number, then press Enter)");
  if (!line) {
    return std::nullopt;
  }

  size_t consumed = 0;
  unsigned long choice = 0;
  try {
    choice = std::stoul(*line, &consumed);
  } catch (const std::exception &) {
    return std::nullopt;
  }
  if (consumed != line->size() || choice < 1 || choice > options.size()) {
    return std::nullopt;
  }
  return static_cast<size_t>(choice - 1);
}

std::optional<std::string> ConsoleOperator::read_line(const std::string &hint) {
  out_ << hint << ": " << std::flush;

  std::string line;
  if (!std::getline(in_, line)) {
    eof_ = true;
    out_ << "\n";
    return std::nullopt;
  }
  return trim(line);
}

} // namespace uuidfix
