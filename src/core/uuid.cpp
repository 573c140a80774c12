// core/uuid.cpp - UUID normalization implementation
#include "uuid.hpp"
#include "../utils.hpp"
#include "error.hpp"
#include <cctype>

namespace uuidfix {

std::optional<std::string> try_normalize_uuid(const std::string &text) {
  std::string value = trim(text);

  if (to_lower(value.substr(0, 4)) == "urn:") {
    value = value.substr(4);
  }
  if (to_lower(value.substr(0, 5)) == "uuid:") {
    value = value.substr(5);
  }
  if (value.size() >= 2 && value.front() == '{' && value.back() == '}') {
    value = value.substr(1, value.size() - 2);
  }

  std::string hex;
  for (char c : value) {
    if (c == '-')
      continue;
    if (!std::isxdigit(static_cast<unsigned char>(c)))
      return std::nullopt;
    hex += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  }
  if (hex.size() != 32) {
    return std::nullopt;
  }

  return hex.substr(0, 8) + "-" + hex.substr(8, 4) + "-" + hex.substr(12, 4) +
         "-" + hex.substr(16, 4) + "-" + hex.substr(20);
}

std::string normalize_uuid(const std::string &text) {
  auto normalized = try_normalize_uuid(text);
  if (!normalized) {
    throw FixError(ErrorKind::InvalidUuid, "Not a valid UUID: " + text);
  }
  return *normalized;
}

} // namespace uuidfix
