// core/error.hpp - Error kinds raised by the repair core
#pragma once

#include <stdexcept>
#include <string>

namespace uuidfix {

enum class ErrorKind {
  NotFound,
  InvalidLayout,
  InvalidUuid,
  AmbiguousOrMissingEvidence,
  UnexpectedFileKind,
  RenameFailed,
};

std::string error_kind_to_string(ErrorKind kind);

class FixError : public std::runtime_error {
public:
  FixError(ErrorKind kind, const std::string &message)
      : std::runtime_error(message), kind_(kind) {}

  ErrorKind kind() const { return kind_; }

private:
  ErrorKind kind_;
};

} // namespace uuidfix
