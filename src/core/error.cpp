// core/error.cpp - Error kind names
#include "error.hpp"

namespace uuidfix {

std::string error_kind_to_string(ErrorKind kind) {
  switch (kind) {
  case ErrorKind::NotFound:
    return "NotFound";
  case ErrorKind::InvalidLayout:
    return "InvalidLayout";
  case ErrorKind::InvalidUuid:
    return "InvalidUuid";
  case ErrorKind::AmbiguousOrMissingEvidence:
    return "AmbiguousOrMissingEvidence";
  case ErrorKind::UnexpectedFileKind:
    return "UnexpectedFileKind";
  case ErrorKind::RenameFailed:
    return "RenameFailed";
  }
  return "Unknown";
}

} // namespace uuidfix
