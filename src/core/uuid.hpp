// core/uuid.hpp - UUID normalization
#pragma once

#include <optional>
#include <string>

namespace uuidfix {

// Canonical lowercase 8-4-4-4-12 form of a UUID written with or without
// hyphens, in any case, optionally wrapped in braces or prefixed with
// "urn:uuid:". Returns nullopt for anything else.
std::optional<std::string> try_normalize_uuid(const std::string &text);

// Same as try_normalize_uuid, throws FixError(InvalidUuid) on failure.
std::string normalize_uuid(const std::string &text);

} // namespace uuidfix
