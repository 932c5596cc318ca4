#pragma once
#include "types.hpp"
#include <string>
#include <optional>
#include <nlohmann/json.hpp>

namespace docserve {

// Derive the cache key for a set of render inputs: a 64-char lowercase hex
// SHA-256 over a length-prefixed encoding of every field. Absent fields
// encode differently from empty ones, and object keys are hashed in sorted
// order, so the result is stable across calls and restarts.
//
// Throws InvalidKeyParams if options/metadata are neither null nor a JSON
// object, hold non-finite numbers, or hold strings that are not valid UTF-8.
CacheKey fingerprint(const CacheKeyParams& params);

CacheKey fingerprint(const std::string& source,
                     const std::optional<std::string>& file_path = std::nullopt,
                     const nlohmann::json& options = nullptr,
                     const std::optional<std::string>& theme = std::nullopt,
                     const nlohmann::json& metadata = nullptr);

} // namespace docserve
