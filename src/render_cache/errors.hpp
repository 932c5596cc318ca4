#pragma once
#include <stdexcept>
#include <string>

namespace docserve {

// The compute closure passed to RenderCache::get_or_compute threw.
// Every coalesced waiter receives the same error; nothing is cached.
class ComputeFailed : public std::runtime_error {
public:
    explicit ComputeFailed(const std::string& msg) : std::runtime_error(msg) {}
};

// Render inputs that cannot be serialized into a fingerprint.
class InvalidKeyParams : public std::invalid_argument {
public:
    explicit InvalidKeyParams(const std::string& msg) : std::invalid_argument(msg) {}
};

// Raised at construction when a cache limit is zero.
class CapacityMisconfigured : public std::invalid_argument {
public:
    explicit CapacityMisconfigured(const std::string& msg) : std::invalid_argument(msg) {}
};

} // namespace docserve
