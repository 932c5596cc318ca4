#include "fingerprint.hpp"
#include "errors.hpp"

#include <openssl/sha.h>
#include <cmath>
#include <cstdio>

namespace docserve {

// Field layout: tag byte, presence byte, 8-byte little-endian length, bytes.
static void append_field(std::string& buf, char tag, const std::string* value) {
    buf += tag;
    if (!value) {
        buf += '\0';
        return;
    }
    buf += '\1';
    uint64_t len = value->size();
    for (int i = 0; i < 8; ++i) {
        buf += static_cast<char>((len >> (8 * i)) & 0xFF);
    }
    buf += *value;
}

static void reject_non_finite(const nlohmann::json& j, const char* field) {
    if (j.is_number_float() && !std::isfinite(j.get<double>())) {
        throw InvalidKeyParams(std::string("fingerprint: ") + field +
                               " contains a non-finite number");
    }
    if (j.is_structured()) {
        for (const auto& child : j) {
            reject_non_finite(child, field);
        }
    }
}

// nlohmann::json objects are std::map backed, so dump() is already
// key-sorted. The strict error handler throws on invalid UTF-8.
static std::optional<std::string> canonical_json(const nlohmann::json& j, const char* field) {
    if (j.is_null()) return std::nullopt;
    if (!j.is_object()) {
        throw InvalidKeyParams(std::string("fingerprint: ") + field +
                               " must be a JSON object, got " + j.type_name());
    }
    reject_non_finite(j, field);
    try {
        return j.dump();
    } catch (const nlohmann::json::type_error& e) {
        throw InvalidKeyParams(std::string("fingerprint: ") + field +
                               " is not serializable: " + e.what());
    }
}

CacheKey fingerprint(const CacheKeyParams& params) {
    return fingerprint(params.source, params.file_path, params.options,
                       params.theme, params.metadata);
}

CacheKey fingerprint(const std::string& source,
                     const std::optional<std::string>& file_path,
                     const nlohmann::json& options,
                     const std::optional<std::string>& theme,
                     const nlohmann::json& metadata) {
    auto options_str = canonical_json(options, "options");
    auto metadata_str = canonical_json(metadata, "metadata");

    std::string buf;
    buf.reserve(source.size() + 128);
    append_field(buf, 's', &source);
    append_field(buf, 'p', file_path ? &*file_path : nullptr);
    append_field(buf, 'o', options_str ? &*options_str : nullptr);
    append_field(buf, 't', theme ? &*theme : nullptr);
    append_field(buf, 'm', metadata_str ? &*metadata_str : nullptr);

    unsigned char hash[SHA256_DIGEST_LENGTH];
    SHA256(reinterpret_cast<const unsigned char*>(buf.data()), buf.size(), hash);

    std::string hex;
    hex.reserve(SHA256_DIGEST_LENGTH * 2);
    char byte_hex[3];
    for (unsigned char b : hash) {
        std::snprintf(byte_hex, sizeof(byte_hex), "%02x", b);
        hex += byte_hex;
    }
    return hex;
}

} // namespace docserve
