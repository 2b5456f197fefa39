#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <span>
#include <string>
#include <string_view>

namespace hib {

/// Content identity: lowercase hex SHA-256 plus byte size.
struct Fingerprint {
    std::string digest;
    uint64_t size = 0;

    bool operator==(const Fingerprint& other) const {
        return size == other.size && digest == other.digest;
    }
    bool operator!=(const Fingerprint& other) const { return !(*this == other); }
};

Fingerprint fingerprint_bytes(std::span<const uint8_t> data);

/// Streams the file through SHA-256. Returns nullopt if the file cannot be
/// opened or read.
std::optional<Fingerprint> fingerprint_file(const std::filesystem::path& path);

/// Hex SHA-256 of a string.
std::string sha256_hex(std::string_view data);

}  // namespace hib
