#pragma once

// Helpers shared by the provider implementations.

#include "hib/net/http.hpp"
#include "hib/provider.hpp"

#include <algorithm>
#include <chrono>
#include <cstdio>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <initializer_list>
#include <optional>
#include <string>
#include <vector>

namespace hib::providers {

inline std::string param_or(const ProviderFactory::Params& params, const char* key,
                            const std::string& fallback = {}) {
    auto it = params.find(key);
    return (it == params.end() || it->second.empty()) ? fallback : it->second;
}

/// Returns "<type> provider requires '<key>'" for the first missing key.
inline std::string require_params(const ProviderFactory::Params& params, const char* type,
                                  std::initializer_list<const char*> keys) {
    for (const char* key : keys) {
        if (param_or(params, key).empty()) {
            return std::string(type) + " provider requires '" + key + "'";
        }
    }
    return {};
}

/// Bound a request by the task deadline.
inline void apply_deadline(net::HttpRequest& request, Deadline deadline) {
    auto left = remaining(deadline);
    request.total_timeout = left;
    request.connect_timeout = std::min(request.connect_timeout, left);
}

/// Parse "2023-12-15T14:30:00.000Z" or "2023-12-15 14:30:00" as UTC.
inline std::optional<std::chrono::system_clock::time_point> parse_timestamp(const std::string& s) {
    if (s.empty()) return std::nullopt;
    std::tm tm = {};
    int year, month, day, hour, min, sec;
    int millis = 0;
    if (sscanf(s.c_str(), "%d-%d-%dT%d:%d:%d.%dZ",
               &year, &month, &day, &hour, &min, &sec, &millis) >= 6 ||
        sscanf(s.c_str(), "%d-%d-%d %d:%d:%d",
               &year, &month, &day, &hour, &min, &sec) == 6) {
        tm.tm_year = year - 1900;
        tm.tm_mon = month - 1;
        tm.tm_mday = day;
        tm.tm_hour = hour;
        tm.tm_min = min;
        tm.tm_sec = sec;
        tm.tm_isdst = 0;
        time_t tt = timegm(&tm);
        if (tt == -1) return std::nullopt;
        return std::chrono::system_clock::from_time_t(tt) + std::chrono::milliseconds(millis);
    }
    return std::nullopt;
}

/// Whole-file read for push bodies.
inline std::optional<std::vector<uint8_t>> read_local_file(const std::filesystem::path& path) {
    std::ifstream file(path, std::ios::binary | std::ios::ate);
    if (!file) return std::nullopt;
    auto size = file.tellg();
    if (size < 0) return std::nullopt;
    std::vector<uint8_t> data(static_cast<size_t>(size));
    file.seekg(0);
    file.read(reinterpret_cast<char*>(data.data()), size);
    if (!file) return std::nullopt;
    return data;
}

inline TransferError local_read_error(const std::filesystem::path& path) {
    return {ErrorKind::LocalIOError, "Cannot read " + path.string(), {}};
}

/// A 2xx reply whose body could not be understood.
inline TransferError bad_reply(const std::string& what) {
    return {ErrorKind::Rejected, "Unexpected response: " + what, {}};
}

/// Last path component of a key.
inline std::string key_basename(const std::string& key) {
    auto slash = key.rfind('/');
    return slash == std::string::npos ? key : key.substr(slash + 1);
}

}  // namespace hib::providers
