#pragma once

#include <chrono>
#include <cstddef>
#include <map>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

namespace fetch_engine {

enum class HttpMethod { Get, Post, Put, Patch, Delete };

/// "GET", "POST", ...
std::string toString(HttpMethod method);

/// Parse a method name (case-insensitive). Throws std::invalid_argument.
HttpMethod parseHttpMethod(const std::string& name);

/// Caller correlation data. Echoed verbatim into every ResponseRecord.
struct RequestMetadata {
    std::optional<std::size_t>         batchIndex;  // set by BatchCoordinator
    std::optional<int>                 page;        // set by Paginator
    std::map<std::string, std::string> tags;

    bool operator==(const RequestMetadata& other) const {
        return batchIndex == other.batchIndex && page == other.page &&
               tags == other.tags;
    }
    bool operator!=(const RequestMetadata& other) const { return !(*this == other); }

    nlohmann::json toJson() const;
};

/// One logical HTTP request.
struct RequestDescriptor {
    std::string                               url;   // absolute, or relative to base_url
    HttpMethod                                method = HttpMethod::Get;
    std::map<std::string, std::string>        headers;
    std::map<std::string, std::string>        params;
    std::optional<nlohmann::json>             body;  // string => raw, else JSON
    std::optional<std::chrono::milliseconds>  timeout;
    RequestMetadata                           metadata;
};

/// Result of one logical request (or a synthesized failure placeholder).
struct ResponseRecord {
    int                                   status = 0;
    nlohmann::json                        body;
    std::map<std::string, std::string>    headers;
    std::string                           url;
    double                                elapsedSeconds = 0.0;
    std::chrono::system_clock::time_point completedAt{};
    RequestMetadata                       metadata;

    bool success() const { return status >= 200 && status < 300; }

    nlohmann::json toJson() const;
};

} // namespace fetch_engine
