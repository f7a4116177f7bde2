#include "models.hpp"

#include <algorithm>
#include <cctype>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace fetch_engine {

std::string toString(HttpMethod method) {
    switch (method) {
        case HttpMethod::Get:    return "GET";
        case HttpMethod::Post:   return "POST";
        case HttpMethod::Put:    return "PUT";
        case HttpMethod::Patch:  return "PATCH";
        case HttpMethod::Delete: return "DELETE";
    }
    return "GET";
}

HttpMethod parseHttpMethod(const std::string& name) {
    std::string upper = name;
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });

    if (upper == "GET")    return HttpMethod::Get;
    if (upper == "POST")   return HttpMethod::Post;
    if (upper == "PUT")    return HttpMethod::Put;
    if (upper == "PATCH")  return HttpMethod::Patch;
    if (upper == "DELETE") return HttpMethod::Delete;
    throw std::invalid_argument("Unsupported HTTP method: " + name);
}

nlohmann::json RequestMetadata::toJson() const {
    nlohmann::json j = nlohmann::json::object();
    if (batchIndex) j["batch_index"] = *batchIndex;
    if (page)       j["page"]        = *page;
    if (!tags.empty()) j["tags"] = tags;
    return j;
}

static std::string toIso8601(std::chrono::system_clock::time_point tp) {
    const auto secs = std::chrono::system_clock::to_time_t(tp);
    const auto micros = std::chrono::duration_cast<std::chrono::microseconds>(
        tp.time_since_epoch()).count() % 1000000;

    std::tm utc{};
    gmtime_r(&secs, &utc);

    std::ostringstream out;
    out << std::put_time(&utc, "%Y-%m-%dT%H:%M:%S")
        << '.' << std::setw(6) << std::setfill('0') << micros << 'Z';
    return out.str();
}

nlohmann::json ResponseRecord::toJson() const {
    return {
        {"status", status},
        {"data", body},
        {"headers", headers},
        {"url", url},
        {"request_time", elapsedSeconds},
        {"response_time", toIso8601(completedAt)},
        {"success", success()},
        {"metadata", metadata.toJson()}
    };
}

} // namespace fetch_engine
