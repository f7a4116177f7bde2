#include "util.hpp"

#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace fetch_engine {

UrlParts parseUrl(const std::string& url) {
    UrlParts parts;

    // --- scheme ---
    auto schemeEnd = url.find("://");
    if (schemeEnd == std::string::npos) {
        throw std::invalid_argument("Invalid URL (missing scheme): " + url);
    }
    parts.scheme = url.substr(0, schemeEnd);
    if (parts.scheme != "http" && parts.scheme != "https") {
        throw std::invalid_argument("Unsupported URL scheme: " + url);
    }

    // --- authority (host[:port]) ---
    auto hostStart = schemeEnd + 3;
    auto pathStart = url.find_first_of("/?", hostStart);

    std::string authority;
    if (pathStart == std::string::npos) {
        authority    = url.substr(hostStart);
        parts.target = "/";
    } else {
        authority    = url.substr(hostStart, pathStart - hostStart);
        parts.target = url.substr(pathStart);
        if (parts.target[0] == '?') {
            parts.target.insert(parts.target.begin(), '/');
        }
    }

    // --- host / port ---
    auto colon = authority.find(':');
    if (colon == std::string::npos) {
        parts.host = authority;
        parts.port = (parts.scheme == "https") ? "443" : "80";
    } else {
        parts.host = authority.substr(0, colon);
        parts.port = authority.substr(colon + 1);
    }

    if (parts.host.empty()) {
        throw std::invalid_argument("Invalid URL (empty host): " + url);
    }
    if (parts.port.empty()) {
        throw std::invalid_argument("Invalid URL (empty port): " + url);
    }
    return parts;
}

std::string resolveUrl(const std::string& baseUrl, const std::string& path) {
    if (path.rfind("http://", 0) == 0 || path.rfind("https://", 0) == 0) {
        return path;
    }
    if (baseUrl.empty()) {
        return path;
    }

    std::string base = baseUrl;
    while (!base.empty() && base.back() == '/') base.pop_back();

    std::string::size_type first = 0;
    while (first < path.size() && path[first] == '/') ++first;

    return base + "/" + path.substr(first);
}

std::string urlEncode(const std::string& value) {
    static const char kHex[] = "0123456789ABCDEF";

    std::string out;
    out.reserve(value.size());
    for (unsigned char c : value) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
            out.push_back(static_cast<char>(c));
        } else {
            out.push_back('%');
            out.push_back(kHex[c >> 4]);
            out.push_back(kHex[c & 0x0F]);
        }
    }
    return out;
}

std::string appendQuery(const std::string& url,
                        const std::map<std::string, std::string>& params) {
    if (params.empty()) return url;

    std::string out = url;
    char sep = (url.find('?') == std::string::npos) ? '?' : '&';
    for (const auto& [key, value] : params) {
        out.push_back(sep);
        out += urlEncode(key);
        out.push_back('=');
        out += urlEncode(value);
        sep = '&';
    }
    return out;
}

bool isJsonContentType(const std::string& contentType) {
    std::string media = contentType.substr(0, contentType.find(';'));
    media.erase(std::remove_if(media.begin(), media.end(),
                               [](unsigned char c) { return std::isspace(c); }),
                media.end());
    std::transform(media.begin(), media.end(), media.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (media == "application/json") return true;
    const std::string suffix = "+json";
    return media.size() > suffix.size() &&
           media.compare(media.size() - suffix.size(), suffix.size(), suffix) == 0;
}

nlohmann::json decodeBody(const std::string& contentType, const std::string& text) {
    if (isJsonContentType(contentType)) {
        try {
            return nlohmann::json::parse(text);
        } catch (const nlohmann::json::parse_error&) {
            // Mislabelled payload; keep the text.
        }
    }
    return nlohmann::json(text);
}

} // namespace fetch_engine
