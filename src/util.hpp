#pragma once

#include <map>
#include <string>

#include <nlohmann/json.hpp>

namespace fetch_engine {

/// Decomposed URL components.
struct UrlParts {
    std::string scheme;   // "http" or "https"
    std::string host;
    std::string port;     // "80", "443", "4000", etc.
    std::string target;   // path + query (e.g. "/v1/items?page=2")
};

/// Parse an HTTP(S) URL into its components.
/// Throws std::invalid_argument on malformed input.
UrlParts parseUrl(const std::string& url);

/// Join a relative path onto the client's base URL.
/// Absolute http(s) URLs are returned untouched.
std::string resolveUrl(const std::string& baseUrl, const std::string& path);

/// Percent-encode everything outside the RFC 3986 unreserved set.
std::string urlEncode(const std::string& value);

/// Append @p params to @p url as an encoded query string (key order).
std::string appendQuery(const std::string& url,
                        const std::map<std::string, std::string>& params);

/// True for "application/json" and "+json" media types, parameters ignored.
bool isJsonContentType(const std::string& contentType);

/// Decode a response body: JSON when the content type says so and it parses,
/// otherwise the raw text as a JSON string value.
nlohmann::json decodeBody(const std::string& contentType, const std::string& text);

} // namespace fetch_engine
