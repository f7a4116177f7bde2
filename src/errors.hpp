#pragma once

#include <stdexcept>
#include <string>
#include <utility>

namespace fetch_engine {

/// Timeout, resolve, connect, read or write failure: no HTTP response.
struct TransportError : public std::runtime_error {
    explicit TransportError(const std::string& msg)
        : std::runtime_error(msg) {}
};

/// Every attempt of one logical request failed at the transport level.
struct ExhaustedRetriesError : public std::runtime_error {
    int         attempts;
    std::string url;
    std::string lastCause;

    ExhaustedRetriesError(int attempts, std::string url, std::string lastCause)
        : std::runtime_error("Max retries exceeded after " + std::to_string(attempts) +
                             " attempts for " + url + ".  Last error: " + lastCause)
        , attempts(attempts)
        , url(std::move(url))
        , lastCause(std::move(lastCause)) {}
};

} // namespace fetch_engine
