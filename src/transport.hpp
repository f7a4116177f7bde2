#pragma once

#include "models.hpp"

#include <chrono>
#include <map>
#include <string>

namespace fetch_engine {

/// Fully resolved request as it goes on the wire.
struct PreparedRequest {
    HttpMethod                         method = HttpMethod::Get;
    std::string                        url;      // absolute, query included
    std::map<std::string, std::string> headers;
    std::string                        body;
};

/// Undecoded HTTP response.
struct RawResponse {
    int                                status = 0;
    std::map<std::string, std::string> headers;
    std::string                        body;
    std::string                        url;

    /// Header lookup, case-insensitive. Empty when absent.
    std::string header(const std::string& name) const;
};

/// Moves one request/response exchange over the network.
/// Implementations must allow concurrent send() calls from several threads.
class HttpTransport {
public:
    HttpTransport() = default;
    virtual ~HttpTransport() = default;
    HttpTransport(const HttpTransport&) = delete;
    HttpTransport& operator=(const HttpTransport&) = delete;

    /// @throws TransportError when no HTTP response was received
    ///         (timeout, resolve/connect/read/write failure).
    virtual RawResponse send(const PreparedRequest& request,
                             std::chrono::milliseconds timeout) = 0;

    /// Release pooled connections. No send() may be in progress.
    virtual void close() = 0;
};

} // namespace fetch_engine
