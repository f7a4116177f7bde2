#include "beast_transport.hpp"
#include "errors.hpp"

#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/version.hpp>
#include <boost/asio/connect.hpp>
#include <boost/asio/ip/tcp.hpp>

#ifdef FETCH_ENGINE_HAS_SSL
#include <boost/beast/ssl.hpp>
#include <boost/asio/ssl.hpp>
#endif

#include <algorithm>
#include <cstdint>
#include <iostream>
#include <stdexcept>

namespace beast = boost::beast;
namespace http  = beast::http;
namespace net   = boost::asio;
using tcp       = net::ip::tcp;

namespace fetch_engine {

namespace {

constexpr std::uint64_t kMaxBodyBytes    = 64ull * 1024 * 1024;
constexpr auto          kShutdownTimeout = std::chrono::seconds(1);

http::verb toVerb(HttpMethod method) {
    switch (method) {
        case HttpMethod::Get:    return http::verb::get;
        case HttpMethod::Post:   return http::verb::post;
        case HttpMethod::Put:    return http::verb::put;
        case HttpMethod::Patch:  return http::verb::patch;
        case HttpMethod::Delete: return http::verb::delete_;
    }
    return http::verb::get;
}

std::string hostKey(const UrlParts& parts) {
    return parts.scheme + "://" + parts.host + ":" + parts.port;
}

std::string toStdString(beast::string_view sv) {
    return std::string(sv.data(), sv.size());
}

/// Start one async operation on @p ioc, run it to completion on the calling
/// thread and return its error.  Stream deadlines turn stalls into errors.
template <typename Initiate>
beast::error_code runOp(net::io_context& ioc, Initiate&& initiate) {
    beast::error_code result;
    initiate([&result](beast::error_code ec, auto&&...) { result = ec; });
    ioc.restart();
    ioc.run();
    return result;
}

void throwIfFailed(const beast::error_code& ec, const std::string& what) {
    if (ec) {
        throw TransportError(what + " failed: " + ec.message());
    }
}

/// Failure that shows the server dropped an idle connection before it read
/// anything from us, so the request can go out again on a new socket.
class StaleConnectionError : public TransportError {
public:
    using TransportError::TransportError;
};

bool isPeerClose(const beast::error_code& ec) {
    return ec == http::error::end_of_stream ||
           ec == net::error::eof ||
           ec == net::error::connection_reset ||
           ec == net::error::connection_aborted ||
           ec == net::error::broken_pipe;
}

template <typename Stream>
void writeThenRead(net::io_context& ioc,
                   Stream& stream,
                   beast::flat_buffer& buffer,
                   http::request<http::string_body>& req,
                   http::response_parser<http::string_body>& parser,
                   const std::string& key)
{
    beast::error_code ec = runOp(ioc, [&](auto handler) {
        http::async_write(stream, req, std::move(handler));
    });
    if (ec && isPeerClose(ec)) {
        throw StaleConnectionError("Write to " + key + " failed: " + ec.message());
    }
    throwIfFailed(ec, "Write to " + key);

    ec = runOp(ioc, [&](auto handler) {
        http::async_read(stream, buffer, parser, std::move(handler));
    });
    if (ec && isPeerClose(ec) && !parser.got_some()) {
        throw StaleConnectionError("Read from " + key + " failed: " + ec.message());
    }
    throwIfFailed(ec, "Read from " + key);
}

} // namespace

// ---------------------------------------------------------------------------
// Connection
// ---------------------------------------------------------------------------

struct BeastTransport::Connection {
    std::string        key;
    net::io_context    ioc;
    beast::flat_buffer buffer;
#ifdef FETCH_ENGINE_HAS_SSL
    std::unique_ptr<net::ssl::context>                    sslCtx;
    std::unique_ptr<beast::ssl_stream<beast::tcp_stream>> tls;
#endif
    std::unique_ptr<beast::tcp_stream> plain;

    beast::tcp_stream& lowest() {
#ifdef FETCH_ENGINE_HAS_SSL
        if (tls) return beast::get_lowest_layer(*tls);
#endif
        return *plain;
    }

    void closeSocket() {
        beast::error_code ec;
        lowest().socket().close(ec);
    }

    void shutdown() {
        // Best effort.
        beast::error_code ec;
#ifdef FETCH_ENGINE_HAS_SSL
        if (tls) {
            lowest().expires_after(kShutdownTimeout);
            ec = runOp(ioc, [this](auto handler) { tls->async_shutdown(std::move(handler)); });
        }
#endif
        lowest().socket().shutdown(tcp::socket::shutdown_both, ec);
        lowest().socket().close(ec);
    }
};

// ---------------------------------------------------------------------------
// Construction
// ---------------------------------------------------------------------------

BeastTransport::BeastTransport(const ConnectionPoolConfig& pool, bool verbose)
    : mPool(pool)
    , mVerbose(verbose) {}

BeastTransport::~BeastTransport() {
    close();
}

// ---------------------------------------------------------------------------
// Public API
// ---------------------------------------------------------------------------

RawResponse BeastTransport::send(const PreparedRequest& request,
                                 std::chrono::milliseconds timeout)
{
    const UrlParts parts = parseUrl(request.url);

    if (mVerbose) {
        std::cerr << "[BeastTransport] " << toString(request.method) << " "
                  << parts.host << ":" << parts.port << parts.target << "\n";
    }

    return doSend(request, parts, timeout, /*allowReuse=*/true);
}

void BeastTransport::close() {
    std::vector<std::unique_ptr<Connection>> closing;
    {
        std::lock_guard<std::mutex> lock(mMutex);
        for (auto& [key, idle] : mIdle) {
            for (auto& entry : idle) {
                releaseSlotLocked(key);
                closing.push_back(std::move(entry.conn));
            }
        }
        mIdle.clear();
    }
    mConnectionFreed.notify_all();

    for (auto& conn : closing) {
        conn->shutdown();
    }

    std::lock_guard<std::mutex> lock(mDnsMutex);
    mDnsCache.clear();
}

int BeastTransport::openConnections() const {
    std::lock_guard<std::mutex> lock(mMutex);
    return mOpenTotal;
}

int BeastTransport::idleConnections() const {
    std::lock_guard<std::mutex> lock(mMutex);
    int count = 0;
    for (const auto& [key, idle] : mIdle) {
        count += static_cast<int>(idle.size());
    }
    return count;
}

// ---------------------------------------------------------------------------
// Exchange
// ---------------------------------------------------------------------------

RawResponse BeastTransport::doSend(const PreparedRequest& request,
                                   const UrlParts& parts,
                                   std::chrono::milliseconds timeout,
                                   bool allowReuse)
{
    const auto deadline = Clock::now() + timeout;
    bool reused = false;
    auto conn = checkout(parts, timeout, allowReuse, reused);

    try {
        if (!reused) {
            connect(*conn, parts, timeout);
        }

        bool keepAlive = false;
        RawResponse response = exchange(*conn, parts, request, timeout, keepAlive);

        if (keepAlive) {
            checkin(std::move(conn));
        } else {
            conn->shutdown();
            discard(std::move(conn));
        }
        return response;

    } catch (const StaleConnectionError& e) {
        if (conn) discard(std::move(conn));
        if (!reused) throw;

        // The parked socket was closed by the server before it saw the
        // request. Replay once on a new socket within the same deadline.
        const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - Clock::now());
        if (remaining.count() <= 0) throw;

        if (mVerbose) {
            std::cerr << "[BeastTransport] Pooled connection to " << hostKey(parts)
                      << " was closed by the server (" << e.what() << "), reconnecting\n";
        }
        return doSend(request, parts, remaining, /*allowReuse=*/false);

    } catch (...) {
        if (conn) discard(std::move(conn));
        throw;
    }
}

void BeastTransport::connect(Connection& conn,
                             const UrlParts& parts,
                             std::chrono::milliseconds timeout)
{
    const auto endpoints = resolve(parts);

    auto& stream = conn.lowest();
    stream.expires_after(std::min(timeout, mPool.connectTimeout));
    throwIfFailed(runOp(conn.ioc, [&](auto handler) {
                      stream.async_connect(endpoints, std::move(handler));
                  }),
                  "Connect to " + conn.key);

#ifdef FETCH_ENGINE_HAS_SSL
    if (conn.tls) {
        // SNI hostname.
        if (!SSL_set_tlsext_host_name(conn.tls->native_handle(), parts.host.c_str())) {
            throw TransportError("Failed to set SNI hostname for " + parts.host);
        }
        stream.expires_after(timeout);
        throwIfFailed(runOp(conn.ioc, [&](auto handler) {
                          conn.tls->async_handshake(net::ssl::stream_base::client,
                                                    std::move(handler));
                      }),
                      "TLS handshake with " + conn.key);
    }
#endif
}

RawResponse BeastTransport::exchange(Connection& conn,
                                     const UrlParts& parts,
                                     const PreparedRequest& request,
                                     std::chrono::milliseconds timeout,
                                     bool& keepAlive)
{
    const bool defaultPort = (parts.scheme == "https" && parts.port == "443") ||
                             (parts.scheme == "http" && parts.port == "80");

    // Build request.
    http::request<http::string_body> req{toVerb(request.method), parts.target, 11};
    req.set(http::field::host, defaultPort ? parts.host : parts.host + ":" + parts.port);
    req.set(http::field::user_agent, "fetch_engine/1.0");
    req.keep_alive(mPool.keepAlive.count() > 0);
    for (const auto& [name, value] : request.headers) {
        req.set(name, value);
    }
    req.body() = request.body;
    req.prepare_payload();

    http::response_parser<http::string_body> parser;
    parser.body_limit(kMaxBodyBytes);

    // Send + receive share one deadline.
    conn.lowest().expires_after(timeout);
#ifdef FETCH_ENGINE_HAS_SSL
    if (conn.tls) {
        writeThenRead(conn.ioc, *conn.tls, conn.buffer, req, parser, conn.key);
    } else
#endif
    {
        writeThenRead(conn.ioc, *conn.plain, conn.buffer, req, parser, conn.key);
    }

    auto& res = parser.get();

    RawResponse response;
    response.status = static_cast<int>(res.result_int());
    for (const auto& field : res) {
        auto& slot = response.headers[toStdString(field.name_string())];
        if (!slot.empty()) slot += ", ";
        slot += toStdString(field.value());
    }
    response.url  = request.url;
    keepAlive     = res.keep_alive() && mPool.keepAlive.count() > 0;
    response.body = std::move(res.body());

    if (mVerbose) {
        std::cerr << "[BeastTransport] HTTP " << response.status << " "
                  << response.body.size() << " bytes\n";
    }
    return response;
}

// ---------------------------------------------------------------------------
// Connection accounting
// ---------------------------------------------------------------------------

std::unique_ptr<BeastTransport::Connection>
BeastTransport::checkout(const UrlParts& parts,
                         std::chrono::milliseconds timeout,
                         bool allowReuse,
                         bool& reused)
{
    const std::string key      = hostKey(parts);
    const auto        deadline = Clock::now() + timeout;
    reused = false;

    {
        std::unique_lock<std::mutex> lock(mMutex);
        for (;;) {
            auto& idle = mIdle[key];
            while (allowReuse && !idle.empty()) {
                IdleConnection entry = std::move(idle.back());
                idle.pop_back();
                if (Clock::now() - entry.since < mPool.keepAlive) {
                    reused = true;
                    return std::move(entry.conn);
                }
                releaseSlotLocked(key);
            }

            if (mOpenTotal < mPool.totalConnections &&
                mOpenPerHost[key] < mPool.perHostConnections) {
                ++mOpenTotal;
                ++mOpenPerHost[key];
                break;
            }

            if (evictIdleLocked()) continue;

            if (mConnectionFreed.wait_until(lock, deadline) == std::cv_status::timeout) {
                throw TransportError("Timed out waiting for a free connection to " + key);
            }
        }
    }

    try {
        auto conn = std::make_unique<Connection>();
        conn->key = key;
        if (parts.scheme == "https") {
#ifdef FETCH_ENGINE_HAS_SSL
            conn->sslCtx = std::make_unique<net::ssl::context>(net::ssl::context::tlsv12_client);
            conn->sslCtx->set_default_verify_paths();
            conn->sslCtx->set_verify_mode(net::ssl::verify_peer);
            conn->tls = std::make_unique<beast::ssl_stream<beast::tcp_stream>>(
                conn->ioc, *conn->sslCtx);
#else
            throw std::runtime_error(
                "HTTPS endpoint requested but SSL support was not compiled in. "
                "Rebuild with OpenSSL to enable HTTPS.");
#endif
        } else {
            conn->plain = std::make_unique<beast::tcp_stream>(conn->ioc);
        }
        return conn;
    } catch (...) {
        {
            std::lock_guard<std::mutex> lock(mMutex);
            releaseSlotLocked(key);
        }
        mConnectionFreed.notify_all();
        throw;
    }
}

void BeastTransport::checkin(std::unique_ptr<Connection> conn) {
    {
        std::lock_guard<std::mutex> lock(mMutex);
        const std::string key = conn->key;
        mIdle[key].push_back(IdleConnection{std::move(conn), Clock::now()});
    }
    mConnectionFreed.notify_all();
}

void BeastTransport::discard(std::unique_ptr<Connection> conn) {
    conn->closeSocket();
    {
        std::lock_guard<std::mutex> lock(mMutex);
        releaseSlotLocked(conn->key);
    }
    mConnectionFreed.notify_all();
}

void BeastTransport::releaseSlotLocked(const std::string& key) {
    if (mOpenTotal > 0) --mOpenTotal;
    auto it = mOpenPerHost.find(key);
    if (it != mOpenPerHost.end() && --it->second <= 0) {
        mOpenPerHost.erase(it);
    }
}

bool BeastTransport::evictIdleLocked() {
    for (auto& [key, idle] : mIdle) {
        if (idle.empty()) continue;
        // Oldest first.
        idle.front().conn->closeSocket();
        idle.erase(idle.begin());
        releaseSlotLocked(key);
        return true;
    }
    return false;
}

// ---------------------------------------------------------------------------
// DNS cache
// ---------------------------------------------------------------------------

std::vector<tcp::endpoint> BeastTransport::resolve(const UrlParts& parts) {
    const std::string key = parts.host + ":" + parts.port;
    const auto now = Clock::now();

    {
        std::lock_guard<std::mutex> lock(mDnsMutex);
        auto it = mDnsCache.find(key);
        if (it != mDnsCache.end() && now < it->second.expires) {
            return it->second.endpoints;
        }
    }

    net::io_context ioc;
    tcp::resolver   resolver(ioc);
    beast::error_code ec;
    auto const results = resolver.resolve(parts.host, parts.port, ec);
    throwIfFailed(ec, "Resolve " + key);

    std::vector<tcp::endpoint> endpoints;
    for (const auto& entry : results) {
        endpoints.push_back(entry.endpoint());
    }
    if (endpoints.empty()) {
        throw TransportError("Resolve " + key + " returned no addresses");
    }

    if (mPool.dnsCacheTtl.count() > 0) {
        std::lock_guard<std::mutex> lock(mDnsMutex);
        mDnsCache[key] = DnsEntry{endpoints, now + mPool.dnsCacheTtl};
    }
    return endpoints;
}

} // namespace fetch_engine
