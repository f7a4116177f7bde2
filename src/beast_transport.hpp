#pragma once

#include "config.hpp"
#include "transport.hpp"
#include "util.hpp"

#include <boost/asio/ip/tcp.hpp>

#include <chrono>
#include <condition_variable>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace fetch_engine {

/// HTTP/1.1 transport built on Boost.Beast.
///
/// Every exchange runs on a private io_context owned by its connection, so
/// send() blocks only the calling thread and many threads may send at once.
/// Connections that the server keeps alive are parked per host:port and
/// reused for up to ConnectionPoolConfig::keepAlive.  Open sockets (idle
/// or in use) never exceed the total and per-host limits; a caller that
/// hits a limit waits for a socket to be returned, up to its timeout.
class BeastTransport : public HttpTransport {
public:
    explicit BeastTransport(const ConnectionPoolConfig& pool, bool verbose = false);
    ~BeastTransport() override;

    RawResponse send(const PreparedRequest& request,
                     std::chrono::milliseconds timeout) override;

    void close() override;

    // ---- accessors ----
    int openConnections() const;
    int idleConnections() const;

private:
    using Clock = std::chrono::steady_clock;

    struct Connection;

    struct IdleConnection {
        std::unique_ptr<Connection> conn;
        Clock::time_point           since;
    };

    struct DnsEntry {
        std::vector<boost::asio::ip::tcp::endpoint> endpoints;
        Clock::time_point                           expires;
    };

    ConnectionPoolConfig mPool;
    bool                 mVerbose;

    mutable std::mutex                                  mMutex;
    std::condition_variable                             mConnectionFreed;
    int                                                 mOpenTotal = 0;
    std::map<std::string, int>                          mOpenPerHost;
    std::map<std::string, std::vector<IdleConnection>>  mIdle;

    std::mutex                      mDnsMutex;
    std::map<std::string, DnsEntry> mDnsCache;

    RawResponse doSend(const PreparedRequest& request,
                       const UrlParts& parts,
                       std::chrono::milliseconds timeout,
                       bool allowReuse);

    std::unique_ptr<Connection> checkout(const UrlParts& parts,
                                         std::chrono::milliseconds timeout,
                                         bool allowReuse,
                                         bool& reused);
    void checkin(std::unique_ptr<Connection> conn);
    void discard(std::unique_ptr<Connection> conn);
    void releaseSlotLocked(const std::string& key);
    bool evictIdleLocked();

    std::vector<boost::asio::ip::tcp::endpoint> resolve(const UrlParts& parts);
    void connect(Connection& conn, const UrlParts& parts,
                 std::chrono::milliseconds timeout);
    RawResponse exchange(Connection& conn, const UrlParts& parts,
                         const PreparedRequest& request,
                         std::chrono::milliseconds timeout,
                         bool& keepAlive);
};

} // namespace fetch_engine
