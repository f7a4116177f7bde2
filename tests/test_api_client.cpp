/// @file test_api_client.cpp
/// Unit tests for api_client.hpp and convenience.hpp: transport lifetime,
/// statistics and the one-shot fetch helper.

#include "api_client.hpp"
#include "convenience.hpp"
#include "errors.hpp"
#include "fake_transport.hpp"

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include <atomic>
#include <memory>
#include <stdexcept>
#include <utility>

using namespace fetch_engine;
using namespace fetch_engine::testing_support;
using json = nlohmann::json;

namespace {

/// Factory that hands out FakeTransports and remembers how often it ran
/// and how often its transports were closed.
struct CountingFactory {
    explicit CountingFactory(FakeTransport::Handler fn) : handler(std::move(fn)) {}

    std::shared_ptr<std::atomic<int>> created = std::make_shared<std::atomic<int>>(0);
    std::shared_ptr<std::atomic<int>> closed  = std::make_shared<std::atomic<int>>(0);
    FakeTransport::Handler handler;

    ApiClient::TransportFactory make() {
        auto createdCount = created;
        auto closedCount = closed;
        auto h = handler;
        return [createdCount, closedCount, h](const ClientConfig&) {
            ++*createdCount;
            struct Tracked : FakeTransport {
                Tracked(Handler fn, std::shared_ptr<std::atomic<int>> c)
                    : FakeTransport(std::move(fn)), counter(std::move(c)) {}
                void close() override {
                    FakeTransport::close();
                    ++*counter;
                }
                std::shared_ptr<std::atomic<int>> counter;
            };
            return std::unique_ptr<HttpTransport>(std::make_unique<Tracked>(h, closedCount));
        };
    }
};

FakeTransport::Handler okHandler() {
    return [](const PreparedRequest& req, auto) {
        return jsonResponse(200, {{"path", pathOf(req.url)}}, req.url);
    };
}

RequestDescriptor get(const std::string& url) {
    RequestDescriptor r;
    r.url = url;
    return r;
}

} // namespace

// ============================================================================
// Construction and validation
// ============================================================================

TEST(ApiClient, InvalidConfigIsRejected) {
    auto cfg = fastConfig();
    cfg.maxConcurrent = 0;
    EXPECT_THROW(ApiClient client(cfg), std::invalid_argument);

    cfg = fastConfig();
    cfg.rateLimit.requestsPerSecond = 0.0;
    EXPECT_THROW(ApiClient client(cfg), std::invalid_argument);
}

TEST(ApiClient, SharedComponentsFollowConfig) {
    auto cfg = fastConfig();
    cfg.maxConcurrent = 4;
    cfg.rateLimit.burstSize = 7;
    CountingFactory factory(okHandler());
    ApiClient client(cfg, factory.make());

    EXPECT_EQ(client.gate().capacity(), 4);
    EXPECT_DOUBLE_EQ(client.rateLimiter().tokens(), 7.0);
    EXPECT_EQ(client.config().baseUrl, "http://api.test");
}

// ============================================================================
// Transport lifetime
// ============================================================================

TEST(ApiClient, TransportIsCreatedLazilyOnce) {
    CountingFactory factory(okHandler());
    ApiClient client(fastConfig(), factory.make());

    EXPECT_FALSE(client.isOpen());
    EXPECT_EQ(factory.created->load(), 0);

    client.request(get("/a"));
    client.request(get("/b"));
    client.batch({get("/c"), get("/d")});

    EXPECT_TRUE(client.isOpen());
    EXPECT_EQ(factory.created->load(), 1);
}

TEST(ApiClient, CloseReleasesTransportAndReopens) {
    CountingFactory factory(okHandler());
    ApiClient client(fastConfig(), factory.make());

    client.open();
    client.open();
    EXPECT_EQ(factory.created->load(), 1);

    client.close();
    EXPECT_FALSE(client.isOpen());
    EXPECT_EQ(factory.closed->load(), 1);

    client.close();  // idempotent
    EXPECT_EQ(factory.closed->load(), 1);

    client.request(get("/again"));
    EXPECT_EQ(factory.created->load(), 2);
}

TEST(ApiClient, DestructorClosesTransport) {
    CountingFactory factory(okHandler());
    {
        ApiClient client(fastConfig(), factory.make());
        client.open();
    }
    EXPECT_EQ(factory.closed->load(), 1);
}

TEST(ApiClient, NullTransportFromFactoryThrows) {
    ApiClient client(fastConfig(), [](const ClientConfig&) {
        return std::unique_ptr<HttpTransport>();
    });

    EXPECT_THROW(client.open(), std::runtime_error);
    EXPECT_THROW(client.batch({get("/a")}), std::runtime_error);
    EXPECT_FALSE(client.isOpen());
}

// ============================================================================
// Requests and statistics
// ============================================================================

TEST(ApiClient, StatsAggregateAcrossOperations) {
    auto cfg = fastConfig();
    cfg.retry.maxRetries = 1;
    CountingFactory factory([](const PreparedRequest& req, auto) {
        if (pathOf(req.url) == "/bad") return jsonResponse(404, json::object(), req.url);
        return jsonResponse(200, json::object(), req.url);
    });
    ApiClient client(cfg, factory.make());

    client.request(get("/ok"));
    client.request(get("/bad"));
    client.batch({get("/ok"), get("/ok")});

    auto stats = client.stats();
    EXPECT_EQ(stats.totalRequests, 4);
    EXPECT_EQ(stats.successfulRequests, 3);
    EXPECT_EQ(stats.failedRequests, 1);
    EXPECT_EQ(stats.retriedRequests, 0);
    EXPECT_DOUBLE_EQ(stats.successRate(), 75.0);
    EXPECT_GE(stats.averageResponseTime(), 0.0);

    client.resetStats();
    EXPECT_EQ(client.stats().totalRequests, 0);
    EXPECT_DOUBLE_EQ(client.stats().successRate(), 0.0);
}

TEST(ApiClient, RequestPropagatesExhaustedRetries) {
    auto cfg = fastConfig();
    cfg.retry.maxRetries = 2;
    CountingFactory factory([](const PreparedRequest&, auto) -> RawResponse {
        throw TransportError("no route to host");
    });
    ApiClient client(cfg, factory.make());

    EXPECT_THROW(client.request(get("/x")), ExhaustedRetriesError);
    EXPECT_EQ(client.gate().inFlight(), 0);
}

TEST(ApiClient, PaginateWalksThroughClient) {
    CountingFactory factory([](const PreparedRequest& req, auto) {
        const bool first = queryParam(req.url, "page") == "1";
        json items = json::array();
        for (int i = 0; i < (first ? 2 : 1); ++i) items.push_back(i);
        return jsonResponse(200, items, req.url);
    });
    ApiClient client(fastConfig(), factory.make());

    PaginationOptions options;
    options.pageSize = 2;
    auto pages = client.paginate(get("/list"), options);

    ASSERT_EQ(pages.size(), 2u);
    EXPECT_EQ(client.stats().totalRequests, 2);
}

// ============================================================================
// fetchJsonData
// ============================================================================

TEST(FetchJsonData, ReturnsOneRecordPerUrlInOrder) {
    CountingFactory factory([](const PreparedRequest& req, auto) {
        EXPECT_EQ(req.headers.at("Authorization"), "Bearer t");
        return jsonResponse(200, {{"path", pathOf(req.url)}}, req.url);
    });

    RetryConfig retry;
    retry.baseDelay = 0.001;
    retry.maxDelay = 0.001;

    auto results = fetchJsonData({"http://a.test/1", "http://b.test/2", "http://a.test/3"},
                                 {{"Authorization", "Bearer t"}}, 2, retry, factory.make());

    ASSERT_EQ(results.size(), 3u);
    EXPECT_EQ(results[0].body["path"], "/1");
    EXPECT_EQ(results[1].body["path"], "/2");
    EXPECT_EQ(results[2].body["path"], "/3");
    EXPECT_EQ(factory.created->load(), 1);
    EXPECT_EQ(factory.closed->load(), 1);
}
