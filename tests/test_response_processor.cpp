/// @file test_response_processor.cpp
/// Unit tests for response_processor.hpp.

#include "response_processor.hpp"

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include <stdexcept>
#include <utility>
#include <vector>

using namespace fetch_engine;
using json = nlohmann::json;

static ResponseRecord record(int status, json body) {
    ResponseRecord r;
    r.status = status;
    r.body = std::move(body);
    r.url = "http://api.test/item";
    return r;
}

TEST(ResponseProcessor, AppliesFunctionToSuccessfulBodies) {
    std::vector<ResponseRecord> responses = {
        record(200, {{"n", 1}}),
        record(500, {{"error", "boom"}}),
        record(201, {{"n", 3}}),
    };

    ResponseProcessor processor;
    auto out = processor.process(responses, [](const json& body) {
        return json(body.at("n").get<int>() * 10);
    });

    ASSERT_EQ(out.size(), 2u);
    EXPECT_EQ(out[0], 10);
    EXPECT_EQ(out[1], 30);
    EXPECT_EQ(processor.processedCount(), 2);
    EXPECT_EQ(processor.errorCount(), 1);
}

TEST(ResponseProcessor, ThrowingFunctionCountsAsError) {
    std::vector<ResponseRecord> responses = {
        record(200, {{"n", 1}}),
        record(200, {{"missing", true}}),
    };

    ResponseProcessor processor;
    auto out = processor.process(responses, [](const json& body) {
        return body.at("n");  // throws json::out_of_range on the second body
    });

    EXPECT_EQ(out.size(), 1u);
    EXPECT_EQ(processor.errorCount(), 1);
}

TEST(ResponseProcessor, SmallBatchesCoverEveryResponse) {
    std::vector<ResponseRecord> responses;
    for (int i = 0; i < 7; ++i) responses.push_back(record(200, json(i)));

    ResponseProcessor processor;
    auto out = processor.process(responses, [](const json& body) { return body; }, 3);

    ASSERT_EQ(out.size(), 7u);
    for (int i = 0; i < 7; ++i) EXPECT_EQ(out[i], i);
}

TEST(ResponseProcessor, ZeroBatchSizeThrows) {
    ResponseProcessor processor;
    EXPECT_THROW(processor.process({}, [](const json& b) { return b; }, 0),
                 std::invalid_argument);
}
