/**
 * request_router_test.cpp - response correlation
 *
 * Tests:
 * - Callback runs exactly once with status and results
 * - Responses in any order reach the right callback
 * - Unknown ids and non-response messages are ignored
 * - clear() abandons pending requests without invoking them
 */

#include "client/request_router.hpp"

#include <gtest/gtest.h>

#include <stdexcept>
#include <string>
#include <vector>

using namespace qode::client;
using json = nlohmann::json;

namespace {
json response(const std::string &id, bool status, const json &results) {
    return {{"request_id", id}, {"status", status}, {"results", results}};
}
}  // namespace

TEST(RequestRouterTest, DispatchInvokesCallbackOnce) {
    RequestRouter router;
    int calls = 0;
    bool seen_status = false;
    json seen_results;

    router.add("r1", [&](bool status, const json &results) {
        ++calls;
        seen_status = status;
        seen_results = results;
    });
    EXPECT_TRUE(router.is_pending("r1"));

    EXPECT_TRUE(router.dispatch(response("r1", true, {{"count", 3}})));
    EXPECT_FALSE(router.dispatch(response("r1", true, {{"count", 4}})));

    EXPECT_EQ(calls, 1);
    EXPECT_TRUE(seen_status);
    EXPECT_EQ(seen_results["count"], 3);
    EXPECT_FALSE(router.is_pending("r1"));
    EXPECT_EQ(router.pending_count(), 0u);
}

TEST(RequestRouterTest, OutOfOrderResponses) {
    RequestRouter router;
    std::vector<std::string> order;

    router.add("a", [&](bool, const json &results) { order.push_back("a:" + results.get<std::string>()); });
    router.add("b", [&](bool, const json &results) { order.push_back("b:" + results.get<std::string>()); });

    router.dispatch(response("b", true, "second"));
    router.dispatch(response("a", false, "first"));

    ASSERT_EQ(order.size(), 2u);
    EXPECT_EQ(order[0], "b:second");
    EXPECT_EQ(order[1], "a:first");
}

TEST(RequestRouterTest, FailedStatusIsDelivered) {
    RequestRouter router;
    bool status = true;
    router.add("r", [&](bool s, const json &) { status = s; });

    router.dispatch(response("r", false, {{"error", "boom"}}));
    EXPECT_FALSE(status);
}

TEST(RequestRouterTest, UnknownIdIsIgnored) {
    RequestRouter router;
    int calls = 0;
    router.add("known", [&](bool, const json &) { ++calls; });

    EXPECT_FALSE(router.dispatch(response("stranger", true, nullptr)));
    EXPECT_EQ(calls, 0);
    EXPECT_EQ(router.pending_count(), 1u);
}

TEST(RequestRouterTest, NonResponseMessagesAreIgnored) {
    RequestRouter router;
    int calls = 0;
    router.add("r", [&](bool, const json &) { ++calls; });

    EXPECT_FALSE(router.dispatch(json("progress")));
    EXPECT_FALSE(router.dispatch(json::array({1, 2})));
    EXPECT_FALSE(router.dispatch({{"request_id", "r"}, {"status", true}}));                    // no results
    EXPECT_FALSE(router.dispatch({{"request_id", "r"}, {"status", "yes"}, {"results", 1}}));  // status not bool
    EXPECT_FALSE(router.dispatch({{"request_id", 5}, {"status", true}, {"results", 1}}));     // id not string

    EXPECT_EQ(calls, 0);
    EXPECT_TRUE(router.is_pending("r"));
}

TEST(RequestRouterTest, NullResultsAreDelivered) {
    RequestRouter router;
    bool called = false;
    router.add("r", [&](bool, const json &results) {
        called = true;
        EXPECT_TRUE(results.is_null());
    });

    EXPECT_TRUE(router.dispatch(response("r", true, nullptr)));
    EXPECT_TRUE(called);
}

TEST(RequestRouterTest, ClearInvokesNothing) {
    RequestRouter router;
    int calls = 0;
    router.add("a", [&](bool, const json &) { ++calls; });
    router.add("b", [&](bool, const json &) { ++calls; });

    router.clear();
    EXPECT_EQ(router.pending_count(), 0u);

    router.dispatch(response("a", true, 1));
    EXPECT_EQ(calls, 0);
}

TEST(RequestRouterTest, ThrowingCallbackIsContained) {
    RequestRouter router;
    router.add("r", [](bool, const json &) { throw std::runtime_error("handler failed"); });

    EXPECT_NO_THROW(router.dispatch(response("r", true, 1)));
    EXPECT_FALSE(router.is_pending("r"));
}
