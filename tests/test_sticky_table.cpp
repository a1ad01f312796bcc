#include <gtest/gtest.h>
#include "sticky_table.hpp"
#include <thread>

using namespace slb;
using namespace std::chrono_literals;

TEST(StickyTableTest, RemembersAssignment) {
    StickyTable table(16, 0ms);

    table.assign("doc-1", "http://a");

    auto address = table.find("doc-1");
    ASSERT_TRUE(address.has_value());
    EXPECT_EQ(*address, "http://a");
    EXPECT_FALSE(table.find("doc-2").has_value());
    EXPECT_EQ(table.size(), 1u);
}

TEST(StickyTableTest, TokenResolvesToAddress) {
    StickyTable table(16, 0ms);

    SessionToken token = table.assign("doc-1", "http://a");
    EXPECT_FALSE(token.value.empty());

    auto by_session = table.token_for("doc-1");
    ASSERT_TRUE(by_session.has_value());
    EXPECT_EQ(*by_session, token);

    auto address = table.address_for_token(token);
    ASSERT_TRUE(address.has_value());
    EXPECT_EQ(*address, "http://a");
}

TEST(StickyTableTest, ReassignIssuesNewToken) {
    StickyTable table(16, 0ms);

    SessionToken first = table.assign("doc-1", "http://a");
    SessionToken second = table.assign("doc-1", "http://b");

    EXPECT_NE(first, second);
    EXPECT_FALSE(table.address_for_token(first).has_value());
    EXPECT_EQ(table.address_for_token(second).value_or(""), "http://b");
    EXPECT_EQ(table.size(), 1u);
}

TEST(StickyTableTest, EvictsLeastRecentlyUsed) {
    StickyTable table(2, 0ms);

    table.assign("doc-1", "http://a");
    table.assign("doc-2", "http://b");
    // doc-1 becomes the most recent entry
    ASSERT_TRUE(table.find("doc-1").has_value());
    table.assign("doc-3", "http://c");

    EXPECT_EQ(table.size(), 2u);
    EXPECT_TRUE(table.find("doc-1").has_value());
    EXPECT_FALSE(table.find("doc-2").has_value());
    EXPECT_TRUE(table.find("doc-3").has_value());
}

TEST(StickyTableTest, ZeroCapacityIsUnbounded) {
    StickyTable table(0, 0ms);

    for (int i = 0; i < 100; ++i) {
        table.assign("doc-" + std::to_string(i), "http://a");
    }
    EXPECT_EQ(table.size(), 100u);
}

TEST(StickyTableTest, IdleEntriesExpire) {
    StickyTable table(16, 50ms);

    SessionToken token = table.assign("doc-1", "http://a");
    std::this_thread::sleep_for(80ms);

    EXPECT_FALSE(table.token_for("doc-1").has_value());
    EXPECT_FALSE(table.address_for_token(token).has_value());
    EXPECT_FALSE(table.find("doc-1").has_value());
    EXPECT_EQ(table.size(), 0u);
}

TEST(StickyTableTest, UseRefreshesIdleTimer) {
    StickyTable table(16, 200ms);

    table.assign("doc-1", "http://a");
    for (int i = 0; i < 4; ++i) {
        std::this_thread::sleep_for(100ms);
        ASSERT_TRUE(table.find("doc-1").has_value()) << "iteration " << i;
    }
}
