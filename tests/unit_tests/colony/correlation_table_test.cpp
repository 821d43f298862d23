/*
 *   Copyright (c) 2026 Edward Boggis-Rolfe
 *   All rights reserved.
 */

#include <set>

#include <gtest/gtest.h>

#include <colony/command_channel.h>
#include <colony/correlation_table.h>

using colony::correlation_table;

namespace
{
    auto later()
    {
        return std::chrono::steady_clock::now() + std::chrono::seconds(30);
    }
}

TEST(correlation_table_test, resolve_delivers_the_response_once)
{
    correlation_table table;
    auto request = table.insert("a", later());
    ASSERT_NE(request, nullptr);
    EXPECT_TRUE(table.contains("a"));
    EXPECT_FALSE(request->resolved.is_set());

    EXPECT_TRUE(table.resolve("a", {{"requestId", "a"}, {"success", true}}));
    EXPECT_TRUE(request->resolved.is_set());
    EXPECT_EQ(request->error_code, colony::error::OK());
    EXPECT_EQ(request->response["success"], true);
    EXPECT_EQ(table.size(), 0u);

    // a duplicate response and a late failure both find nothing
    EXPECT_FALSE(table.resolve("a", {{"success", false}}));
    EXPECT_FALSE(table.fail("a", colony::error::TIMED_OUT()));
    EXPECT_EQ(request->error_code, colony::error::OK());
    EXPECT_EQ(request->response["success"], true);
}

TEST(correlation_table_test, unknown_id_is_ignored)
{
    correlation_table table;
    auto request = table.insert("known", later());
    EXPECT_FALSE(table.resolve("unknown", nlohmann::json::object()));
    EXPECT_FALSE(request->resolved.is_set());
    EXPECT_EQ(table.size(), 1u);
}

TEST(correlation_table_test, duplicate_insert_is_refused)
{
    correlation_table table;
    auto first = table.insert("dup", later());
    ASSERT_NE(first, nullptr);
    EXPECT_EQ(table.insert("dup", later()), nullptr);
    EXPECT_EQ(table.size(), 1u);
}

TEST(correlation_table_test, fail_records_the_error)
{
    correlation_table table;
    auto request = table.insert("t", later());
    EXPECT_TRUE(table.fail("t", colony::error::TIMED_OUT()));
    EXPECT_TRUE(request->resolved.is_set());
    EXPECT_EQ(request->error_code, colony::error::TIMED_OUT());
    EXPECT_TRUE(request->response.is_null());
    EXPECT_FALSE(table.resolve("t", nlohmann::json::object()));
}

TEST(correlation_table_test, fail_all_cancels_everything)
{
    correlation_table table;
    auto a = table.insert("a", later());
    auto b = table.insert("b", later());
    auto c = table.insert("c", later());
    EXPECT_TRUE(table.resolve("b", nlohmann::json::object()));

    EXPECT_EQ(table.fail_all(colony::error::CALL_CANCELLED()), 2u);
    EXPECT_EQ(table.size(), 0u);
    EXPECT_EQ(a->error_code, colony::error::CALL_CANCELLED());
    EXPECT_EQ(b->error_code, colony::error::OK());
    EXPECT_EQ(c->error_code, colony::error::CALL_CANCELLED());
    EXPECT_TRUE(a->resolved.is_set());
    EXPECT_TRUE(c->resolved.is_set());
    EXPECT_EQ(table.fail_all(colony::error::CALL_CANCELLED()), 0u);
}

TEST(correlation_table_test, request_ids_are_uuids)
{
    std::set<std::string> ids;
    for (int i = 0; i < 1000; ++i)
    {
        auto id = colony::generate_request_id();
        ASSERT_EQ(id.size(), 36u);
        EXPECT_EQ(id[8], '-');
        EXPECT_EQ(id[13], '-');
        EXPECT_EQ(id[14], '4');
        EXPECT_EQ(id[18], '-');
        EXPECT_EQ(id[23], '-');
        ids.insert(id);
    }
    EXPECT_EQ(ids.size(), 1000u);
}
