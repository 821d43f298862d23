/*
 *   Copyright (c) 2026 Edward Boggis-Rolfe
 *   All rights reserved.
 */

#include <gtest/gtest.h>

#include <colony/error_codes.h>
#include <transports/websocket/url.h>

using colony::websocket::endpoint;
using colony::websocket::parse_ws_url;

TEST(url_test, parses_host_port_and_path)
{
    endpoint target;
    ASSERT_EQ(parse_ws_url("ws://localhost:8080/api/commands", target), colony::error::OK());
    EXPECT_EQ(target.host, "localhost");
    EXPECT_EQ(target.port, 8080);
    EXPECT_EQ(target.path, "/api/commands");
    EXPECT_EQ(target.host_header(), "localhost:8080");
}

TEST(url_test, default_endpoints)
{
    endpoint command;
    endpoint events;
    ASSERT_EQ(parse_ws_url("ws://localhost:8080", command), colony::error::OK());
    ASSERT_EQ(parse_ws_url("ws://localhost:8181", events), colony::error::OK());
    EXPECT_EQ(command.port, 8080);
    EXPECT_EQ(events.port, 8181);
    EXPECT_EQ(command.path, "/");
}

TEST(url_test, port_defaults_to_80)
{
    endpoint target;
    ASSERT_EQ(parse_ws_url("ws://10.0.0.7/", target), colony::error::OK());
    EXPECT_EQ(target.host, "10.0.0.7");
    EXPECT_EQ(target.port, 80);
    EXPECT_EQ(target.host_header(), "10.0.0.7");
}

TEST(url_test, rejects_other_schemes_and_bad_ports)
{
    endpoint target;
    EXPECT_EQ(parse_ws_url("wss://localhost:8080", target), colony::error::INVALID_URL());
    EXPECT_EQ(parse_ws_url("http://localhost:8080", target), colony::error::INVALID_URL());
    EXPECT_EQ(parse_ws_url("localhost:8080", target), colony::error::INVALID_URL());
    EXPECT_EQ(parse_ws_url("ws://", target), colony::error::INVALID_URL());
    EXPECT_EQ(parse_ws_url("ws://:8080", target), colony::error::INVALID_URL());
    EXPECT_EQ(parse_ws_url("ws://localhost:0", target), colony::error::INVALID_URL());
    EXPECT_EQ(parse_ws_url("ws://localhost:70000", target), colony::error::INVALID_URL());
    EXPECT_EQ(parse_ws_url("ws://localhost:80a", target), colony::error::INVALID_URL());
}

TEST(url_test, resolves_localhost_and_literals)
{
    std::string address;
    ASSERT_EQ(colony::websocket::resolve_ipv4("localhost", address), colony::error::OK());
    EXPECT_EQ(address, "127.0.0.1");
    ASSERT_EQ(colony::websocket::resolve_ipv4("192.168.1.20", address), colony::error::OK());
    EXPECT_EQ(address, "192.168.1.20");
}
