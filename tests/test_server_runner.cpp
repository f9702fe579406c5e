//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_server_runner.cpp
// Purpose: GoogleTests for the start/stop/run lifecycle and the invocation descriptor
//==========================================================================================================

#include <gtest/gtest.h>

#include <chrono>
#include <stdexcept>
#include <string>

#include <boost/asio.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>

#include "ssehost/ServerRunner.h"

using namespace ssehost;
namespace net = boost::asio;
namespace beast = boost::beast;
namespace http = boost::beast::http;
using tcp = net::ip::tcp;

namespace {

ServerRunner::Options loopbackOptions() {
    ServerRunner::Options opts;
    opts.address = "127.0.0.1";
    opts.startupGraceMs = 2000;
    opts.shutdownTimeoutMs = 2000;
    return opts;
}

// A port that was free a moment ago.
int freePort() {
    net::io_context io;
    tcp::acceptor a(io, tcp::endpoint(net::ip::make_address("127.0.0.1"), 0));
    return a.local_endpoint().port();
}

JSONValue invocation(JSONValue port) {
    JSONValue::Object inputs;
    inputs["port"] = std::make_shared<JSONValue>(std::move(port));
    JSONValue::Object deployment;
    deployment["node_url"] = std::make_shared<JSONValue>(std::string("http://node.local:7001"));
    JSONValue::Object root;
    root["inputs"] = std::make_shared<JSONValue>(inputs);
    root["deployment"] = std::make_shared<JSONValue>(deployment);
    root["consumer_id"] = std::make_shared<JSONValue>(std::string("consumer-1"));
    root["signature"] = std::make_shared<JSONValue>(std::string("sig"));
    return JSONValue{root};
}

} // namespace

TEST(RunInvocation, ParsesDescriptor) {
    RunInvocation inv = RunInvocation::FromJson(invocation(JSONValue{static_cast<int64_t>(8001)}));
    EXPECT_EQ(inv.port, 8001);
    ASSERT_TRUE(inv.nodeUrl.has_value());
    EXPECT_EQ(*inv.nodeUrl, "http://node.local:7001");
    EXPECT_EQ(inv.consumerId, "consumer-1");
    EXPECT_EQ(inv.signature, "sig");

    JSONValue back = inv.ToJson();
    EXPECT_EQ(std::get<int64_t>(back.find("inputs")->find("port")->value), 8001);
}

TEST(RunInvocation, RejectsBadDescriptors) {
    EXPECT_THROW(RunInvocation::FromJson(JSONValue{std::string("nope")}), std::invalid_argument);
    EXPECT_THROW(RunInvocation::FromJson(JSONValue{JSONValue::Object{}}), std::invalid_argument);
    EXPECT_THROW(RunInvocation::FromJson(invocation(JSONValue{std::string("8001")})), std::invalid_argument);
    EXPECT_THROW(RunInvocation::FromJson(invocation(JSONValue{static_cast<int64_t>(0)})), std::invalid_argument);
    EXPECT_THROW(RunInvocation::FromJson(invocation(JSONValue{static_cast<int64_t>(70000)})), std::invalid_argument);
}

TEST(RunResult, RendersStatusAndMessage) {
    RunResult r;
    r.status = RunResult::Status::Success;
    r.message = "ok";
    JSONValue doc = r.ToJson();
    EXPECT_EQ(std::get<std::string>(doc.find("status")->value), "success");
    EXPECT_EQ(std::get<std::string>(doc.find("message")->value), "ok");
    r.status = RunResult::Status::Error;
    EXPECT_EQ(std::get<std::string>(r.ToJson().find("status")->value), "error");
}

TEST(ServerRunner, StartStopLifecycle) {
    ServerRunner runner(loopbackOptions());
    EXPECT_FALSE(runner.IsRunning());
    runner.Stop();  // no-op while stopped

    EXPECT_EQ(runner.Start(0), StartStatus::Started);
    EXPECT_TRUE(runner.IsRunning());
    const unsigned short bound = runner.BoundPort();
    EXPECT_NE(bound, 0);

    EXPECT_EQ(runner.Start(0), StartStatus::AlreadyRunning);
    EXPECT_EQ(runner.BoundPort(), bound);

    runner.Stop();
    EXPECT_FALSE(runner.IsRunning());
    EXPECT_EQ(runner.BoundPort(), 0);
    runner.Stop();
    EXPECT_FALSE(runner.IsRunning());

    EXPECT_EQ(runner.Start(0), StartStatus::Started);
    runner.Stop();
}

TEST(ServerRunner, OccupiedPortIsBindFailure) {
    net::io_context io;
    tcp::acceptor holder(io, tcp::endpoint(net::ip::make_address("127.0.0.1"), 0));
    holder.listen();
    const int port = holder.local_endpoint().port();

    ServerRunner runner(loopbackOptions());
    EXPECT_EQ(runner.Start(port), StartStatus::BindFailure);
    EXPECT_FALSE(runner.IsRunning());
    EXPECT_EQ(runner.Start(70000), StartStatus::BindFailure);

    RunInvocation inv;
    inv.port = port;
    RunResult r = runner.Run(inv);
    EXPECT_FALSE(r.ok());
    EXPECT_EQ(r.message, "Failed to start MCP server on port " + std::to_string(port));
}

TEST(ServerRunner, RunReportsStartedThenAlreadyRunning) {
    ServerRunner runner(loopbackOptions());
    const int port = freePort();

    RunResult first = runner.Run(invocation(JSONValue{static_cast<int64_t>(port)}));
    ASSERT_TRUE(first.ok()) << first.message;
    EXPECT_EQ(first.message, "MCP server started for this run on port " + std::to_string(port));
    EXPECT_EQ(runner.BoundPort(), port);

    RunResult second = runner.Run(invocation(JSONValue{static_cast<int64_t>(port)}));
    EXPECT_TRUE(second.ok());
    EXPECT_EQ(second.message, "MCP server already running on port " + std::to_string(port));
    runner.Stop();
}

TEST(ServerRunner, RunWithBadDescriptorThrowsAndStaysStopped) {
    ServerRunner runner(loopbackOptions());
    EXPECT_THROW(runner.Run(JSONValue{JSONValue::Object{}}), std::invalid_argument);
    EXPECT_FALSE(runner.IsRunning());

    ASSERT_EQ(runner.Start(0), StartStatus::Started);
    EXPECT_THROW(runner.Run(invocation(JSONValue{std::string("x")})), std::invalid_argument);
    EXPECT_FALSE(runner.IsRunning());
}

TEST(ServerRunner, OnlyOneRunnerPerProcessIsActive) {
    ServerRunner first(loopbackOptions());
    ServerRunner second(loopbackOptions());

    ASSERT_EQ(first.Start(0), StartStatus::Started);
    const unsigned short bound = first.BoundPort();
    EXPECT_EQ(ServerRunner::ActivePort(), bound);

    EXPECT_EQ(second.Start(0), StartStatus::AlreadyRunning);
    EXPECT_FALSE(second.IsRunning());
    EXPECT_EQ(second.BoundPort(), 0);

    RunInvocation inv;
    inv.port = freePort();
    RunResult r = second.Run(inv);
    EXPECT_TRUE(r.ok());
    EXPECT_EQ(r.message, "MCP server already running on port " + std::to_string(bound));
    EXPECT_FALSE(second.IsRunning());

    // Stopping the idle runner leaves the active one alone.
    second.Stop();
    EXPECT_TRUE(first.IsRunning());
    EXPECT_EQ(ServerRunner::ActivePort(), bound);

    first.Stop();
    EXPECT_EQ(ServerRunner::ActivePort(), 0);
    EXPECT_EQ(second.Start(0), StartStatus::Started);
    EXPECT_EQ(first.Start(0), StartStatus::AlreadyRunning);
    second.Stop();
}

TEST(ServerRunner, StopEndsOpenEventStream) {
    ServerRunner runner(loopbackOptions());
    ASSERT_EQ(runner.Start(0), StartStatus::Started);

    net::io_context io;
    tcp::socket socket{io};
    socket.connect(tcp::endpoint(net::ip::make_address("127.0.0.1"), runner.BoundPort()));
    http::request<http::empty_body> req{http::verb::get, "/sse", 11};
    req.set(http::field::host, "127.0.0.1");
    http::write(socket, req);

    beast::flat_buffer buffer;
    http::response_parser<http::string_body> parser;
    http::read_header(socket, buffer, parser);
    ASSERT_EQ(parser.get().result_int(), 200u);

    const auto begin = std::chrono::steady_clock::now();
    runner.Stop();
    EXPECT_FALSE(runner.IsRunning());
    EXPECT_LT(std::chrono::steady_clock::now() - begin, std::chrono::milliseconds(3000));

    // The stream ends either with its last chunk or with the connection closing.
    beast::error_code ec;
    http::read(socket, buffer, parser, ec);
    EXPECT_TRUE(parser.is_done() || ec);
    EXPECT_NE(parser.get().body().find("event: endpoint"), std::string::npos);
}
