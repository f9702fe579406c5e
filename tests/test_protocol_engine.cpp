//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_protocol_engine.cpp
// Purpose: GoogleTests for the initialize handshake, tools/list, tools/call and JSON-RPC error framing
//==========================================================================================================

#include <gtest/gtest.h>

#include <memory>
#include <string>
#include <vector>

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/use_future.hpp>

#include "ssehost/Server.h"
#include "ssehost/errors/Errors.h"
#include "ssehost/tools/BuiltinTools.h"
#include "ssehost/typed/Content.h"

using namespace ssehost;
namespace net = boost::asio;

namespace {

const std::string kInitialize =
    R"({"jsonrpc":"2.0","id":1,"method":"initialize","params":{"protocolVersion":"2024-11-05",)"
    R"("capabilities":{},"clientInfo":{"name":"test-client","version":"0.1"}}})";

class ProtocolEngineTest : public ::testing::Test {
protected:
    void SetUp() override {
        registry = std::make_shared<ToolRegistry>();
        tools::RegisterBuiltinTools(*registry, std::make_shared<HTTPFetcher>());
        server = std::make_unique<Server>(Implementation("ssehost-test", "1.0"), registry);
        ctx.sessionId = "test-session";
    }

    // Runs one message through the engine and returns the parsed response document, or null.
    JSONValue handle(const std::string& body) {
        net::io_context ioc;
        auto fut = net::co_spawn(ioc, server->HandleMessage(ctx, body), net::use_future);
        ioc.run();
        auto resp = fut.get();
        if (!resp) {
            return JSONValue{nullptr};
        }
        return ParseJSON(resp->Serialize());
    }

    void initialize() {
        JSONValue doc = handle(kInitialize);
        ASSERT_NE(doc.find("result"), nullptr);
        ASSERT_EQ(ctx.state, Server::SessionState::Initialized);
    }

    static int64_t errorCode(const JSONValue& doc) {
        const JSONValue* err = doc.find("error");
        if (err == nullptr) {
            return 0;
        }
        return std::get<int64_t>(err->find("code")->value);
    }

    static std::string str(const JSONValue* v) {
        return v != nullptr && v->isString() ? std::get<std::string>(v->value) : std::string();
    }

    std::shared_ptr<ToolRegistry> registry;
    std::unique_ptr<Server> server;
    Server::SessionContext ctx;
};

} // namespace

TEST_F(ProtocolEngineTest, RequestsBeforeInitializeAreRejected) {
    JSONValue doc = handle(R"({"jsonrpc":"2.0","id":7,"method":"tools/list"})");
    EXPECT_EQ(errorCode(doc), JSONRPCErrorCodes::NotInitialized);
    EXPECT_EQ(std::get<int64_t>(doc.find("id")->value), 7);
    EXPECT_EQ(ctx.state, Server::SessionState::Uninitialized);
}

TEST_F(ProtocolEngineTest, InitializeEchoesVersionAndAdvertisesTools) {
    JSONValue doc = handle(kInitialize);
    const JSONValue* result = doc.find("result");
    ASSERT_NE(result, nullptr);
    EXPECT_EQ(str(result->find("protocolVersion")), "2024-11-05");
    const JSONValue* tools = result->find("capabilities")->find("tools");
    ASSERT_NE(tools, nullptr);
    EXPECT_FALSE(std::get<bool>(tools->find("listChanged")->value));
    EXPECT_EQ(str(result->find("serverInfo")->find("name")), "ssehost-test");
    EXPECT_EQ(ctx.clientInfo.name, "test-client");
}

TEST_F(ProtocolEngineTest, InitializeWithoutVersionFallsBackToDefault) {
    JSONValue doc = handle(R"({"jsonrpc":"2.0","id":"a","method":"initialize","params":{}})");
    EXPECT_EQ(str(doc.find("result")->find("protocolVersion")), PROTOCOL_VERSION);
    EXPECT_EQ(str(doc.find("id")), "a");
}

TEST_F(ProtocolEngineTest, ToolsListKeepsRegistrationOrder) {
    initialize();
    JSONValue doc = handle(R"({"jsonrpc":"2.0","id":2,"method":"tools/list"})");
    const JSONValue* tools = doc.find("result")->find("tools");
    ASSERT_NE(tools, nullptr);
    const auto& arr = std::get<JSONValue::Array>(tools->value);
    ASSERT_EQ(arr.size(), 3u);
    EXPECT_EQ(str(arr[0]->find("name")), "fetch");
    EXPECT_EQ(str(arr[1]->find("name")), "echo");
    EXPECT_EQ(str(arr[2]->find("name")), "hello");
    EXPECT_NE(arr[0]->find("inputSchema"), nullptr);
}

TEST_F(ProtocolEngineTest, CallEchoAndHello) {
    initialize();
    JSONValue echo = handle(
        R"({"jsonrpc":"2.0","id":3,"method":"tools/call","params":{"name":"echo","arguments":{"message":"hi"}}})");
    const JSONValue* content = echo.find("result")->find("content");
    ASSERT_NE(content, nullptr);
    const auto& items = std::get<JSONValue::Array>(content->value);
    ASSERT_EQ(items.size(), 1u);
    EXPECT_EQ(str(items[0]->find("type")), "text");
    EXPECT_EQ(str(items[0]->find("text")), "hi");

    JSONValue hello = handle(R"({"jsonrpc":"2.0","id":4,"method":"tools/call","params":{"name":"hello"}})");
    const auto& greet = std::get<JSONValue::Array>(hello.find("result")->find("content")->value);
    EXPECT_EQ(str(greet[0]->find("text")), "Hello, World!");
}

TEST_F(ProtocolEngineTest, CallErrorsAreFramedAsJsonRpcErrors) {
    initialize();
    JSONValue unknown = handle(
        R"({"jsonrpc":"2.0","id":5,"method":"tools/call","params":{"name":"nope","arguments":{}}})");
    EXPECT_EQ(errorCode(unknown), JSONRPCErrorCodes::ToolNotFound);

    JSONValue missing = handle(
        R"({"jsonrpc":"2.0","id":6,"method":"tools/call","params":{"name":"echo","arguments":{}}})");
    EXPECT_EQ(errorCode(missing), JSONRPCErrorCodes::InvalidParams);
    EXPECT_EQ(str(missing.find("error")->find("data")->find("field")), "message");

    JSONValue badType = handle(
        R"({"jsonrpc":"2.0","id":7,"method":"tools/call","params":{"name":"echo","arguments":{"message":12}}})");
    EXPECT_EQ(errorCode(badType), JSONRPCErrorCodes::InvalidParams);
    EXPECT_EQ(std::get<int64_t>(badType.find("id")->value), 7);

    JSONValue noName = handle(R"({"jsonrpc":"2.0","id":8,"method":"tools/call","params":{}})");
    EXPECT_EQ(errorCode(noName), JSONRPCErrorCodes::InvalidParams);
}

TEST_F(ProtocolEngineTest, UnknownMethodAndPing) {
    initialize();
    EXPECT_EQ(errorCode(handle(R"({"jsonrpc":"2.0","id":9,"method":"resources/list"})")),
              JSONRPCErrorCodes::MethodNotFound);
    JSONValue pong = handle(R"({"jsonrpc":"2.0","id":10,"method":"ping"})");
    ASSERT_NE(pong.find("result"), nullptr);
    EXPECT_TRUE(pong.find("result")->isObject());
}

TEST_F(ProtocolEngineTest, NotificationsAndResponsesProduceNothing) {
    initialize();
    EXPECT_TRUE(std::holds_alternative<std::nullptr_t>(
        handle(R"({"jsonrpc":"2.0","method":"notifications/initialized"})").value));
    EXPECT_TRUE(std::holds_alternative<std::nullptr_t>(
        handle(R"({"jsonrpc":"2.0","id":99,"result":{}})").value));
}

TEST_F(ProtocolEngineTest, MalformedBodyYieldsParseError) {
    JSONValue doc = handle("{not json");
    EXPECT_EQ(errorCode(doc), JSONRPCErrorCodes::ParseError);
    EXPECT_TRUE(std::holds_alternative<std::nullptr_t>(doc.find("id")->value));
}

TEST_F(ProtocolEngineTest, ServeSessionAnswersInOrderUntilClose) {
    net::io_context ioc;
    auto session = std::make_shared<Session>(ioc.get_executor(), "ordered");
    session->Deliver(kInitialize);
    session->Deliver(R"({"jsonrpc":"2.0","method":"notifications/initialized"})");
    session->Deliver(R"({"jsonrpc":"2.0","id":2,"method":"tools/list"})");
    session->Deliver(
        R"({"jsonrpc":"2.0","id":3,"method":"tools/call","params":{"name":"hello","arguments":{"name":"Ada"}}})");

    auto served = net::co_spawn(ioc, server->ServeSession(session), net::use_future);
    auto frames = net::co_spawn(ioc, [session]() -> net::awaitable<std::vector<std::string>> {
        std::vector<std::string> out;
        for (int i = 0; i < 3; ++i) {
            auto f = co_await session->NextFrame();
            if (!f) break;
            out.push_back(*f);
        }
        session->Close();
        co_return out;
    }, net::use_future);
    ioc.run();

    served.get();
    auto got = frames.get();
    ASSERT_EQ(got.size(), 3u);
    EXPECT_NE(got[0].find("\"id\":1"), std::string::npos);
    EXPECT_NE(got[1].find("\"id\":2"), std::string::npos);
    EXPECT_NE(got[2].find("\"id\":3"), std::string::npos);
    EXPECT_NE(got[2].find("Hello, Ada!"), std::string::npos);
}

TEST(ContentItems, MixedResultSerializesEveryKind) {
    CallToolResult r = typed::textResult("first");
    r.content.push_back(typed::makeImage("aGk=", "image/png"));
    r.content.push_back(typed::makeEmbeddedResource("file:///notes.txt", "body", std::string("text/plain")));

    EXPECT_EQ(typed::collectText(r), std::vector<std::string>{"first"});
    EXPECT_EQ(typed::contentType(r.content[1]).value_or(""), "image");

    JSONValue doc = r.ToJSON();
    EXPECT_FALSE(std::get<bool>(doc.find("isError")->value));
    const auto& items = std::get<JSONValue::Array>(doc.find("content")->value);
    ASSERT_EQ(items.size(), 3u);
    EXPECT_EQ(std::get<std::string>(items[1]->find("mimeType")->value), "image/png");
    const JSONValue* res = items[2]->find("resource");
    ASSERT_NE(res, nullptr);
    EXPECT_EQ(std::get<std::string>(res->find("uri")->value), "file:///notes.txt");
    EXPECT_EQ(std::get<std::string>(res->find("mimeType")->value), "text/plain");
}
