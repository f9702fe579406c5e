//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_sse_server.cpp
// Purpose: GoogleTests for the SSE listener: stream handshake, POST routing, status codes, per-session order
//==========================================================================================================

#include <gtest/gtest.h>

#include <sys/resource.h>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include <boost/asio.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>

#include "ssehost/SSEServer.hpp"
#include "ssehost/Server.h"
#include "ssehost/tools/BuiltinTools.h"

using namespace ssehost;
namespace net = boost::asio;
namespace beast = boost::beast;
namespace http = boost::beast::http;
using tcp = net::ip::tcp;

namespace {

const std::string kInitialize =
    R"({"jsonrpc":"2.0","id":1,"method":"initialize","params":{"protocolVersion":"2024-11-05",)"
    R"("capabilities":{},"clientInfo":{"name":"sse-test","version":"0.1"}}})";

//==========================================================================================================
// EventStreamClient
// Purpose: Blocking client holding one GET /sse connection open and decoding its chunked body into
//          SSE frames.
//==========================================================================================================
struct EventStreamClient {
    net::io_context io;
    tcp::socket socket{io};
    beast::flat_buffer buffer;
    http::response_parser<http::string_body> parser;
    std::string pending;
    std::function<std::size_t(std::uint64_t, beast::string_view, beast::error_code&)> onChunk;

    explicit EventStreamClient(unsigned short port) {
        socket.connect(tcp::endpoint(net::ip::make_address("127.0.0.1"), port));
        http::request<http::empty_body> req{http::verb::get, "/sse", 11};
        req.set(http::field::host, "127.0.0.1");
        req.set(http::field::accept, "text/event-stream");
        http::write(socket, req);

        onChunk = [this](std::uint64_t, beast::string_view body, beast::error_code&) {
            pending.append(body.data(), body.size());
            return body.size();
        };
        parser.on_chunk_body(onChunk);
        http::read_header(socket, buffer, parser);
    }

    unsigned status() const { return parser.get().result_int(); }
    std::string contentType() const { return std::string(parser.get()[http::field::content_type]); }

    // Next complete frame, skipping keepalive comments.
    std::string nextFrame() {
        for (;;) {
            const std::size_t end = pending.find("\n\n");
            if (end != std::string::npos) {
                std::string frame = pending.substr(0, end + 2);
                pending.erase(0, end + 2);
                if (frame.rfind(":", 0) == 0) {
                    continue;
                }
                return frame;
            }
            http::read_some(socket, buffer, parser);
        }
    }

    // Value of the frame's data field.
    static std::string dataOf(const std::string& frame) {
        const std::string marker = "data: ";
        const std::size_t p = frame.find(marker);
        if (p == std::string::npos) {
            return std::string();
        }
        const std::size_t e = frame.find('\n', p);
        return frame.substr(p + marker.size(), e - p - marker.size());
    }
};

struct PostResult {
    unsigned status{0};
    std::string allow;
    std::string body;
};

PostResult sendRequest(unsigned short port, http::verb verb, const std::string& target, const std::string& body) {
    net::io_context io;
    tcp::socket socket{io};
    socket.connect(tcp::endpoint(net::ip::make_address("127.0.0.1"), port));
    http::request<http::string_body> req{verb, target, 11};
    req.set(http::field::host, "127.0.0.1");
    req.set(http::field::content_type, "application/json");
    req.keep_alive(false);
    req.body() = body;
    req.prepare_payload();
    http::write(socket, req);

    beast::flat_buffer buffer;
    http::response<http::string_body> res;
    http::read(socket, buffer, res);
    boost::system::error_code ec;
    socket.shutdown(tcp::socket::shutdown_both, ec);
    return PostResult{res.result_int(), std::string(res[http::field::allow]), res.body()};
}

class SSEServerTest : public ::testing::Test {
protected:
    void SetUp() override {
        auto registry = std::make_shared<ToolRegistry>();
        tools::RegisterBuiltinTools(*registry, std::make_shared<HTTPFetcher>());
        engine = std::make_shared<Server>(Implementation("ssehost-test", "1.0"), registry);

        SSEServer::Options opts;
        opts.address = "127.0.0.1";
        opts.port = "0";
        opts.keepaliveMs = 60000;
        opts.maxBodyBytes = 1024;
        server = std::make_unique<SSEServer>(opts);
        auto eng = engine;
        server->SetSessionHandler([eng](std::shared_ptr<Session> s) { return eng->ServeSession(std::move(s)); });
        server->SetErrorHandler([this](const std::string& msg) {
            if (msg.find("accept error") != std::string::npos) {
                ++acceptErrors;
            }
        });
        server->Start().get();
        port = server->LocalPort();
        ASSERT_NE(port, 0);
    }

    void TearDown() override {
        if (server) {
            server->Stop(std::chrono::milliseconds(2000));
        }
    }

    std::string messagesUrl(const std::string& endpointFrame) const {
        return EventStreamClient::dataOf(endpointFrame);
    }

    std::atomic<int> acceptErrors{0};
    std::shared_ptr<Server> engine;
    std::unique_ptr<SSEServer> server;
    unsigned short port{0};
};

} // namespace

TEST_F(SSEServerTest, StreamOpensWithEndpointEvent) {
    EventStreamClient client(port);
    EXPECT_EQ(client.status(), 200u);
    EXPECT_EQ(client.contentType(), "text/event-stream");

    const std::string frame = client.nextFrame();
    EXPECT_EQ(frame.rfind("event: endpoint\n", 0), 0u);
    const std::string url = EventStreamClient::dataOf(frame);
    ASSERT_EQ(url.rfind("/messages/?session_id=", 0), 0u);
    EXPECT_EQ(url.size(), std::string("/messages/?session_id=").size() + 32);
}

TEST_F(SSEServerTest, PostedRequestIsAnsweredOnStream) {
    EventStreamClient client(port);
    const std::string url = messagesUrl(client.nextFrame());

    PostResult r = sendRequest(port, http::verb::post, url, kInitialize);
    EXPECT_EQ(r.status, 202u);

    const std::string frame = client.nextFrame();
    EXPECT_EQ(frame.rfind("event: message\n", 0), 0u);
    JSONValue doc = ParseJSON(EventStreamClient::dataOf(frame));
    EXPECT_EQ(std::get<int64_t>(doc.find("id")->value), 1);
    ASSERT_NE(doc.find("result"), nullptr);
}

TEST_F(SSEServerTest, PostStatusCodes) {
    EventStreamClient client(port);
    const std::string url = messagesUrl(client.nextFrame());

    EXPECT_EQ(sendRequest(port, http::verb::post, "/messages/", kInitialize).status, 400u);
    EXPECT_EQ(sendRequest(port, http::verb::post, "/messages/?session_id=xyz", kInitialize).status, 400u);
    EXPECT_EQ(sendRequest(port, http::verb::post, "/messages/?session_id=" + std::string(32, 'a'), kInitialize).status,
              404u);
    EXPECT_EQ(sendRequest(port, http::verb::post, "/nowhere", kInitialize).status, 404u);

    PostResult wrongMethod = sendRequest(port, http::verb::get, url, "");
    EXPECT_EQ(wrongMethod.status, 405u);
    EXPECT_EQ(wrongMethod.allow, "POST");

    EXPECT_EQ(sendRequest(port, http::verb::post, url, std::string(4096, ' ')).status, 413u);
}

TEST_F(SSEServerTest, MalformedBodyIsRejectedAndReported) {
    EventStreamClient client(port);
    const std::string url = messagesUrl(client.nextFrame());

    EXPECT_EQ(sendRequest(port, http::verb::post, url, "{oops").status, 400u);
    JSONValue doc = ParseJSON(EventStreamClient::dataOf(client.nextFrame()));
    ASSERT_NE(doc.find("error"), nullptr);
    EXPECT_EQ(std::get<int64_t>(doc.find("error")->find("code")->value), JSONRPCErrorCodes::ParseError);
}

TEST_F(SSEServerTest, SessionsAreIsolatedAndOrdered) {
    EventStreamClient a(port);
    EventStreamClient b(port);
    const std::string urlA = messagesUrl(a.nextFrame());
    const std::string urlB = messagesUrl(b.nextFrame());
    ASSERT_NE(urlA, urlB);

    ASSERT_EQ(sendRequest(port, http::verb::post, urlA, kInitialize).status, 202u);
    ASSERT_EQ(sendRequest(port, http::verb::post, urlB, kInitialize).status, 202u);
    for (int i = 2; i <= 4; ++i) {
        const std::string call = R"({"jsonrpc":"2.0","id":)" + std::to_string(i) +
            R"(,"method":"tools/call","params":{"name":"echo","arguments":{"message":"a)" + std::to_string(i) + R"("}}})";
        ASSERT_EQ(sendRequest(port, http::verb::post, urlA, call).status, 202u);
    }
    ASSERT_EQ(sendRequest(port, http::verb::post, urlB,
                          R"({"jsonrpc":"2.0","id":"b","method":"tools/list"})").status, 202u);

    for (int i = 1; i <= 4; ++i) {
        JSONValue doc = ParseJSON(EventStreamClient::dataOf(a.nextFrame()));
        EXPECT_EQ(std::get<int64_t>(doc.find("id")->value), i);
    }
    JSONValue initB = ParseJSON(EventStreamClient::dataOf(b.nextFrame()));
    EXPECT_EQ(std::get<int64_t>(initB.find("id")->value), 1);
    JSONValue listB = ParseJSON(EventStreamClient::dataOf(b.nextFrame()));
    EXPECT_EQ(std::get<std::string>(listB.find("id")->value), "b");
    EXPECT_TRUE(a.pending.empty());
    EXPECT_EQ(server->SessionCount(), 2u);
}

TEST_F(SSEServerTest, DisconnectReleasesSessionId) {
    std::string url;
    {
        EventStreamClient client(port);
        url = messagesUrl(client.nextFrame());
        ASSERT_EQ(sendRequest(port, http::verb::post, url, kInitialize).status, 202u);
        boost::system::error_code ec;
        client.socket.shutdown(tcp::socket::shutdown_both, ec);
        client.socket.close(ec);
    }

    unsigned status = 0;
    const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(3);
    while (std::chrono::steady_clock::now() < deadline) {
        status = sendRequest(port, http::verb::post, url, kInitialize).status;
        if (status == 404u && server->SessionCount() == 0u) {
            break;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }
    EXPECT_EQ(status, 404u);
    EXPECT_EQ(server->SessionCount(), 0u);
}

TEST_F(SSEServerTest, UnknownSessionPostLeavesOpenSessionWorking) {
    EventStreamClient client(port);
    const std::string url = messagesUrl(client.nextFrame());

    const std::string stranger = "/messages/?session_id=" + std::string(32, 'f');
    ASSERT_NE(stranger, url);
    EXPECT_EQ(sendRequest(port, http::verb::post, stranger, kInitialize).status, 404u);

    ASSERT_EQ(sendRequest(port, http::verb::post, url, kInitialize).status, 202u);
    ASSERT_EQ(sendRequest(port, http::verb::post, url,
                          R"({"jsonrpc":"2.0","id":2,"method":"tools/call","params":{"name":"hello","arguments":{"name":"Ada"}}})")
                  .status,
              202u);
    JSONValue init = ParseJSON(EventStreamClient::dataOf(client.nextFrame()));
    EXPECT_EQ(std::get<int64_t>(init.find("id")->value), 1);
    JSONValue call = ParseJSON(EventStreamClient::dataOf(client.nextFrame()));
    EXPECT_EQ(std::get<int64_t>(call.find("id")->value), 2);
    ASSERT_NE(call.find("result"), nullptr);
    EXPECT_EQ(server->SessionCount(), 1u);
}

TEST_F(SSEServerTest, AcceptFailuresBackOffUntilDescriptorsFree) {
    rlimit original{};
    ASSERT_EQ(getrlimit(RLIMIT_NOFILE, &original), 0);
    rlimit lowered = original;
    lowered.rlim_cur = 64;
    ASSERT_EQ(setrlimit(RLIMIT_NOFILE, &lowered), 0);

    // Client sockets use up the descriptor table, leaving peers queued on the listener.
    net::io_context io;
    std::vector<std::unique_ptr<tcp::socket>> clients;
    for (int i = 0; i < 200; ++i) {
        auto s = std::make_unique<tcp::socket>(io);
        boost::system::error_code ec;
        s->connect(tcp::endpoint(net::ip::make_address("127.0.0.1"), port), ec);
        if (ec) {
            break;
        }
        clients.push_back(std::move(s));
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(500));
    const int reported = acceptErrors.load();

    clients.clear();
    ASSERT_EQ(setrlimit(RLIMIT_NOFILE, &original), 0);

    EXPECT_LE(reported, 5);

    EventStreamClient client(port);
    EXPECT_EQ(client.nextFrame().rfind("event: endpoint\n", 0), 0u);
}
