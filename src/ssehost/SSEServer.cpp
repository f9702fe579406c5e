//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: src/ssehost/SSEServer.cpp
// Purpose: Event-stream listener and session routing using Boost.Beast coroutines
//==========================================================================================================

#include <algorithm>
#include <array>
#include <chrono>
#include <atomic>
#include <cctype>
#include <optional>
#include <set>
#include <stdexcept>
#include <thread>
#include <unordered_map>
#include <utility>
#include <vector>

#include <boost/asio.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>

#include "logging/Logger.h"
#include "ssehost/SSEServer.hpp"
#include "ssehost/errors/Errors.h"

namespace ssehost {
namespace net = boost::asio;
namespace beast = boost::beast;
namespace http = boost::beast::http;
using tcp = net::ip::tcp;

namespace {

std::optional<std::string> queryParam(const std::string& target, const std::string& key) {
    const std::size_t q = target.find('?');
    if (q == std::string::npos) {
        return std::nullopt;
    }
    std::size_t pos = q + 1;
    while (pos <= target.size()) {
        std::size_t amp = target.find('&', pos);
        if (amp == std::string::npos) amp = target.size();
        const std::string kv = target.substr(pos, amp - pos);
        const std::size_t eq = kv.find('=');
        if (kv.substr(0, eq) == key) {
            return eq == std::string::npos ? std::string() : kv.substr(eq + 1);
        }
        pos = amp + 1;
    }
    return std::nullopt;
}

bool isSessionIdToken(const std::string& s) {
    return s.size() == 32 &&
           std::all_of(s.begin(), s.end(), [](unsigned char c) { return std::isxdigit(c) != 0; });
}

} // namespace

class SSEServer::Impl {
public:
    using Stream = beast::tcp_stream;

    SSEServer::Options opts;
    std::atomic<bool> started{false};
    std::atomic<bool> shuttingDown{false};
    std::atomic<unsigned short> localPort{0};
    std::atomic<std::size_t> sessionCount{0};

    net::io_context ioc;
    std::thread ioThread;
    std::promise<void> exitedPromise;
    std::shared_future<void> exited;

    // io thread only
    std::unique_ptr<tcp::acceptor> acceptor;
    std::unordered_map<std::string, std::shared_ptr<Session>> sessions;
    std::set<std::shared_ptr<Stream>> connections;

    SSEServer::SessionHandler sessionHandler;
    SSEServer::ErrorHandler errorHandler;

    explicit Impl(const SSEServer::Options& o) : opts(o), exited(exitedPromise.get_future().share()) {}

    ~Impl() {
        forceStop();
    }

    void setError(const std::string& msg) {
        if (errorHandler) {
            errorHandler(msg);
        } else {
            LOG_ERROR("{}", msg);
        }
    }

    void forceStop() {
        ioc.stop();
        if (ioThread.joinable()) {
            ioThread.join();
        }
    }

    void closeAll() {
        shuttingDown.store(true);
        boost::system::error_code ec;
        if (acceptor) {
            acceptor->close(ec);
        }
        // Stream writers erase their own entries once they observe the close.
        std::vector<std::shared_ptr<Session>> snapshot;
        snapshot.reserve(sessions.size());
        for (auto& kv : sessions) {
            snapshot.push_back(kv.second);
        }
        for (auto& s : snapshot) {
            s->Close();
        }
        for (auto& c : connections) {
            c->socket().shutdown(tcp::socket::shutdown_both, ec);
            c->socket().close(ec);
        }
        LOG_DEBUG("SSEServer: shutdown closed {} session(s), {} connection(s)", snapshot.size(), connections.size());
    }

    ///////////////////////////////////////// Responses ///////////////////////////////////////////
    http::response<http::string_body> plainResponse(const http::request<http::string_body>& req,
                                                    http::status status, const std::string& body) {
        http::response<http::string_body> res{status, req.version()};
        res.set(http::field::content_type, "text/plain; charset=utf-8");
        res.keep_alive(req.keep_alive());
        res.body() = body;
        res.prepare_payload();
        return res;
    }

    http::response<http::string_body> handlePost(const http::request<http::string_body>& req) {
        const std::string target(req.target());
        auto sid = queryParam(target, "session_id");
        if (!sid.has_value() || sid->empty()) {
            return plainResponse(req, http::status::bad_request, "session_id is required");
        }
        if (!isSessionIdToken(*sid)) {
            return plainResponse(req, http::status::bad_request, "Invalid session ID");
        }
        std::string id = *sid;
        std::transform(id.begin(), id.end(), id.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

        auto it = sessions.find(id);
        if (it == sessions.end() || !it->second->IsOpen()) {
            errors::UnknownSessionError err(id);
            LOG_WARN("SSEServer: {}", err.what());
            return plainResponse(req, http::status::not_found, "Could not find session");
        }
        auto session = it->second;

        try {
            (void)ParseInboundMessage(req.body());
        } catch (const std::exception& e) {
            LOG_DEBUG("SSEServer: rejected body for session {}: {}", id, e.what());
            auto err = CreateErrorResponse(nullptr, JSONRPCErrorCodes::ParseError, std::string("Parse error: ") + e.what());
            session->Send(*err);
            return plainResponse(req, http::status::bad_request, "Could not parse message");
        }

        session->Deliver(req.body());
        return plainResponse(req, http::status::accepted, "Accepted");
    }

    http::response<http::string_body> makeResponse(const http::request<http::string_body>& req) {
        const std::string target(req.target());
        const std::string path = target.substr(0, target.find('?'));

        if (path == opts.messagesPath) {
            if (req.method() != http::verb::post) {
                auto res = plainResponse(req, http::status::method_not_allowed, "Method Not Allowed");
                res.set(http::field::allow, "POST");
                return res;
            }
            return handlePost(req);
        }
        if (path == opts.ssePath) {
            auto res = plainResponse(req, http::status::method_not_allowed, "Method Not Allowed");
            res.set(http::field::allow, "GET");
            return res;
        }
        return plainResponse(req, http::status::not_found, "Not Found");
    }

    ///////////////////////////////////////// Event stream ///////////////////////////////////////////
    net::awaitable<void> keepalive(std::shared_ptr<Session> session, std::shared_ptr<net::steady_timer> timer) {
        for (;;) {
            boost::system::error_code ec;
            timer->expires_after(std::chrono::milliseconds(opts.keepaliveMs));
            co_await timer->async_wait(net::redirect_error(net::use_awaitable, ec));
            if (ec || !session->IsOpen()) {
                co_return;
            }
            session->SendComment("ping");
        }
    }

    // Detects peer disconnect; anything the client sends on the stream connection is discarded.
    net::awaitable<void> watchDisconnect(std::shared_ptr<Stream> stream, std::shared_ptr<Session> session) {
        std::array<char, 512> scratch{};
        for (;;) {
            boost::system::error_code ec;
            co_await stream->socket().async_read_some(net::buffer(scratch), net::redirect_error(net::use_awaitable, ec));
            if (ec) {
                break;
            }
        }
        if (session->IsOpen()) {
            LOG_DEBUG("SSEServer: peer of session {} disconnected", session->Id());
        }
        session->Close();
    }

    void spawnSessionHandler(const std::shared_ptr<Session>& session) {
        if (!sessionHandler) {
            return;
        }
        net::co_spawn(ioc, sessionHandler(session), [session](std::exception_ptr ep) {
            if (ep) {
                try {
                    std::rethrow_exception(ep);
                } catch (const std::exception& e) {
                    LOG_ERROR("SSEServer: session {} handler failed: {}", session->Id(), e.what());
                }
            }
            session->Close();
        });
    }

    net::awaitable<void> serveStream(std::shared_ptr<Stream> stream, const http::request<http::string_body>& req) {
        auto session = std::make_shared<Session>(ioc.get_executor(), Session::GenerateId());
        const std::string id = session->Id();

        http::response<http::empty_body> res{http::status::ok, req.version()};
        res.set(http::field::content_type, "text/event-stream");
        res.set(http::field::cache_control, "no-store");
        res.set(http::field::connection, "keep-alive");
        res.chunked(true);
        http::response_serializer<http::empty_body> sr{res};

        stream->expires_never();
        co_await http::async_write_header(*stream, sr, net::use_awaitable);

        sessions.emplace(id, session);
        sessionCount.store(sessions.size());
        LOG_INFO("SSEServer: session {} opened", id);

        session->SendEvent("endpoint", opts.messagesPath + "?session_id=" + id);

        auto keepaliveTimer = std::make_shared<net::steady_timer>(ioc);
        if (opts.keepaliveMs > 0) {
            net::co_spawn(ioc, keepalive(session, keepaliveTimer), net::detached);
        }
        net::co_spawn(ioc, watchDisconnect(stream, session), net::detached);
        spawnSessionHandler(session);

        std::string failure;
        try {
            for (;;) {
                std::optional<std::string> frame = co_await session->NextFrame();
                if (!frame.has_value()) {
                    break;
                }
                co_await net::async_write(*stream, http::make_chunk(net::buffer(*frame)), net::use_awaitable);
            }
        } catch (const boost::system::system_error& e) {
            failure = e.what();
        }
        if (!failure.empty() && !shuttingDown.load()) {
            LOG_DEBUG("SSEServer: write to session {} failed: {}", id, failure);
        }

        session->Close();
        keepaliveTimer->cancel();
        sessions.erase(id);
        sessionCount.store(sessions.size());
        LOG_INFO("SSEServer: session {} closed", id);

        boost::system::error_code ec;
        co_await net::async_write(*stream, http::make_chunk_last(), net::redirect_error(net::use_awaitable, ec));
        stream->socket().shutdown(tcp::socket::shutdown_both, ec);
    }

    ///////////////////////////////////////// Connections ///////////////////////////////////////////
    net::awaitable<void> serveConnection(tcp::socket socket) {
        auto stream = std::make_shared<Stream>(std::move(socket));
        connections.insert(stream);
        try {
            beast::flat_buffer buffer;
            for (;;) {
                http::request_parser<http::string_body> parser;
                parser.body_limit(opts.maxBodyBytes);
                boost::system::error_code ec;
                stream->expires_after(std::chrono::milliseconds(opts.readTimeoutMs));
                co_await http::async_read(*stream, buffer, parser, net::redirect_error(net::use_awaitable, ec));
                if (ec == http::error::body_limit) {
                    http::response<http::string_body> res{http::status::payload_too_large, 11};
                    res.set(http::field::content_type, "text/plain; charset=utf-8");
                    res.keep_alive(false);
                    res.body() = "Request body too large";
                    res.prepare_payload();
                    co_await http::async_write(*stream, res, net::use_awaitable);
                    break;
                }
                if (ec) {
                    if (ec != http::error::end_of_stream && ec != net::error::operation_aborted) {
                        LOG_DEBUG("SSEServer: read failed: {}", ec.message());
                    }
                    break;
                }

                http::request<http::string_body> req = parser.release();
                const std::string target(req.target());
                if (req.method() == http::verb::get && target.substr(0, target.find('?')) == opts.ssePath) {
                    if (shuttingDown.load()) {
                        break;
                    }
                    co_await serveStream(stream, req);
                    break;
                }

                auto res = makeResponse(req);
                const bool keepAlive = res.keep_alive();
                co_await http::async_write(*stream, res, net::use_awaitable);
                if (!keepAlive || shuttingDown.load()) {
                    break;
                }
            }
        } catch (const std::exception& e) {
            if (shuttingDown.load()) {
                LOG_DEBUG("SSEServer connection error suppressed during shutdown: {}", e.what());
            } else {
                setError(std::string("SSEServer connection error: ") + e.what());
            }
        }
        boost::system::error_code ec;
        stream->socket().shutdown(tcp::socket::shutdown_both, ec);
        connections.erase(stream);
    }

    net::awaitable<void> acceptLoop(std::shared_ptr<std::promise<void>> ready) {
        try {
            tcp::resolver resolver(co_await net::this_coro::executor);
            auto results = co_await resolver.async_resolve(opts.address, opts.port, net::use_awaitable);
            tcp::endpoint ep = *results.begin();

            acceptor = std::make_unique<tcp::acceptor>(ioc);
            acceptor->open(ep.protocol());
            acceptor->set_option(tcp::acceptor::reuse_address(true));
            acceptor->bind(ep);
            acceptor->listen();
            localPort.store(acceptor->local_endpoint().port());
        } catch (const std::exception& e) {
            acceptor.reset();
            const std::string msg = "Failed to bind " + opts.address + ":" + opts.port + ": " + e.what();
            LOG_ERROR("SSEServer: {}", msg);
            ready->set_exception(std::make_exception_ptr(
                errors::HostError(errors::ErrorCategory::BindFailure, JSONRPCErrorCodes::InternalError, msg)));
            co_return;
        }

        LOG_INFO("SSEServer: listening on {}:{} (stream {}, messages {})",
                 opts.address, localPort.load(), opts.ssePath, opts.messagesPath);
        ready->set_value();

        net::steady_timer backoff(ioc);
        std::size_t failedAccepts = 0;
        while (!shuttingDown.load()) {
            boost::system::error_code ec;
            tcp::socket socket = co_await acceptor->async_accept(net::redirect_error(net::use_awaitable, ec));
            if (ec) {
                if (shuttingDown.load() || ec == net::error::operation_aborted) {
                    break;
                }
                // The peer stays queued after a failed accept (EMFILE, ENFILE); pause before retrying.
                if (++failedAccepts == 1) {
                    setError("SSEServer accept error: " + ec.message());
                } else {
                    LOG_DEBUG("SSEServer: accept still failing ({} in a row): {}", failedAccepts, ec.message());
                }
                backoff.expires_after(std::chrono::milliseconds(opts.acceptRetryDelayMs));
                boost::system::error_code waitEc;
                co_await backoff.async_wait(net::redirect_error(net::use_awaitable, waitEc));
                continue;
            }
            if (failedAccepts > 0) {
                LOG_INFO("SSEServer: accept recovered after {} failure(s)", failedAccepts);
                failedAccepts = 0;
            }
            net::co_spawn(ioc, serveConnection(std::move(socket)), net::detached);
        }
    }
};

SSEServer::SSEServer(const Options& opts) : pImpl(std::make_unique<Impl>(opts)) {}

SSEServer::~SSEServer() = default;

std::future<void> SSEServer::Start() {
    if (pImpl->started.exchange(true)) {
        throw std::logic_error("SSEServer already started");
    }
    auto ready = std::make_shared<std::promise<void>>();
    auto fut = ready->get_future();
    pImpl->ioThread = std::thread([this, ready]() {
        net::co_spawn(pImpl->ioc, pImpl->acceptLoop(ready), net::detached);
        try {
            pImpl->ioc.run();
        } catch (const std::exception& e) {
            pImpl->setError(std::string("SSEServer io thread error: ") + e.what());
        }
        pImpl->exitedPromise.set_value();
    });
    return fut;
}

void SSEServer::RequestShutdown() {
    pImpl->shuttingDown.store(true);
    net::post(pImpl->ioc, [impl = pImpl.get()]() { impl->closeAll(); });
}

bool SSEServer::WaitForExit(std::chrono::milliseconds timeout) {
    if (!pImpl->started.load()) {
        return true;
    }
    return pImpl->exited.wait_for(timeout) == std::future_status::ready;
}

void SSEServer::ForceStop() {
    pImpl->forceStop();
}

bool SSEServer::Stop(std::chrono::milliseconds timeout) {
    RequestShutdown();
    const bool clean = WaitForExit(timeout);
    ForceStop();
    return clean;
}

void SSEServer::SetSessionHandler(SessionHandler handler) {
    pImpl->sessionHandler = std::move(handler);
}

void SSEServer::SetErrorHandler(ErrorHandler handler) {
    pImpl->errorHandler = std::move(handler);
}

const SSEServer::Options& SSEServer::GetOptions() const {
    return pImpl->opts;
}

unsigned short SSEServer::LocalPort() const {
    return pImpl->localPort.load();
}

std::size_t SSEServer::SessionCount() const {
    return pImpl->sessionCount.load();
}

} // namespace ssehost
