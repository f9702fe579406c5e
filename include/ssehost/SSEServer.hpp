//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: SSEServer.hpp
// Purpose: Coroutine-based HTTP listener pairing a Server-Sent Events stream (GET) with a message
//          post endpoint (POST) per session, using Boost.Beast
//==========================================================================================================

#pragma once

#include <chrono>
#include <functional>
#include <future>
#include <memory>
#include <string>

#include <boost/asio/awaitable.hpp>

#include "ssehost/Session.h"

namespace ssehost {

class SSEServer {
public:
    //==========================================================================================================
    // Options
    // Purpose: Listener configuration.
    // Fields:
    //   address: Bind address (default: 0.0.0.0)
    //   port: Listen port; "0" picks an ephemeral port (see LocalPort())
    //   ssePath: GET path opening an event stream
    //   messagesPath: POST path receiving messages addressed by ?session_id=
    //   keepaliveMs: Idle interval between ": ping" comments on each stream (<= 0 disables)
    //   maxBodyBytes: Largest accepted POST body; larger bodies get 413
    //   readTimeoutMs: Deadline for reading one request on a non-stream connection
    //   acceptRetryDelayMs: Pause before accepting again after a failed accept
    //==========================================================================================================
    struct Options {
        std::string address{"0.0.0.0"};
        std::string port{"8001"};
        std::string ssePath{"/sse"};
        std::string messagesPath{"/messages/"};
        int keepaliveMs{15000};
        std::size_t maxBodyBytes{4u * 1024u * 1024u};
        int readTimeoutMs{30000};
        int acceptRetryDelayMs{100};
    };

    // Runs on the io thread for each new session; the session closes when the handler returns.
    using SessionHandler = std::function<boost::asio::awaitable<void>(std::shared_ptr<Session>)>;
    using ErrorHandler = std::function<void(const std::string&)>;

    explicit SSEServer(const Options& opts);
    ~SSEServer();

    SSEServer(const SSEServer&) = delete;
    SSEServer& operator=(const SSEServer&) = delete;

    //==========================================================================================================
    // Starts the io thread and binds the listener.
    // Returns:
    //   Future that becomes ready once the socket is listening, or holds an errors::HostError with
    //   category BindFailure when resolving/binding fails (the io thread then exits on its own).
    // Throws:
    //   std::logic_error when called more than once.
    //==========================================================================================================
    std::future<void> Start();

    //==========================================================================================================
    // Asks the io thread to wind down: stops accepting, closes every session and connection.
    // Safe to call from any thread and more than once. Does not wait.
    //==========================================================================================================
    void RequestShutdown();

    //==========================================================================================================
    // Waits for the io thread to run out of work. Returns true when it did within timeout
    // (also true when the server was never started).
    //==========================================================================================================
    bool WaitForExit(std::chrono::milliseconds timeout);

    // Stops the io_context outright and joins the io thread. Abandons in-flight work.
    void ForceStop();

    // RequestShutdown, bounded wait, then ForceStop. Returns false when the wait timed out.
    bool Stop(std::chrono::milliseconds timeout = std::chrono::milliseconds(5000));

    void SetSessionHandler(SessionHandler handler);
    void SetErrorHandler(ErrorHandler handler);

    const Options& GetOptions() const;
    unsigned short LocalPort() const;
    std::size_t SessionCount() const;

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

} // namespace ssehost
