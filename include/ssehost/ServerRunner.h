//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ServerRunner.h
// Purpose: Process lifecycle manager hosting the SSE listener and protocol engine on a background
//          io thread, controlled from the embedding caller's thread
//==========================================================================================================

#pragma once

#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include "ssehost/HTTPFetcher.hpp"
#include "ssehost/JSONRPCTypes.h"
#include "ssehost/SSEServer.hpp"
#include "ssehost/Server.h"
#include "ssehost/ToolRegistry.h"

namespace ssehost {

//==========================================================================================================
// RunInvocation
// Purpose: Descriptor handed to ServerRunner::Run by the deployment harness.
// Wire shape:
//   {"inputs": {"port": <int>}, "deployment": {"node_url": <string>}, "consumer_id": <string>,
//    "signature": <string>}
//   Only inputs.port is required.
//==========================================================================================================
struct RunInvocation {
    int port{0};
    std::optional<std::string> nodeUrl;
    std::string consumerId;
    std::string signature;

    //==========================================================================================================
    // Throws:
    //   std::invalid_argument when the descriptor is not an object, inputs.port is missing or not an
    //   integer, or the port lies outside 1..65535.
    //==========================================================================================================
    static RunInvocation FromJson(const JSONValue& value);
    JSONValue ToJson() const;
};

struct RunResult {
    enum class Status { Success, Error };
    Status status{Status::Error};
    std::string message;

    bool ok() const { return status == Status::Success; }
    // {"status": "success"|"error", "message": ...}
    JSONValue ToJson() const;
};

enum class StartStatus { Started, AlreadyRunning, BindFailure };

const char* toString(StartStatus status);

//==========================================================================================================
// ServerRunner
// Purpose: Owns the server run state {listener | none, running}. Start/Stop/IsRunning/Run are safe to
//          call from any thread except the io thread itself; they serialize on one mutex.
// Notes:
//   - The tool registry (fetch, echo, hello) and protocol engine are built once at construction and
//     survive restarts; each Start creates a fresh listener.
//   - At most one runner per process is running at a time; Start on any other runner returns
//     AlreadyRunning until the active one stops.
//==========================================================================================================
class ServerRunner {
public:
    struct Options {
        std::string address{"0.0.0.0"};
        int startupGraceMs{1000};
        int shutdownTimeoutMs{5000};
        int keepaliveMs{15000};
        std::size_t maxBodyBytes{4u * 1024u * 1024u};
        std::string serverName{"ssehost"};
        std::string serverVersion;  // empty means getVersionString()
        HTTPFetcher::Options fetcher;
    };

    ServerRunner();
    explicit ServerRunner(const Options& opts);
    ~ServerRunner();

    ServerRunner(const ServerRunner&) = delete;
    ServerRunner& operator=(const ServerRunner&) = delete;

    //==========================================================================================================
    // Binds the listener on port (0 picks an ephemeral port) and waits up to startupGraceMs for the
    // bind result.
    // Returns:
    //   Started; AlreadyRunning when this or another runner in the process is active; BindFailure when the port is out of
    //   range, the bind failed or did not complete within the grace period (state stays not-running).
    //==========================================================================================================
    StartStatus Start(int port);

    //==========================================================================================================
    // Idempotent. Signals shutdown, waits up to shutdownTimeoutMs, then force-stops the io thread.
    // A timeout is logged as ShutdownTimeout and otherwise ignored. Always ends not-running.
    //==========================================================================================================
    void Stop();

    bool IsRunning() const;

    // Port actually bound while running, 0 otherwise.
    unsigned short BoundPort() const;

    // Port of whichever runner in the process is active, 0 when none is.
    static unsigned short ActivePort();

    //==========================================================================================================
    // Starts the server for an invocation unless one is already running.
    // Returns:
    //   Success with "MCP server started for this run on port N" (or "... already running ..."),
    //   Error with "Failed to start MCP server on port N" on bind failure.
    // Throws:
    //   Any unexpected exception, after calling Stop().
    //==========================================================================================================
    RunResult Run(const RunInvocation& invocation);

    // Parses the descriptor inside the guarded startup path; see RunInvocation::FromJson.
    RunResult Run(const JSONValue& invocation);

private:
    void stopLocked();

    Options opts;
    std::shared_ptr<ToolRegistry> registry;
    std::shared_ptr<Server> engine;

    mutable std::mutex stateMutex;
    bool running{false};
    int activePort{0};
    std::unique_ptr<SSEServer> listener;
};

} // namespace ssehost
