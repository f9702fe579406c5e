//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Server.h
// Purpose: MCP protocol engine - per-session handshake state and request dispatch onto the tool registry
//==========================================================================================================

#pragma once

#include <memory>
#include <string>

#include <boost/asio/awaitable.hpp>

#include "ssehost/Protocol.h"
#include "ssehost/Session.h"
#include "ssehost/ToolRegistry.h"

namespace ssehost {

//==========================================================================================================
// Server
// Purpose: Speaks JSON-RPC on top of Session channels. One Server serves any number of sessions; all
//          per-session state lives in SessionContext, so concurrently served sessions are independent.
//==========================================================================================================
class Server {
public:
    enum class SessionState { Uninitialized, Initialized, Closed };

    struct SessionContext {
        std::string sessionId;
        SessionState state{SessionState::Uninitialized};
        std::string protocolVersion;
        Implementation clientInfo;
    };

    Server(Implementation info, std::shared_ptr<ToolRegistry> registry);

    //==========================================================================================================
    // Consumes the session's posted messages strictly one at a time and writes each response to the
    // session stream before reading the next. Returns when the session reaches end-of-stream.
    //==========================================================================================================
    boost::asio::awaitable<void> ServeSession(std::shared_ptr<Session> session);

    //==========================================================================================================
    // Handles one raw message body.
    // Returns:
    //   The response to send, or nullptr for notifications and client responses.
    //==========================================================================================================
    boost::asio::awaitable<std::unique_ptr<JSONRPCResponse>> HandleMessage(SessionContext& ctx, std::string body);

    boost::asio::awaitable<std::unique_ptr<JSONRPCResponse>> HandleRequest(SessionContext& ctx,
                                                                          const JSONRPCRequest& request);
    void HandleNotification(SessionContext& ctx, const JSONRPCNotification& notification);

private:
    std::unique_ptr<JSONRPCResponse> handleInitialize(SessionContext& ctx, const JSONRPCRequest& request);
    std::unique_ptr<JSONRPCResponse> handleToolsList(const JSONRPCRequest& request);
    boost::asio::awaitable<std::unique_ptr<JSONRPCResponse>> handleToolsCall(const SessionContext& ctx,
                                                                            const JSONRPCRequest& request);

    Implementation serverInfo;
    ServerCapabilities capabilities;
    std::shared_ptr<ToolRegistry> registry;
};

const char* toString(Server::SessionState state);

} // namespace ssehost
