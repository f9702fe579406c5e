//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Server.cpp
// Purpose: Protocol engine implementation: initialize handshake, tools/list, tools/call, error framing
//==========================================================================================================

#include <optional>
#include <stdexcept>
#include <utility>

#include "logging/Logger.h"
#include "ssehost/Server.h"
#include "ssehost/errors/Errors.h"

namespace ssehost {

const char* toString(Server::SessionState state) {
    switch (state) {
        case Server::SessionState::Uninitialized: return "Uninitialized";
        case Server::SessionState::Initialized: return "Initialized";
        case Server::SessionState::Closed: return "Closed";
    }
    return "Unknown";
}

Server::Server(Implementation info, std::shared_ptr<ToolRegistry> reg)
    : serverInfo(std::move(info)), registry(std::move(reg)) {
    if (!registry) {
        throw std::invalid_argument("Server requires a tool registry");
    }
    capabilities.tools = ServerCapabilities::Tools{};
}

boost::asio::awaitable<void> Server::ServeSession(std::shared_ptr<Session> session) {
    SessionContext ctx;
    ctx.sessionId = session->Id();
    LOG_DEBUG("Serving session {}", ctx.sessionId);

    for (;;) {
        std::optional<std::string> body = co_await session->Receive();
        if (!body.has_value()) {
            break;
        }
        auto response = co_await HandleMessage(ctx, std::move(*body));
        if (response && session->IsOpen()) {
            session->Send(*response);
        }
    }

    ctx.state = SessionState::Closed;
    LOG_DEBUG("Session {} reached end-of-stream", ctx.sessionId);
}

boost::asio::awaitable<std::unique_ptr<JSONRPCResponse>> Server::HandleMessage(SessionContext& ctx, std::string body) {
    InboundMessage msg;
    try {
        msg = ParseInboundMessage(body);
    } catch (const std::exception& e) {
        LOG_DEBUG("Session {}: unparseable message: {}", ctx.sessionId, e.what());
        co_return CreateErrorResponse(nullptr, JSONRPCErrorCodes::ParseError, std::string("Parse error: ") + e.what());
    }

    switch (msg.kind) {
        case InboundMessage::Kind::Request:
            co_return co_await HandleRequest(ctx, *msg.request);
        case InboundMessage::Kind::Notification:
            HandleNotification(ctx, *msg.notification);
            break;
        case InboundMessage::Kind::Response:
            LOG_DEBUG("Session {}: ignoring client response id={}", ctx.sessionId, IdToString(msg.response->id));
            break;
    }
    co_return nullptr;
}

void Server::HandleNotification(SessionContext& ctx, const JSONRPCNotification& notification) {
    if (notification.method == Methods::Initialized) {
        LOG_DEBUG("Session {}: client initialized", ctx.sessionId);
        return;
    }
    if (notification.method == Methods::Cancelled) {
        // Requests of a session are served sequentially; by the time this arrives the target is done.
        LOG_DEBUG("Session {}: cancellation notice ignored", ctx.sessionId);
        return;
    }
    LOG_DEBUG("Session {}: unhandled notification '{}'", ctx.sessionId, notification.method);
}

boost::asio::awaitable<std::unique_ptr<JSONRPCResponse>> Server::HandleRequest(SessionContext& ctx,
                                                                              const JSONRPCRequest& request) {
    if (ctx.state == SessionState::Closed) {
        errors::McpError e;
        e.code = JSONRPCErrorCodes::InvalidRequest;
        e.message = "Session is closed";
        co_return errors::makeErrorResponse(request.id, e);
    }
    if (request.method == Methods::Initialize) {
        co_return handleInitialize(ctx, request);
    }
    if (ctx.state != SessionState::Initialized) {
        errors::NotInitializedError err(request.method);
        LOG_DEBUG("Session {}: {}", ctx.sessionId, err.what());
        co_return errors::makeErrorResponse(request.id, err.toMcpError());
    }

    if (request.method == Methods::Ping) {
        co_return std::make_unique<JSONRPCResponse>(request.id, JSONValue(JSONValue::Object{}));
    }
    if (request.method == Methods::ListTools) {
        co_return handleToolsList(request);
    }
    if (request.method == Methods::CallTool) {
        co_return co_await handleToolsCall(ctx, request);
    }

    errors::McpError e;
    e.code = JSONRPCErrorCodes::MethodNotFound;
    e.message = "Method not found";
    co_return errors::makeErrorResponse(request.id, e);
}

std::unique_ptr<JSONRPCResponse> Server::handleInitialize(SessionContext& ctx, const JSONRPCRequest& request) {
    std::string version = PROTOCOL_VERSION;
    if (request.params.has_value()) {
        if (const JSONValue* pv = request.params->find("protocolVersion"); pv != nullptr && pv->isString()) {
            version = std::get<std::string>(pv->value);
        }
        if (const JSONValue* ci = request.params->find("clientInfo"); ci != nullptr) {
            ctx.clientInfo = Implementation::FromJSON(*ci);
        }
    }
    ctx.protocolVersion = version;
    ctx.state = SessionState::Initialized;
    LOG_INFO("Session {}: initialized by '{}' (protocol {})", ctx.sessionId,
             ctx.clientInfo.name.empty() ? std::string("unknown client") : ctx.clientInfo.name, version);

    JSONValue::Object result;
    result["protocolVersion"] = std::make_shared<JSONValue>(version);
    result["capabilities"] = std::make_shared<JSONValue>(capabilities.ToJSON());
    result["serverInfo"] = std::make_shared<JSONValue>(serverInfo.ToJSON());
    return std::make_unique<JSONRPCResponse>(request.id, JSONValue(std::move(result)));
}

std::unique_ptr<JSONRPCResponse> Server::handleToolsList(const JSONRPCRequest& request) {
    JSONValue::Array tools;
    for (const auto& t : registry->List()) {
        tools.push_back(std::make_shared<JSONValue>(t.ToJSON()));
    }
    JSONValue::Object result;
    result["tools"] = std::make_shared<JSONValue>(std::move(tools));
    return std::make_unique<JSONRPCResponse>(request.id, JSONValue(std::move(result)));
}

boost::asio::awaitable<std::unique_ptr<JSONRPCResponse>> Server::handleToolsCall(const SessionContext& ctx,
                                                                                const JSONRPCRequest& request) {
    std::optional<CallToolParams> params = CallToolParams::FromJSON(request.params);
    if (!params.has_value()) {
        errors::McpError e;
        e.code = JSONRPCErrorCodes::InvalidParams;
        e.message = "Invalid params: tools/call requires a tool name";
        co_return errors::makeErrorResponse(request.id, e);
    }

    LOG_DEBUG("Session {}: tools/call '{}' id={}", ctx.sessionId, params->name, IdToString(request.id));
    std::optional<errors::McpError> failure;
    try {
        CallToolResult result = co_await registry->Invoke(params->name, params->arguments);
        co_return std::make_unique<JSONRPCResponse>(request.id, result.ToJSON());
    } catch (const errors::HostError& e) {
        failure = e.toMcpError();
    } catch (const std::exception& e) {
        errors::McpError err;
        err.code = JSONRPCErrorCodes::InternalError;
        err.message = e.what();
        err.category = errors::ErrorCategory::JsonRpcInternal;
        failure = err;
    }
    LOG_INFO("Session {}: tools/call '{}' failed ({}): {}", ctx.sessionId, params->name,
             errors::toString(failure->category), failure->message);
    co_return errors::makeErrorResponse(request.id, *failure);
}

} // namespace ssehost
