//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: JSONRPCTypes.h
// Purpose: JSON-RPC 2.0 messages exchanged over a session: requests, responses, notifications
//==========================================================================================================

#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <variant>

#include "ssehost/JSONValue.h"

namespace ssehost {

// Request id: string, integer or null.
using JSONRPCId = std::variant<std::string, int64_t, std::nullptr_t>;

// Renders an id for log lines ("null" for the null id).
std::string IdToString(const JSONRPCId& id);
JSONValue IdToJSON(const JSONRPCId& id);

//==========================================================================================================
// JSONRPCMessage
// Purpose: Common base of the three message shapes. Subclasses build their JSON object; Serialize()
//          renders it compactly for one SSE data field.
//==========================================================================================================
class JSONRPCMessage {
public:
    virtual ~JSONRPCMessage() = default;

    virtual JSONValue ToJSON() const = 0;
    std::string Serialize() const { return SerializeJSON(ToJSON()); }
};

class JSONRPCRequest : public JSONRPCMessage {
public:
    JSONRPCId id;
    std::string method;
    std::optional<JSONValue> params;

    JSONRPCRequest() = default;
    JSONRPCRequest(JSONRPCId id, std::string method, std::optional<JSONValue> params = std::nullopt)
        : id(std::move(id)), method(std::move(method)), params(std::move(params)) {}

    JSONValue ToJSON() const override;
};

//==========================================================================================================
// JSONRPCResponse
// Purpose: Carries exactly one of result or error for the request with the same id.
//==========================================================================================================
class JSONRPCResponse : public JSONRPCMessage {
public:
    JSONRPCId id;
    std::optional<JSONValue> result;
    std::optional<JSONValue> error;

    JSONRPCResponse() = default;
    JSONRPCResponse(JSONRPCId id, JSONValue result) : id(std::move(id)), result(std::move(result)) {}

    JSONValue ToJSON() const override;
    bool IsError() const { return error.has_value(); }
};

class JSONRPCNotification : public JSONRPCMessage {
public:
    std::string method;
    std::optional<JSONValue> params;

    JSONRPCNotification() = default;
    explicit JSONRPCNotification(std::string method, std::optional<JSONValue> params = std::nullopt)
        : method(std::move(method)), params(std::move(params)) {}

    JSONValue ToJSON() const override;
};

//==========================================================================================================
// InboundMessage
// Purpose: A posted body classified by shape. A member "method" with "id" is a request, "method" without
//          "id" a notification, and "result" or "error" a response. Exactly one pointer is set.
//==========================================================================================================
struct InboundMessage {
    enum class Kind { Request, Notification, Response };
    Kind kind{Kind::Request};
    std::unique_ptr<JSONRPCRequest> request;
    std::unique_ptr<JSONRPCNotification> notification;
    std::unique_ptr<JSONRPCResponse> response;
};

//==========================================================================================================
// ParseInboundMessage
// Throws:
//   std::runtime_error when the text is not JSON, not an object, lacks jsonrpc "2.0", has an id that is
//   not a string/integer/null, or fits none of the three shapes.
//==========================================================================================================
InboundMessage ParseInboundMessage(const std::string& json);

namespace JSONRPCErrorCodes {
    constexpr int ParseError = -32700;
    constexpr int InvalidRequest = -32600;
    constexpr int MethodNotFound = -32601;
    constexpr int InvalidParams = -32602;
    constexpr int InternalError = -32603;

    // Implementation-defined server errors
    constexpr int NotInitialized = -32002;
    constexpr int ToolNotFound = -32003;
}

// {code, message, data?}
JSONValue CreateErrorObject(int code, const std::string& message,
                            const std::optional<JSONValue>& data = std::nullopt);

std::unique_ptr<JSONRPCResponse> CreateErrorResponse(const JSONRPCId& id, int code, const std::string& message,
                                                     const std::optional<JSONValue>& data = std::nullopt);

} // namespace ssehost
