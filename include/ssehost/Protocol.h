//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Protocol.h
// Purpose: Handshake and tool data carried inside JSON-RPC payloads, with their wire encodings
//==========================================================================================================

#pragma once

#include <optional>
#include <string>
#include <vector>

#include "ssehost/JSONRPCTypes.h"

namespace ssehost {

// Revision advertised when the client does not name one during initialize.
constexpr const char* PROTOCOL_VERSION = "2024-11-05";

namespace Methods {
    constexpr const char* Initialize = "initialize";
    constexpr const char* Initialized = "notifications/initialized";
    constexpr const char* Cancelled = "notifications/cancelled";
    constexpr const char* Ping = "ping";
    constexpr const char* ListTools = "tools/list";
    constexpr const char* CallTool = "tools/call";
}

///////////////////////////////////////// Handshake ///////////////////////////////////////////
// serverInfo / clientInfo: {name, version}
struct Implementation {
    std::string name;
    std::string version;

    Implementation() = default;
    Implementation(std::string name, std::string version) : name(std::move(name)), version(std::move(version)) {}

    JSONValue ToJSON() const;
    // Missing or non-string members are left empty.
    static Implementation FromJSON(const JSONValue& value);
};

struct ServerCapabilities {
    struct Tools {
        bool listChanged{false};
    };
    std::optional<Tools> tools;

    // {tools: {listChanged}} or {} when tools are not offered.
    JSONValue ToJSON() const;
};

///////////////////////////////////////// Tools ///////////////////////////////////////////
//==========================================================================================================
// Tool
// Purpose: Tool descriptor advertised by tools/list. name is the registry key; inputSchema is an object
//          schema ({type: "object", properties: {...}, required: [...]}). A descriptor without a schema
//          is advertised with {type: "object"}.
//==========================================================================================================
struct Tool {
    std::string name;
    std::string description;
    JSONValue inputSchema;

    Tool() = default;
    Tool(std::string name, std::string description, JSONValue inputSchema = JSONValue{})
        : name(std::move(name)), description(std::move(description)), inputSchema(std::move(inputSchema)) {}

    JSONValue ToJSON() const;
};

// tools/call params; arguments stays null when the client omits it.
struct CallToolParams {
    std::string name;
    JSONValue arguments;

    // Returns std::nullopt when params carry no non-empty string "name".
    static std::optional<CallToolParams> FromJSON(const std::optional<JSONValue>& params);
};

// Ordered content items built with typed/Content.h.
struct CallToolResult {
    std::vector<JSONValue> content;
    bool isError{false};

    // {content: [...], isError}
    JSONValue ToJSON() const;
};

} // namespace ssehost
