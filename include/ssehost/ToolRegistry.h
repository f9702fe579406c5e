//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ToolRegistry.h
// Purpose: Name-keyed registry of tool descriptors and their coroutine handlers
//==========================================================================================================

#pragma once

#include <functional>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include <boost/asio/awaitable.hpp>

#include "ssehost/Protocol.h"

namespace ssehost {

//==========================================================================================================
// ToolHandler
// Purpose: Coroutine invoked on the server's io_context with the call's arguments object. Handlers may
//          suspend on network I/O; they report failure by throwing.
//==========================================================================================================
using ToolHandler = std::function<boost::asio::awaitable<CallToolResult>(const JSONValue& arguments)>;

class ToolRegistry {
public:
    ToolRegistry() = default;
    ToolRegistry(const ToolRegistry&) = delete;
    ToolRegistry& operator=(const ToolRegistry&) = delete;

    //==========================================================================================================
    // Registers a descriptor and its handler.
    // Throws:
    //   errors::DuplicateToolError when a tool with the same name is already registered.
    //   std::invalid_argument when the name is empty or the handler is empty.
    //==========================================================================================================
    void Register(const Tool& tool, ToolHandler handler);

    //==========================================================================================================
    // Returns all descriptors in registration order.
    //==========================================================================================================
    std::vector<Tool> List() const;

    bool Contains(const std::string& name) const;
    std::size_t Size() const;

    //==========================================================================================================
    // Invokes a tool by name.
    // Args:
    //   name: Tool name.
    //   arguments: JSON object (null is treated as an empty object).
    // Returns:
    //   The handler's result.
    // Throws:
    //   errors::UnknownToolError when no tool has that name.
    //   errors::MissingArgumentError(field) for the first schema-required field absent from arguments.
    //   errors::HostError(JsonRpcInvalidParams) when arguments is neither an object nor null.
    //   errors::ToolExecutionError wrapping any failure raised by the handler.
    //==========================================================================================================
    boost::asio::awaitable<CallToolResult> Invoke(std::string name, JSONValue arguments) const;

    // Field names listed in schema.required (non-string entries are skipped).
    static std::vector<std::string> RequiredFields(const JSONValue& schema);

private:
    struct Entry {
        Tool tool;
        ToolHandler handler;
    };

    mutable std::mutex registryMutex;
    std::vector<Entry> entries;
    std::unordered_map<std::string, std::size_t> index;
};

} // namespace ssehost
