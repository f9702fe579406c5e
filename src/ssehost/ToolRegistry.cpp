//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ToolRegistry.cpp
// Purpose: Tool registration, listing and schema-checked dispatch
//==========================================================================================================

#include <optional>
#include <stdexcept>

#include "logging/Logger.h"
#include "ssehost/ToolRegistry.h"
#include "ssehost/errors/Errors.h"

namespace ssehost {

void ToolRegistry::Register(const Tool& tool, ToolHandler handler) {
    if (tool.name.empty()) {
        throw std::invalid_argument("Tool name must not be empty");
    }
    if (!handler) {
        throw std::invalid_argument("Tool handler must not be empty: " + tool.name);
    }
    std::lock_guard<std::mutex> lock(registryMutex);
    if (index.find(tool.name) != index.end()) {
        throw errors::DuplicateToolError(tool.name);
    }
    index.emplace(tool.name, entries.size());
    entries.push_back(Entry{tool, std::move(handler)});
    LOG_DEBUG("Registered tool '{}'", tool.name);
}

std::vector<Tool> ToolRegistry::List() const {
    std::lock_guard<std::mutex> lock(registryMutex);
    std::vector<Tool> out;
    out.reserve(entries.size());
    for (const auto& e : entries) {
        out.push_back(e.tool);
    }
    return out;
}

bool ToolRegistry::Contains(const std::string& name) const {
    std::lock_guard<std::mutex> lock(registryMutex);
    return index.find(name) != index.end();
}

std::size_t ToolRegistry::Size() const {
    std::lock_guard<std::mutex> lock(registryMutex);
    return entries.size();
}

std::vector<std::string> ToolRegistry::RequiredFields(const JSONValue& schema) {
    std::vector<std::string> fields;
    const JSONValue* req = schema.find("required");
    if (req == nullptr || !req->isArray()) {
        return fields;
    }
    for (const auto& v : std::get<JSONValue::Array>(req->value)) {
        if (v && v->isString()) {
            fields.push_back(std::get<std::string>(v->value));
        }
    }
    return fields;
}

boost::asio::awaitable<CallToolResult> ToolRegistry::Invoke(std::string name, JSONValue arguments) const {
    Tool tool;
    ToolHandler handler;
    {
        std::lock_guard<std::mutex> lock(registryMutex);
        auto it = index.find(name);
        if (it == index.end()) {
            throw errors::UnknownToolError(name);
        }
        tool = entries[it->second].tool;
        handler = entries[it->second].handler;
    }

    if (arguments.isNull()) {
        arguments = JSONValue{JSONValue::Object{}};
    }
    if (!arguments.isObject()) {
        throw errors::HostError(errors::ErrorCategory::JsonRpcInvalidParams, JSONRPCErrorCodes::InvalidParams,
                                "Arguments for tool '" + name + "' must be an object");
    }
    for (const auto& field : RequiredFields(tool.inputSchema)) {
        if (arguments.find(field) == nullptr) {
            throw errors::MissingArgumentError(field);
        }
    }

    // co_await is not permitted inside a handler block, so failures are captured and rethrown after.
    std::optional<errors::ToolExecutionError> failure;
    try {
        co_return co_await handler(arguments);
    } catch (const errors::ToolExecutionError& e) {
        failure.emplace(e);
    } catch (const errors::HostError& e) {
        // Malformed arguments stay -32602 rather than becoming an execution failure.
        if (e.code() == JSONRPCErrorCodes::InvalidParams) {
            LOG_DEBUG("Tool '{}' rejected its arguments: {}", name, e.what());
            throw;
        }
        failure.emplace(name, e.what(), e.category(), e.data());
    } catch (const std::exception& e) {
        failure.emplace(name, e.what());
    }
    LOG_WARN("Tool '{}' failed: {}", name, failure->cause());
    throw *failure;
}

} // namespace ssehost
