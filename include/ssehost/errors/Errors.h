//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Errors.h
// Purpose: Error taxonomy, typed exceptions and JSON-RPC error mapping helpers
//==========================================================================================================

#pragma once

#include <optional>
#include <stdexcept>
#include <string>

#include "ssehost/JSONRPCTypes.h"

namespace ssehost {
namespace errors {

// Categorization of JSON-RPC framing errors and the server's own failure kinds.
enum class ErrorCategory {
    JsonRpcParse,
    JsonRpcInvalidRequest,
    JsonRpcMethodNotFound,
    JsonRpcInvalidParams,
    JsonRpcInternal,
    DuplicateTool,
    UnknownTool,
    MissingArgument,
    ToolExecution,
    Fetch,
    UnknownSession,
    NotInitialized,
    AlreadyRunning,
    BindFailure,
    ShutdownTimeout,
    Unknown
};

const char* toString(ErrorCategory category);

// Typed error representation used on the wire.
struct McpError {
    int code{0};
    std::string message;
    std::optional<JSONValue> data;
    ErrorCategory category{ErrorCategory::Unknown};
};

//==========================================================================================================
// HostError
// Purpose: Base of all typed exceptions raised by the registry, tools and transport. Carries the
//          category and the JSON-RPC code used when the error is framed into a response.
//==========================================================================================================
class HostError : public std::runtime_error {
public:
    HostError(ErrorCategory category, int code, const std::string& message)
        : std::runtime_error(message), category_(category), code_(code) {}

    ErrorCategory category() const noexcept { return category_; }
    int code() const noexcept { return code_; }

    // Structured payload attached as error.data; none by default.
    virtual std::optional<JSONValue> data() const { return std::nullopt; }

    McpError toMcpError() const;

private:
    ErrorCategory category_;
    int code_;
};

class DuplicateToolError : public HostError {
public:
    explicit DuplicateToolError(const std::string& name)
        : HostError(ErrorCategory::DuplicateTool, JSONRPCErrorCodes::InvalidRequest,
                    "Tool already registered: " + name), name_(name) {}
    const std::string& name() const noexcept { return name_; }
private:
    std::string name_;
};

class UnknownToolError : public HostError {
public:
    explicit UnknownToolError(const std::string& name)
        : HostError(ErrorCategory::UnknownTool, JSONRPCErrorCodes::ToolNotFound,
                    "Unknown tool: " + name), name_(name) {}
    const std::string& name() const noexcept { return name_; }
private:
    std::string name_;
};

class MissingArgumentError : public HostError {
public:
    explicit MissingArgumentError(const std::string& field)
        : HostError(ErrorCategory::MissingArgument, JSONRPCErrorCodes::InvalidParams,
                    "Missing required argument '" + field + "'"), field_(field) {}
    const std::string& field() const noexcept { return field_; }
    std::optional<JSONValue> data() const override;
private:
    std::string field_;
};

//==========================================================================================================
// FetchError
// Purpose: Outbound HTTP GET failed: transport failure (status 0) or a 4xx/5xx response.
//==========================================================================================================
class FetchError : public HostError {
public:
    FetchError(const std::string& url, unsigned int status, const std::string& message)
        : HostError(ErrorCategory::Fetch, JSONRPCErrorCodes::InternalError, message),
          url_(url), status_(status) {}
    const std::string& url() const noexcept { return url_; }
    unsigned int status() const noexcept { return status_; }
    std::optional<JSONValue> data() const override;
private:
    std::string url_;
    unsigned int status_;
};

//==========================================================================================================
// ToolExecutionError
// Purpose: A tool handler failed. Wraps the underlying cause (e.g. FetchError) together with its
//          category so the response can still name what went wrong.
//==========================================================================================================
class ToolExecutionError : public HostError {
public:
    ToolExecutionError(const std::string& tool, const std::string& cause,
                       ErrorCategory causeCategory = ErrorCategory::Unknown,
                       std::optional<JSONValue> causeData = std::nullopt)
        : HostError(ErrorCategory::ToolExecution, JSONRPCErrorCodes::InternalError,
                    "Tool '" + tool + "' failed: " + cause),
          tool_(tool), cause_(cause), causeCategory_(causeCategory), causeData_(std::move(causeData)) {}
    const std::string& tool() const noexcept { return tool_; }
    const std::string& cause() const noexcept { return cause_; }
    ErrorCategory causeCategory() const noexcept { return causeCategory_; }
    std::optional<JSONValue> data() const override;
private:
    std::string tool_;
    std::string cause_;
    ErrorCategory causeCategory_;
    std::optional<JSONValue> causeData_;
};

class UnknownSessionError : public HostError {
public:
    explicit UnknownSessionError(const std::string& sessionId)
        : HostError(ErrorCategory::UnknownSession, JSONRPCErrorCodes::InvalidRequest,
                    "Could not find session " + sessionId), sessionId_(sessionId) {}
    const std::string& sessionId() const noexcept { return sessionId_; }
private:
    std::string sessionId_;
};

class NotInitializedError : public HostError {
public:
    explicit NotInitializedError(const std::string& method)
        : HostError(ErrorCategory::NotInitialized, JSONRPCErrorCodes::NotInitialized,
                    "Received request '" + method + "' before initialization was complete") {}
};

// Map a JSON-RPC numeric error code to an ErrorCategory.
inline ErrorCategory errorCategoryFromCode(int code) {
    switch (code) {
        case JSONRPCErrorCodes::ParseError: return ErrorCategory::JsonRpcParse;
        case JSONRPCErrorCodes::InvalidRequest: return ErrorCategory::JsonRpcInvalidRequest;
        case JSONRPCErrorCodes::MethodNotFound: return ErrorCategory::JsonRpcMethodNotFound;
        case JSONRPCErrorCodes::InvalidParams: return ErrorCategory::JsonRpcInvalidParams;
        case JSONRPCErrorCodes::InternalError: return ErrorCategory::JsonRpcInternal;
        case JSONRPCErrorCodes::NotInitialized: return ErrorCategory::NotInitialized;
        case JSONRPCErrorCodes::ToolNotFound: return ErrorCategory::UnknownTool;
        default: return ErrorCategory::Unknown;
    }
}

// Convert a JSON-RPC error object (shape: { code, message, data? }) to McpError.
// Returns std::nullopt when the input is not a valid error object.
std::optional<McpError> mcpErrorFromErrorValue(const JSONValue& errVal);

// Extract McpError from a JSONRPCResponse if it carries an error.
inline std::optional<McpError> mcpErrorFromResponse(const JSONRPCResponse& response) {
    if (!response.error.has_value()) {
        return std::nullopt;
    }
    return mcpErrorFromErrorValue(response.error.value());
}

// Create a JSONValue error object from a typed McpError.
JSONValue makeErrorValue(const McpError& err);

// Convenience: Create a JSONRPCResponse error from McpError and id.
inline std::unique_ptr<JSONRPCResponse> makeErrorResponse(const JSONRPCId& id, const McpError& err) {
    return CreateErrorResponse(id, err.code, err.message, err.data);
}

} // namespace errors
} // namespace ssehost
