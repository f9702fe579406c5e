//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Errors.cpp
// Purpose: Error payloads and JSON-RPC error object conversions
//==========================================================================================================

#include "ssehost/errors/Errors.h"

namespace ssehost {
namespace errors {

const char* toString(ErrorCategory category) {
    switch (category) {
        case ErrorCategory::JsonRpcParse: return "ParseError";
        case ErrorCategory::JsonRpcInvalidRequest: return "InvalidRequest";
        case ErrorCategory::JsonRpcMethodNotFound: return "MethodNotFound";
        case ErrorCategory::JsonRpcInvalidParams: return "InvalidParams";
        case ErrorCategory::JsonRpcInternal: return "InternalError";
        case ErrorCategory::DuplicateTool: return "DuplicateTool";
        case ErrorCategory::UnknownTool: return "UnknownTool";
        case ErrorCategory::MissingArgument: return "MissingArgument";
        case ErrorCategory::ToolExecution: return "ToolExecutionError";
        case ErrorCategory::Fetch: return "FetchError";
        case ErrorCategory::UnknownSession: return "UnknownSession";
        case ErrorCategory::NotInitialized: return "NotInitialized";
        case ErrorCategory::AlreadyRunning: return "AlreadyRunning";
        case ErrorCategory::BindFailure: return "BindFailure";
        case ErrorCategory::ShutdownTimeout: return "ShutdownTimeout";
        case ErrorCategory::Unknown:
        default: return "Unknown";
    }
}

McpError HostError::toMcpError() const {
    McpError e;
    e.code = code_;
    e.message = what();
    e.data = data();
    e.category = category_;
    return e;
}

std::optional<JSONValue> MissingArgumentError::data() const {
    JSONValue::Object obj;
    obj["field"] = std::make_shared<JSONValue>(field_);
    return JSONValue{obj};
}

std::optional<JSONValue> FetchError::data() const {
    JSONValue::Object obj;
    obj["url"] = std::make_shared<JSONValue>(url_);
    obj["status"] = std::make_shared<JSONValue>(static_cast<int64_t>(status_));
    return JSONValue{obj};
}

std::optional<JSONValue> ToolExecutionError::data() const {
    JSONValue::Object obj;
    obj["tool"] = std::make_shared<JSONValue>(tool_);
    obj["kind"] = std::make_shared<JSONValue>(std::string(toString(causeCategory_)));
    if (causeData_.has_value()) {
        obj["cause"] = std::make_shared<JSONValue>(causeData_.value());
    }
    return JSONValue{obj};
}

std::optional<McpError> mcpErrorFromErrorValue(const JSONValue& errVal) {
    const JSONValue* codeVal = errVal.find("code");
    const JSONValue* msgVal = errVal.find("message");
    if (codeVal == nullptr || msgVal == nullptr) {
        return std::nullopt;
    }
    if (!std::holds_alternative<int64_t>(codeVal->value) || !msgVal->isString()) {
        return std::nullopt;
    }

    McpError e;
    e.code = static_cast<int>(std::get<int64_t>(codeVal->value));
    e.message = std::get<std::string>(msgVal->value);
    if (const JSONValue* dataVal = errVal.find("data")) {
        e.data = *dataVal;
    }
    e.category = errorCategoryFromCode(e.code);
    return e;
}

JSONValue makeErrorValue(const McpError& err) {
    return CreateErrorObject(err.code, err.message, err.data);
}

} // namespace errors
} // namespace ssehost
