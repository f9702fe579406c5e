//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: JSONRPC.cpp
// Purpose: JSON-RPC 2.0 message encoding and classification of posted bodies
//==========================================================================================================

#include <stdexcept>

#include "ssehost/JSONRPCTypes.h"

namespace ssehost {

namespace {

using Member = std::shared_ptr<JSONValue>;

Member member(JSONValue v) { return std::make_shared<JSONValue>(std::move(v)); }

JSONValue::Object envelope() {
    JSONValue::Object obj;
    obj["jsonrpc"] = member(JSONValue("2.0"));
    return obj;
}

JSONRPCId readId(const JSONValue& v) {
    if (const auto* s = std::get_if<std::string>(&v.value)) {
        return *s;
    }
    if (const auto* i = std::get_if<int64_t>(&v.value)) {
        return *i;
    }
    if (v.isNull()) {
        return nullptr;
    }
    throw std::runtime_error("JSON-RPC id must be a string, integer or null");
}

std::string readMethod(const JSONValue& doc) {
    const JSONValue* m = doc.find("method");
    if (m == nullptr || !m->isString() || std::get<std::string>(m->value).empty()) {
        throw std::runtime_error("JSON-RPC method must be a non-empty string");
    }
    return std::get<std::string>(m->value);
}

std::optional<JSONValue> optionalMember(const JSONValue& doc, const char* key) {
    const JSONValue* v = doc.find(key);
    return v != nullptr ? std::optional<JSONValue>(*v) : std::nullopt;
}

} // namespace

std::string IdToString(const JSONRPCId& id) {
    if (const auto* s = std::get_if<std::string>(&id)) {
        return *s;
    }
    if (const auto* i = std::get_if<int64_t>(&id)) {
        return std::to_string(*i);
    }
    return "null";
}

JSONValue IdToJSON(const JSONRPCId& id) {
    if (const auto* s = std::get_if<std::string>(&id)) {
        return JSONValue(*s);
    }
    if (const auto* i = std::get_if<int64_t>(&id)) {
        return JSONValue(*i);
    }
    return JSONValue(nullptr);
}

JSONValue JSONRPCRequest::ToJSON() const {
    JSONValue::Object obj = envelope();
    obj["id"] = member(IdToJSON(id));
    obj["method"] = member(JSONValue(method));
    if (params.has_value()) {
        obj["params"] = member(*params);
    }
    return JSONValue(std::move(obj));
}

JSONValue JSONRPCResponse::ToJSON() const {
    JSONValue::Object obj = envelope();
    obj["id"] = member(IdToJSON(id));
    if (error.has_value()) {
        obj["error"] = member(*error);
    } else {
        obj["result"] = member(result.value_or(JSONValue(JSONValue::Object{})));
    }
    return JSONValue(std::move(obj));
}

JSONValue JSONRPCNotification::ToJSON() const {
    JSONValue::Object obj = envelope();
    obj["method"] = member(JSONValue(method));
    if (params.has_value()) {
        obj["params"] = member(*params);
    }
    return JSONValue(std::move(obj));
}

InboundMessage ParseInboundMessage(const std::string& json) {
    const JSONValue doc = ParseJSON(json);
    if (!doc.isObject()) {
        throw std::runtime_error("JSON-RPC message must be an object");
    }
    const JSONValue* version = doc.find("jsonrpc");
    if (version == nullptr || !version->isString() || std::get<std::string>(version->value) != "2.0") {
        throw std::runtime_error("JSON-RPC message must carry jsonrpc \"2.0\"");
    }

    InboundMessage msg;
    const JSONValue* id = doc.find("id");
    if (doc.find("method") != nullptr) {
        if (id == nullptr) {
            msg.kind = InboundMessage::Kind::Notification;
            msg.notification = std::make_unique<JSONRPCNotification>(readMethod(doc), optionalMember(doc, "params"));
        } else {
            msg.kind = InboundMessage::Kind::Request;
            msg.request = std::make_unique<JSONRPCRequest>(readId(*id), readMethod(doc), optionalMember(doc, "params"));
        }
        return msg;
    }

    auto result = optionalMember(doc, "result");
    auto error = optionalMember(doc, "error");
    if (result.has_value() == error.has_value()) {
        throw std::runtime_error("JSON-RPC response must carry exactly one of result or error");
    }
    msg.kind = InboundMessage::Kind::Response;
    msg.response = std::make_unique<JSONRPCResponse>();
    msg.response->id = id != nullptr ? readId(*id) : JSONRPCId(nullptr);
    msg.response->result = std::move(result);
    msg.response->error = std::move(error);
    return msg;
}

JSONValue CreateErrorObject(int code, const std::string& message, const std::optional<JSONValue>& data) {
    JSONValue::Object obj;
    obj["code"] = member(JSONValue(static_cast<int64_t>(code)));
    obj["message"] = member(JSONValue(message));
    if (data.has_value()) {
        obj["data"] = member(*data);
    }
    return JSONValue(std::move(obj));
}

std::unique_ptr<JSONRPCResponse> CreateErrorResponse(const JSONRPCId& id, int code, const std::string& message,
                                                     const std::optional<JSONValue>& data) {
    auto response = std::make_unique<JSONRPCResponse>();
    response->id = id;
    response->error = CreateErrorObject(code, message, data);
    return response;
}

} // namespace ssehost
