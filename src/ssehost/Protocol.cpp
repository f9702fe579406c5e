//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Protocol.cpp
// Purpose: Wire encodings of handshake data, tool descriptors and tool results
//==========================================================================================================

#include "ssehost/Protocol.h"

namespace ssehost {

namespace {

std::shared_ptr<JSONValue> member(JSONValue v) { return std::make_shared<JSONValue>(std::move(v)); }

std::string stringMember(const JSONValue& obj, const char* key) {
    const JSONValue* v = obj.find(key);
    return (v != nullptr && v->isString()) ? std::get<std::string>(v->value) : std::string();
}

} // namespace

JSONValue Implementation::ToJSON() const {
    JSONValue::Object obj;
    obj["name"] = member(JSONValue(name));
    obj["version"] = member(JSONValue(version));
    return JSONValue(std::move(obj));
}

Implementation Implementation::FromJSON(const JSONValue& value) {
    return Implementation(stringMember(value, "name"), stringMember(value, "version"));
}

JSONValue ServerCapabilities::ToJSON() const {
    JSONValue::Object caps;
    if (tools.has_value()) {
        JSONValue::Object t;
        t["listChanged"] = member(JSONValue(tools->listChanged));
        caps["tools"] = member(JSONValue(std::move(t)));
    }
    return JSONValue(std::move(caps));
}

JSONValue Tool::ToJSON() const {
    JSONValue::Object obj;
    obj["name"] = member(JSONValue(name));
    obj["description"] = member(JSONValue(description));
    if (inputSchema.isObject()) {
        obj["inputSchema"] = member(inputSchema);
    } else {
        JSONValue::Object schema;
        schema["type"] = member(JSONValue("object"));
        obj["inputSchema"] = member(JSONValue(std::move(schema)));
    }
    return JSONValue(std::move(obj));
}

std::optional<CallToolParams> CallToolParams::FromJSON(const std::optional<JSONValue>& params) {
    if (!params.has_value()) {
        return std::nullopt;
    }
    CallToolParams out;
    out.name = stringMember(*params, "name");
    if (out.name.empty()) {
        return std::nullopt;
    }
    if (const JSONValue* args = params->find("arguments"); args != nullptr) {
        out.arguments = *args;
    }
    return out;
}

JSONValue CallToolResult::ToJSON() const {
    JSONValue::Array items;
    items.reserve(content.size());
    for (const auto& c : content) {
        items.push_back(member(c));
    }
    JSONValue::Object obj;
    obj["content"] = member(JSONValue(std::move(items)));
    obj["isError"] = member(JSONValue(isError));
    return JSONValue(std::move(obj));
}

} // namespace ssehost
