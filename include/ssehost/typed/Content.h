//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Content.h
// Purpose: Content items of a tool result: text, image and embedded resource builders plus text readers
//==========================================================================================================

#pragma once

#include <initializer_list>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "ssehost/Protocol.h"

namespace ssehost {
namespace typed {

namespace detail {
inline JSONValue object(std::initializer_list<std::pair<const char*, JSONValue>> fields) {
    JSONValue::Object obj;
    for (const auto& [key, value] : fields) {
        obj[key] = std::make_shared<JSONValue>(value);
    }
    return JSONValue(std::move(obj));
}

inline std::optional<std::string> stringMember(const JSONValue& v, const char* key) {
    const JSONValue* m = v.find(key);
    if (m == nullptr || !m->isString()) {
        return std::nullopt;
    }
    return std::get<std::string>(m->value);
}
} // namespace detail

// {type:"text", text}
inline JSONValue makeText(const std::string& text) {
    return detail::object({{"type", JSONValue("text")}, {"text", JSONValue(text)}});
}

// {type:"image", data, mimeType}; data is base64.
inline JSONValue makeImage(const std::string& base64Data, const std::string& mimeType) {
    return detail::object({{"type", JSONValue("image")}, {"data", JSONValue(base64Data)}, {"mimeType", JSONValue(mimeType)}});
}

// {type:"resource", resource:{uri, text, mimeType?}}
inline JSONValue makeEmbeddedResource(const std::string& uri, const std::string& text,
                                      const std::optional<std::string>& mimeType = std::nullopt) {
    JSONValue resource = detail::object({{"uri", JSONValue(uri)}, {"text", JSONValue(text)}});
    if (mimeType.has_value()) {
        std::get<JSONValue::Object>(resource.value)["mimeType"] = std::make_shared<JSONValue>(*mimeType);
    }
    return detail::object({{"type", JSONValue("resource")}, {"resource", std::move(resource)}});
}

// Successful result holding one text item.
inline CallToolResult textResult(const std::string& text) {
    CallToolResult r;
    r.content.push_back(makeText(text));
    return r;
}

inline std::optional<std::string> contentType(const JSONValue& item) {
    return detail::stringMember(item, "type");
}

// Text of a text item; std::nullopt for every other kind.
inline std::optional<std::string> getText(const JSONValue& item) {
    if (contentType(item) != std::optional<std::string>("text")) {
        return std::nullopt;
    }
    return detail::stringMember(item, "text");
}

// Texts of all text items, in order.
inline std::vector<std::string> collectText(const CallToolResult& r) {
    std::vector<std::string> out;
    for (const auto& item : r.content) {
        if (auto t = getText(item)) {
            out.push_back(std::move(*t));
        }
    }
    return out;
}

inline std::optional<std::string> firstText(const CallToolResult& r) {
    for (const auto& item : r.content) {
        if (auto t = getText(item)) {
            return t;
        }
    }
    return std::nullopt;
}

} // namespace typed
} // namespace ssehost
