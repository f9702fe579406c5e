//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: JSONValue.h
// Purpose: In-memory JSON document model with a strict parser and a compact serializer
//==========================================================================================================

#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <unordered_map>
#include <variant>
#include <vector>

namespace ssehost {

//==========================================================================================================
// JSONValue
// Purpose: One JSON value. Containers hold shared_ptr children so documents can be assembled piecewise
//          and shared between messages without deep copies.
// Notes:
//   Integers that fit int64_t are kept as int64_t; every other number is a double.
//   Object member order is not preserved.
//==========================================================================================================
struct JSONValue {
    using Array = std::vector<std::shared_ptr<JSONValue>>;
    using Object = std::unordered_map<std::string, std::shared_ptr<JSONValue>>;
    using Storage = std::variant<std::nullptr_t, bool, int64_t, double, std::string, Array, Object>;

    Storage value;

    JSONValue();
    JSONValue(const JSONValue&);
    JSONValue(JSONValue&&);
    JSONValue& operator=(const JSONValue&);
    JSONValue& operator=(JSONValue&&);
    ~JSONValue();

    explicit JSONValue(std::nullptr_t);
    explicit JSONValue(bool v);
    explicit JSONValue(int64_t v);
    explicit JSONValue(double v);
    explicit JSONValue(const char* s);
    explicit JSONValue(const std::string& s);
    explicit JSONValue(std::string&& s);
    explicit JSONValue(const Array& a);
    explicit JSONValue(Array&& a);
    explicit JSONValue(const Object& o);
    explicit JSONValue(Object&& o);

    bool isNull() const { return std::holds_alternative<std::nullptr_t>(value); }
    bool isArray() const { return std::holds_alternative<Array>(value); }
    bool isObject() const { return std::holds_alternative<Object>(value); }
    bool isString() const { return std::holds_alternative<std::string>(value); }

    // Member stored under key when this is an object and the slot is populated; nullptr otherwise.
    const JSONValue* find(const std::string& key) const;
};

//==========================================================================================================
// ParseJSON
// Purpose: Parses exactly one JSON document (RFC 8259). Surrounding whitespace is allowed, anything else
//          after the value is not. Nesting deeper than 256 containers is rejected.
// Throws:
//   std::runtime_error naming the first syntax error and its byte offset.
//==========================================================================================================
JSONValue ParseJSON(const std::string& text);

// Compact serialization with no insignificant whitespace. Non-finite doubles are written as null.
std::string SerializeJSON(const JSONValue& value);

} // namespace ssehost
