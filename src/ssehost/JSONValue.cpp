//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: JSONValue.cpp
// Purpose: JSON document model, strict recursive-descent reader and compact writer
//==========================================================================================================

#include <array>
#include <charconv>
#include <cmath>
#include <stdexcept>
#include <string_view>
#include <type_traits>

#include "ssehost/JSONValue.h"

namespace ssehost {

JSONValue::JSONValue() : value(nullptr) {}
JSONValue::JSONValue(const JSONValue&) = default;
JSONValue::JSONValue(JSONValue&&) = default;
JSONValue& JSONValue::operator=(const JSONValue&) = default;
JSONValue& JSONValue::operator=(JSONValue&&) = default;
JSONValue::~JSONValue() = default;

JSONValue::JSONValue(std::nullptr_t) : value(nullptr) {}
JSONValue::JSONValue(bool v) : value(v) {}
JSONValue::JSONValue(int64_t v) : value(v) {}
JSONValue::JSONValue(double v) : value(v) {}
JSONValue::JSONValue(const char* s) : value(std::string(s != nullptr ? s : "")) {}
JSONValue::JSONValue(const std::string& s) : value(s) {}
JSONValue::JSONValue(std::string&& s) : value(std::move(s)) {}
JSONValue::JSONValue(const Array& a) : value(a) {}
JSONValue::JSONValue(Array&& a) : value(std::move(a)) {}
JSONValue::JSONValue(const Object& o) : value(o) {}
JSONValue::JSONValue(Object&& o) : value(std::move(o)) {}

const JSONValue* JSONValue::find(const std::string& key) const {
    const auto* obj = std::get_if<Object>(&value);
    if (obj == nullptr) {
        return nullptr;
    }
    auto it = obj->find(key);
    return (it == obj->end() || !it->second) ? nullptr : it->second.get();
}

namespace {

constexpr int kMaxNesting = 256;

bool isDigit(char c) { return c >= '0' && c <= '9'; }

///////////////////////////////////////// Reader ///////////////////////////////////////////
class Reader {
public:
    explicit Reader(std::string_view text) : in(text) {}

    JSONValue document() {
        JSONValue v = value(0);
        skipSpace();
        if (pos != in.size()) {
            error("unexpected characters after the document");
        }
        return v;
    }

private:
    [[noreturn]] void error(const std::string& what) const {
        throw std::runtime_error("JSON parse error at offset " + std::to_string(pos) + ": " + what);
    }

    void skipSpace() {
        while (pos < in.size() && (in[pos] == ' ' || in[pos] == '\n' || in[pos] == '\r' || in[pos] == '\t')) {
            ++pos;
        }
    }

    // Next significant character without consuming it; '\0' at end of input.
    char peek() {
        skipSpace();
        return pos < in.size() ? in[pos] : '\0';
    }

    void expect(char c) {
        if (peek() != c) {
            error(std::string("expected '") + c + "'");
        }
        ++pos;
    }

    JSONValue value(int depth) {
        switch (peek()) {
            case '{': return object(depth + 1);
            case '[': return array(depth + 1);
            case '"': return JSONValue(string());
            case 't': return literal("true", JSONValue(true));
            case 'f': return literal("false", JSONValue(false));
            case 'n': return literal("null", JSONValue(nullptr));
            case '\0':
                if (pos >= in.size()) {
                    error("unexpected end of input");
                }
                break;
            default: break;
        }
        return number();
    }

    JSONValue literal(std::string_view word, JSONValue v) {
        if (in.substr(pos, word.size()) != word) {
            error("invalid literal");
        }
        pos += word.size();
        return v;
    }

    JSONValue object(int depth) {
        if (depth > kMaxNesting) {
            error("nesting exceeds " + std::to_string(kMaxNesting) + " levels");
        }
        expect('{');
        JSONValue::Object members;
        if (peek() == '}') {
            ++pos;
            return JSONValue(std::move(members));
        }
        for (;;) {
            if (peek() != '"') {
                error("object key must be a string");
            }
            std::string key = string();
            expect(':');
            members[std::move(key)] = std::make_shared<JSONValue>(value(depth));
            const char c = peek();
            ++pos;
            if (c == '}') {
                return JSONValue(std::move(members));
            }
            if (c != ',') {
                --pos;
                error("expected ',' or '}' in object");
            }
        }
    }

    JSONValue array(int depth) {
        if (depth > kMaxNesting) {
            error("nesting exceeds " + std::to_string(kMaxNesting) + " levels");
        }
        expect('[');
        JSONValue::Array items;
        if (peek() == ']') {
            ++pos;
            return JSONValue(std::move(items));
        }
        for (;;) {
            items.push_back(std::make_shared<JSONValue>(value(depth)));
            const char c = peek();
            ++pos;
            if (c == ']') {
                return JSONValue(std::move(items));
            }
            if (c != ',') {
                --pos;
                error("expected ',' or ']' in array");
            }
        }
    }

    JSONValue number() {
        const std::size_t start = pos;
        if (pos < in.size() && in[pos] == '-') {
            ++pos;
        }
        const std::size_t intStart = pos;
        while (pos < in.size() && isDigit(in[pos])) {
            ++pos;
        }
        if (pos == intStart) {
            error("invalid value");
        }
        if (in[intStart] == '0' && pos - intStart > 1) {
            error("leading zeros are not allowed");
        }
        bool integral = true;
        if (pos < in.size() && in[pos] == '.') {
            integral = false;
            const std::size_t fracStart = ++pos;
            while (pos < in.size() && isDigit(in[pos])) {
                ++pos;
            }
            if (pos == fracStart) {
                error("digits required after decimal point");
            }
        }
        if (pos < in.size() && (in[pos] == 'e' || in[pos] == 'E')) {
            integral = false;
            ++pos;
            if (pos < in.size() && (in[pos] == '+' || in[pos] == '-')) {
                ++pos;
            }
            const std::size_t expStart = pos;
            while (pos < in.size() && isDigit(in[pos])) {
                ++pos;
            }
            if (pos == expStart) {
                error("digits required in exponent");
            }
        }

        const char* first = in.data() + start;
        const char* last = in.data() + pos;
        if (integral) {
            int64_t i = 0;
            auto r = std::from_chars(first, last, i);
            if (r.ec == std::errc() && r.ptr == last) {
                return JSONValue(i);
            }
        }
        double d = 0.0;
        auto r = std::from_chars(first, last, d);
        if (r.ec != std::errc() || r.ptr != last) {
            error("number out of range");
        }
        return JSONValue(d);
    }

    unsigned hex4() {
        if (in.size() - pos < 4) {
            error("truncated \\u escape");
        }
        unsigned cp = 0;
        auto r = std::from_chars(in.data() + pos, in.data() + pos + 4, cp, 16);
        if (r.ec != std::errc() || r.ptr != in.data() + pos + 4) {
            error("invalid \\u escape");
        }
        pos += 4;
        return cp;
    }

    static void putUtf8(std::string& out, unsigned cp) {
        if (cp < 0x80) {
            out += static_cast<char>(cp);
        } else if (cp < 0x800) {
            out += static_cast<char>(0xC0 | (cp >> 6));
            out += static_cast<char>(0x80 | (cp & 0x3F));
        } else if (cp < 0x10000) {
            out += static_cast<char>(0xE0 | (cp >> 12));
            out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
            out += static_cast<char>(0x80 | (cp & 0x3F));
        } else {
            out += static_cast<char>(0xF0 | (cp >> 18));
            out += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
            out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
            out += static_cast<char>(0x80 | (cp & 0x3F));
        }
    }

    unsigned codePoint() {
        unsigned cp = hex4();
        if (cp >= 0xDC00 && cp <= 0xDFFF) {
            error("lone low surrogate");
        }
        if (cp >= 0xD800 && cp <= 0xDBFF) {
            if (in.substr(pos, 2) != "\\u") {
                error("high surrogate without a low surrogate");
            }
            pos += 2;
            const unsigned low = hex4();
            if (low < 0xDC00 || low > 0xDFFF) {
                error("high surrogate without a low surrogate");
            }
            cp = 0x10000 + ((cp - 0xD800) << 10) + (low - 0xDC00);
        }
        return cp;
    }

    std::string string() {
        expect('"');
        std::string out;
        for (;;) {
            if (pos >= in.size()) {
                error("unterminated string");
            }
            const char c = in[pos++];
            if (c == '"') {
                return out;
            }
            if (static_cast<unsigned char>(c) < 0x20) {
                error("unescaped control character in string");
            }
            if (c != '\\') {
                out += c;
                continue;
            }
            if (pos >= in.size()) {
                error("unterminated escape");
            }
            switch (in[pos++]) {
                case '"': out += '"'; break;
                case '\\': out += '\\'; break;
                case '/': out += '/'; break;
                case 'b': out += '\b'; break;
                case 'f': out += '\f'; break;
                case 'n': out += '\n'; break;
                case 'r': out += '\r'; break;
                case 't': out += '\t'; break;
                case 'u': putUtf8(out, codePoint()); break;
                default: --pos; error("unknown escape");
            }
        }
    }

    std::string_view in;
    std::size_t pos{0};
};

///////////////////////////////////////// Writer ///////////////////////////////////////////
void writeString(std::string& out, std::string_view s) {
    static constexpr char kHex[] = "0123456789abcdef";
    out += '"';
    for (char c : s) {
        switch (c) {
            case '"': out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\b': out += "\\b"; break;
            case '\f': out += "\\f"; break;
            case '\n': out += "\\n"; break;
            case '\r': out += "\\r"; break;
            case '\t': out += "\\t"; break;
            default: {
                const auto u = static_cast<unsigned char>(c);
                if (u < 0x20) {
                    out += "\\u00";
                    out += kHex[u >> 4];
                    out += kHex[u & 0x0F];
                } else {
                    out += c;
                }
            }
        }
    }
    out += '"';
}

void writeValue(std::string& out, const JSONValue& v);

void writeChild(std::string& out, const std::shared_ptr<JSONValue>& child) {
    if (child) {
        writeValue(out, *child);
    } else {
        out += "null";
    }
}

void writeValue(std::string& out, const JSONValue& v) {
    std::visit([&out](const auto& x) {
        using T = std::decay_t<decltype(x)>;
        if constexpr (std::is_same_v<T, std::nullptr_t>) {
            out += "null";
        } else if constexpr (std::is_same_v<T, bool>) {
            out += x ? "true" : "false";
        } else if constexpr (std::is_same_v<T, int64_t>) {
            out += std::to_string(x);
        } else if constexpr (std::is_same_v<T, double>) {
            std::array<char, 32> buf{};
            auto r = std::to_chars(buf.data(), buf.data() + buf.size(), x);
            if (!std::isfinite(x) || r.ec != std::errc()) {
                out += "null";
            } else {
                out.append(buf.data(), r.ptr);
            }
        } else if constexpr (std::is_same_v<T, std::string>) {
            writeString(out, x);
        } else if constexpr (std::is_same_v<T, JSONValue::Array>) {
            out += '[';
            for (std::size_t k = 0; k < x.size(); ++k) {
                if (k != 0) out += ',';
                writeChild(out, x[k]);
            }
            out += ']';
        } else {
            out += '{';
            bool first = true;
            for (const auto& [key, child] : x) {
                if (!first) out += ',';
                first = false;
                writeString(out, key);
                out += ':';
                writeChild(out, child);
            }
            out += '}';
        }
    }, v.value);
}

} // namespace

JSONValue ParseJSON(const std::string& text) {
    return Reader(text).document();
}

std::string SerializeJSON(const JSONValue& value) {
    std::string out;
    writeValue(out, value);
    return out;
}

} // namespace ssehost
