//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: BuiltinTools.cpp
// Purpose: Descriptors and handlers of the fetch, echo and hello tools
//==========================================================================================================

#include <initializer_list>
#include <stdexcept>
#include <utility>

#include "logging/Logger.h"
#include "ssehost/errors/Errors.h"
#include "ssehost/tools/BuiltinTools.h"
#include "ssehost/typed/Content.h"

namespace ssehost {
namespace tools {

namespace {

// {type:"object", properties:{<name>:{type:"string", description}}, required:[...]}
JSONValue stringPropertiesSchema(std::initializer_list<std::pair<const char*, const char*>> props,
                                 std::initializer_list<const char*> required) {
    JSONValue::Object properties;
    for (const auto& [name, description] : props) {
        JSONValue::Object prop;
        prop["type"] = std::make_shared<JSONValue>("string");
        prop["description"] = std::make_shared<JSONValue>(description);
        properties[name] = std::make_shared<JSONValue>(JSONValue{prop});
    }
    JSONValue::Array req;
    for (const char* r : required) {
        req.push_back(std::make_shared<JSONValue>(r));
    }
    JSONValue::Object schema;
    schema["type"] = std::make_shared<JSONValue>("object");
    schema["properties"] = std::make_shared<JSONValue>(JSONValue{properties});
    schema["required"] = std::make_shared<JSONValue>(JSONValue{req});
    return JSONValue{schema};
}

// Presence is checked by the registry; the value must still be a string.
std::string stringArgument(const JSONValue& args, const std::string& field) {
    const JSONValue* v = args.find(field);
    if (v == nullptr) {
        throw errors::MissingArgumentError(field);
    }
    if (!v->isString()) {
        throw errors::HostError(errors::ErrorCategory::JsonRpcInvalidParams, JSONRPCErrorCodes::InvalidParams,
                                "Argument '" + field + "' must be a string");
    }
    return std::get<std::string>(v->value);
}

} // namespace

Tool FetchToolDescriptor() {
    return Tool("fetch", "Fetches a website and returns its content",
                stringPropertiesSchema({{"url", "URL to fetch"}}, {"url"}));
}

Tool EchoToolDescriptor() {
    return Tool("echo", "Returns the provided message",
                stringPropertiesSchema({{"message", "Message to echo"}}, {"message"}));
}

Tool HelloToolDescriptor() {
    return Tool("hello", "Returns a greeting message",
                stringPropertiesSchema({{"name", "Name to greet"}}, {}));
}

void RegisterBuiltinTools(ToolRegistry& registry, std::shared_ptr<HTTPFetcher> fetcher) {
    if (!fetcher) {
        throw std::invalid_argument("RegisterBuiltinTools requires a fetcher");
    }

    registry.Register(FetchToolDescriptor(),
        [fetcher](const JSONValue& args) -> boost::asio::awaitable<CallToolResult> {
            const std::string url = stringArgument(args, "url");
            HTTPFetcher::Response res = co_await fetcher->Get(url);
            LOG_DEBUG("fetch {} returned {} bytes", url, res.body.size());
            co_return typed::textResult(res.body);
        });

    registry.Register(EchoToolDescriptor(),
        [](const JSONValue& args) -> boost::asio::awaitable<CallToolResult> {
            co_return typed::textResult(stringArgument(args, "message"));
        });

    registry.Register(HelloToolDescriptor(),
        [](const JSONValue& args) -> boost::asio::awaitable<CallToolResult> {
            // Any JSON value is greeted; non-strings render as their JSON text.
            std::string name = "World";
            if (const JSONValue* v = args.find("name"); v != nullptr) {
                name = v->isString() ? std::get<std::string>(v->value) : SerializeJSON(*v);
            }
            co_return typed::textResult("Hello, " + name + "!");
        });
}

} // namespace tools
} // namespace ssehost
