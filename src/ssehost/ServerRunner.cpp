//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ServerRunner.cpp
// Purpose: Start/stop/run lifecycle of the background io thread and the invocation descriptor codec
//==========================================================================================================

#include <chrono>
#include <mutex>
#include <stdexcept>
#include <utility>

#include "logging/Logger.h"
#include "ssehost/ServerRunner.h"
#include "ssehost/errors/Errors.h"
#include "ssehost/tools/BuiltinTools.h"
#include "ssehost/version.h"

namespace ssehost {

namespace {

// At most one runner per process holds a listener.
struct ActiveRunner {
    std::mutex mutex;
    const ServerRunner* owner{nullptr};
    int port{0};
};

ActiveRunner& activeRunner() {
    static ActiveRunner active;
    return active;
}

void releaseActive(const ServerRunner* owner) {
    ActiveRunner& active = activeRunner();
    std::lock_guard<std::mutex> guard(active.mutex);
    if (active.owner == owner) {
        active.owner = nullptr;
        active.port = 0;
    }
}

// Gives the process-wide slot back unless the start completed.
struct ActiveClaim {
    const ServerRunner* owner;
    bool committed{false};
    ~ActiveClaim() {
        if (!committed) {
            releaseActive(owner);
        }
    }
};

} // namespace

///////////////////////////////////////// RunInvocation ///////////////////////////////////////////
RunInvocation RunInvocation::FromJson(const JSONValue& value) {
    if (!value.isObject()) {
        throw std::invalid_argument("Invocation must be a JSON object");
    }
    const JSONValue* inputs = value.find("inputs");
    if (inputs == nullptr || !inputs->isObject()) {
        throw std::invalid_argument("Invocation is missing 'inputs'");
    }
    const JSONValue* port = inputs->find("port");
    if (port == nullptr) {
        throw std::invalid_argument("Invocation is missing 'inputs.port'");
    }
    if (!std::holds_alternative<int64_t>(port->value)) {
        throw std::invalid_argument("'inputs.port' must be an integer");
    }
    const int64_t p = std::get<int64_t>(port->value);
    if (p < 1 || p > 65535) {
        throw std::invalid_argument("'inputs.port' out of range: " + std::to_string(p));
    }

    RunInvocation inv;
    inv.port = static_cast<int>(p);
    if (const JSONValue* dep = value.find("deployment"); dep != nullptr) {
        if (const JSONValue* url = dep->find("node_url"); url != nullptr && url->isString()) {
            inv.nodeUrl = std::get<std::string>(url->value);
        }
    }
    if (const JSONValue* c = value.find("consumer_id"); c != nullptr && c->isString()) {
        inv.consumerId = std::get<std::string>(c->value);
    }
    if (const JSONValue* s = value.find("signature"); s != nullptr && s->isString()) {
        inv.signature = std::get<std::string>(s->value);
    }
    return inv;
}

JSONValue RunInvocation::ToJson() const {
    JSONValue::Object inputs;
    inputs["port"] = std::make_shared<JSONValue>(static_cast<int64_t>(port));
    JSONValue::Object deployment;
    if (nodeUrl.has_value()) {
        deployment["node_url"] = std::make_shared<JSONValue>(nodeUrl.value());
    } else {
        deployment["node_url"] = std::make_shared<JSONValue>(nullptr);
    }
    JSONValue::Object obj;
    obj["inputs"] = std::make_shared<JSONValue>(inputs);
    obj["deployment"] = std::make_shared<JSONValue>(deployment);
    obj["consumer_id"] = std::make_shared<JSONValue>(consumerId);
    obj["signature"] = std::make_shared<JSONValue>(signature);
    return JSONValue{obj};
}

JSONValue RunResult::ToJson() const {
    JSONValue::Object obj;
    obj["status"] = std::make_shared<JSONValue>(ok() ? "success" : "error");
    obj["message"] = std::make_shared<JSONValue>(message);
    return JSONValue{obj};
}

const char* toString(StartStatus status) {
    switch (status) {
        case StartStatus::Started: return "Started";
        case StartStatus::AlreadyRunning: return "AlreadyRunning";
        case StartStatus::BindFailure: return "BindFailure";
    }
    return "Unknown";
}

///////////////////////////////////////// ServerRunner ///////////////////////////////////////////
ServerRunner::ServerRunner() : ServerRunner(Options{}) {}

ServerRunner::ServerRunner(const Options& o) : opts(o) {
    if (opts.serverVersion.empty()) {
        opts.serverVersion = getVersionString();
    }
    registry = std::make_shared<ToolRegistry>();
    tools::RegisterBuiltinTools(*registry, std::make_shared<HTTPFetcher>(opts.fetcher));
    engine = std::make_shared<Server>(Implementation{opts.serverName, opts.serverVersion}, registry);
}

ServerRunner::~ServerRunner() {
    Stop();
}

StartStatus ServerRunner::Start(int port) {
    std::lock_guard<std::mutex> lock(stateMutex);
    ActiveRunner& active = activeRunner();
    {
        std::lock_guard<std::mutex> guard(active.mutex);
        if (active.owner != nullptr) {
            LOG_WARN("{}: server already running on port {}",
                     errors::toString(errors::ErrorCategory::AlreadyRunning), active.port);
            return StartStatus::AlreadyRunning;
        }
        if (port < 0 || port > 65535) {
            LOG_ERROR("{}: invalid port {}", errors::toString(errors::ErrorCategory::BindFailure), port);
            return StartStatus::BindFailure;
        }
        active.owner = this;
        active.port = port;
    }
    ActiveClaim claim{this};

    SSEServer::Options so;
    so.address = opts.address;
    so.port = std::to_string(port);
    so.keepaliveMs = opts.keepaliveMs;
    so.maxBodyBytes = opts.maxBodyBytes;
    auto server = std::make_unique<SSEServer>(so);
    server->SetSessionHandler([engine = engine](std::shared_ptr<Session> session) {
        return engine->ServeSession(std::move(session));
    });
    server->SetErrorHandler([](const std::string& msg) { LOG_ERROR("{}", msg); });

    const auto shutdownTimeout = std::chrono::milliseconds(opts.shutdownTimeoutMs);
    std::future<void> ready = server->Start();
    if (ready.wait_for(std::chrono::milliseconds(opts.startupGraceMs)) != std::future_status::ready) {
        LOG_ERROR("{}: listener on port {} not ready within {} ms",
                  errors::toString(errors::ErrorCategory::BindFailure), port, opts.startupGraceMs);
        server->Stop(shutdownTimeout);
        return StartStatus::BindFailure;
    }
    try {
        ready.get();
    } catch (const std::exception& e) {
        LOG_ERROR("{}: {}", errors::toString(errors::ErrorCategory::BindFailure), e.what());
        server->Stop(shutdownTimeout);
        return StartStatus::BindFailure;
    }

    listener = std::move(server);
    activePort = listener->LocalPort();
    running = true;
    {
        std::lock_guard<std::mutex> guard(active.mutex);
        active.port = activePort;
    }
    claim.committed = true;
    LOG_INFO("MCP server running on {}:{}", opts.address, activePort);
    return StartStatus::Started;
}

void ServerRunner::Stop() {
    std::lock_guard<std::mutex> lock(stateMutex);
    stopLocked();
}

void ServerRunner::stopLocked() {
    if (!running) {
        return;
    }
    LOG_INFO("Stopping MCP server on port {}", activePort);
    listener->RequestShutdown();
    if (!listener->WaitForExit(std::chrono::milliseconds(opts.shutdownTimeoutMs))) {
        LOG_WARN("{}: server did not exit within {} ms; forcing stop",
                 errors::toString(errors::ErrorCategory::ShutdownTimeout), opts.shutdownTimeoutMs);
    }
    listener->ForceStop();
    listener.reset();
    running = false;
    activePort = 0;
    releaseActive(this);
    LOG_INFO("MCP server stopped");
}

bool ServerRunner::IsRunning() const {
    std::lock_guard<std::mutex> lock(stateMutex);
    return running;
}

unsigned short ServerRunner::ActivePort() {
    ActiveRunner& active = activeRunner();
    std::lock_guard<std::mutex> guard(active.mutex);
    return static_cast<unsigned short>(active.port);
}

unsigned short ServerRunner::BoundPort() const {
    std::lock_guard<std::mutex> lock(stateMutex);
    return static_cast<unsigned short>(activePort);
}

RunResult ServerRunner::Run(const RunInvocation& invocation) {
    RunResult result;
    try {
        const StartStatus status = Start(invocation.port);
        switch (status) {
            case StartStatus::Started:
                result.status = RunResult::Status::Success;
                result.message = "MCP server started for this run on port " + std::to_string(invocation.port);
                break;
            case StartStatus::AlreadyRunning:
                result.status = RunResult::Status::Success;
                result.message = "MCP server already running on port " + std::to_string(ActivePort());
                break;
            case StartStatus::BindFailure:
                result.status = RunResult::Status::Error;
                result.message = "Failed to start MCP server on port " + std::to_string(invocation.port);
                break;
        }
    } catch (const std::exception& e) {
        LOG_ERROR("Run failed during startup: {}", e.what());
        Stop();
        throw;
    }
    return result;
}

RunResult ServerRunner::Run(const JSONValue& invocation) {
    RunInvocation parsed;
    try {
        parsed = RunInvocation::FromJson(invocation);
    } catch (const std::exception& e) {
        LOG_ERROR("Run rejected invocation: {}", e.what());
        Stop();
        throw;
    }
    return Run(parsed);
}

} // namespace ssehost
