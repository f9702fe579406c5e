//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: main.cpp
// Purpose: ssehost_server entry point - builds the run invocation from environment/CLI, starts the
//          server and stops it on SIGINT/SIGTERM
//==========================================================================================================

#include <csignal>
#include <cstdlib>
#include <iostream>
#include <optional>
#include <string>

#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>

#include "env/EnvVars.h"
#include "logging/Logger.h"
#include "ssehost/ServerRunner.h"
#include "ssehost/version.h"

using namespace ssehost;

//==========================================================================================================
// Parses simple key=value style command-line options.
// Args:
//   argc: Argument count
//   argv: Argument values
//   key: Option name including leading dashes (e.g., "--port")
// Returns:
//   Optional value string when present; empty optional otherwise
//==========================================================================================================
static std::optional<std::string> getArgValue(int argc, char** argv, const std::string& key) {
    for (int i = 1; i < argc; ++i) {
        if (argv[i] == nullptr) {
            continue;
        }
        const std::string a = argv[i];
        const std::size_t eq = a.find('=');
        if (eq != std::string::npos && a.substr(0, eq) == key) {
            return a.substr(eq + 1);
        }
    }
    return std::nullopt;
}

static std::optional<long> parsePort(const std::string& s) {
    char* end = nullptr;
    const long v = std::strtol(s.c_str(), &end, 10);
    if (s.empty() || *end != '\0') {
        return std::nullopt;
    }
    return v;
}

int main(int argc, char** argv) {
    Logger::configureFromEnvironment();
    LOG_INFO("ssehost_server {}", getVersionString());

    ServerRunner::Options opts;
    opts.address = getArgValue(argc, argv, "--address").value_or(GetEnvOrDefault("SSEHOST_BIND_ADDRESS", "0.0.0.0"));
    if (auto ka = GetEnvInt("SSEHOST_KEEPALIVE_MS"); ka.has_value()) {
        opts.keepaliveMs = static_cast<int>(ka.value());
    }

    long port = GetEnvInt("SSEHOST_PORT").value_or(8001);
    if (auto p = getArgValue(argc, argv, "--port"); p.has_value()) {
        auto parsed = parsePort(p.value());
        if (!parsed.has_value()) {
            std::cerr << "Invalid --port value: " << p.value() << std::endl;
            return 2;
        }
        port = parsed.value();
    }

    JSONValue::Object inputs;
    inputs["port"] = std::make_shared<JSONValue>(static_cast<int64_t>(port));
    JSONValue::Object deployment;
    deployment["node_url"] = std::make_shared<JSONValue>(GetEnvOrDefault("NODE_URL", ""));
    JSONValue::Object invocation;
    invocation["inputs"] = std::make_shared<JSONValue>(inputs);
    invocation["deployment"] = std::make_shared<JSONValue>(deployment);
    invocation["consumer_id"] = std::make_shared<JSONValue>(GetEnvOrDefault("SSEHOST_CONSUMER_ID", "local"));
    invocation["signature"] = std::make_shared<JSONValue>(std::string());

    ServerRunner runner(opts);
    RunResult result;
    try {
        result = runner.Run(JSONValue{invocation});
    } catch (const std::exception& e) {
        LOG_ERROR("Startup failed: {}", e.what());
        std::cerr << "Startup failed: " << e.what() << std::endl;
        return 1;
    }
    std::cout << SerializeJSON(result.ToJson()) << std::endl;
    if (!result.ok()) {
        return 1;
    }

    boost::asio::io_context signalContext;
    boost::asio::signal_set signals(signalContext, SIGINT, SIGTERM);
    signals.async_wait([&](const boost::system::error_code& ec, int signo) {
        if (!ec) {
            LOG_INFO("Received signal {}; shutting down", signo);
        }
        runner.Stop();
    });
    signalContext.run();

    LOG_INFO("Server stopped");
    return 0;
}
