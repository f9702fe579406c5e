//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Session.cpp
// Purpose: Session queues, SSE event framing and session id generation
//==========================================================================================================

#include <array>
#include <stdexcept>

#include <boost/asio/redirect_error.hpp>
#include <boost/asio/use_awaitable.hpp>

#include <openssl/err.h>
#include <openssl/rand.h>

#include "logging/Logger.h"
#include "ssehost/Session.h"

namespace ssehost {
namespace net = boost::asio;

namespace {

// Parks the calling coroutine until the timer is cancelled.
net::awaitable<void> waitSignal(net::steady_timer& signal) {
    boost::system::error_code ec;
    signal.expires_at(net::steady_timer::time_point::max());
    co_await signal.async_wait(net::redirect_error(net::use_awaitable, ec));
}

} // namespace

Session::Session(const net::any_io_executor& ex, std::string id)
    : id(std::move(id)), inboxSignal(ex), outboxSignal(ex) {}

bool Session::Deliver(std::string body) {
    if (!open) {
        return false;
    }
    inbox.push_back(std::move(body));
    inboxSignal.cancel();
    return true;
}

net::awaitable<std::optional<std::string>> Session::Receive() {
    for (;;) {
        if (!open) {
            co_return std::nullopt;
        }
        if (!inbox.empty()) {
            std::string next = std::move(inbox.front());
            inbox.pop_front();
            co_return next;
        }
        co_await waitSignal(inboxSignal);
    }
}

void Session::queueFrame(std::string frame) {
    if (!open) {
        return;
    }
    outbox.push_back(std::move(frame));
    outboxSignal.cancel();
}

void Session::Send(const JSONRPCMessage& message) {
    queueFrame(FormatEvent("message", message.Serialize()));
}

void Session::SendEvent(const std::string& event, const std::string& data) {
    queueFrame(FormatEvent(event, data));
}

void Session::SendComment(const std::string& text) {
    queueFrame(": " + text + "\n\n");
}

net::awaitable<std::optional<std::string>> Session::NextFrame() {
    for (;;) {
        if (!open) {
            co_return std::nullopt;
        }
        if (!outbox.empty()) {
            std::string next = std::move(outbox.front());
            outbox.pop_front();
            co_return next;
        }
        co_await waitSignal(outboxSignal);
    }
}

void Session::Close() {
    if (!open) {
        return;
    }
    open = false;
    if (!inbox.empty()) {
        LOG_DEBUG("Session {} closed with {} unprocessed message(s)", id, inbox.size());
    }
    inbox.clear();
    outbox.clear();
    inboxSignal.cancel();
    outboxSignal.cancel();
}

std::string Session::FormatEvent(const std::string& event, const std::string& data) {
    std::string out;
    out.reserve(event.size() + data.size() + 24);
    out += "event: ";
    out += event;
    out += '\n';
    std::size_t start = 0;
    for (;;) {
        std::size_t nl = data.find('\n', start);
        std::string line = data.substr(start, nl == std::string::npos ? std::string::npos : nl - start);
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        out += "data: ";
        out += line;
        out += '\n';
        if (nl == std::string::npos) {
            break;
        }
        start = nl + 1;
    }
    out += '\n';
    return out;
}

std::string Session::GenerateId() {
    std::array<unsigned char, 16> bytes{};
    if (::RAND_bytes(bytes.data(), static_cast<int>(bytes.size())) != 1) {
        const unsigned long err = ::ERR_get_error();
        throw std::runtime_error("RAND_bytes failed: " + std::to_string(err));
    }
    static const char* hex = "0123456789abcdef";
    std::string out;
    out.reserve(bytes.size() * 2);
    for (unsigned char b : bytes) {
        out.push_back(hex[b >> 4]);
        out.push_back(hex[b & 0x0f]);
    }
    return out;
}

} // namespace ssehost
