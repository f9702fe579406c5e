//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Session.h
// Purpose: One client session: inbound message queue (posted bodies) and outbound SSE frame queue
//==========================================================================================================

#pragma once

#include <deque>
#include <optional>
#include <string>

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/steady_timer.hpp>

#include "ssehost/JSONRPCTypes.h"

namespace ssehost {

//==========================================================================================================
// Session
// Purpose: The paired read/write channels of one event-stream client.
// Notes:
//   - Every member must be called on the io_context that owns the executor passed at construction;
//     the queues are not synchronized.
//   - Producers never suspend. Consumers (Receive, NextFrame) suspend on a steady_timer used as a
//     wakeup signal until an item arrives or the session closes.
//   - Close() is terminal: queued inbound messages are discarded and both consumers observe
//     end-of-stream.
//==========================================================================================================
class Session {
public:
    Session(const boost::asio::any_io_executor& ex, std::string id);
    Session(const Session&) = delete;
    Session& operator=(const Session&) = delete;

    const std::string& Id() const { return id; }
    bool IsOpen() const { return open; }

    ///////////////////////////////////////// Read channel ////////////////////////////////////////////
    // Queues a posted message body. Returns false when the session is closed.
    bool Deliver(std::string body);

    // Next posted body in arrival order, or std::nullopt once the session is closed.
    boost::asio::awaitable<std::optional<std::string>> Receive();

    ///////////////////////////////////////// Write channel ///////////////////////////////////////////
    // Queues "event: message" carrying the serialized message. Ignored when closed.
    void Send(const JSONRPCMessage& message);
    void SendEvent(const std::string& event, const std::string& data);
    void SendComment(const std::string& text);

    // Next frame to write to the stream, or std::nullopt once the session is closed.
    boost::asio::awaitable<std::optional<std::string>> NextFrame();

    std::size_t PendingInbound() const { return inbox.size(); }
    std::size_t PendingOutbound() const { return outbox.size(); }

    void Close();

    // "event: <event>\ndata: <line>\n...\n\n"; multi-line data is split over several data fields.
    static std::string FormatEvent(const std::string& event, const std::string& data);

    // 128 random bits from OpenSSL RAND_bytes as 32 lowercase hex characters.
    // Throws std::runtime_error when the RNG fails.
    static std::string GenerateId();

private:
    void queueFrame(std::string frame);

    std::string id;
    bool open{true};
    std::deque<std::string> inbox;
    std::deque<std::string> outbox;
    boost::asio::steady_timer inboxSignal;
    boost::asio::steady_timer outboxSignal;
};

} // namespace ssehost
