//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Session.h
// Purpose: One accepted client connection with its receive buffer, framing state and write queue
//==========================================================================================================

#pragma once

#include <deque>
#include <functional>
#include <memory>
#include <optional>
#include <string>

#include <boost/asio/awaitable.hpp>
#include <boost/asio/ip/tcp.hpp>

#include "wsmcp/Config.h"
#include "wsmcp/FramingDecoder.h"
#include "wsmcp/Peer.h"

namespace wsmcp {

class RequestDispatcher;

//==========================================================================================================
// Session
// Purpose: Reads bytes from its socket, decodes them with its own FramingDecoder and hands each message to
//          the RequestDispatcher. Outgoing frames are queued and written one at a time.
// Notes:
//   - All methods must be called on the io_context that owns the socket.
//   - Outgoing messages are newline-terminated unless FramingOptions::mirrorRequestFraming is set, in which
//     case they use the framing of the first message decoded on this session (line framing before that).
//==========================================================================================================
class Session : public IPeer, public std::enable_shared_from_this<Session> {
public:
    // Invoked once when the session closes for any reason.
    using CloseHandler = std::function<void(const std::shared_ptr<Session>&)>;

    Session(boost::asio::ip::tcp::socket socket,
            std::shared_ptr<RequestDispatcher> dispatcher,
            const FramingOptions& framing);

    // Spawns the read loop on the socket's executor.
    void Start(CloseHandler onClose);

    void Send(const std::string& json) override;
    bool IsOpen() const override { return open; }
    const std::string& GetSessionId() const override { return sessionId; }

    // Idempotent. Pending writes are discarded.
    void Close();

    FramingMode ReplyMode() const {
        return mirrorFraming ? replyMode.value_or(FramingMode::Line) : FramingMode::Line;
    }

private:
    boost::asio::awaitable<void> readLoop(std::shared_ptr<Session> self);
    void writeNext();

    boost::asio::ip::tcp::socket socket;
    std::shared_ptr<RequestDispatcher> dispatcher;
    std::unique_ptr<IFramingDecoder> decoder;
    std::string buffer;
    std::deque<std::string> outbox;
    std::optional<FramingMode> replyMode;
    CloseHandler onClose;
    std::string sessionId;
    bool mirrorFraming{false};
    bool open{true};
    bool writing{false};
};

} // namespace wsmcp
