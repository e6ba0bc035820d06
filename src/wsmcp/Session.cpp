//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Session.cpp
// Purpose: Per-connection read loop and serialized writes
//==========================================================================================================

#include <array>
#include <atomic>
#include <utility>

#include <boost/asio/buffer.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/error.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/asio/write.hpp>

#include "logging/Logger.h"
#include "wsmcp/RequestDispatcher.h"
#include "wsmcp/Session.h"

namespace wsmcp {

namespace net = boost::asio;
using tcp = net::ip::tcp;

namespace {
constexpr std::size_t kReadChunkBytes = 8192;

std::string nextSessionId() {
    static std::atomic<unsigned long long> counter{0};
    return "session-" + std::to_string(++counter);
}
} // namespace

Session::Session(tcp::socket socket, std::shared_ptr<RequestDispatcher> dispatcher, const FramingOptions& framing)
    : socket(std::move(socket)), dispatcher(std::move(dispatcher)),
      decoder(MakeFramingDecoder(framing)), sessionId(nextSessionId()),
      mirrorFraming(framing.mirrorRequestFraming) {}

void Session::Start(CloseHandler handler) {
    onClose = std::move(handler);
    net::co_spawn(socket.get_executor(), readLoop(shared_from_this()), net::detached);
}

net::awaitable<void> Session::readLoop(std::shared_ptr<Session> self) {
    std::array<char, kReadChunkBytes> chunk{};
    try {
        while (open) {
            std::size_t n = co_await socket.async_read_some(net::buffer(chunk), net::use_awaitable);
            LOG_DEBUG("{} received {} bytes", sessionId, n);
            buffer.append(chunk.data(), n);

            auto status = decoder->Drain(buffer, [this, &self](JSONValue&& message, FramingMode mode) {
                if (!replyMode.has_value()) {
                    replyMode = mode;
                }
                dispatcher->Dispatch(message, self);
            });
            if (status == IFramingDecoder::DecodeStatus::InvalidHeader ||
                status == IFramingDecoder::DecodeStatus::BodyTooLarge) {
                LOG_WARN("Closing {} after {}", sessionId, ToString(status));
                break;
            }
        }
    } catch (const boost::system::system_error& e) {
        if (e.code() == net::error::eof || e.code() == net::error::connection_reset) {
            LOG_INFO("Client disconnected ({})", sessionId);
        } else if (e.code() != net::error::operation_aborted) {
            LOG_WARN("Read error on {}: {}", sessionId, e.what());
        }
    }
    Close();
}

void Session::Send(const std::string& json) {
    if (!open) {
        return;
    }
    outbox.push_back(EncodeFrame(json, ReplyMode()));
    if (!writing) {
        writeNext();
    }
}

void Session::writeNext() {
    if (outbox.empty() || !open) {
        writing = false;
        return;
    }
    writing = true;
    net::async_write(socket, net::buffer(outbox.front()),
        [self = shared_from_this()](const boost::system::error_code& ec, std::size_t) {
            if (ec) {
                if (ec != net::error::operation_aborted) {
                    LOG_WARN("Write error on {}: {}", self->sessionId, ec.message());
                }
                self->writing = false;
                self->Close();
                return;
            }
            if (!self->outbox.empty()) {
                self->outbox.pop_front();
            }
            self->writeNext();
        });
}

void Session::Close() {
    if (!open) {
        return;
    }
    open = false;
    boost::system::error_code ec;
    socket.shutdown(tcp::socket::shutdown_both, ec);
    socket.close(ec);
    // Front frame may still be referenced by an in-flight async_write until its handler runs
    if (writing && !outbox.empty()) {
        outbox.erase(outbox.begin() + 1, outbox.end());
    } else {
        outbox.clear();
    }
    if (onClose) {
        CloseHandler handler = std::move(onClose);
        onClose = nullptr;
        handler(shared_from_this());
    }
}

} // namespace wsmcp
