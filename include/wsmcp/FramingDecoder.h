//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: FramingDecoder.h
// Purpose: Incremental decoder for Content-Length (header) and newline (line) framed JSON messages
//==========================================================================================================

#pragma once

#include <cstddef>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <variant>

#include "wsmcp/Config.h"
#include "wsmcp/JSONRPCTypes.h"

namespace wsmcp {

// Literal token that selects header framing when it starts the unconsumed buffer.
constexpr const char* CONTENT_LENGTH_TOKEN = "Content-Length:";

// Message delimiting convention a frame arrived with (and replies are written with).
enum class FramingMode {
    Header,
    Line
};

// No body length pending; the next bytes are a header block or a line.
struct HeaderSearch {};

// A header was parsed and expectedLength body bytes are awaited.
struct BodyAccumulation {
    std::size_t expectedLength{0};
};

using FramingState = std::variant<HeaderSearch, BodyAccumulation>;

class IFramingDecoder {
public:
    virtual ~IFramingDecoder() = default;
    enum class DecodeStatus {
        Message,            // one JSON document extracted
        Incomplete,         // need more bytes; nothing consumed
        DroppedInvalidJson, // a complete line/body was consumed but was not valid JSON
        Overflow,           // unterminated line data exceeded the threshold; buffer cleared
        InvalidHeader,      // header block without a parsable Content-Length
        BodyTooLarge        // Content-Length above the configured maximum; nothing consumed
    };
    struct DecodeResult {
        DecodeStatus status;
        std::optional<JSONValue> message; // present when status==Message
        FramingMode mode{FramingMode::Line};
        std::size_t bytesConsumed{0};
    };
    using MessageSink = std::function<void(JSONValue&& message, FramingMode mode)>;

    //==========================================================================================================
    // Performs decoding until one message is extracted, one unit is dropped, or no progress is possible.
    // Consumed bytes are erased from the front of buffer.
    // Args:
    //   buffer: Append-only receive buffer owned by the caller.
    // Returns:
    //   DecodeResult describing what happened.
    //==========================================================================================================
    virtual DecodeResult Next(std::string& buffer) = 0;

    //==========================================================================================================
    // Repeats Next() and hands every extracted message to sink in arrival order.
    // Args:
    //   buffer: Receive buffer.
    //   sink: Receives decoded messages.
    // Returns:
    //   The status that stopped decoding: Incomplete, Overflow, BodyTooLarge, or InvalidHeader when the
    //   policy is CloseSession.
    //==========================================================================================================
    virtual DecodeStatus Drain(std::string& buffer, const MessageSink& sink) = 0;

    virtual const FramingState& State() const = 0;
};

std::unique_ptr<IFramingDecoder> MakeFramingDecoder(const FramingOptions& options = FramingOptions{});

//==========================================================================================================
// EncodeFrame
// Purpose: Frames an outgoing payload: "Content-Length: <n>\r\n\r\n<payload>" or "<payload>\n".
//==========================================================================================================
std::string EncodeFrame(const std::string& payload, FramingMode mode);

const char* ToString(IFramingDecoder::DecodeStatus status);

} // namespace wsmcp
