//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Config.h
// Purpose: Server, framing and logging configuration with environment overrides
//==========================================================================================================

#pragma once

#include <cstddef>
#include <string>

namespace wsmcp {

// What a Session does when a Content-Length header block carries no parsable length.
enum class InvalidHeaderPolicy {
    SkipHeader,   // drop the header block and keep decoding
    CloseSession  // close the connection
};

//==========================================================================================================
// FramingOptions
// Purpose: Limits applied by the FramingDecoder.
// Fields:
//   lineOverflowBytes: Unterminated line-framed data beyond this size is discarded (default 10000).
//   maxContentLength: Largest accepted Content-Length; 0 disables the check.
//   invalidHeaderPolicy: Reaction to a header block without a parsable length.
//   mirrorRequestFraming: Frame outgoing messages like the session's first decoded message instead of
//                         always newline-terminating them (default false).
//==========================================================================================================
struct FramingOptions {
    std::size_t lineOverflowBytes{10000};
    std::size_t maxContentLength{0};
    InvalidHeaderPolicy invalidHeaderPolicy{InvalidHeaderPolicy::SkipHeader};
    bool mirrorRequestFraming{false};
};

//==========================================================================================================
// ServerOptions
// Purpose: Configuration shared by every ServerInstance created by a ServerRegistry.
// Fields:
//   address: Bind address (default: 127.0.0.1, loopback only)
//   port: Listen port (default: 0, ephemeral)
//   backlog: listen() backlog
//   framing: FramingDecoder limits
//   serverName/serverVersion: serverInfo answered to initialize (version defaults to the library version)
//   defaultProtocolVersion: protocolVersion answered when the client sends none
//==========================================================================================================
struct ServerOptions {
    std::string address{"127.0.0.1"};
    unsigned short port{0};
    int backlog{128};
    FramingOptions framing;
    std::string serverName{"wsmcp"};
    std::string serverVersion;
    std::string defaultProtocolVersion;

    ServerOptions();
};

//==========================================================================================================
// LoadServerOptionsFromEnv
// Purpose: Default ServerOptions overlaid with WSMCP_* environment variables:
//   WSMCP_BIND_ADDRESS, WSMCP_LISTEN_BACKLOG, WSMCP_LINE_OVERFLOW_BYTES, WSMCP_MAX_CONTENT_LENGTH,
//   WSMCP_INVALID_HEADER (skip|close), WSMCP_MIRROR_FRAMING, WSMCP_SERVER_NAME.
// Returns:
//   ServerOptions; unparsable values are logged and left at their defaults.
//==========================================================================================================
ServerOptions LoadServerOptionsFromEnv();

//==========================================================================================================
// ConfigureLoggingFromEnv
// Purpose: Applies WSMCP_LOG_LEVEL, WSMCP_LOG_FILE, WSMCP_LOG_COLOR and WSMCP_LOG_STDOUT to the Logger.
//==========================================================================================================
void ConfigureLoggingFromEnv();

} // namespace wsmcp
