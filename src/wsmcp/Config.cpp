//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Config.cpp
// Purpose: Environment-driven configuration loading
//==========================================================================================================

#include <algorithm>
#include <cctype>
#include <optional>
#include <string>

#include "env/EnvVars.h"
#include "logging/Logger.h"
#include "wsmcp/Config.h"
#include "wsmcp/Protocol.h"

namespace wsmcp {

namespace {
// Parses a non-negative decimal; std::nullopt when any non-digit is present.
std::optional<unsigned long long> parseUnsigned(const std::string& text) {
    if (text.empty() || !std::all_of(text.begin(), text.end(), [](unsigned char ch){ return std::isdigit(ch) != 0; })) {
        return std::nullopt;
    }
    try {
        return std::stoull(text);
    } catch (const std::out_of_range&) {
        return std::nullopt;
    }
}

template <typename T>
void overlayUnsigned(const char* name, T& target, unsigned long long maxValue) {
    auto raw = GetEnvOptional(name);
    if (!raw.has_value()) {
        return;
    }
    auto parsed = parseUnsigned(raw.value());
    if (!parsed.has_value() || parsed.value() > maxValue) {
        LOG_WARN("Ignoring {}={} (expected an unsigned integer <= {})", name, raw.value(), maxValue);
        return;
    }
    target = static_cast<T>(parsed.value());
}
} // namespace

// WSMCP_VERSION is the project version, supplied by the build.
ServerOptions::ServerOptions()
    : serverVersion(WSMCP_VERSION), defaultProtocolVersion(DEFAULT_PROTOCOL_VERSION) {}

ServerOptions LoadServerOptionsFromEnv() {
    FUNC_SCOPE();
    ServerOptions opts;
    opts.address = GetEnvOptional("WSMCP_BIND_ADDRESS").value_or(opts.address);
    opts.serverName = GetEnvOptional("WSMCP_SERVER_NAME").value_or(opts.serverName);
    overlayUnsigned("WSMCP_LISTEN_BACKLOG", opts.backlog, 65535ull);
    overlayUnsigned("WSMCP_LINE_OVERFLOW_BYTES", opts.framing.lineOverflowBytes, 1ull << 40);
    overlayUnsigned("WSMCP_MAX_CONTENT_LENGTH", opts.framing.maxContentLength, 1ull << 40);
    opts.framing.mirrorRequestFraming = IsTruthy(GetEnvOrDefault("WSMCP_MIRROR_FRAMING", "0"));

    if (auto policy = GetEnvOptional("WSMCP_INVALID_HEADER")) {
        if (policy.value() == "skip") {
            opts.framing.invalidHeaderPolicy = InvalidHeaderPolicy::SkipHeader;
        } else if (policy.value() == "close") {
            opts.framing.invalidHeaderPolicy = InvalidHeaderPolicy::CloseSession;
        } else {
            LOG_WARN("Ignoring WSMCP_INVALID_HEADER={} (expected skip or close)", policy.value());
        }
    }
    return opts;
}

void ConfigureLoggingFromEnv() {
    Logger::setLogLevelFromString(GetEnvOrDefault("WSMCP_LOG_LEVEL", "INFO"));
    Logger::setColorEnabled(IsTruthy(GetEnvOrDefault("WSMCP_LOG_COLOR", "1")));
    Logger::setUseStdout(IsTruthy(GetEnvOrDefault("WSMCP_LOG_STDOUT", "0")));
    if (auto file = GetEnvOptional("WSMCP_LOG_FILE")) {
        Logger::setLogFile(file.value());
    }
}

} // namespace wsmcp
