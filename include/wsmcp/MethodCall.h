//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: MethodCall.h
// Purpose: Typed view of an inbound JSON-RPC request or notification
//==========================================================================================================

#pragma once

#include <optional>
#include <string>
#include <variant>

#include "wsmcp/JSONRPCTypes.h"

namespace wsmcp {

struct InitializeParams {
    std::optional<std::string> protocolVersion;
    std::optional<std::string> clientName;
};
struct InitializedParams {};
struct PingParams {};
struct ListPromptsParams {};
struct ListResourcesParams {};
struct RootsListChangedParams {};
struct ListToolsParams {};

// tools/call; arguments is an empty object when the client omits it or sends null.
struct CallToolParams {
    std::string name;
    JSONValue arguments{JSONValue::Object{}};
};

// Any method this server does not implement.
struct UnknownMethodParams {};

using MethodParams = std::variant<
    InitializeParams,
    InitializedParams,
    PingParams,
    ListPromptsParams,
    ListResourcesParams,
    RootsListChangedParams,
    ListToolsParams,
    CallToolParams,
    UnknownMethodParams
>;

//==========================================================================================================
// MethodCall
// Purpose: One decoded inbound message.
// Fields:
//   id: Present for requests (an explicit "id": null counts); absent for notifications.
//   method: Method name as received.
//   params: Method-specific parameters; UnknownMethodParams for unsupported methods.
//==========================================================================================================
struct MethodCall {
    std::optional<JSONRPCId> id;
    std::string method;
    MethodParams params;

    bool IsNotification() const { return !id.has_value(); }
};

//==========================================================================================================
// ParseMethodCall
// Purpose: Classifies a decoded JSON document.
// Args:
//   message: Value produced by the FramingDecoder.
// Returns:
//   MethodCall, or std::nullopt when the value is not an object with a string "method" member.
//==========================================================================================================
std::optional<MethodCall> ParseMethodCall(const JSONValue& message);

} // namespace wsmcp
