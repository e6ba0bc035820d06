//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: MethodCall.cpp
// Purpose: Method name to typed parameter mapping
//==========================================================================================================

#include "wsmcp/MethodCall.h"
#include "wsmcp/Protocol.h"

namespace wsmcp {

namespace {
MethodParams paramsFor(const std::string& method, const JSONValue* params) {
    if (method == Methods::Initialize) {
        InitializeParams p;
        if (params) {
            p.protocolVersion = GetStringMember(*params, "protocolVersion");
            if (const JSONValue* info = GetMember(*params, "clientInfo")) {
                p.clientName = GetStringMember(*info, "name");
            }
        }
        return p;
    }
    if (method == Methods::Initialized) return InitializedParams{};
    if (method == Methods::Ping) return PingParams{};
    if (method == Methods::ListPrompts) return ListPromptsParams{};
    if (method == Methods::ListResources) return ListResourcesParams{};
    if (method == Methods::RootsListChanged) return RootsListChangedParams{};
    if (method == Methods::ListTools) return ListToolsParams{};
    if (method == Methods::CallTool) {
        CallToolParams p;
        if (params) {
            p.name = GetStringMember(*params, "name").value_or("");
            const JSONValue* args = GetMember(*params, "arguments");
            if (args && !args->isNull()) {
                p.arguments = *args;
            }
        }
        return p;
    }
    return UnknownMethodParams{};
}
} // namespace

std::optional<MethodCall> ParseMethodCall(const JSONValue& message) {
    if (!message.isObject()) {
        return std::nullopt;
    }
    auto method = GetStringMember(message, "method");
    if (!method.has_value()) {
        return std::nullopt;
    }
    MethodCall call;
    call.method = std::move(method.value());
    if (const JSONValue* id = GetMember(message, "id")) {
        call.id = IdFromJSON(*id);
    }
    call.params = paramsFor(call.method, GetMember(message, "params"));
    return call;
}

} // namespace wsmcp
