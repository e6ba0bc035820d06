//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Protocol.h
// Purpose: MCP protocol data structures and constants
//==========================================================================================================

#pragma once

#include "JSONRPCTypes.h"
#include <string>

namespace wsmcp {
//==========================================================================================================
// MCP Protocol types and constants
// Purpose: Shared protocol structures, capabilities, and method names.
//==========================================================================================================
///////////////////////////////////////// Protocol constants ///////////////////////////////////////////
// Protocol version answered when the client does not request one
constexpr const char* DEFAULT_PROTOCOL_VERSION = "2024-11-05";

///////////////////////////////////////// Tools ///////////////////////////////////////////
//==========================================================================================================
// ToolSpec
// Purpose: Metadata advertised by tools/list for one tool.
// Fields:
//   name: Unique tool name.
//   description: Human-readable description.
//   inputSchema: JSON Schema describing the accepted arguments.
//==========================================================================================================
struct ToolSpec {
    std::string name;
    std::string description;
    JSONValue inputSchema;

    ToolSpec() = default;
    ToolSpec(std::string name, std::string description, JSONValue inputSchema = JSONValue{JSONValue::Object{}})
        : name(std::move(name)), description(std::move(description)), inputSchema(std::move(inputSchema)) {}

    JSONValue ToJSON() const {
        JSONValue::Object obj;
        SetMember(obj, "name", JSONValue(name));
        SetMember(obj, "description", JSONValue(description));
        SetMember(obj, "inputSchema", inputSchema);
        return JSONValue(std::move(obj));
    }
};

///////////////////////////////////////// Methods ///////////////////////////////////////////
namespace Methods {
    // Client to server
    constexpr const char* Initialize = "initialize";
    constexpr const char* Ping = "ping";
    constexpr const char* ListTools = "tools/list";
    constexpr const char* CallTool = "tools/call";
    constexpr const char* ListResources = "resources/list";
    constexpr const char* ListPrompts = "prompts/list";

    // Notifications
    constexpr const char* Initialized = "notifications/initialized";
    constexpr const char* RootsListChanged = "notifications/roots/list_changed";
    constexpr const char* ToolListChanged = "notifications/tools/list_changed";
}

} // namespace wsmcp
