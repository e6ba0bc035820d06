//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ToolRegistry.h
// Purpose: Host-facing tool registry (name -> handler + specification)
//==========================================================================================================

#pragma once

#include <functional>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "wsmcp/Protocol.h"

namespace wsmcp {

// A tool handler receives the tools/call arguments and returns its result; throwing reports failure.
using ToolHandler = std::function<JSONValue(const JSONValue& arguments)>;

//==========================================================================================================
// IToolRegistry
// Purpose: What the dispatcher needs from the host's tool storage.
//==========================================================================================================
class IToolRegistry {
public:
    virtual ~IToolRegistry() = default;

    //==========================================================================================================
    // Returns the current specification of every registered tool, in registration order.
    //==========================================================================================================
    virtual std::vector<ToolSpec> List() const = 0;

    //==========================================================================================================
    // Resolves a tool name to its handler.
    // Returns:
    //   The handler, or std::nullopt when no tool of that name is registered.
    //==========================================================================================================
    virtual std::optional<ToolHandler> Resolve(const std::string& name) const = 0;
};

//==========================================================================================================
// ToolRegistry
// Purpose: In-memory IToolRegistry. Registration order is preserved for tools/list.
//==========================================================================================================
class ToolRegistry : public IToolRegistry {
public:
    //==========================================================================================================
    // Registers a tool.
    // Args:
    //   spec: Tool metadata; spec.name must be non-empty and unused.
    //   handler: Callable invoked for tools/call.
    // Throws:
    //   std::invalid_argument on an empty name, an empty handler or a duplicate name.
    //==========================================================================================================
    void Register(const ToolSpec& spec, ToolHandler handler);

    // Removes a tool; returns false when it was not registered.
    bool Unregister(const std::string& name);

    std::optional<ToolSpec> GetSpec(const std::string& name) const;

    std::vector<ToolSpec> List() const override;
    std::optional<ToolHandler> Resolve(const std::string& name) const override;

    std::size_t Size() const { return specs.size(); }

private:
    std::vector<ToolSpec> specs;
    std::unordered_map<std::string, ToolHandler> handlers;
};

} // namespace wsmcp
