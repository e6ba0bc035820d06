//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ToolRegistry.cpp
// Purpose: In-memory tool registry
//==========================================================================================================

#include <algorithm>
#include <stdexcept>

#include "logging/Logger.h"
#include "wsmcp/ToolRegistry.h"

namespace wsmcp {

void ToolRegistry::Register(const ToolSpec& spec, ToolHandler handler) {
    FUNC_SCOPE();
    if (spec.name.empty()) {
        throw std::invalid_argument("tool name must not be empty");
    }
    if (!handler) {
        throw std::invalid_argument("tool " + spec.name + " has no handler");
    }
    if (handlers.count(spec.name) != 0) {
        throw std::invalid_argument("tool " + spec.name + " already registered");
    }
    specs.push_back(spec);
    handlers.emplace(spec.name, std::move(handler));
    LOG_DEBUG("Registered tool {}", spec.name);
}

bool ToolRegistry::Unregister(const std::string& name) {
    auto it = handlers.find(name);
    if (it == handlers.end()) {
        return false;
    }
    handlers.erase(it);
    specs.erase(std::remove_if(specs.begin(), specs.end(), [&name](const ToolSpec& s){ return s.name == name; }), specs.end());
    LOG_DEBUG("Unregistered tool {}", name);
    return true;
}

std::optional<ToolSpec> ToolRegistry::GetSpec(const std::string& name) const {
    auto it = std::find_if(specs.begin(), specs.end(), [&name](const ToolSpec& s){ return s.name == name; });
    if (it == specs.end()) {
        return std::nullopt;
    }
    return *it;
}

std::vector<ToolSpec> ToolRegistry::List() const {
    return specs;
}

std::optional<ToolHandler> ToolRegistry::Resolve(const std::string& name) const {
    auto it = handlers.find(name);
    if (it == handlers.end()) {
        return std::nullopt;
    }
    return it->second;
}

} // namespace wsmcp
