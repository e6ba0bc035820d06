//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ServerRegistry.cpp
// Purpose: Workspace path to server lifecycle
//==========================================================================================================

#include <filesystem>

#include "logging/Logger.h"
#include "wsmcp/ServerRegistry.h"

namespace wsmcp {

std::string NormalizeWorkspacePath(const std::string& path) {
    namespace fs = std::filesystem;
    std::error_code ec;
    fs::path resolved = path.empty() ? fs::current_path(ec) : fs::absolute(fs::path(path), ec);
    if (ec) {
        LOG_WARN("Cannot resolve workspace path '{}': {}", path, ec.message());
        resolved = fs::path(path);
    }
    std::string out = resolved.lexically_normal().string();
    while (out.size() > 1 && (out.back() == '/' || out.back() == '\\')) {
        out.pop_back();
    }
    return out;
}

ServerRegistry::ServerRegistry(boost::asio::io_context& ioc,
                               const IToolRegistry& tools,
                               IHostScheduler& host,
                               ServerOptions options)
    : ioc(ioc), tools(tools), host(host), options(std::move(options)) {}

ServerRegistry::~ServerRegistry() {
    StopAll();
}

std::optional<ServerEntry> ServerRegistry::EnsureServer(const std::string& path) {
    const std::string key = NormalizeWorkspacePath(path);

    auto it = entries.find(key);
    if (it != entries.end()) {
        notifyDirectoryChanged(key);
        return it->second;
    }

    auto instance = std::make_shared<ServerInstance>(ioc, key, tools, host, options, onInitialized);
    try {
        instance->Start();
    } catch (const boost::system::system_error& e) {
        LOG_ERROR("Failed to start server for {}: {}", key, e.what());
        return std::nullopt;
    }

    ServerEntry entry{instance, instance->Port(), std::nullopt};
    entries.emplace(key, entry);
    if (onCreated) {
        try {
            onCreated(key, instance);
        } catch (const std::exception& e) {
            LOG_ERROR("Server created callback failed for {}: {}", key, e.what());
        }
    }
    notifyDirectoryChanged(key);
    return entry;
}

void ServerRegistry::notifyDirectoryChanged(const std::string& key) {
    if (!onDirectoryChanged) {
        return;
    }
    try {
        onDirectoryChanged(key);
    } catch (const std::exception& e) {
        LOG_ERROR("Directory change callback failed for {}: {}", key, e.what());
    }
}

std::optional<ServerEntry> ServerRegistry::GetServer(const std::string& path) const {
    auto it = entries.find(NormalizeWorkspacePath(path));
    if (it == entries.end()) {
        return std::nullopt;
    }
    return it->second;
}

void ServerRegistry::StopAll() {
    if (entries.empty()) {
        return;
    }
    LOG_INFO("Stopping {} server(s)", entries.size());
    auto stopping = std::move(entries);
    entries.clear();
    for (auto& [path, entry] : stopping) {
        entry.instance->Stop();
    }
}

void ServerRegistry::RestartAll() {
    std::vector<std::string> paths;
    paths.reserve(entries.size());
    for (const auto& [path, entry] : entries) {
        paths.push_back(path);
    }
    StopAll();
    for (const auto& path : paths) {
        if (!EnsureServer(path).has_value()) {
            LOG_WARN("Server for {} was not restarted", path);
        }
    }
}

void ServerRegistry::NotifyAll(const std::string& method, const std::optional<JSONValue>& params) {
    for (auto& [path, entry] : entries) {
        entry.instance->NotifyAll(method, params);
    }
}

} // namespace wsmcp
