//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ServerRegistry.h
// Purpose: Table of running ServerInstances keyed by normalized workspace path
//==========================================================================================================

#pragma once

#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <boost/asio/io_context.hpp>

#include "wsmcp/Config.h"
#include "wsmcp/HostScheduler.h"
#include "wsmcp/ServerInstance.h"
#include "wsmcp/ToolRegistry.h"

namespace wsmcp {

//==========================================================================================================
// ServerEntry
// Fields:
//   instance: Running server for the workspace.
//   port: Bound TCP port.
//   token: Reserved for client authentication; always empty.
//==========================================================================================================
struct ServerEntry {
    std::shared_ptr<ServerInstance> instance;
    unsigned short port{0};
    std::optional<std::string> token;
};

//==========================================================================================================
// NormalizeWorkspacePath
// Purpose: Absolute, lexically normalized path with any trailing '/' or '\' removed. The filesystem root
//          keeps its single separator and an empty path resolves to the working directory.
//==========================================================================================================
std::string NormalizeWorkspacePath(const std::string& path);

//==========================================================================================================
// ServerRegistry
// Purpose: Ensures at most one ServerInstance per workspace path. Owned by the application; every call must
//          happen on the io_context thread.
//==========================================================================================================
class ServerRegistry {
public:
    using ServerCreatedCallback = std::function<void(const std::string& path, const std::shared_ptr<ServerInstance>& instance)>;
    using DirectoryChangedCallback = std::function<void(const std::string& path)>;

    ServerRegistry(boost::asio::io_context& ioc,
                   const IToolRegistry& tools,
                   IHostScheduler& host,
                   ServerOptions options = ServerOptions{});
    ~ServerRegistry();

    ServerRegistry(const ServerRegistry&) = delete;
    ServerRegistry& operator=(const ServerRegistry&) = delete;

    //==========================================================================================================
    // Returns the entry for path, starting a server first when none exists.
    // Args:
    //   path: Workspace directory; relative paths resolve against the working directory.
    // Returns:
    //   The entry, or std::nullopt when a new server could not be bound (the error is logged).
    // Notes:
    //   The created callback fires for a new entry, then the directory-changed callback fires for every
    //   successful call. Neither fires when binding fails.
    //==========================================================================================================
    std::optional<ServerEntry> EnsureServer(const std::string& path);

    // Existing entry for path; never creates.
    std::optional<ServerEntry> GetServer(const std::string& path) const;

    // Snapshot of all entries keyed by normalized path.
    std::map<std::string, ServerEntry> Servers() const { return entries; }

    // Stops every server and clears the table.
    void StopAll();

    // Stops every server, then starts a new one for each previously known path.
    void RestartAll();

    // Sends one notification to every session of every server.
    void NotifyAll(const std::string& method, const std::optional<JSONValue>& params = std::nullopt);

    std::size_t Size() const { return entries.size(); }

    void SetServerCreatedCallback(ServerCreatedCallback cb) { onCreated = std::move(cb); }
    void SetDirectoryChangedCallback(DirectoryChangedCallback cb) { onDirectoryChanged = std::move(cb); }
    void SetInitializedCallback(RequestDispatcher::InitializedCallback cb) { onInitialized = std::move(cb); }

private:
    void notifyDirectoryChanged(const std::string& key);

    boost::asio::io_context& ioc;
    const IToolRegistry& tools;
    IHostScheduler& host;
    ServerOptions options;
    std::map<std::string, ServerEntry> entries;
    ServerCreatedCallback onCreated;
    DirectoryChangedCallback onDirectoryChanged;
    RequestDispatcher::InitializedCallback onInitialized;
};

} // namespace wsmcp
