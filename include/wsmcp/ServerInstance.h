//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ServerInstance.h
// Purpose: Listening endpoint for one workspace and the set of Sessions it accepted
//==========================================================================================================

#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <boost/asio/awaitable.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>

#include "wsmcp/Config.h"
#include "wsmcp/HostScheduler.h"
#include "wsmcp/RequestDispatcher.h"
#include "wsmcp/Session.h"
#include "wsmcp/ToolRegistry.h"

namespace wsmcp {

//==========================================================================================================
// ServerInstance
// Purpose: Accepts connections on a loopback TCP port and routes each Session's messages into a shared
//          RequestDispatcher.
// Notes:
//   - Single-threaded: Start, Stop, NotifyAll and all I/O run on the same io_context.
//   - Sessions are kept in accept order and remove themselves when they close.
//==========================================================================================================
class ServerInstance : public std::enable_shared_from_this<ServerInstance> {
public:
    ServerInstance(boost::asio::io_context& ioc,
                   std::string workspacePath,
                   const IToolRegistry& tools,
                   IHostScheduler& host,
                   ServerOptions options,
                   RequestDispatcher::InitializedCallback onInitialized = nullptr);
    ~ServerInstance();

    ServerInstance(const ServerInstance&) = delete;
    ServerInstance& operator=(const ServerInstance&) = delete;

    //==========================================================================================================
    // Opens, binds and listens synchronously, then spawns the accept loop.
    // Throws:
    //   boost::system::system_error when the endpoint cannot be bound.
    //==========================================================================================================
    void Start();

    // Closes the listening endpoint and every Session. Idempotent.
    void Stop();

    //==========================================================================================================
    // Writes one notification to every open Session.
    // Args:
    //   method: Notification method name.
    //   params: Optional params member.
    //==========================================================================================================
    void NotifyAll(const std::string& method, const std::optional<JSONValue>& params = std::nullopt);

    unsigned short Port() const { return port; }
    bool IsRunning() const { return running; }
    std::size_t SessionCount() const { return sessions.size(); }
    const std::string& WorkspacePath() const { return workspacePath; }

private:
    boost::asio::awaitable<void> acceptLoop(std::shared_ptr<ServerInstance> self);
    void removeSession(const std::shared_ptr<Session>& session);

    boost::asio::io_context& ioc;
    std::string workspacePath;
    ServerOptions options;
    std::shared_ptr<RequestDispatcher> dispatcher;
    std::unique_ptr<boost::asio::ip::tcp::acceptor> acceptor;
    std::vector<std::shared_ptr<Session>> sessions;
    unsigned short port{0};
    bool running{false};
};

} // namespace wsmcp
