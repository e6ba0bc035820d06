//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ServerInstance.cpp
// Purpose: Accept loop and session bookkeeping
//==========================================================================================================

#include <algorithm>
#include <utility>

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/error.hpp>
#include <boost/asio/use_awaitable.hpp>

#include "logging/Logger.h"
#include "wsmcp/ServerInstance.h"

namespace wsmcp {

namespace net = boost::asio;
using tcp = net::ip::tcp;

namespace {
constexpr std::size_t kSendPreviewChars = 100;
} // namespace

ServerInstance::ServerInstance(net::io_context& ioc,
                               std::string workspacePath,
                               const IToolRegistry& tools,
                               IHostScheduler& host,
                               ServerOptions options,
                               RequestDispatcher::InitializedCallback onInitialized)
    : ioc(ioc), workspacePath(std::move(workspacePath)), options(std::move(options)) {
    dispatcher = std::make_shared<RequestDispatcher>(tools, host, ioc.get_executor(), this->options, std::move(onInitialized));
}

ServerInstance::~ServerInstance() {
    Stop();
}

void ServerInstance::Start() {
    FUNC_SCOPE();
    if (running) {
        return;
    }
    tcp::endpoint ep(net::ip::make_address(options.address), options.port);
    auto acc = std::make_unique<tcp::acceptor>(ioc);
    acc->open(ep.protocol());
    acc->set_option(tcp::acceptor::reuse_address(true));
    acc->bind(ep);
    acc->listen(options.backlog);

    acceptor = std::move(acc);
    port = acceptor->local_endpoint().port();
    running = true;
    LOG_INFO("Server started for {} on {}:{}", workspacePath, options.address, port);
    net::co_spawn(ioc, acceptLoop(shared_from_this()), net::detached);
}

net::awaitable<void> ServerInstance::acceptLoop(std::shared_ptr<ServerInstance> self) {
    while (running) {
        tcp::socket socket(ioc);
        try {
            socket = co_await acceptor->async_accept(net::use_awaitable);
        } catch (const boost::system::system_error& e) {
            if (!running || e.code() == net::error::operation_aborted) {
                break;
            }
            LOG_WARN("Accept error on port {}: {}", port, e.what());
            continue;
        }
        if (!running) {
            break;
        }
        auto session = std::make_shared<Session>(std::move(socket), dispatcher, options.framing);
        sessions.push_back(session);
        LOG_INFO("Client connected ({} on port {})", session->GetSessionId(), port);
        std::weak_ptr<ServerInstance> weakSelf = self;
        session->Start([weakSelf](const std::shared_ptr<Session>& closed) {
            if (auto owner = weakSelf.lock()) {
                owner->removeSession(closed);
            }
        });
    }
    co_return;
}

void ServerInstance::removeSession(const std::shared_ptr<Session>& session) {
    auto it = std::find(sessions.begin(), sessions.end(), session);
    if (it != sessions.end()) {
        sessions.erase(it);
        LOG_DEBUG("Removed {} ({} remaining)", session->GetSessionId(), sessions.size());
    }
}

void ServerInstance::NotifyAll(const std::string& method, const std::optional<JSONValue>& params) {
    const std::string payload = JSONRPCNotification(method, params).Serialize();
    LOG_DEBUG("Notify {} session(s) on port {}: {}", sessions.size(), port, PreviewPayload(payload, kSendPreviewChars));
    // Copy: a failed write may close a session and shrink the set
    auto targets = sessions;
    for (const auto& session : targets) {
        if (session->IsOpen()) {
            session->Send(payload);
        }
    }
}

void ServerInstance::Stop() {
    if (!running) {
        return;
    }
    running = false;
    boost::system::error_code ec;
    if (acceptor) {
        acceptor->close(ec);
    }
    auto closing = std::move(sessions);
    sessions.clear();
    for (const auto& session : closing) {
        session->Close();
    }
    LOG_INFO("Server stopped for {} (port {})", workspacePath, port);
}

} // namespace wsmcp
