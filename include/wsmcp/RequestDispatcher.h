//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: RequestDispatcher.h
// Purpose: Routes decoded JSON-RPC messages to MCP method handlers and writes replies to the sender
//==========================================================================================================

#pragma once

#include <functional>
#include <memory>
#include <string>

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/awaitable.hpp>

#include "wsmcp/Config.h"
#include "wsmcp/HostScheduler.h"
#include "wsmcp/MethodCall.h"
#include "wsmcp/Peer.h"
#include "wsmcp/ToolRegistry.h"

namespace wsmcp {

//==========================================================================================================
// RequestDispatcher
// Purpose: Stateless per-message router shared by all sessions of one ServerInstance.
// Notes:
//   - Messages without an id never receive a response, including errors.
//   - tools/call is answered asynchronously: the tool lookup and handler invocation run on a later
//     turn of the host scheduler and the reply goes to the originating peer if it is still open.
//==========================================================================================================
class RequestDispatcher : public std::enable_shared_from_this<RequestDispatcher> {
public:
    // Invoked for every notifications/initialized with the sending peer.
    using InitializedCallback = std::function<void(const std::shared_ptr<IPeer>&)>;

    RequestDispatcher(const IToolRegistry& tools,
                      IHostScheduler& host,
                      boost::asio::any_io_executor executor,
                      ServerOptions options,
                      InitializedCallback onInitialized = nullptr);

    //==========================================================================================================
    // Handles one decoded message.
    // Args:
    //   message: Decoded JSON document; non-objects and objects without a string method are dropped.
    //   origin: Peer the message arrived on; replies are sent to it.
    //==========================================================================================================
    void Dispatch(const JSONValue& message, const std::shared_ptr<IPeer>& origin);

    //==========================================================================================================
    // Builds the tools/call result for a tool's return value.
    // Returns:
    //   { content: [ { type: "text", text } ], isError: false } where text is the string verbatim or the
    //   compact JSON of any other value.
    //==========================================================================================================
    static JSONValue MakeToolTextResult(const JSONValue& value);

private:
    JSONValue initializeResult(const InitializeParams& params) const;
    JSONValue listToolsResult() const;
    void handleCallTool(const MethodCall& call, const CallToolParams& params, const std::shared_ptr<IPeer>& origin);
    boost::asio::awaitable<void> runToolCall(std::shared_ptr<RequestDispatcher> self,
                                             std::weak_ptr<IPeer> peer,
                                             std::optional<JSONRPCId> id,
                                             CallToolParams params);

    static void reply(const std::shared_ptr<IPeer>& peer, const JSONRPCResponse& response);

    const IToolRegistry& tools;
    IHostScheduler& host;
    boost::asio::any_io_executor executor;
    ServerOptions options;
    InitializedCallback onInitialized;
};

} // namespace wsmcp
