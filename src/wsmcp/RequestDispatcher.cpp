//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: RequestDispatcher.cpp
// Purpose: MCP method handlers
//==========================================================================================================

#include <stdexcept>
#include <type_traits>
#include <utility>

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/use_awaitable.hpp>

#include "logging/Logger.h"
#include "wsmcp/RequestDispatcher.h"
#include "wsmcp/errors/Errors.h"

namespace wsmcp {

namespace net = boost::asio;

namespace {
constexpr std::size_t kSendPreviewChars = 100;

template <typename>
inline constexpr bool kAlwaysFalse = false;

class ToolNotFoundError : public std::runtime_error {
public:
    explicit ToolNotFoundError(const std::string& name) : std::runtime_error("Tool not found: " + name) {}
};

JSONValue emptyObject() {
    return JSONValue{JSONValue::Object{}};
}

JSONValue objectWithEmptyArray(const char* key) {
    JSONValue::Object obj;
    SetMember(obj, key, JSONValue{JSONValue::Array{}});
    return JSONValue{std::move(obj)};
}
} // namespace

RequestDispatcher::RequestDispatcher(const IToolRegistry& tools,
                                     IHostScheduler& host,
                                     net::any_io_executor executor,
                                     ServerOptions options,
                                     InitializedCallback onInitialized)
    : tools(tools), host(host), executor(std::move(executor)),
      options(std::move(options)), onInitialized(std::move(onInitialized)) {}

void RequestDispatcher::Dispatch(const JSONValue& message, const std::shared_ptr<IPeer>& origin) {
    auto parsed = ParseMethodCall(message);
    if (!parsed.has_value()) {
        LOG_DEBUG("Dropping message without a method: {}", PreviewPayload(SerializeJSON(message), kSendPreviewChars));
        return;
    }
    const MethodCall& call = parsed.value();
    if (call.IsNotification()) {
        LOG_DEBUG("Recv Notification: {}", call.method);
    } else {
        LOG_DEBUG("Recv Request: {} (id {})", call.method, IdToString(call.id.value()));
    }

    // Request methods sent without an id are executed but never answered
    auto respond = [&](JSONValue result) {
        if (call.id.has_value()) {
            reply(origin, JSONRPCResponse(call.id.value(), std::move(result)));
        }
    };

    std::visit([&](const auto& params) {
        using T = std::decay_t<decltype(params)>;
        if constexpr (std::is_same_v<T, InitializeParams>) {
            respond(initializeResult(params));
        } else if constexpr (std::is_same_v<T, InitializedParams>) {
            LOG_INFO("Client initialized (session {})", origin ? origin->GetSessionId() : std::string("-"));
            if (onInitialized) {
                try {
                    onInitialized(origin);
                } catch (const std::exception& e) {
                    LOG_ERROR("Initialized callback failed: {}", e.what());
                }
            }
        } else if constexpr (std::is_same_v<T, PingParams>) {
            respond(emptyObject());
        } else if constexpr (std::is_same_v<T, ListPromptsParams>) {
            respond(objectWithEmptyArray("prompts"));
        } else if constexpr (std::is_same_v<T, ListResourcesParams>) {
            respond(objectWithEmptyArray("resources"));
        } else if constexpr (std::is_same_v<T, RootsListChangedParams>) {
            LOG_DEBUG("Client roots changed");
        } else if constexpr (std::is_same_v<T, ListToolsParams>) {
            respond(listToolsResult());
        } else if constexpr (std::is_same_v<T, CallToolParams>) {
            handleCallTool(call, params, origin);
        } else if constexpr (std::is_same_v<T, UnknownMethodParams>) {
            if (call.id.has_value()) {
                errors::McpError err = errors::makeError(JSONRPCErrorCodes::MethodNotFound, "Method not found: " + call.method);
                reply(origin, *errors::makeErrorResponse(call.id.value(), err));
            } else {
                LOG_DEBUG("Ignoring unknown notification {}", call.method);
            }
        } else {
            static_assert(kAlwaysFalse<T>, "unhandled method parameters");
        }
    }, call.params);
}

JSONValue RequestDispatcher::MakeToolTextResult(const JSONValue& value) {
    std::string text = value.isString() ? std::get<std::string>(value.value) : SerializeJSON(value);

    JSONValue::Object item;
    SetMember(item, "type", JSONValue("text"));
    SetMember(item, "text", JSONValue(std::move(text)));
    JSONValue::Array content;
    content.push_back(std::make_shared<JSONValue>(std::move(item)));

    JSONValue::Object obj;
    SetMember(obj, "content", JSONValue(std::move(content)));
    SetMember(obj, "isError", JSONValue(false));
    return JSONValue{std::move(obj)};
}

JSONValue RequestDispatcher::initializeResult(const InitializeParams& params) const {
    if (params.clientName.has_value()) {
        LOG_INFO("Initialize from client {}", params.clientName.value());
    }
    JSONValue::Object serverInfo;
    SetMember(serverInfo, "name", JSONValue(options.serverName));
    SetMember(serverInfo, "version", JSONValue(options.serverVersion));

    JSONValue::Object tools;
    SetMember(tools, "listChanged", JSONValue(true));
    JSONValue::Object capabilities;
    SetMember(capabilities, "tools", JSONValue(std::move(tools)));
    SetMember(capabilities, "resources", emptyObject());
    SetMember(capabilities, "prompts", emptyObject());

    JSONValue::Object result;
    SetMember(result, "protocolVersion", JSONValue(params.protocolVersion.value_or(options.defaultProtocolVersion)));
    SetMember(result, "serverInfo", JSONValue(std::move(serverInfo)));
    SetMember(result, "capabilities", JSONValue(std::move(capabilities)));
    return JSONValue{std::move(result)};
}

JSONValue RequestDispatcher::listToolsResult() const {
    JSONValue::Array arr;
    for (const auto& spec : tools.List()) {
        arr.push_back(std::make_shared<JSONValue>(spec.ToJSON()));
    }
    JSONValue::Object result;
    SetMember(result, "tools", JSONValue(std::move(arr)));
    return JSONValue{std::move(result)};
}

void RequestDispatcher::handleCallTool(const MethodCall& call, const CallToolParams& params, const std::shared_ptr<IPeer>& origin) {
    LOG_DEBUG("Scheduling tools/call {}", params.name);
    net::co_spawn(executor,
                  runToolCall(shared_from_this(), std::weak_ptr<IPeer>(origin), call.id, params),
                  net::detached);
}

net::awaitable<void> RequestDispatcher::runToolCall(std::shared_ptr<RequestDispatcher> self,
                                                    std::weak_ptr<IPeer> peer,
                                                    std::optional<JSONRPCId> id,
                                                    CallToolParams params) {
    const IToolRegistry& registry = self->tools;
    const std::string name = params.name;
    JSONValue arguments = params.arguments;

    std::optional<errors::McpError> failure;
    JSONValue result;
    try {
        // Resolved on the host turn so tools registered after the request arrived are visible
        JSONValue value = co_await AsyncRunOnHost(self->host, [&registry, name, arguments]() {
            auto handler = registry.Resolve(name);
            if (!handler.has_value()) {
                throw ToolNotFoundError(name);
            }
            return (*handler)(arguments);
        }, net::use_awaitable);
        result = MakeToolTextResult(value);
    } catch (const ToolNotFoundError& e) {
        LOG_WARN("{}", e.what());
        failure = errors::makeError(JSONRPCErrorCodes::InternalError, e.what());
    } catch (const std::exception& e) {
        LOG_ERROR("Tool {} failed: {}", name, e.what());
        failure = errors::makeError(JSONRPCErrorCodes::InternalError, std::string("Internal Error: ") + e.what());
    } catch (...) {
        LOG_ERROR("Tool {} failed with a non-standard exception", name);
        failure = errors::makeError(JSONRPCErrorCodes::InternalError, "Internal Error: unknown exception");
    }

    if (!id.has_value()) {
        co_return;
    }
    auto target = peer.lock();
    if (!target || !target->IsOpen()) {
        LOG_DEBUG("Dropping tools/call reply for {}: session closed", name);
        co_return;
    }
    if (failure.has_value()) {
        reply(target, *errors::makeErrorResponse(id.value(), failure.value()));
    } else {
        reply(target, JSONRPCResponse(id.value(), std::move(result)));
    }
}

void RequestDispatcher::reply(const std::shared_ptr<IPeer>& peer, const JSONRPCResponse& response) {
    if (!peer || !peer->IsOpen()) {
        return;
    }
    std::string payload = response.Serialize();
    LOG_DEBUG("Sending to {}: {}", peer->GetSessionId(), PreviewPayload(payload, kSendPreviewChars));
    peer->Send(payload);
}

} // namespace wsmcp
