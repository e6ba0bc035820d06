//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: main.cpp
// Purpose: Host application serving one MCP endpoint per workspace directory
//==========================================================================================================

#include <csignal>
#include <filesystem>
#include <functional>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include <boost/asio/io_context.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/signal_set.hpp>

#include "env/EnvVars.h"
#include "logging/Logger.h"
#include "wsmcp/Config.h"
#include "wsmcp/HostScheduler.h"
#include "wsmcp/Protocol.h"
#include "wsmcp/ServerRegistry.h"
#include "wsmcp/ToolRegistry.h"

using namespace wsmcp;
namespace net = boost::asio;

//==========================================================================================================
// Parses simple key=value style command-line options.
// Args:
//   argc: Argument count
//   argv: Argument values
//   key: Option name including leading dashes (e.g., "--log-level")
// Returns:
//   Optional value string when present; empty optional otherwise
//==========================================================================================================
static std::optional<std::string> getArgValue(int argc, char** argv, const std::string& key) {
    for (int i = 1; i < argc; ++i) {
        if (argv[i] == nullptr) {
            continue;
        }
        std::string a = argv[i];
        std::size_t eq = a.find('=');
        if (eq != std::string::npos && a.substr(0, eq) == key) {
            return a.substr(eq + 1);
        }
    }
    return std::nullopt;
}

static bool hasFlag(int argc, char** argv, const std::string& flag) {
    for (int i = 1; i < argc; ++i) {
        if (argv[i] != nullptr && flag == argv[i]) {
            return true;
        }
    }
    return false;
}

// Arguments that are not options are workspace directories.
static std::vector<std::string> workspaceArgs(int argc, char** argv) {
    std::vector<std::string> dirs;
    for (int i = 1; i < argc; ++i) {
        if (argv[i] != nullptr && argv[i][0] != '-') {
            dirs.emplace_back(argv[i]);
        }
    }
    return dirs;
}

static JSONValue stringSchema(const std::string& property) {
    JSONValue::Object propType;
    SetMember(propType, "type", JSONValue("string"));
    JSONValue::Object props;
    SetMember(props, property, JSONValue(std::move(propType)));
    JSONValue::Array required;
    required.push_back(std::make_shared<JSONValue>(property));
    JSONValue::Object schema;
    SetMember(schema, "type", JSONValue("object"));
    SetMember(schema, "properties", JSONValue(std::move(props)));
    SetMember(schema, "required", JSONValue(std::move(required)));
    return JSONValue(std::move(schema));
}

static void registerSampleTools(ToolRegistry& tools, const ServerRegistry& servers) {
    tools.Register(ToolSpec{"echo", "Echo a message", stringSchema("message")},
        [](const JSONValue& args) -> JSONValue {
            auto message = GetStringMember(args, "message");
            if (!message.has_value()) {
                throw std::invalid_argument("missing string argument 'message'");
            }
            return JSONValue(message.value());
        });

    tools.Register(ToolSpec{"workspace_info", "List the workspaces served by this process"},
        [&servers](const JSONValue&) -> JSONValue {
            JSONValue::Array arr;
            for (const auto& [path, entry] : servers.Servers()) {
                JSONValue::Object item;
                SetMember(item, "path", JSONValue(path));
                SetMember(item, "port", JSONValue(static_cast<int64_t>(entry.port)));
                SetMember(item, "sessions", JSONValue(static_cast<int64_t>(entry.instance->SessionCount())));
                arr.push_back(std::make_shared<JSONValue>(std::move(item)));
            }
            return JSONValue(std::move(arr));
        });
}

int main(int argc, char** argv) {
    FUNC_SCOPE();
    ConfigureLoggingFromEnv();
    if (auto level = getArgValue(argc, argv, "--log-level")) {
        Logger::setLogLevelFromString(level.value());
    }

    net::io_context ioc;
    AsioHostScheduler host(ioc);
    ToolRegistry tools;
    ServerRegistry servers(ioc, tools, host, LoadServerOptionsFromEnv());
    registerSampleTools(tools, servers);

    servers.SetServerCreatedCallback([](const std::string& path, const std::shared_ptr<ServerInstance>& instance) {
        std::cout << path << " " << instance->Port() << std::endl;
    });
    servers.SetInitializedCallback([](const std::shared_ptr<IPeer>& peer) {
        LOG_INFO("Session {} completed the handshake", peer->GetSessionId());
    });

    std::vector<std::string> dirs = workspaceArgs(argc, argv);
    if (dirs.empty()) {
        dirs.push_back(std::filesystem::current_path().string());
    }
    for (const auto& dir : dirs) {
        if (!servers.EnsureServer(dir).has_value()) {
            LOG_ERROR("No server for {}", dir);
        }
    }
    if (servers.Size() == 0) {
        return 1;
    }

    if (hasFlag(argc, argv, "--announce")) {
        net::post(ioc, [&servers]() { servers.NotifyAll(Methods::ToolListChanged); });
    }

    net::signal_set signals(ioc, SIGINT, SIGTERM);
#ifdef SIGHUP
    net::signal_set reloads(ioc, SIGHUP);
    std::function<void(const boost::system::error_code&, int)> onReload;
    onReload = [&](const boost::system::error_code& ec, int) {
        if (ec) {
            return;
        }
        LOG_INFO("SIGHUP: restarting all servers");
        servers.RestartAll();
        reloads.async_wait(onReload);
    };
    reloads.async_wait(onReload);
#endif
    signals.async_wait([&](const boost::system::error_code& ec, int signo) {
        if (ec) {
            return;
        }
        LOG_INFO("Signal {} received, shutting down", signo);
        servers.StopAll();
        ioc.stop();
    });

    ioc.run();
    return 0;
}
