//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_server_instance.cpp
// Purpose: Loopback tests for ServerInstance and Session (framing, replies, fan-out, disconnects)
//==========================================================================================================

#include <gtest/gtest.h>

#include <chrono>
#include <future>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include <boost/asio.hpp>

#include "wsmcp/ServerInstance.h"

using namespace wsmcp;
namespace net = boost::asio;
using tcp = net::ip::tcp;
using namespace std::chrono_literals;

namespace {
const std::string kPing = "{\"jsonrpc\":\"2.0\",\"id\":1,\"method\":\"ping\"}";
const std::string kPong = "{\"jsonrpc\":\"2.0\",\"id\":1,\"result\":{}}";

// Drives the server io_context on this thread while fn runs blocking client I/O on a helper thread.
template <typename F>
auto runClient(net::io_context& ioc, F fn) {
    auto fut = std::async(std::launch::async, std::move(fn));
    const auto deadline = std::chrono::steady_clock::now() + 5s;
    while (fut.wait_for(0ms) != std::future_status::ready && std::chrono::steady_clock::now() < deadline) {
        if (ioc.stopped()) {
            ioc.restart();
        }
        ioc.run_for(10ms);
    }
    return fut.get();
}

// Runs the io_context until pred holds or the deadline passes.
template <typename Pred>
bool runUntil(net::io_context& ioc, Pred pred) {
    const auto deadline = std::chrono::steady_clock::now() + 5s;
    while (!pred() && std::chrono::steady_clock::now() < deadline) {
        if (ioc.stopped()) {
            ioc.restart();
        }
        ioc.run_for(10ms);
    }
    return pred();
}

std::string readLine(tcp::socket& s, std::string& pending) {
    std::size_t n = net::read_until(s, net::dynamic_buffer(pending), '\n');
    std::string line = pending.substr(0, n);
    pending.erase(0, n);
    return line;
}

std::string readHeaderFrame(tcp::socket& s, std::string& pending) {
    std::size_t n = net::read_until(s, net::dynamic_buffer(pending), "\r\n\r\n");
    std::string header = pending.substr(0, n);
    pending.erase(0, n);
    const std::string token = "Content-Length: ";
    std::size_t length = std::stoul(header.substr(token.size()));
    if (pending.size() < length) {
        std::size_t missing = length - pending.size();
        std::string rest(missing, '\0');
        net::read(s, net::buffer(rest));
        pending += rest;
    }
    std::string body = header + pending.substr(0, length);
    pending.erase(0, length);
    return body;
}

class ServerInstanceTest : public ::testing::Test {
protected:
    ServerInstanceTest() : host(ioc) {}

    std::shared_ptr<ServerInstance> startServer(ServerOptions opts = ServerOptions{}) {
        auto server = std::make_shared<ServerInstance>(ioc, "/tmp/workspace", tools, host, opts);
        server->Start();
        servers.push_back(server);
        return server;
    }

    // Lets accept loops and read loops observe the shutdown before the io_context goes away
    void TearDown() override {
        for (auto& server : servers) {
            server->Stop();
        }
        servers.clear();
        ioc.restart();
        ioc.run();
    }

    tcp::socket connect(unsigned short port) {
        tcp::socket s(clientCtx);
        s.connect(tcp::endpoint(net::ip::make_address("127.0.0.1"), port));
        return s;
    }

    net::io_context ioc;
    net::io_context clientCtx;
    AsioHostScheduler host;
    ToolRegistry tools;
    std::vector<std::shared_ptr<ServerInstance>> servers;
};
} // namespace

TEST_F(ServerInstanceTest, StartBindsEphemeralLoopbackPort) {
    auto server = startServer();
    EXPECT_TRUE(server->IsRunning());
    EXPECT_NE(server->Port(), 0);
    EXPECT_EQ(server->SessionCount(), 0u);
    EXPECT_EQ(server->WorkspacePath(), "/tmp/workspace");
    server->Stop();
    EXPECT_FALSE(server->IsRunning());
    server->Stop();
}

TEST_F(ServerInstanceTest, LineFramedPingGetsLineFramedReply) {
    auto server = startServer();
    tcp::socket client = connect(server->Port());
    std::string reply = runClient(ioc, [&]() {
        net::write(client, net::buffer(kPing + "\n"));
        std::string pending;
        return readLine(client, pending);
    });
    EXPECT_EQ(reply, kPong + "\n");
    EXPECT_EQ(server->SessionCount(), 1u);
}

TEST_F(ServerInstanceTest, HeaderFramedRequestGetsLineFramedReply) {
    tools.Register(ToolSpec{"echo", "Echo"}, [](const JSONValue& args) { return args; });
    auto server = startServer();
    tcp::socket client = connect(server->Port());
    const std::string body = "{\"jsonrpc\":\"2.0\",\"id\":2,\"method\":\"tools/list\"}";
    std::string line = runClient(ioc, [&]() {
        net::write(client, net::buffer("Content-Length: " + std::to_string(body.size()) + "\r\n\r\n" + body));
        std::string pending;
        return readLine(client, pending);
    });
    ASSERT_EQ(line.rfind("{", 0), 0u);
    ASSERT_EQ(line.back(), '\n');
    JSONValue reply = ParseJSON(line.substr(0, line.size() - 1));
    const JSONValue* list = GetMember(*GetMember(reply, "result"), "tools");
    ASSERT_NE(list, nullptr);
    ASSERT_EQ(std::get<JSONValue::Array>(list->value).size(), 1u);
}

TEST_F(ServerInstanceTest, MirroredFramingAnswersHeaderWithHeader) {
    ServerOptions opts;
    opts.framing.mirrorRequestFraming = true;
    auto server = startServer(opts);
    tcp::socket client = connect(server->Port());
    std::string frame = runClient(ioc, [&]() {
        net::write(client, net::buffer("Content-Length: " + std::to_string(kPing.size()) + "\r\n\r\n" + kPing));
        std::string pending;
        return readHeaderFrame(client, pending);
    });
    ASSERT_EQ(frame.rfind("Content-Length: " + std::to_string(kPong.size()) + "\r\n\r\n", 0), 0u);
    EXPECT_NE(frame.find(kPong), std::string::npos);
}

TEST_F(ServerInstanceTest, FragmentedWritesAreReassembled) {
    auto server = startServer();
    tcp::socket client = connect(server->Port());
    std::string reply = runClient(ioc, [&]() {
        const std::string frame = "Content-Length: " + std::to_string(kPing.size()) + "\r\n\r\n" + kPing;
        for (std::size_t i = 0; i < frame.size(); i += 7) {
            net::write(client, net::buffer(frame.substr(i, 7)));
            std::this_thread::sleep_for(1ms);
        }
        std::string pending;
        return readLine(client, pending);
    });
    EXPECT_EQ(reply, kPong + "\n");
}

TEST_F(ServerInstanceTest, ToolCallRoundTrip) {
    tools.Register(ToolSpec{"echo", "Echo"}, [](const JSONValue& args) {
        return JSONValue(GetStringMember(args, "message").value_or(""));
    });
    auto server = startServer();
    tcp::socket client = connect(server->Port());
    std::string line = runClient(ioc, [&]() {
        net::write(client, net::buffer(std::string(
            "{\"jsonrpc\":\"2.0\",\"id\":3,\"method\":\"tools/call\",\"params\":{\"name\":\"echo\",\"arguments\":{\"message\":\"hey\"}}}\n")));
        std::string pending;
        return readLine(client, pending);
    });
    JSONValue reply = ParseJSON(line);
    const JSONValue* result = GetMember(reply, "result");
    ASSERT_NE(result, nullptr);
    const auto& content = std::get<JSONValue::Array>(GetMember(*result, "content")->value);
    ASSERT_EQ(content.size(), 1u);
    EXPECT_EQ(GetStringMember(*content[0], "text").value_or(""), "hey");
}

TEST_F(ServerInstanceTest, NotifyAllReachesEverySession) {
    auto server = startServer();
    tcp::socket a = connect(server->Port());
    tcp::socket b = connect(server->Port());
    std::string pendingA;
    std::string pendingB;
    runClient(ioc, [&]() {
        net::write(a, net::buffer(kPing + "\n"));
        net::write(b, net::buffer(kPing + "\n"));
        readLine(a, pendingA);
        readLine(b, pendingB);
        return 0;
    });
    ASSERT_EQ(server->SessionCount(), 2u);

    server->NotifyAll(Methods::ToolListChanged);
    auto lines = runClient(ioc, [&]() {
        return std::make_pair(readLine(a, pendingA), readLine(b, pendingB));
    });
    const std::string expected = "{\"jsonrpc\":\"2.0\",\"method\":\"notifications/tools/list_changed\"}\n";
    EXPECT_EQ(lines.first, expected);
    EXPECT_EQ(lines.second, expected);
}

TEST_F(ServerInstanceTest, DisconnectRemovesSession) {
    auto server = startServer();
    tcp::socket client = connect(server->Port());
    runClient(ioc, [&]() {
        net::write(client, net::buffer(kPing + "\n"));
        std::string pending;
        return readLine(client, pending);
    });
    ASSERT_EQ(server->SessionCount(), 1u);
    client.close();
    EXPECT_TRUE(runUntil(ioc, [&]() { return server->SessionCount() == 0; }));
    EXPECT_TRUE(server->IsRunning());
}

TEST_F(ServerInstanceTest, InvalidJsonKeepsConnectionOpen) {
    auto server = startServer();
    tcp::socket client = connect(server->Port());
    std::string reply = runClient(ioc, [&]() {
        net::write(client, net::buffer(std::string("{broken\n\n") + "Content-Length: x\r\n\r\n" + kPing + "\n"));
        std::string pending;
        return readLine(client, pending);
    });
    EXPECT_EQ(reply, kPong + "\n");
}

TEST_F(ServerInstanceTest, OversizedBodyClosesSession) {
    ServerOptions opts;
    opts.framing.maxContentLength = 8;
    auto server = startServer(opts);
    tcp::socket client = connect(server->Port());
    boost::system::error_code ec = runClient(ioc, [&]() {
        net::write(client, net::buffer(std::string("Content-Length: 100\r\n\r\n")));
        char byte;
        boost::system::error_code readEc;
        client.read_some(net::buffer(&byte, 1), readEc);
        return readEc;
    });
    EXPECT_TRUE(ec == net::error::eof || ec == net::error::connection_reset);
    EXPECT_TRUE(runUntil(ioc, [&]() { return server->SessionCount() == 0; }));
}

TEST_F(ServerInstanceTest, StopClosesSessions) {
    auto server = startServer();
    tcp::socket client = connect(server->Port());
    runClient(ioc, [&]() {
        net::write(client, net::buffer(kPing + "\n"));
        std::string pending;
        return readLine(client, pending);
    });
    server->Stop();
    EXPECT_EQ(server->SessionCount(), 0u);
    boost::system::error_code ec = runClient(ioc, [&]() {
        char byte;
        boost::system::error_code readEc;
        client.read_some(net::buffer(&byte, 1), readEc);
        return readEc;
    });
    EXPECT_TRUE(ec == net::error::eof || ec == net::error::connection_reset);
}
