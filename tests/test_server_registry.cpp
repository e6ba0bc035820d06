//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_server_registry.cpp
// Purpose: Tests for workspace path normalization and server lifecycle in the ServerRegistry
//==========================================================================================================

#include <gtest/gtest.h>

#include <filesystem>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include <boost/asio/io_context.hpp>

#include "wsmcp/ServerRegistry.h"

using namespace wsmcp;
namespace fs = std::filesystem;

namespace {
class ServerRegistryTest : public ::testing::Test {
protected:
    ServerRegistryTest() : host(ioc), registry(ioc, tools, host) {}

    void TearDown() override {
        registry.StopAll();
        ioc.restart();
        ioc.run();
    }

    boost::asio::io_context ioc;
    AsioHostScheduler host;
    ToolRegistry tools;
    ServerRegistry registry;
};
} // namespace

TEST(NormalizeWorkspacePathTest, StripsTrailingSeparators) {
    EXPECT_EQ(NormalizeWorkspacePath("/tmp/project/"), "/tmp/project");
    EXPECT_EQ(NormalizeWorkspacePath("/tmp/project//"), "/tmp/project");
    EXPECT_EQ(NormalizeWorkspacePath("/tmp/project"), "/tmp/project");
    EXPECT_EQ(NormalizeWorkspacePath("/tmp/./project/../project"), "/tmp/project");
}

TEST(NormalizeWorkspacePathTest, RootKeepsSeparator) {
    EXPECT_EQ(NormalizeWorkspacePath("/"), "/");
}

TEST(NormalizeWorkspacePathTest, RelativeResolvesAgainstWorkingDirectory) {
    EXPECT_EQ(NormalizeWorkspacePath("some/dir/"), (fs::current_path() / "some" / "dir").lexically_normal().string());
}

TEST_F(ServerRegistryTest, EnsureServerIsIdempotentAcrossSpellings) {
    auto first = registry.EnsureServer("/tmp/wsmcp-a");
    ASSERT_TRUE(first.has_value());
    auto second = registry.EnsureServer("/tmp/wsmcp-a/");
    ASSERT_TRUE(second.has_value());
    EXPECT_EQ(first->instance, second->instance);
    EXPECT_EQ(first->port, second->port);
    EXPECT_NE(first->port, 0);
    EXPECT_FALSE(first->token.has_value());
    EXPECT_EQ(registry.Size(), 1u);
}

TEST_F(ServerRegistryTest, DistinctPathsGetDistinctServers) {
    auto a = registry.EnsureServer("/tmp/wsmcp-a");
    auto b = registry.EnsureServer("/tmp/wsmcp-b");
    ASSERT_TRUE(a.has_value());
    ASSERT_TRUE(b.has_value());
    EXPECT_NE(a->instance, b->instance);
    EXPECT_NE(a->port, b->port);
    EXPECT_EQ(registry.Servers().size(), 2u);
}

TEST_F(ServerRegistryTest, GetServerNeverCreates) {
    EXPECT_FALSE(registry.GetServer("/tmp/wsmcp-missing").has_value());
    EXPECT_EQ(registry.Size(), 0u);
    registry.EnsureServer("/tmp/wsmcp-a");
    auto found = registry.GetServer("/tmp/wsmcp-a/");
    ASSERT_TRUE(found.has_value());
    EXPECT_TRUE(found->instance->IsRunning());
}

TEST_F(ServerRegistryTest, StopAllClearsTable) {
    auto a = registry.EnsureServer("/tmp/wsmcp-a");
    ASSERT_TRUE(a.has_value());
    registry.StopAll();
    EXPECT_EQ(registry.Size(), 0u);
    EXPECT_FALSE(a->instance->IsRunning());
    EXPECT_FALSE(registry.GetServer("/tmp/wsmcp-a").has_value());
}

TEST_F(ServerRegistryTest, RestartAllRecreatesEveryPath) {
    auto a = registry.EnsureServer("/tmp/wsmcp-a");
    auto b = registry.EnsureServer("/tmp/wsmcp-b");
    ASSERT_TRUE(a.has_value());
    ASSERT_TRUE(b.has_value());
    registry.RestartAll();
    EXPECT_EQ(registry.Size(), 2u);
    EXPECT_FALSE(a->instance->IsRunning());
    auto a2 = registry.GetServer("/tmp/wsmcp-a");
    ASSERT_TRUE(a2.has_value());
    EXPECT_NE(a2->instance, a->instance);
    EXPECT_TRUE(a2->instance->IsRunning());
    EXPECT_TRUE(registry.GetServer("/tmp/wsmcp-b").has_value());
}

TEST_F(ServerRegistryTest, CallbacksFire) {
    std::vector<std::string> events;
    registry.SetServerCreatedCallback([&events](const std::string& path, const std::shared_ptr<ServerInstance>& instance) {
        EXPECT_TRUE(instance->IsRunning());
        events.push_back("created " + path);
    });
    registry.SetDirectoryChangedCallback([this, &events](const std::string& path) {
        auto entry = registry.GetServer(path);
        ASSERT_TRUE(entry.has_value());
        EXPECT_TRUE(entry->instance->IsRunning());
        events.push_back("changed " + path);
    });

    registry.EnsureServer("/tmp/wsmcp-a/");
    registry.EnsureServer("/tmp/wsmcp-a");
    EXPECT_EQ(events, (std::vector<std::string>{"created /tmp/wsmcp-a", "changed /tmp/wsmcp-a", "changed /tmp/wsmcp-a"}));
}

TEST_F(ServerRegistryTest, EmptyPathResolvesToWorkingDirectory) {
    const std::string cwd = NormalizeWorkspacePath(fs::current_path().string());
    EXPECT_EQ(NormalizeWorkspacePath(""), cwd);

    std::optional<ServerEntry> missing;
    EXPECT_NO_THROW(missing = registry.GetServer(""));
    EXPECT_FALSE(missing.has_value());

    std::optional<ServerEntry> entry;
    EXPECT_NO_THROW(entry = registry.EnsureServer(""));
    ASSERT_TRUE(entry.has_value());
    EXPECT_EQ(entry->instance->WorkspacePath(), cwd);
    EXPECT_TRUE(registry.GetServer("").has_value());
}

TEST_F(ServerRegistryTest, ThrowingCreatedCallbackStillRegisters) {
    registry.SetServerCreatedCallback([](const std::string&, const std::shared_ptr<ServerInstance>&) {
        throw std::runtime_error("host failure");
    });
    auto entry = registry.EnsureServer("/tmp/wsmcp-a");
    ASSERT_TRUE(entry.has_value());
    EXPECT_EQ(registry.Size(), 1u);
}

TEST(ServerRegistryBindTest, BindFailureReturnsEmpty) {
    boost::asio::io_context ioc;
    AsioHostScheduler host(ioc);
    ToolRegistry tools;
    ServerOptions opts;
    opts.address = "203.0.113.1";
    ServerRegistry registry(ioc, tools, host, opts);
    int fired = 0;
    registry.SetServerCreatedCallback([&fired](const std::string&, const std::shared_ptr<ServerInstance>&) { ++fired; });
    registry.SetDirectoryChangedCallback([&fired](const std::string&) { ++fired; });
    EXPECT_FALSE(registry.EnsureServer("/tmp/wsmcp-unbindable").has_value());
    EXPECT_EQ(registry.Size(), 0u);
    EXPECT_EQ(fired, 0);
}
