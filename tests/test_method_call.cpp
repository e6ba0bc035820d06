//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_method_call.cpp
// Purpose: Tests for classifying inbound messages into typed method calls
//==========================================================================================================

#include <gtest/gtest.h>

#include "wsmcp/MethodCall.h"

using namespace wsmcp;

TEST(MethodCallTest, RequestWithIdAndCallToolParams) {
    auto call = ParseMethodCall(ParseJSON(
        "{\"jsonrpc\":\"2.0\",\"id\":5,\"method\":\"tools/call\",\"params\":{\"name\":\"echo\",\"arguments\":{\"m\":1}}}"));
    ASSERT_TRUE(call.has_value());
    EXPECT_FALSE(call->IsNotification());
    EXPECT_EQ(std::get<int64_t>(call->id.value()), 5);
    ASSERT_TRUE(std::holds_alternative<CallToolParams>(call->params));
    const auto& p = std::get<CallToolParams>(call->params);
    EXPECT_EQ(p.name, "echo");
    EXPECT_EQ(SerializeJSON(p.arguments), "{\"m\":1}");
}

TEST(MethodCallTest, MissingOrNullArgumentsBecomeEmptyObject) {
    auto call = ParseMethodCall(ParseJSON("{\"id\":1,\"method\":\"tools/call\",\"params\":{\"name\":\"t\",\"arguments\":null}}"));
    ASSERT_TRUE(call.has_value());
    EXPECT_EQ(SerializeJSON(std::get<CallToolParams>(call->params).arguments), "{}");

    call = ParseMethodCall(ParseJSON("{\"id\":1,\"method\":\"tools/call\"}"));
    ASSERT_TRUE(call.has_value());
    EXPECT_EQ(std::get<CallToolParams>(call->params).name, "");
    EXPECT_EQ(SerializeJSON(std::get<CallToolParams>(call->params).arguments), "{}");
}

TEST(MethodCallTest, NotificationHasNoId) {
    auto call = ParseMethodCall(ParseJSON("{\"jsonrpc\":\"2.0\",\"method\":\"notifications/initialized\"}"));
    ASSERT_TRUE(call.has_value());
    EXPECT_TRUE(call->IsNotification());
    EXPECT_TRUE(std::holds_alternative<InitializedParams>(call->params));
}

TEST(MethodCallTest, ExplicitNullIdIsRequest) {
    auto call = ParseMethodCall(ParseJSON("{\"jsonrpc\":\"2.0\",\"id\":null,\"method\":\"ping\"}"));
    ASSERT_TRUE(call.has_value());
    EXPECT_FALSE(call->IsNotification());
    EXPECT_TRUE(std::holds_alternative<std::nullptr_t>(call->id.value()));
    EXPECT_TRUE(std::holds_alternative<PingParams>(call->params));
}

TEST(MethodCallTest, InitializeReadsVersionAndClientName) {
    auto call = ParseMethodCall(ParseJSON(
        "{\"id\":\"i\",\"method\":\"initialize\",\"params\":{\"protocolVersion\":\"2025-03-26\",\"clientInfo\":{\"name\":\"cli\"}}}"));
    ASSERT_TRUE(call.has_value());
    const auto& p = std::get<InitializeParams>(call->params);
    EXPECT_EQ(p.protocolVersion.value_or(""), "2025-03-26");
    EXPECT_EQ(p.clientName.value_or(""), "cli");
}

TEST(MethodCallTest, EveryKnownMethodMapsToItsParams) {
    auto kind = [](const char* method) {
        return ParseMethodCall(ParseJSON(std::string("{\"id\":1,\"method\":\"") + method + "\"}"))->params.index();
    };
    EXPECT_EQ(kind("prompts/list"), MethodParams(ListPromptsParams{}).index());
    EXPECT_EQ(kind("resources/list"), MethodParams(ListResourcesParams{}).index());
    EXPECT_EQ(kind("tools/list"), MethodParams(ListToolsParams{}).index());
    EXPECT_EQ(kind("notifications/roots/list_changed"), MethodParams(RootsListChangedParams{}).index());
    EXPECT_EQ(kind("resources/read"), MethodParams(UnknownMethodParams{}).index());
}

TEST(MethodCallTest, NonRequestsRejected) {
    EXPECT_FALSE(ParseMethodCall(ParseJSON("[1,2]")).has_value());
    EXPECT_FALSE(ParseMethodCall(ParseJSON("{\"jsonrpc\":\"2.0\",\"id\":1,\"result\":{}}")).has_value());
    EXPECT_FALSE(ParseMethodCall(ParseJSON("{\"method\":7}")).has_value());
}
