//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_errors.cpp
// Purpose: GoogleTests for typed error structures and JSON-RPC error mapping helpers
//==========================================================================================================

#include <gtest/gtest.h>
#include "wsmcp/JSONRPCTypes.h"
#include "wsmcp/errors/Errors.h"

using namespace wsmcp;

TEST(Errors, CategoryMapping) {
    using wsmcp::errors::ErrorCategory;
    EXPECT_EQ(errors::errorCategoryFromCode(JSONRPCErrorCodes::ParseError), ErrorCategory::JsonRpcParse);
    EXPECT_EQ(errors::errorCategoryFromCode(JSONRPCErrorCodes::InvalidRequest), ErrorCategory::JsonRpcInvalidRequest);
    EXPECT_EQ(errors::errorCategoryFromCode(JSONRPCErrorCodes::MethodNotFound), ErrorCategory::JsonRpcMethodNotFound);
    EXPECT_EQ(errors::errorCategoryFromCode(JSONRPCErrorCodes::InvalidParams), ErrorCategory::JsonRpcInvalidParams);
    EXPECT_EQ(errors::errorCategoryFromCode(JSONRPCErrorCodes::InternalError), ErrorCategory::JsonRpcInternal);
    EXPECT_EQ(errors::errorCategoryFromCode(12345), ErrorCategory::Unknown);
}

TEST(Errors, ErrorResponseCarriesCodeMessageAndData) {
    errors::McpError err = errors::makeError(JSONRPCErrorCodes::InternalError, "Tool not found: x");
    EXPECT_EQ(err.category, errors::ErrorCategory::JsonRpcInternal);
    auto resp = errors::makeErrorResponse(JSONRPCId{static_cast<int64_t>(4)}, err);
    ASSERT_TRUE(resp->IsError());
    EXPECT_FALSE(resp->result.has_value());

    JSONValue parsed = ParseJSON(resp->Serialize());
    EXPECT_EQ(std::get<int64_t>(GetMember(parsed, "id")->value), 4);
    const JSONValue* error = GetMember(parsed, "error");
    ASSERT_NE(error, nullptr);
    EXPECT_EQ(std::get<int64_t>(GetMember(*error, "code")->value), JSONRPCErrorCodes::InternalError);
    EXPECT_EQ(GetStringMember(*error, "message").value_or(""), "Tool not found: x");
    EXPECT_EQ(GetMember(*error, "data"), nullptr);

    err.data = JSONValue("detail");
    resp = errors::makeErrorResponse(JSONRPCId{nullptr}, err);
    parsed = ParseJSON(resp->Serialize());
    EXPECT_EQ(GetStringMember(*GetMember(parsed, "error"), "data").value_or(""), "detail");
}
