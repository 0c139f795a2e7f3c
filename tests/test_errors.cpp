//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_errors.cpp
// Purpose: Tests for McpError helpers and the error-object wire shape
//==========================================================================================================

#include <gtest/gtest.h>

#include <string>

#include "mcpengine/errors/Errors.h"
#include "mcpengine/JSONRPCTypes.h"

namespace mcpengine {

TEST(Errors, CategoryFollowsCode) {
    using errors::ErrorCategory;
    EXPECT_EQ(errors::errorCategoryFromCode(JSONRPCErrorCodes::ParseError), ErrorCategory::JsonRpcParse);
    EXPECT_EQ(errors::errorCategoryFromCode(JSONRPCErrorCodes::MethodNotFound), ErrorCategory::JsonRpcMethodNotFound);
    EXPECT_EQ(errors::errorCategoryFromCode(JSONRPCErrorCodes::UnknownTool), ErrorCategory::UnknownTool);
    EXPECT_EQ(errors::errorCategoryFromCode(JSONRPCErrorCodes::UnsupportedProtocolVersion),
              ErrorCategory::UnsupportedProtocolVersion);
    EXPECT_EQ(errors::errorCategoryFromCode(JSONRPCErrorCodes::InternalHandlerError),
              ErrorCategory::InternalHandlerError);
    EXPECT_EQ(errors::errorCategoryFromCode(12345), ErrorCategory::Unknown);
}

TEST(Errors, ExceptionCarriesCodeAndMessage) {
    try {
        throw errors::McpException(JSONRPCErrorCodes::PromptNotFound, "Prompt not found: p");
    } catch (const errors::McpException& e) {
        EXPECT_EQ(e.code(), JSONRPCErrorCodes::PromptNotFound);
        EXPECT_STREQ(e.what(), "Prompt not found: p");
        EXPECT_EQ(e.details().category, errors::ErrorCategory::PromptNotFound);
        EXPECT_FALSE(e.details().data.has_value());
    }
}

TEST(Errors, ErrorValueRoundTripKeepsData) {
    JSONValue::Object data;
    data["requested"] = std::make_shared<JSONValue>("1999-01-01");
    auto err = errors::makeError(JSONRPCErrorCodes::UnsupportedProtocolVersion, "Unsupported protocol version: 1999-01-01",
                                 JSONValue{data});
    JSONValue wire = errors::makeErrorValue(err);

    auto back = errors::mcpErrorFromErrorValue(wire);
    ASSERT_TRUE(back.has_value());
    EXPECT_EQ(back->code, err.code);
    EXPECT_EQ(back->message, err.message);
    ASSERT_TRUE(back->data.has_value());
    EXPECT_EQ(back->data.value(), JSONValue{data});
}

TEST(Errors, MalformedErrorObjectsYieldNothing) {
    EXPECT_FALSE(errors::mcpErrorFromErrorValue(ParseJSON(R"({"message":"x"})")).has_value());
    EXPECT_FALSE(errors::mcpErrorFromErrorValue(ParseJSON(R"({"code":"1","message":"x"})")).has_value());
    EXPECT_FALSE(errors::mcpErrorFromErrorValue(ParseJSON(R"({"code":1})")).has_value());
}

TEST(Errors, FromResponse) {
    auto resp = errors::makeErrorResponse(std::string("abc"),
                                          errors::makeError(JSONRPCErrorCodes::ResourceNotFound, "Resource not found: u"));
    ASSERT_TRUE(resp->IsError());
    EXPECT_EQ(std::get<std::string>(resp->id), "abc");
    auto err = errors::mcpErrorFromResponse(*resp);
    ASSERT_TRUE(err.has_value());
    EXPECT_EQ(err->code, JSONRPCErrorCodes::ResourceNotFound);
    EXPECT_EQ(err->category, errors::ErrorCategory::ResourceNotFound);

    JSONRPCResponse ok(int64_t{1}, JSONValue{JSONValue::Object{}});
    EXPECT_FALSE(errors::mcpErrorFromResponse(ok).has_value());
}

TEST(Errors, RemoteErrorIsMcpException) {
    try {
        throw errors::RemoteError(errors::makeError(JSONRPCErrorCodes::InvalidParams, "bad"));
    } catch (const errors::McpException& e) {
        EXPECT_EQ(e.code(), JSONRPCErrorCodes::InvalidParams);
    }
}

} // namespace mcpengine
