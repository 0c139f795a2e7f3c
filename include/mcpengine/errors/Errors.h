//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Errors.h
// Purpose: Typed error structures, exceptions and JSON-RPC error mapping helpers
//==========================================================================================================

#pragma once

#include <optional>
#include <stdexcept>
#include <string>

#include "mcpengine/JSONRPCTypes.h"

namespace mcpengine {
namespace errors {

// Categorization of JSON-RPC and protocol-specific error codes.
enum class ErrorCategory {
    JsonRpcParse,
    JsonRpcInvalidRequest,
    JsonRpcMethodNotFound,
    JsonRpcInvalidParams,
    JsonRpcInternal,
    UnknownTool,
    ResourceNotFound,
    UnsupportedProtocolVersion,
    PromptNotFound,
    InternalHandlerError,
    Unknown
};

// Typed error representation.
struct McpError {
    int code{0};
    std::string message;
    std::optional<JSONValue> data;
    ErrorCategory category{ErrorCategory::Unknown};
};

// Map a numeric error code to an ErrorCategory.
//
// Args:
//   code: The integer error code (JSON-RPC standard or protocol-specific).
//
// Returns:
//   ErrorCategory corresponding to the code, or Unknown when unmapped.
inline ErrorCategory errorCategoryFromCode(int code) {
    switch (code) {
        case JSONRPCErrorCodes::ParseError: return ErrorCategory::JsonRpcParse;
        case JSONRPCErrorCodes::InvalidRequest: return ErrorCategory::JsonRpcInvalidRequest;
        case JSONRPCErrorCodes::MethodNotFound: return ErrorCategory::JsonRpcMethodNotFound;
        case JSONRPCErrorCodes::InvalidParams: return ErrorCategory::JsonRpcInvalidParams;
        case JSONRPCErrorCodes::InternalError: return ErrorCategory::JsonRpcInternal;
        case JSONRPCErrorCodes::UnknownTool: return ErrorCategory::UnknownTool;
        case JSONRPCErrorCodes::ResourceNotFound: return ErrorCategory::ResourceNotFound;
        case JSONRPCErrorCodes::UnsupportedProtocolVersion: return ErrorCategory::UnsupportedProtocolVersion;
        case JSONRPCErrorCodes::PromptNotFound: return ErrorCategory::PromptNotFound;
        case JSONRPCErrorCodes::InternalHandlerError: return ErrorCategory::InternalHandlerError;
        default: return ErrorCategory::Unknown;
    }
}

inline McpError makeError(int code, std::string message, std::optional<JSONValue> data = std::nullopt) {
    McpError e;
    e.code = code;
    e.message = std::move(message);
    e.data = std::move(data);
    e.category = errorCategoryFromCode(code);
    return e;
}

//==========================================================================================================
// McpException
// Purpose: Exception carrying a typed McpError. Thrown locally (parsing, validation, handler failures
//          that should keep their code); the engine converts it into an error response.
//==========================================================================================================
class McpException : public std::runtime_error {
public:
    explicit McpException(McpError err)
        : std::runtime_error(err.message), error(std::move(err)) {}
    McpException(int code, const std::string& message)
        : McpException(makeError(code, message)) {}

    int code() const noexcept { return error.code; }
    const McpError& details() const noexcept { return error; }

private:
    McpError error;
};

//==========================================================================================================
// RemoteError
// Purpose: The peer answered a request with a JSON-RPC error object. Surfaced to SendRequest callers.
//==========================================================================================================
class RemoteError : public McpException {
public:
    explicit RemoteError(McpError err) : McpException(std::move(err)) {}
};

// Convert a JSON-RPC error object (shape: { code, message, data? }) to McpError.
// Returns std::nullopt when the input is not a valid error object.
//
// Args:
//   errVal: JSONValue expected to be an Object with code/message and optional data.
//
// Returns:
//   std::optional<McpError> populated when shape is valid.
inline std::optional<McpError> mcpErrorFromErrorValue(const JSONValue& errVal) {
    const JSONValue* codeVal = errVal.find("code");
    const JSONValue* msgVal = errVal.find("message");
    if (codeVal == nullptr || msgVal == nullptr) {
        return std::nullopt;
    }
    if (!std::holds_alternative<int64_t>(codeVal->value) ||
        !std::holds_alternative<std::string>(msgVal->value)) {
        return std::nullopt;
    }
    std::optional<JSONValue> data;
    if (const JSONValue* dataVal = errVal.find("data")) {
        data = *dataVal;
    }
    return makeError(static_cast<int>(std::get<int64_t>(codeVal->value)),
                     std::get<std::string>(msgVal->value), std::move(data));
}

// Extract McpError from a JSONRPCResponse if it carries an error.
//
// Args:
//   response: JSONRPCResponse that may contain an error object.
//
// Returns:
//   std::optional<McpError> when response.IsError() and shape is valid.
inline std::optional<McpError> mcpErrorFromResponse(const JSONRPCResponse& response) {
    if (!response.error.has_value()) {
        return std::nullopt;
    }
    return mcpErrorFromErrorValue(response.error.value());
}

// Create a JSONValue error object from a typed McpError.
inline JSONValue makeErrorValue(const McpError& err) {
    return CreateErrorObject(err.code, err.message, err.data);
}

// Convenience: Create a JSONRPCResponse error from McpError and id.
inline std::unique_ptr<JSONRPCResponse> makeErrorResponse(const JSONRPCId& id, const McpError& err) {
    return CreateErrorResponse(id, err.code, err.message, err.data);
}

} // namespace errors
} // namespace mcpengine
