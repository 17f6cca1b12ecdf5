//------------------------------------------------------------------------------
/*
    This file is part of tronbridge.
    Copyright (c) 2024, the tronbridge developers.

    Permission to use, copy, modify, and distribute this software for any
    purpose with or without fee is hereby granted, provided that the above
    copyright notice and this permission notice appear in all copies.

    THE  SOFTWARE IS PROVIDED "AS IS" AND THE AUTHOR DISCLAIMS ALL WARRANTIES
    WITH  REGARD  TO  THIS  SOFTWARE  INCLUDING  ALL  IMPLIED  WARRANTIES  OF
    MERCHANTABILITY  AND  FITNESS. IN NO EVENT SHALL THE AUTHOR BE LIABLE FOR
    ANY  SPECIAL,  DIRECT,  INDIRECT, OR CONSEQUENTIAL DAMAGES OR ANY DAMAGES
    WHATSOEVER  RESULTING  FROM  LOSS  OF USE, DATA OR PROFITS, WHETHER IN AN
    ACTION  OF  CONTRACT, NEGLIGENCE OR OTHER TORTIOUS ACTION, ARISING OUT OF
    OR IN CONNECTION WITH THE USE OR PERFORMANCE OF THIS SOFTWARE.
*/
//==============================================================================

#pragma once

#include <boost/json/object.hpp>
#include <boost/json/value.hpp>

#include <expected>
#include <optional>
#include <string>
#include <string_view>

namespace rpc {

/**
 * @brief The body is not a JSON-RPC envelope; it is to be forwarded as opaque bytes
 */
struct DecodeError {
    std::string message;
};

/**
 * @brief A transformed envelope could not be serialized
 */
struct EncodeError {
    std::string message;
};

/**
 * @brief A JSON-RPC 2.0 request envelope.
 *
 * `params` and `id` are opaque. An absent member stays absent when encoded, while an explicit null is kept.
 * Unknown top-level members are carried in `extra` in the order they were received.
 */
struct JsonRpcRequest {
    std::string jsonrpc;
    std::string method;
    std::optional<boost::json::value> params;
    std::optional<boost::json::value> id;
    boost::json::object extra;

    bool
    operator==(JsonRpcRequest const&) const = default;
};

/**
 * @brief A JSON-RPC 2.0 response envelope.
 *
 * Having exactly one of `result` and `error` is not enforced.
 */
struct JsonRpcResponse {
    std::string jsonrpc;
    std::optional<boost::json::value> result;
    std::optional<boost::json::value> error;
    std::optional<boost::json::value> id;
    boost::json::object extra;

    bool
    operator==(JsonRpcResponse const&) const = default;
};

/**
 * @brief Decode a request envelope. `jsonrpc` and `method` must be strings.
 *
 * @param body The raw request body
 * @return The request or the reason it is not an envelope
 */
std::expected<JsonRpcRequest, DecodeError>
decodeRequest(std::string_view body);

/**
 * @brief Decode a response envelope. `jsonrpc` must be a string.
 *
 * @param body The raw response body
 * @return The response or the reason it is not an envelope
 */
std::expected<JsonRpcResponse, DecodeError>
decodeResponse(std::string_view body);

/**
 * @brief Serialize a request as `jsonrpc`, `method`, `params`, `id` followed by the extra members.
 *
 * @param request The request to serialize
 * @return The JSON text or an error
 */
std::expected<std::string, EncodeError>
encode(JsonRpcRequest const& request);

/**
 * @brief Serialize a response as `jsonrpc`, `result`, `error`, `id` followed by the extra members.
 *
 * @param response The response to serialize
 * @return The JSON text or an error
 */
std::expected<std::string, EncodeError>
encode(JsonRpcResponse const& response);

}  // namespace rpc
