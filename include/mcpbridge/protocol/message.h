#pragma once

#include <mcpbridge/core/types.h>
#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace mcpbridge::protocol {

using json = nlohmann::json;

// Protocol constants
constexpr std::string_view JSONRPC_VERSION = "2.0";
constexpr std::string_view DEFAULT_PROTOCOL_VERSION = "2024-11-05";
constexpr std::string_view METHOD_INITIALIZE = "initialize";
constexpr std::string_view METHOD_INITIALIZED = "notifications/initialized";
constexpr std::string_view METHOD_PING = "ping";
constexpr std::string_view METHOD_TOOLS_LIST = "tools/list";
constexpr std::string_view METHOD_TOOLS_CALL = "tools/call";

// Error codes from JSON-RPC 2.0 specification
constexpr int PARSE_ERROR = -32700;
constexpr int INVALID_REQUEST = -32600;
constexpr int METHOD_NOT_FOUND = -32601;
constexpr int INVALID_PARAMS = -32602;
constexpr int INTERNAL_ERROR = -32603;
constexpr int SERVER_UNAVAILABLE = -32000;

/**
 * @brief JSON-RPC error object carried by an error response.
 */
struct RpcError {
    int64_t code{INTERNAL_ERROR};
    std::string message;
    std::optional<json> data;
};

struct Request {
    RequestId id{0};
    std::string method;
    json params = json::object();
};

/**
 * @brief Response to a request. Exactly one of result / error is set.
 */
struct Response {
    RequestId id{0};
    std::optional<json> result;
    std::optional<RpcError> error;

    bool isError() const noexcept { return error.has_value(); }
};

struct Notification {
    std::string method;
    json params = json::object();
};

using ProtocolMessage = std::variant<Request, Response, Notification>;

// Construction helpers
Response makeResult(RequestId id, json result);
Response makeError(RequestId id, int64_t code, std::string message);

/**
 * @brief Serialize a message to its JSON-RPC object form.
 */
json toJson(const ProtocolMessage& message);

/**
 * @brief Serialize a message to a single newline-terminated frame.
 *
 * The JSON text never contains a raw newline, so one frame is exactly one line.
 */
std::string encodeFrame(const ProtocolMessage& message);

/**
 * @brief Decode one frame (without its trailing newline).
 *
 * Returns ProtocolViolation for malformed JSON, a missing or wrong "jsonrpc"
 * member, non-integer ids, or an object that is none of request, response or
 * notification.
 */
Result<ProtocolMessage> decodeMessage(std::string_view line);

/**
 * @brief Decode an already parsed JSON object.
 */
Result<ProtocolMessage> fromJson(const json& object);

/**
 * @brief Short human readable description used in log lines.
 */
std::string describe(const ProtocolMessage& message);

namespace json_utils {

// Safe JSON parsing without exceptions
Result<json> parse_json(std::string_view input) noexcept;

} // namespace json_utils

} // namespace mcpbridge::protocol
