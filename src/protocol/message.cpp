#include <mcpbridge/protocol/message.h>

#include <limits>

namespace mcpbridge::protocol {

namespace {

Result<RequestId> parseId(const json& id) {
    if (id.is_number_integer()) {
        return id.get<RequestId>();
    }
    if (id.is_number_unsigned()) {
        return static_cast<RequestId>(id.get<uint64_t>());
    }
    return Error{ErrorCode::ProtocolViolation, "Request id must be an integer, got " + id.dump()};
}

Result<RpcError> parseRpcError(const json& err) {
    if (!err.is_object()) {
        return Error{ErrorCode::ProtocolViolation, "'error' member must be an object"};
    }
    RpcError out;
    auto code = err.find("code");
    if (code == err.end() || !code->is_number_integer()) {
        return Error{ErrorCode::ProtocolViolation, "'error.code' must be an integer"};
    }
    if (code->is_number_unsigned() &&
        code->get<uint64_t>() > static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
        return Error{ErrorCode::ProtocolViolation, "'error.code' out of range: " + code->dump()};
    }
    out.code = code->get<int64_t>();
    if (auto msg = err.find("message"); msg != err.end()) {
        if (!msg->is_string()) {
            return Error{ErrorCode::ProtocolViolation, "'error.message' must be a string"};
        }
        out.message = msg->get<std::string>();
    }
    if (err.contains("data")) {
        out.data = err["data"];
    }
    return out;
}

json paramsOrEmpty(const json& object) {
    if (object.contains("params") && !object["params"].is_null()) {
        return object["params"];
    }
    return json::object();
}

} // namespace

Response makeResult(RequestId id, json result) {
    Response r;
    r.id = id;
    r.result = std::move(result);
    return r;
}

Response makeError(RequestId id, int64_t code, std::string message) {
    Response r;
    r.id = id;
    r.error = RpcError{code, std::move(message), std::nullopt};
    return r;
}

json toJson(const ProtocolMessage& message) {
    json j;
    j["jsonrpc"] = JSONRPC_VERSION;
    if (const auto* req = std::get_if<Request>(&message)) {
        j["id"] = req->id;
        j["method"] = req->method;
        j["params"] = req->params;
    } else if (const auto* resp = std::get_if<Response>(&message)) {
        j["id"] = resp->id;
        if (resp->error) {
            json err{{"code", resp->error->code}, {"message", resp->error->message}};
            if (resp->error->data) {
                err["data"] = *resp->error->data;
            }
            j["error"] = std::move(err);
        } else {
            j["result"] = resp->result.value_or(json::object());
        }
    } else {
        const auto& note = std::get<Notification>(message);
        j["method"] = note.method;
        j["params"] = note.params;
    }
    return j;
}

std::string encodeFrame(const ProtocolMessage& message) {
    // dump() escapes control characters, so the payload itself never contains '\n'
    auto frame = toJson(message).dump(-1, ' ', false, json::error_handler_t::replace);
    frame.push_back('\n');
    return frame;
}

Result<ProtocolMessage> fromJson(const json& object) {
    if (!object.is_object()) {
        return Error{ErrorCode::ProtocolViolation, "Message must be a JSON object"};
    }
    auto ver = object.find("jsonrpc");
    if (ver == object.end() || !ver->is_string() || ver->get<std::string>() != JSONRPC_VERSION) {
        return Error{ErrorCode::ProtocolViolation, "Missing or invalid 'jsonrpc' field"};
    }

    const bool hasMethod = object.contains("method");
    const bool hasId = object.contains("id") && !object["id"].is_null();

    if (hasMethod) {
        if (!object["method"].is_string()) {
            return Error{ErrorCode::ProtocolViolation, "'method' must be a string"};
        }
        auto method = object["method"].get<std::string>();
        if (!hasId) {
            return ProtocolMessage{Notification{std::move(method), paramsOrEmpty(object)}};
        }
        auto id = parseId(object["id"]);
        if (!id) {
            return id.error();
        }
        return ProtocolMessage{Request{id.value(), std::move(method), paramsOrEmpty(object)}};
    }

    if (!hasId) {
        return Error{ErrorCode::ProtocolViolation, "Message has neither 'method' nor 'id'"};
    }
    auto id = parseId(object["id"]);
    if (!id) {
        return id.error();
    }

    const bool hasResult = object.contains("result");
    const bool hasError = object.contains("error");
    if (hasResult == hasError) {
        return Error{ErrorCode::ProtocolViolation,
                     "Response must carry exactly one of 'result' or 'error'"};
    }

    Response resp;
    resp.id = id.value();
    if (hasResult) {
        resp.result = object["result"];
    } else {
        auto err = parseRpcError(object["error"]);
        if (!err) {
            return err.error();
        }
        resp.error = std::move(err).value();
    }
    return ProtocolMessage{std::move(resp)};
}

Result<ProtocolMessage> decodeMessage(std::string_view line) {
    auto parsed = json_utils::parse_json(line);
    if (!parsed) {
        return parsed.error();
    }
    try {
        return fromJson(parsed.value());
    } catch (const json::exception& e) {
        return Error{ErrorCode::ProtocolViolation, std::string("Malformed message: ") + e.what()};
    }
}

std::string describe(const ProtocolMessage& message) {
    if (const auto* req = std::get_if<Request>(&message)) {
        return "request #" + std::to_string(req->id) + " " + req->method;
    }
    if (const auto* resp = std::get_if<Response>(&message)) {
        return std::string(resp->isError() ? "error response #" : "response #") +
               std::to_string(resp->id);
    }
    return "notification " + std::get<Notification>(message).method;
}

namespace json_utils {

Result<json> parse_json(std::string_view input) noexcept {
    if (input.empty()) {
        return Error{ErrorCode::ProtocolViolation, "Empty input string for JSON parsing"};
    }

    try {
        return json::parse(input);
    } catch (const json::parse_error& e) {
        return Error{ErrorCode::ProtocolViolation, std::string("JSON parse error: ") + e.what() +
                                                       " at position " + std::to_string(e.byte)};
    } catch (const std::exception& e) {
        return Error{ErrorCode::ProtocolViolation, std::string("JSON parsing failed: ") + e.what()};
    }
}

} // namespace json_utils

} // namespace mcpbridge::protocol
