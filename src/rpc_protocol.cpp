// =============================================================================
// PhoneBridge - RPC Wire Protocol Implementation
// =============================================================================

#include "rpc_protocol.hpp"

namespace phonebridge::rpc {

namespace {

// Device strings (labels, tool output) are not guaranteed to be valid UTF-8.
std::string dump_line(const json& j) {
    std::string out = j.dump(-1, ' ', false, json::error_handler_t::replace);
    out += '\n';
    return out;
}

} // anonymous namespace

Response Response::success(json id, json result) {
    Response r;
    r.id = std::move(id);
    r.result = std::move(result);
    return r;
}

Response Response::failure(json id, std::string message) {
    Response r;
    r.id = std::move(id);
    r.error_message = std::move(message);
    return r;
}

// ---------------------------------------------------------------------------
// Encode
// ---------------------------------------------------------------------------
std::string encode_request(const Request& req) {
    json j;
    j["id"] = req.id;
    j["method"] = req.method;
    j["params"] = req.params.is_null() ? json::object() : req.params;
    return dump_line(j);
}

std::string encode_response(const Response& resp) {
    json j;
    j["id"] = resp.id;
    if (resp.error_message) {
        j["error"] = {{"message", *resp.error_message}};
    } else {
        j["result"] = resp.result;
    }
    return dump_line(j);
}

// ---------------------------------------------------------------------------
// Decode
// ---------------------------------------------------------------------------
Result<Request, FramingFailure> decode_request(const std::string& line) {
    json obj = json::parse(line, nullptr, false);
    if (obj.is_discarded()) {
        return FramingFailure(nullptr, "Invalid JSON payload");
    }
    if (!obj.is_object()) {
        return FramingFailure(nullptr, "Invalid JSON payload");
    }

    json id = obj.contains("id") ? obj["id"] : json(nullptr);

    auto method_it = obj.find("method");
    if (method_it == obj.end() || method_it->is_null()) {
        return FramingFailure(id, "Missing 'method' field");
    }
    if (!method_it->is_string()) {
        return FramingFailure(id, "Field 'method' must be a string");
    }

    Request req;
    req.id = id;
    req.method = method_it->get<std::string>();

    auto params_it = obj.find("params");
    if (params_it != obj.end()) {
        if (!params_it->is_object()) {
            return FramingFailure(id, "Field 'params' must be an object");
        }
        req.params = *params_it;
    }
    return req;
}

Result<Response> decode_response(const std::string& line) {
    json obj = json::parse(line, nullptr, false);
    if (obj.is_discarded() || !obj.is_object()) {
        return framing_error("Invalid JSON response. Head=" + line.substr(0, 200));
    }

    json id = obj.contains("id") ? obj["id"] : json(nullptr);
    auto err_it = obj.find("error");
    if (err_it != obj.end()) {
        std::string message;
        if (err_it->is_object() && err_it->contains("message") && (*err_it)["message"].is_string()) {
            message = (*err_it)["message"].get<std::string>();
        } else {
            message = err_it->dump();
        }
        return Response::failure(std::move(id), std::move(message));
    }
    auto res_it = obj.find("result");
    if (res_it == obj.end()) {
        return framing_error("Response has neither 'result' nor 'error'");
    }
    return Response::success(std::move(id), *res_it);
}

// ---------------------------------------------------------------------------
// LineBuffer
// ---------------------------------------------------------------------------
std::optional<std::string> LineBuffer::next_line() {
    size_t pos = buffer_.find('\n');
    if (pos == std::string::npos) return std::nullopt;

    std::string line = buffer_.substr(0, pos);
    buffer_.erase(0, pos + 1);

    if (!line.empty() && line.back() == '\r') line.pop_back();
    return line;
}

bool LineBuffer::overflowed() const {
    return max_pending_ > 0 && buffer_.size() > max_pending_ &&
           buffer_.find('\n') == std::string::npos;
}

} // namespace phonebridge::rpc
