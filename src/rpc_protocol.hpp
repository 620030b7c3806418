#pragma once
// =============================================================================
// PhoneBridge - RPC Wire Protocol
// =============================================================================
// Newline-delimited JSON shared by the bridge server, the forwarder's peers
// and the client.
//
// Request:  {"id": 1, "method": "tap", "params": {"x": 540, "y": 300}}
// Response: {"id": 1, "result": {"tree": "Hierarchy\n..."}}
//        or {"id": 1, "error": {"message": "..."}}
// =============================================================================

#include <string>
#include <optional>
#include <cstddef>

#include <nlohmann/json.hpp>

#include "result.hpp"

namespace phonebridge::rpc {

using json = nlohmann::json;

static constexpr int DEFAULT_PORT = 45678;
static constexpr const char* DEFAULT_HOST = "127.0.0.1";
static constexpr size_t DEFAULT_MAX_LINE_BYTES = 10 * 1024 * 1024;

struct Request {
    json id;                        // opaque correlation token, echoed back
    std::string method;
    json params = json::object();
};

struct Response {
    json id;
    json result;                    // valid when error_message is empty
    std::optional<std::string> error_message;

    static Response success(json id, json result);
    static Response failure(json id, std::string message);

    bool is_error() const { return error_message.has_value(); }
};

// A line that could not be turned into a Request. `id` is whatever could be
// recovered from the line (null when the line was not even valid JSON).
struct FramingFailure : Error {
    json id;

    FramingFailure() : Error("", ErrorKind::Framing) {}
    FramingFailure(json req_id, std::string msg)
        : Error(std::move(msg), ErrorKind::Framing), id(std::move(req_id)) {}
};

// --- encode (compact, always '\n' terminated) ---
std::string encode_request(const Request& req);
std::string encode_response(const Response& resp);

// --- decode ---
Result<Request, FramingFailure> decode_request(const std::string& line);
Result<Response> decode_response(const std::string& line);

// =============================================================================
// LineBuffer - accumulates stream bytes and yields complete lines
// =============================================================================
class LineBuffer {
public:
    explicit LineBuffer(size_t max_pending = DEFAULT_MAX_LINE_BYTES)
        : max_pending_(max_pending) {}

    void append(const char* data, size_t len) { buffer_.append(data, len); }

    // Next complete line without the '\n' (and without a trailing '\r').
    std::optional<std::string> next_line();

    // True when the pending partial line exceeds the configured limit.
    bool overflowed() const;

    size_t pending() const { return buffer_.size(); }
    void clear() { buffer_.clear(); }

private:
    std::string buffer_;
    size_t max_pending_;
};

} // namespace phonebridge::rpc
