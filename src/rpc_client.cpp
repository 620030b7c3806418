// =============================================================================
// PhoneBridge - RPC Client
// =============================================================================

#include "rpc_client.hpp"
#include "net_socket.hpp"
#include "screen_image.hpp"
#include "phonebridge_log.hpp"

#include <cerrno>
#include <cstring>
#include <ctime>
#include <filesystem>
#include <fstream>

#include <sys/socket.h>

namespace phonebridge {

using json = nlohmann::json;
namespace fs = std::filesystem;

Result<std::string> RpcClient::exchange(const std::string& request_line) {
    auto sock = net::connect_with_timeout(options_.host, options_.port, options_.connect_timeout_ms);
    if (sock.is_err()) {
        return transport_error("Failed to connect to " + options_.host + ":" +
                               std::to_string(options_.port) + ": " + sock.error().message);
    }
    net::UniqueSocket conn = std::move(sock).value();

    std::string payload = request_line;
    if (payload.empty() || payload.back() != '\n') payload += '\n';
    if (!net::write_all(conn.get(), payload)) {
        return transport_error(std::string("send failed: ") + std::strerror(errno));
    }

    std::string line;
    char buf[65536];
    for (;;) {
        if (line.size() > options_.max_bytes) {
            return transport_error("Response exceeded max size (" +
                                   std::to_string(options_.max_bytes) + " bytes).");
        }

        auto wait = net::wait_readable(conn.get(), options_.read_timeout_ms);
        if (wait == net::WaitResult::Timeout) {
            return transport_error("timed out waiting for response after " +
                                   std::to_string(options_.read_timeout_ms) + "ms");
        }
        if (wait == net::WaitResult::Error) {
            return transport_error(std::string("poll failed: ") + std::strerror(errno));
        }

        ssize_t n = ::recv(conn.get(), buf, sizeof(buf), 0);
        if (n < 0 && errno == EINTR) continue;
        if (n < 0) return transport_error(std::string("recv failed: ") + std::strerror(errno));
        if (n == 0) break;

        const char* nl = static_cast<const char*>(std::memchr(buf, '\n', static_cast<size_t>(n)));
        if (nl) {
            line.append(buf, static_cast<size_t>(nl - buf));
            break;
        }
        line.append(buf, static_cast<size_t>(n));
    }

    if (!line.empty() && line.back() == '\r') line.pop_back();
    if (line.empty()) {
        return transport_error("Empty response (server closed the connection).");
    }
    return line;
}

Result<json> RpcClient::call_envelope(const rpc::Request& req) {
    auto line = exchange(rpc::encode_request(req));
    if (line.is_err()) return line.error();

    json envelope = json::parse(line.value(), nullptr, false);
    if (envelope.is_discarded() || !envelope.is_object()) {
        return framing_error("Invalid JSON response. Head=" + line.value().substr(0, 200));
    }
    return envelope;
}

Result<json> RpcClient::call(const std::string& method, json params) {
    rpc::Request req;
    req.id = next_id_++;
    req.method = method;
    req.params = std::move(params);

    auto line = exchange(rpc::encode_request(req));
    if (line.is_err()) return line.error();

    auto resp = rpc::decode_response(line.value());
    if (resp.is_err()) return resp.error();
    if (resp.value().is_error()) {
        return tool_error(*resp.value().error_message);
    }
    return resp.value().result;
}

// ---------------------------------------------------------------------------
// Helpers
// ---------------------------------------------------------------------------
std::optional<std::string> extract_tree(const json& envelope) {
    auto result = envelope.find("result");
    if (result == envelope.end() || !result->is_object()) return std::nullopt;
    auto tree = result->find("tree");
    if (tree == result->end() || !tree->is_string()) return std::nullopt;
    return tree->get<std::string>();
}

std::optional<PrintMode> parse_print_mode(const std::string& name) {
    if (name == "json") return PrintMode::Json;
    if (name == "result") return PrintMode::Result;
    if (name == "tree") return PrintMode::Tree;
    return std::nullopt;
}

std::string render_response(const json& envelope, PrintMode mode, bool pretty) {
    const int indent = pretty ? 2 : -1;
    switch (mode) {
        case PrintMode::Result: {
            auto it = envelope.find("result");
            return it == envelope.end() ? json().dump(indent) : it->dump(indent);
        }
        case PrintMode::Tree: {
            auto tree = extract_tree(envelope);
            if (tree) return *tree;
            return envelope.dump(indent);
        }
        case PrintMode::Json:
            break;
    }
    return envelope.dump(indent);
}

Result<json> parse_params_object(const std::string& text) {
    size_t start = text.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return json::object();

    json params = json::parse(text, nullptr, false);
    if (params.is_discarded()) {
        return validation_error("--params is not valid JSON: " + text.substr(start, 200));
    }
    if (!params.is_object()) {
        return validation_error("--params must be a JSON object");
    }
    return params;
}

std::optional<std::string> extract_error(const json& envelope) {
    auto err = envelope.find("error");
    if (err == envelope.end()) return std::nullopt;
    if (err->is_object()) {
        auto msg = err->find("message");
        if (msg != err->end()) {
            return msg->is_string() ? msg->get<std::string>() : msg->dump();
        }
    }
    return err->dump();
}

Result<std::string> save_screenshot(const std::string& dir, const std::string& kind,
                                    const std::string& id, const std::string& base64_png) {
    auto png = image::base64_decode(base64_png);
    if (png.is_err()) return png.error();

    std::error_code ec;
    fs::create_directories(dir, ec);
    if (ec) {
        return internal_error("cannot create " + dir + ": " + ec.message());
    }

    std::string path = dir + "/" + std::to_string(static_cast<long long>(std::time(nullptr))) +
                       "_" + kind + "_" + id + ".png";
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out.is_open()) {
        return internal_error("cannot write " + path);
    }
    out.write(png.value().data(), static_cast<std::streamsize>(png.value().size()));
    if (!out) {
        return internal_error("short write to " + path);
    }
    return path;
}

} // namespace phonebridge
