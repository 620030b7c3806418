#pragma once
// =============================================================================
// PhoneBridge - RPC Client
// =============================================================================
// One request per connection: connect, write one line, read one line, close.
//
// Usage:
//   RpcClient client(opts);
//   auto tree = client.call("get_tree");
//   if (tree.is_ok()) puts(tree.value()["tree"].get<std::string>().c_str());
// =============================================================================

#include <string>
#include <optional>
#include <cstddef>

#include <nlohmann/json.hpp>

#include "result.hpp"
#include "rpc_protocol.hpp"

namespace phonebridge {

class RpcClient {
public:
    struct Options {
        std::string host = rpc::DEFAULT_HOST;
        int port = rpc::DEFAULT_PORT;
        int connect_timeout_ms = 5000;
        int read_timeout_ms = 30000;
        size_t max_bytes = rpc::DEFAULT_MAX_LINE_BYTES;
    };

    explicit RpcClient(Options options) : options_(std::move(options)) {}

    // Raw exchange: returns the response line without its '\n'
    Result<std::string> exchange(const std::string& request_line);

    // Full envelope as sent by the server ({"id", "result"} or {"id", "error"})
    Result<nlohmann::json> call_envelope(const rpc::Request& req);

    // `result` on success; a server-side error becomes a ToolError with the
    // server's message. Ids increase from 1 per client.
    Result<nlohmann::json> call(const std::string& method,
                                nlohmann::json params = nlohmann::json::object());

    const Options& options() const { return options_; }

private:
    Options options_;
    long long next_id_ = 1;
};

// --- response helpers (used by the CLI) ---

// json: whole envelope, result: `result` only, tree: result.tree falling back
// to the envelope
enum class PrintMode { Json, Result, Tree };

std::optional<PrintMode> parse_print_mode(const std::string& name);

std::string render_response(const nlohmann::json& envelope, PrintMode mode, bool pretty);

// Parses a --params / REPL argument. Empty text is {}; anything that is not
// a JSON object is a ValidationError.
Result<nlohmann::json> parse_params_object(const std::string& text);

// result.tree when it is a string
std::optional<std::string> extract_tree(const nlohmann::json& envelope);

// error.message (or the dumped error object); nullopt when there is no error
std::optional<std::string> extract_error(const nlohmann::json& envelope);

// Decodes base64 and writes <dir>/<epoch>_<kind>_<id>.png; returns the path
Result<std::string> save_screenshot(const std::string& dir, const std::string& kind,
                                    const std::string& id, const std::string& base64_png);

} // namespace phonebridge
