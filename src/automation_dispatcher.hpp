#pragma once
// =============================================================================
// PhoneBridge - Automation Dispatcher
// =============================================================================
// Maps an RPC method name + params onto DeviceAutomation calls.
//
// Methods:
//   get_tree, get_screen_image, get_context
//   tap, tap_element, enter_text, scroll, swipe, open_app
//   set_api_key, submit_prompt, stop
//
// Every UI-mutating method returns a fresh hierarchy snapshot under "tree".
// The only state carried between calls lives in the caller's Session.
// =============================================================================

#include <string>
#include <vector>
#include <map>
#include <optional>
#include <functional>

#include <nlohmann/json.hpp>

#include "result.hpp"
#include "device_automation.hpp"

namespace phonebridge {

using json = nlohmann::json;

// Per-connection state. Owned by the connection handler, never shared.
struct Session {
    std::optional<std::string> api_key;
};

struct DispatchOutcome {
    json result = json::object();
    bool stop = false;          // listener shuts down after the response is written
};

class AutomationDispatcher {
public:
    struct Options {
        int focus_settle_ms = 200;      // after the focus tap in enter_text
        int launch_settle_ms = 800;     // before the foreground check in open_app
        int long_press_ms = 550;
        int gesture_ms = 220;           // scroll / swipe duration
        int enter_key_code = 66;
        size_t text_chunk_chars = 80;
    };

    using Handler = std::function<Result<DispatchOutcome>(const json& params, Session& session)>;

    // Throws std::logic_error when a catalog method has no handler.
    explicit AutomationDispatcher(DeviceAutomation& device);
    AutomationDispatcher(DeviceAutomation& device, Options options);

    Result<DispatchOutcome> dispatch(const std::string& method, const json& params, Session& session);

    // Method names served, in catalog order
    static const std::vector<std::string>& method_catalog();

private:
    void register_handlers();
    void validate_registry() const;

    Result<std::string> current_tree();
    Result<json> screen_image_payload();

    Result<DispatchOutcome> handle_get_tree(const json& params, Session& session);
    Result<DispatchOutcome> handle_get_screen_image(const json& params, Session& session);
    Result<DispatchOutcome> handle_get_context(const json& params, Session& session);
    Result<DispatchOutcome> handle_tap(const json& params, Session& session);
    Result<DispatchOutcome> handle_tap_element(const json& params, Session& session);
    Result<DispatchOutcome> handle_enter_text(const json& params, Session& session);
    Result<DispatchOutcome> handle_scroll(const json& params, Session& session);
    Result<DispatchOutcome> handle_swipe(const json& params, Session& session);
    Result<DispatchOutcome> handle_open_app(const json& params, Session& session);
    Result<DispatchOutcome> handle_set_api_key(const json& params, Session& session);
    Result<DispatchOutcome> handle_submit_prompt(const json& params, Session& session);
    Result<DispatchOutcome> handle_stop(const json& params, Session& session);

    DeviceAutomation& device_;
    Options options_;
    std::map<std::string, Handler> handlers_;
};

// =============================================================================
// Parameter extraction
// =============================================================================
namespace rpc_params {

// JSON number, bool or numeric string
Result<double> number(const json& p, const std::string& key);
// number() rounded to the nearest integer (ties to even)
Result<int> rounded_int(const json& p, const std::string& key);
Result<std::string> text(const json& p, const std::string& key);
// Integer, bool or integer string; `def` when absent
Result<int> integer_or(const json& p, const std::string& key, int def);
// JSON truthiness; `def` when absent
bool truthy_or(const json& p, const std::string& key, bool def);

} // namespace rpc_params

} // namespace phonebridge
