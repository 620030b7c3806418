// =============================================================================
// PhoneBridge - Automation Dispatcher
// =============================================================================

#include "automation_dispatcher.hpp"
#include "adb_security.hpp"
#include "screen_image.hpp"
#include "ui_hierarchy.hpp"
#include "phonebridge_log.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cmath>
#include <climits>
#include <stdexcept>
#include <thread>

namespace phonebridge {

namespace {

std::string trim(const std::string& s) {
    const char* ws = " \t\r\n\f\v";
    size_t start = s.find_first_not_of(ws);
    if (start == std::string::npos) return "";
    size_t end = s.find_last_not_of(ws);
    return s.substr(start, end - start + 1);
}

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

void settle(int ms) {
    if (ms > 0) std::this_thread::sleep_for(std::chrono::milliseconds(ms));
}

Error missing(const std::string& key) {
    return validation_error("missing parameter '" + key + "'");
}

} // anonymous namespace

// =============================================================================
// Parameter extraction
// =============================================================================
namespace rpc_params {

Result<double> number(const json& p, const std::string& key) {
    auto it = p.find(key);
    if (it == p.end()) return missing(key);

    const json& v = *it;
    if (v.is_boolean()) return v.get<bool>() ? 1.0 : 0.0;
    if (v.is_number()) return v.get<double>();
    if (v.is_string()) {
        std::string s = trim(v.get<std::string>());
        try {
            size_t used = 0;
            double d = std::stod(s, &used);
            if (used == s.size() && std::isfinite(d)) return d;
        } catch (const std::exception&) {
        }
    }
    return validation_error("parameter '" + key + "' must be a number");
}

Result<int> rounded_int(const json& p, const std::string& key) {
    auto n = number(p, key);
    if (n.is_err()) return n.error();
    double r = std::nearbyint(n.value());
    if (r > static_cast<double>(INT_MAX) || r < static_cast<double>(INT_MIN)) {
        return validation_error("parameter '" + key + "' is out of range");
    }
    return static_cast<int>(r);
}

Result<std::string> text(const json& p, const std::string& key) {
    auto it = p.find(key);
    if (it == p.end()) return missing(key);
    if (!it->is_string()) {
        return validation_error("parameter '" + key + "' must be a string");
    }
    return it->get<std::string>();
}

Result<int> integer_or(const json& p, const std::string& key, int def) {
    auto it = p.find(key);
    if (it == p.end()) return def;

    const json& v = *it;
    if (v.is_boolean()) return v.get<bool>() ? 1 : 0;
    if (v.is_number_integer()) {
        auto i = v.get<long long>();
        if (i < INT_MIN || i > INT_MAX) {
            return validation_error("parameter '" + key + "' is out of range");
        }
        return static_cast<int>(i);
    }
    if (v.is_number_float()) {
        double d = v.get<double>();
        if (!std::isfinite(d) || d < INT_MIN || d > INT_MAX) {
            return validation_error("parameter '" + key + "' is out of range");
        }
        return static_cast<int>(std::trunc(d));
    }
    if (v.is_string()) {
        std::string s = trim(v.get<std::string>());
        try {
            size_t used = 0;
            int i = std::stoi(s, &used);
            if (used == s.size()) return i;
        } catch (const std::exception&) {
        }
    }
    return validation_error("parameter '" + key + "' must be an integer");
}

bool truthy_or(const json& p, const std::string& key, bool def) {
    auto it = p.find(key);
    if (it == p.end()) return def;

    const json& v = *it;
    if (v.is_null()) return false;
    if (v.is_boolean()) return v.get<bool>();
    if (v.is_number()) return v.get<double>() != 0.0;
    if (v.is_string()) return !v.get_ref<const std::string&>().empty();
    return !v.empty();   // array / object
}

} // namespace rpc_params

// =============================================================================
// Registry
// =============================================================================

const std::vector<std::string>& AutomationDispatcher::method_catalog() {
    static const std::vector<std::string> catalog = {
        "get_tree", "get_screen_image", "get_context",
        "tap", "tap_element", "enter_text", "scroll", "swipe", "open_app",
        "set_api_key", "submit_prompt", "stop",
    };
    return catalog;
}

AutomationDispatcher::AutomationDispatcher(DeviceAutomation& device)
    : AutomationDispatcher(device, Options{}) {}

AutomationDispatcher::AutomationDispatcher(DeviceAutomation& device, Options options)
    : device_(device), options_(options) {
    register_handlers();
    validate_registry();
}

void AutomationDispatcher::register_handlers() {
    using namespace std::placeholders;
    handlers_["get_tree"]         = std::bind(&AutomationDispatcher::handle_get_tree, this, _1, _2);
    handlers_["get_screen_image"] = std::bind(&AutomationDispatcher::handle_get_screen_image, this, _1, _2);
    handlers_["get_context"]      = std::bind(&AutomationDispatcher::handle_get_context, this, _1, _2);
    handlers_["tap"]              = std::bind(&AutomationDispatcher::handle_tap, this, _1, _2);
    handlers_["tap_element"]      = std::bind(&AutomationDispatcher::handle_tap_element, this, _1, _2);
    handlers_["enter_text"]       = std::bind(&AutomationDispatcher::handle_enter_text, this, _1, _2);
    handlers_["scroll"]           = std::bind(&AutomationDispatcher::handle_scroll, this, _1, _2);
    handlers_["swipe"]            = std::bind(&AutomationDispatcher::handle_swipe, this, _1, _2);
    handlers_["open_app"]         = std::bind(&AutomationDispatcher::handle_open_app, this, _1, _2);
    handlers_["set_api_key"]      = std::bind(&AutomationDispatcher::handle_set_api_key, this, _1, _2);
    handlers_["submit_prompt"]    = std::bind(&AutomationDispatcher::handle_submit_prompt, this, _1, _2);
    handlers_["stop"]             = std::bind(&AutomationDispatcher::handle_stop, this, _1, _2);
}

void AutomationDispatcher::validate_registry() const {
    for (const auto& method : method_catalog()) {
        auto it = handlers_.find(method);
        if (it == handlers_.end() || !it->second) {
            throw std::logic_error("no handler registered for method '" + method + "'");
        }
    }
    if (handlers_.size() != method_catalog().size()) {
        throw std::logic_error("handler registered for a method outside the catalog");
    }
}

Result<DispatchOutcome> AutomationDispatcher::dispatch(const std::string& method,
                                                       const json& params, Session& session) {
    auto it = handlers_.find(method);
    if (it == handlers_.end()) {
        return validation_error("Unsupported command: " + method);
    }
    PBLOG_DEBUG("dispatch", "%s", method.c_str());

    const json& p = params.is_object() ? params : json::object();
    auto outcome = it->second(p, session);
    if (outcome.is_err()) {
        PBLOG_INFO("dispatch", "%s failed (%s): %s", method.c_str(),
                   errorKindName(outcome.error().kind), outcome.error().message.c_str());
    }
    return outcome;
}

// =============================================================================
// Shared steps
// =============================================================================

Result<std::string> AutomationDispatcher::current_tree() {
    auto xml = device_.capture_hierarchy();
    if (xml.is_err()) return xml.error();
    return ui::hierarchy_text_from_xml(xml.value());
}

Result<json> AutomationDispatcher::screen_image_payload() {
    auto png = device_.capture_screen_image();
    if (png.is_err()) return png.error();

    const std::string& bytes = png.value();
    if (!image::is_png(bytes)) {
        return tool_error("device screencap did not return PNG bytes");
    }

    json payload = json::object();
    payload["screenshot_base64"] = image::base64_encode(bytes);
    if (auto dims = image::read_png_dimensions(bytes)) {
        payload["metadata"] = {{"width", dims->width}, {"height", dims->height}};
    }
    return payload;
}

static DispatchOutcome tree_outcome(std::string tree) {
    DispatchOutcome out;
    out.result["tree"] = std::move(tree);
    return out;
}

// =============================================================================
// Observation
// =============================================================================

Result<DispatchOutcome> AutomationDispatcher::handle_get_tree(const json&, Session&) {
    auto tree = current_tree();
    if (tree.is_err()) return tree.error();
    return tree_outcome(std::move(tree).value());
}

Result<DispatchOutcome> AutomationDispatcher::handle_get_screen_image(const json&, Session&) {
    auto payload = screen_image_payload();
    if (payload.is_err()) return payload.error();

    DispatchOutcome out;
    out.result = std::move(payload).value();
    return out;
}

Result<DispatchOutcome> AutomationDispatcher::handle_get_context(const json&, Session&) {
    auto tree = current_tree();
    if (tree.is_err()) return tree.error();
    auto payload = screen_image_payload();
    if (payload.is_err()) return payload.error();

    DispatchOutcome out;
    out.result["tree"] = std::move(tree).value();
    for (auto& item : payload.value().items()) {
        out.result[item.key()] = item.value();
    }
    return out;
}

// =============================================================================
// Input
// =============================================================================

Result<DispatchOutcome> AutomationDispatcher::handle_tap(const json& params, Session&) {
    auto x = rpc_params::rounded_int(params, "x");
    if (x.is_err()) return x.error();
    auto y = rpc_params::rounded_int(params, "y");
    if (y.is_err()) return y.error();

    auto sent = device_.send_tap(x.value(), y.value());
    if (sent.is_err()) return sent.error();

    auto tree = current_tree();
    if (tree.is_err()) return tree.error();
    return tree_outcome(std::move(tree).value());
}

Result<DispatchOutcome> AutomationDispatcher::handle_tap_element(const json& params, Session&) {
    auto coordinate = rpc_params::text(params, "coordinate");
    if (coordinate.is_err()) return coordinate.error();
    auto count = rpc_params::integer_or(params, "count", 1);
    if (count.is_err()) return count.error();
    bool long_press = rpc_params::truthy_or(params, "longPress", false);

    if (count.value() < 1) {
        return validation_error("count must be >= 1");
    }
    auto center = ui::center_of_coordinate(coordinate.value());
    if (center.is_err()) return center.error();
    const ui::Point pt = center.value();

    int effective_count = count.value();
    if (long_press) {
        // zero-travel swipe
        auto sent = device_.send_swipe(pt.x, pt.y, pt.x, pt.y, options_.long_press_ms);
        if (sent.is_err()) return sent.error();
        effective_count = 1;
    } else {
        for (int i = 0; i < effective_count; ++i) {
            auto sent = device_.send_tap(pt.x, pt.y);
            if (sent.is_err()) return sent.error();
        }
    }

    auto tree = current_tree();
    if (tree.is_err()) return tree.error();

    DispatchOutcome out;
    out.result["coordinate"] = coordinate.value();
    out.result["count"] = effective_count;
    out.result["longPress"] = long_press;
    out.result["tree"] = std::move(tree).value();
    return out;
}

Result<DispatchOutcome> AutomationDispatcher::handle_enter_text(const json& params, Session&) {
    auto coordinate = rpc_params::text(params, "coordinate");
    if (coordinate.is_err()) return coordinate.error();
    auto text = rpc_params::text(params, "text");
    if (text.is_err()) return text.error();

    auto center = ui::center_of_coordinate(coordinate.value());
    if (center.is_err()) return center.error();

    auto focused = device_.send_tap(center.value().x, center.value().y);
    if (focused.is_err()) return focused.error();
    settle(options_.focus_settle_ms);

    // Lines are typed separately with a newline key event between them
    const std::string& body = text.value();
    if (!body.empty()) {
        size_t start = 0;
        for (;;) {
            size_t nl = body.find('\n', start);
            std::string line = body.substr(start, nl == std::string::npos ? std::string::npos : nl - start);
            for (const auto& chunk : security::chunkUtf8(line, options_.text_chunk_chars)) {
                auto sent = device_.send_text(chunk);
                if (sent.is_err()) return sent.error();
            }
            if (nl == std::string::npos) break;
            auto key = device_.send_key_event(options_.enter_key_code);
            if (key.is_err()) return key.error();
            start = nl + 1;
        }
    }

    auto enter = device_.send_key_event(options_.enter_key_code);
    if (enter.is_err()) return enter.error();

    auto tree = current_tree();
    if (tree.is_err()) return tree.error();

    DispatchOutcome out;
    out.result["coordinate"] = coordinate.value();
    out.result["tree"] = std::move(tree).value();
    return out;
}

Result<DispatchOutcome> AutomationDispatcher::handle_scroll(const json& params, Session&) {
    auto x = rpc_params::rounded_int(params, "x");
    if (x.is_err()) return x.error();
    auto y = rpc_params::rounded_int(params, "y");
    if (y.is_err()) return y.error();
    auto dx = rpc_params::rounded_int(params, "distanceX");
    if (dx.is_err()) return dx.error();
    auto dy = rpc_params::rounded_int(params, "distanceY");
    if (dy.is_err()) return dy.error();

    auto size = device_.query_screen_size();
    if (size.is_err()) return size.error();
    const ScreenSize screen = size.value();

    long long tx = static_cast<long long>(x.value()) + dx.value();
    long long ty = static_cast<long long>(y.value()) + dy.value();
    int x2 = static_cast<int>(std::max<long long>(0, std::min<long long>(tx, screen.width - 1)));
    int y2 = static_cast<int>(std::max<long long>(0, std::min<long long>(ty, screen.height - 1)));

    auto sent = device_.send_swipe(x.value(), y.value(), x2, y2, options_.gesture_ms);
    if (sent.is_err()) return sent.error();

    auto tree = current_tree();
    if (tree.is_err()) return tree.error();
    return tree_outcome(std::move(tree).value());
}

Result<DispatchOutcome> AutomationDispatcher::handle_swipe(const json& params, Session&) {
    auto x = rpc_params::rounded_int(params, "x");
    if (x.is_err()) return x.error();
    auto y = rpc_params::rounded_int(params, "y");
    if (y.is_err()) return y.error();
    auto dir = rpc_params::text(params, "direction");
    if (dir.is_err()) return dir.error();

    std::string direction = to_lower(trim(dir.value()));
    if (direction != "up" && direction != "down" && direction != "left" && direction != "right") {
        return validation_error("direction must be one of: up, down, left, right");
    }

    auto size = device_.query_screen_size();
    if (size.is_err()) return size.error();
    const ScreenSize screen = size.value();

    const int span = std::max(180, std::min(screen.width, screen.height) / 2);
    long long x2 = x.value();
    long long y2 = y.value();
    if (direction == "up")         y2 -= span;
    else if (direction == "down")  y2 += span;
    else if (direction == "left")  x2 -= span;
    else                           x2 += span;

    int cx = static_cast<int>(std::max<long long>(0, std::min<long long>(x2, screen.width - 1)));
    int cy = static_cast<int>(std::max<long long>(0, std::min<long long>(y2, screen.height - 1)));

    auto sent = device_.send_swipe(x.value(), y.value(), cx, cy, options_.gesture_ms);
    if (sent.is_err()) return sent.error();

    auto tree = current_tree();
    if (tree.is_err()) return tree.error();
    return tree_outcome(std::move(tree).value());
}

// =============================================================================
// Apps
// =============================================================================

Result<DispatchOutcome> AutomationDispatcher::handle_open_app(const json& params, Session&) {
    // bundle_identifier wins; package_name is accepted as an alias
    auto pick = [&params](const char* key) -> std::string {
        auto it = params.find(key);
        if (it == params.end() || it->is_null()) return "";
        if (it->is_string()) return it->get<std::string>();
        if (it->is_boolean() && !it->get<bool>()) return "";
        return it->dump();
    };
    std::string package = trim(pick("bundle_identifier"));
    if (package.empty()) package = trim(pick("package_name"));

    if (package.empty()) {
        return validation_error("bundle_identifier is required");
    }
    if (!security::isValidPackageName(package)) {
        return validation_error("bundle_identifier '" + package + "' is not a valid Android package name");
    }

    // Primary: resolved launcher activity. Fallback: generic launcher intent.
    bool launched = false;
    auto target = device_.resolve_launch_target(package);
    if (target.is_ok() && !target.value().empty()) {
        auto started = device_.launch_component(target.value());
        if (started.is_ok()) {
            launched = true;
        } else {
            PBLOG_INFO("dispatch", "open_app %s: component start failed, falling back: %s",
                       package.c_str(), started.error().message.c_str());
        }
    } else if (target.is_err()) {
        PBLOG_INFO("dispatch", "open_app %s: resolve failed, falling back: %s",
                   package.c_str(), target.error().message.c_str());
    }
    if (!launched) {
        auto fallback = device_.launch_package(package);
        if (fallback.is_err()) return fallback.error();
    }

    settle(options_.launch_settle_ms);

    auto foreground = device_.query_foreground_app();
    if (foreground.is_err()) return foreground.error();
    if (!foreground.value().empty() && foreground.value() != package) {
        return tool_error("failed to foreground app '" + package +
                          "' (current foreground package: '" + foreground.value() + "')");
    }

    auto tree = current_tree();
    if (tree.is_err()) return tree.error();

    DispatchOutcome out;
    out.result["bundle_identifier"] = package;
    out.result["package_name"] = package;
    out.result["tree"] = std::move(tree).value();
    return out;
}

// =============================================================================
// Session / control
// =============================================================================

Result<DispatchOutcome> AutomationDispatcher::handle_set_api_key(const json& params, Session& session) {
    auto key = rpc_params::text(params, "api_key");
    if (key.is_err()) return key.error();

    std::string trimmed = trim(key.value());
    if (trimmed.empty()) {
        return validation_error("api_key is required");
    }
    session.api_key = std::move(trimmed);

    DispatchOutcome out;
    out.result["ok"] = true;
    return out;
}

Result<DispatchOutcome> AutomationDispatcher::handle_submit_prompt(const json&, Session& session) {
    if (!session.api_key) {
        return validation_error("No API key found");
    }
    return tool_error("submit_prompt is not yet supported on this bridge; use RPC tool methods directly");
}

Result<DispatchOutcome> AutomationDispatcher::handle_stop(const json&, Session&) {
    DispatchOutcome out;
    out.stop = true;
    return out;
}

} // namespace phonebridge
