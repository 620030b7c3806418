#pragma once
// =============================================================================
// PhoneBridge - UI Hierarchy & Coordinate Model
// =============================================================================
// uiautomator dump (XML) → UiNode tree → indented "Hierarchy" text.
//
// Two rectangle encodings:
//   bounds     "[x1,y1][x2,y2]"        (uiautomator attribute)
//   coordinate "{{x, y}, {w, h}}"      (RPC params/results, used as an
//                                       opaque element handle by callers)
// =============================================================================

#include <string>
#include <vector>
#include <optional>

#include "result.hpp"

namespace phonebridge::ui {

struct Rect {
    double x = 0.0;
    double y = 0.0;
    double width = 0.0;
    double height = 0.0;
};

struct Point {
    int x = 0;
    int y = 0;
};

/// "{{x, y}, {w, h}}" → Rect. Fails with a validation error naming the input.
Result<Rect> parse_rect(const std::string& text);

/// Rect → "{{x, y}, {w, h}}" with exactly one decimal place.
std::string format_rect(double x, double y, double w, double h);
inline std::string format_rect(const Rect& r) { return format_rect(r.x, r.y, r.width, r.height); }

/// "[x1,y1][x2,y2]" → Rect, or nullopt when the string does not match.
std::optional<Rect> parse_bounds(const std::string& text);

/// Center rounded to the nearest pixel (ties to even).
Point center_of(const Rect& r);
Result<Point> center_of_coordinate(const std::string& coordinate);

// =========================================================================
// UI node tree
// =========================================================================

struct UiNode {
    std::string tag;                // "node" for UI elements; other tags are containers
    std::string class_name;         // last dotted component of the class attribute
    std::string text;
    std::string description;        // content-desc
    std::string identifier;         // resource-id
    std::optional<Rect> frame;      // absent when bounds do not parse
    bool clickable = false;
    std::vector<UiNode> children;

    // Visible text wins over the accessibility description.
    const std::string& label() const { return text.empty() ? description : text; }
};

/// Parse a uiautomator window dump into a tree rooted at <hierarchy>.
Result<UiNode> parse_ui_xml(const std::string& xml);

/// Render the tree. First line is always "Hierarchy".
std::string build_hierarchy_text(const UiNode& root);

/// Convenience: parse_ui_xml + build_hierarchy_text.
Result<std::string> hierarchy_text_from_xml(const std::string& xml);

} // namespace phonebridge::ui
