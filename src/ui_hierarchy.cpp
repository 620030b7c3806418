// =============================================================================
// PhoneBridge - UI Hierarchy & Coordinate Model
// =============================================================================

#include "ui_hierarchy.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <cstdio>
#include <climits>
#include <map>
#include <regex>

namespace phonebridge::ui {

namespace {

std::string trim(const std::string& s) {
    const char* ws = " \t\r\n\f\v";
    size_t start = s.find_first_not_of(ws);
    if (start == std::string::npos) return "";
    size_t end = s.find_last_not_of(ws);
    return s.substr(start, end - start + 1);
}

int round_to_pixel(double v) {
    double r = std::nearbyint(v);
    if (r > static_cast<double>(INT_MAX)) return INT_MAX;
    if (r < static_cast<double>(INT_MIN)) return INT_MIN;
    return static_cast<int>(r);
}

// JSON string literal with non-ASCII escaped as \uXXXX
std::string quote(const std::string& s) {
    return nlohmann::json(s).dump(-1, ' ', true, nlohmann::json::error_handler_t::replace);
}

void append_utf8(std::string& out, unsigned long cp) {
    if (cp < 0x80) {
        out += static_cast<char>(cp);
    } else if (cp < 0x800) {
        out += static_cast<char>(0xC0 | (cp >> 6));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else if (cp < 0x10000) {
        out += static_cast<char>(0xE0 | (cp >> 12));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else if (cp <= 0x10FFFF) {
        out += static_cast<char>(0xF0 | (cp >> 18));
        out += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    }
}

// &amp; &lt; &gt; &quot; &apos; &#N; &#xN;  (unknown entities are kept verbatim)
std::string decode_entities(const std::string& in) {
    if (in.find('&') == std::string::npos) return in;

    std::string out;
    out.reserve(in.size());
    for (size_t i = 0; i < in.size(); ++i) {
        if (in[i] != '&') { out += in[i]; continue; }
        size_t semi = in.find(';', i);
        if (semi == std::string::npos || semi - i > 10) { out += in[i]; continue; }
        std::string ent = in.substr(i + 1, semi - i - 1);
        if (ent == "amp")       out += '&';
        else if (ent == "lt")   out += '<';
        else if (ent == "gt")   out += '>';
        else if (ent == "quot") out += '"';
        else if (ent == "apos") out += '\'';
        else if (ent.size() > 1 && ent[0] == '#') {
            char* end = nullptr;
            unsigned long cp = (ent[1] == 'x' || ent[1] == 'X')
                ? std::strtoul(ent.c_str() + 2, &end, 16)
                : std::strtoul(ent.c_str() + 1, &end, 10);
            if (end == nullptr || *end != '\0') { out += in[i]; continue; }
            append_utf8(out, cp);
        } else {
            out += in[i];
            continue;
        }
        i = semi;
    }
    return out;
}

// --- element construction ---------------------------------------------------

UiNode make_node(const std::string& tag, const std::map<std::string, std::string>& attrs) {
    auto get = [&attrs](const char* key) -> std::string {
        auto it = attrs.find(key);
        return it == attrs.end() ? std::string() : it->second;
    };

    UiNode node;
    node.tag = tag;

    std::string cls = attrs.count("class") ? get("class") : std::string("Node");
    size_t dot = cls.rfind('.');
    node.class_name = (dot == std::string::npos) ? cls : cls.substr(dot + 1);
    if (node.class_name.empty()) node.class_name = "Node";

    node.text        = trim(get("text"));
    node.description = trim(get("content-desc"));
    node.identifier  = trim(get("resource-id"));
    node.frame       = parse_bounds(trim(get("bounds")));
    node.clickable   = trim(get("clickable")) == "true";
    return node;
}

// Parses `name="value" name2='value2'` up to the end of the tag.
Result<std::map<std::string, std::string>> parse_attributes(const std::string& body) {
    std::map<std::string, std::string> attrs;
    size_t i = 0;
    while (i < body.size()) {
        while (i < body.size() && std::isspace(static_cast<unsigned char>(body[i]))) ++i;
        if (i >= body.size()) break;

        size_t name_start = i;
        while (i < body.size() && body[i] != '=' &&
               !std::isspace(static_cast<unsigned char>(body[i]))) ++i;
        std::string name = body.substr(name_start, i - name_start);
        while (i < body.size() && std::isspace(static_cast<unsigned char>(body[i]))) ++i;
        if (name.empty() || i >= body.size() || body[i] != '=') {
            return tool_error("failed to parse UI hierarchy XML: malformed attribute near '" +
                              body.substr(name_start, 40) + "'");
        }
        ++i;
        while (i < body.size() && std::isspace(static_cast<unsigned char>(body[i]))) ++i;
        if (i >= body.size() || (body[i] != '"' && body[i] != '\'')) {
            return tool_error("failed to parse UI hierarchy XML: unquoted value for '" + name + "'");
        }
        char quote_char = body[i++];
        size_t close = body.find(quote_char, i);
        if (close == std::string::npos) {
            return tool_error("failed to parse UI hierarchy XML: unterminated value for '" + name + "'");
        }
        attrs[name] = decode_entities(body.substr(i, close - i));
        i = close + 1;
    }
    return attrs;
}

} // anonymous namespace

// =============================================================================
// Rect encodings
// =============================================================================

Result<Rect> parse_rect(const std::string& text) {
    static const std::regex coord_regex(
        R"(\{\{\s*([-+]?\d+(?:\.\d+)?)\s*,\s*([-+]?\d+(?:\.\d+)?)\s*\},\s*\{\s*([-+]?\d+(?:\.\d+)?)\s*,\s*([-+]?\d+(?:\.\d+)?)\s*\}\})");

    std::string trimmed = trim(text);
    std::smatch match;
    if (!std::regex_match(trimmed, match, coord_regex)) {
        return validation_error("coordinate must look like {{x, y}, {w, h}}; got '" + text + "'");
    }

    Rect r;
    try {
        r.x      = std::stod(match[1]);
        r.y      = std::stod(match[2]);
        r.width  = std::stod(match[3]);
        r.height = std::stod(match[4]);
    } catch (const std::exception&) {
        return validation_error("coordinate must look like {{x, y}, {w, h}}; got '" + text + "'");
    }
    return r;
}

std::string format_rect(double x, double y, double w, double h) {
    char buf[160];
    snprintf(buf, sizeof(buf), "{{%.1f, %.1f}, {%.1f, %.1f}}", x, y, w, h);
    return buf;
}

std::optional<Rect> parse_bounds(const std::string& text) {
    // 形式: [x1,y1][x2,y2]
    static const std::regex bounds_regex(R"(\[(-?\d+),(-?\d+)\]\[(-?\d+),(-?\d+)\])");
    std::string trimmed = trim(text);
    std::smatch match;
    if (!std::regex_match(trimmed, match, bounds_regex)) {
        return std::nullopt;
    }

    try {
        double x1 = static_cast<double>(std::stoll(match[1]));
        double y1 = static_cast<double>(std::stoll(match[2]));
        double x2 = static_cast<double>(std::stoll(match[3]));
        double y2 = static_cast<double>(std::stoll(match[4]));

        Rect r;
        r.x = x1;
        r.y = y1;
        r.width  = std::max(0.0, x2 - x1);
        r.height = std::max(0.0, y2 - y1);
        return r;
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

Point center_of(const Rect& r) {
    return Point{round_to_pixel(r.x + r.width / 2.0), round_to_pixel(r.y + r.height / 2.0)};
}

Result<Point> center_of_coordinate(const std::string& coordinate) {
    auto rect = parse_rect(coordinate);
    if (rect.is_err()) return rect.error();
    return center_of(rect.value());
}

// =============================================================================
// XML → tree
// =============================================================================

Result<UiNode> parse_ui_xml(const std::string& raw) {
    // adb may print warnings before the document
    size_t decl = raw.find("<?xml");
    std::string xml = (decl == std::string::npos) ? raw : raw.substr(decl);
    if (xml.find("<hierarchy") == std::string::npos) {
        return tool_error("uiautomator dump did not return XML hierarchy");
    }

    UiNode document;                  // synthetic parent of the root element
    std::vector<UiNode*> open{&document};
    bool saw_root = false;

    size_t i = 0;
    while (i < xml.size()) {
        size_t lt = xml.find('<', i);
        if (lt == std::string::npos) break;

        if (xml.compare(lt, 4, "<!--") == 0) {
            size_t end = xml.find("-->", lt + 4);
            if (end == std::string::npos) return tool_error("failed to parse UI hierarchy XML: unterminated comment");
            i = end + 3;
            continue;
        }
        if (xml.compare(lt, 2, "<?") == 0 || xml.compare(lt, 2, "<!") == 0) {
            size_t end = xml.find('>', lt);
            if (end == std::string::npos) return tool_error("failed to parse UI hierarchy XML: unterminated declaration");
            i = end + 1;
            continue;
        }

        // Find the closing '>' outside of quoted attribute values
        size_t gt = lt + 1;
        char in_quote = 0;
        for (; gt < xml.size(); ++gt) {
            char c = xml[gt];
            if (in_quote) { if (c == in_quote) in_quote = 0; }
            else if (c == '"' || c == '\'') in_quote = c;
            else if (c == '>') break;
        }
        if (gt >= xml.size()) {
            return tool_error("failed to parse UI hierarchy XML: unterminated tag");
        }

        std::string inner = xml.substr(lt + 1, gt - lt - 1);
        i = gt + 1;

        if (!inner.empty() && inner[0] == '/') {
            std::string name = trim(inner.substr(1));
            if (open.size() <= 1 || open.back()->tag != name) {
                return tool_error("failed to parse UI hierarchy XML: unexpected </" + name + ">");
            }
            open.pop_back();
            continue;
        }

        bool self_closing = !inner.empty() && inner.back() == '/';
        if (self_closing) inner.pop_back();

        size_t name_end = 0;
        while (name_end < inner.size() &&
               !std::isspace(static_cast<unsigned char>(inner[name_end]))) ++name_end;
        std::string tag = inner.substr(0, name_end);
        if (tag.empty()) {
            return tool_error("failed to parse UI hierarchy XML: empty tag name");
        }

        auto attrs = parse_attributes(inner.substr(name_end));
        if (attrs.is_err()) return attrs.error();

        if (open.size() == 1) {
            if (saw_root) return tool_error("failed to parse UI hierarchy XML: multiple root elements");
            saw_root = true;
        }

        UiNode* parent = open.back();
        parent->children.push_back(make_node(tag, attrs.value()));
        if (!self_closing) open.push_back(&parent->children.back());
    }

    if (open.size() > 1) {
        return tool_error("failed to parse UI hierarchy XML: unclosed <" + open.back()->tag + ">");
    }
    if (document.children.empty()) {
        return tool_error("failed to parse UI hierarchy XML: no root element");
    }
    return std::move(document.children.front());
}

// =============================================================================
// tree → text
// =============================================================================

namespace {

void render(const UiNode& node, int depth, std::string& out) {
    if (node.tag == "node") {
        const std::string& label = node.label();

        std::string line(static_cast<size_t>(depth) * 2, ' ');
        line += node.class_name;
        if (!label.empty()) {
            line += ", label: " + quote(label);
        }
        if (!node.description.empty() && node.description != label) {
            line += ", value: " + quote(node.description);
        }
        if (!node.identifier.empty()) {
            line += ", identifier: " + quote(node.identifier);
        }
        if (node.frame) {
            line += ", frame: " + format_rect(*node.frame);
        }
        if (node.clickable) {
            line += ", clickable: true";
        }

        out += '\n';
        out += line;
        ++depth;
    }

    for (const auto& child : node.children) {
        render(child, depth, out);
    }
}

} // anonymous namespace

std::string build_hierarchy_text(const UiNode& root) {
    std::string out = "Hierarchy";
    render(root, 0, out);
    return out;
}

Result<std::string> hierarchy_text_from_xml(const std::string& xml) {
    auto root = parse_ui_xml(xml);
    if (root.is_err()) return root.error();
    return build_hierarchy_text(root.value());
}

} // namespace phonebridge::ui
