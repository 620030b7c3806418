#pragma once
// =============================================================================
// adb_security.hpp
//
// Input validation and escaping for everything that ends up on an adb
// command line (device serials, package names, `input text` payloads).
//
// These functions are the security boundary for all ADB command execution.
// =============================================================================

#include <string>
#include <vector>
#include <cstring>
#include <cctype>
#include <regex>

namespace phonebridge {
namespace security {

// Dangerous shell metacharacters that could enable command injection
constexpr const char* SHELL_METACHARACTERS = "|;&$`\\\"'<>(){}[]!#*?~\n\r";

// Characters the device-side shell of `input text` interprets
constexpr const char* INPUT_TEXT_SPECIALS = "\\\"'`()[]{}<>|;&*~$";

/**
 * Validate ADB device ID format.
 * Valid formats:
 *   - Serial number: alphanumeric, may include ':', '.', '-', '_'
 *   - IP:port: xxx.xxx.xxx.xxx:port
 *   - mDNS name: adb-XXXX-yyyy._adb-tls-connect._tcp
 *
 * @param adb_id  The device ID to validate
 * @return true if valid, false if potentially malicious
 */
inline bool isValidAdbId(const std::string& adb_id) {
    if (adb_id.empty() || adb_id.length() > 128) {
        return false;
    }

    for (char c : adb_id) {
        if (std::strchr(SHELL_METACHARACTERS, c) != nullptr) {
            return false;
        }
    }

    for (char c : adb_id) {
        if (!std::isalnum(static_cast<unsigned char>(c)) &&
            c != ':' && c != '.' && c != '-' && c != '_') {
            return false;
        }
    }

    return true;
}

/**
 * Reverse-DNS package name: two or more dot-separated segments, each
 * starting with a letter and containing only letters, digits or '_'.
 */
inline bool isValidPackageName(const std::string& package) {
    static const std::regex package_pattern(
        R"(^[A-Za-z][A-Za-z0-9_]*(?:\.[A-Za-z][A-Za-z0-9_]*)+$)");
    return std::regex_match(package, package_pattern);
}

/**
 * Escape one chunk for `adb shell input text`.
 * Spaces and tabs become "%s", shell specials are backslash-escaped.
 */
inline std::string escapeInputText(const std::string& text) {
    std::string escaped;
    escaped.reserve(text.size() * 2);
    for (char c : text) {
        if (c == ' ' || c == '\t') { escaped += "%s"; continue; }
        if (std::strchr(INPUT_TEXT_SPECIALS, c) != nullptr) {
            escaped += '\\';
        }
        escaped += c;
    }
    return escaped;
}

/**
 * Split text into chunks of at most max_chars code points.
 * Never splits a UTF-8 multi-byte sequence.
 */
inline std::vector<std::string> chunkUtf8(const std::string& text, size_t max_chars) {
    std::vector<std::string> chunks;
    if (text.empty() || max_chars == 0) return chunks;

    std::string current;
    size_t chars = 0;
    for (size_t i = 0; i < text.size();) {
        unsigned char lead = static_cast<unsigned char>(text[i]);
        size_t len = 1;
        if      ((lead & 0xE0) == 0xC0) len = 2;
        else if ((lead & 0xF0) == 0xE0) len = 3;
        else if ((lead & 0xF8) == 0xF0) len = 4;
        if (i + len > text.size()) len = text.size() - i;

        if (chars == max_chars) {
            chunks.push_back(std::move(current));
            current.clear();
            chars = 0;
        }
        current.append(text, i, len);
        ++chars;
        i += len;
    }
    if (!current.empty()) chunks.push_back(std::move(current));
    return chunks;
}

} // namespace security
} // namespace phonebridge
