// =============================================================================
// PhoneBridge - Screen Image Helpers
// =============================================================================

#include "screen_image.hpp"

#include <cstring>

namespace phonebridge::image {

namespace {

const char PNG_SIGNATURE[8] = {'\x89', 'P', 'N', 'G', '\r', '\n', '\x1a', '\n'};

const char B64_ALPHABET[] = "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

uint32_t read_be32(const std::string& s, size_t off) {
    return (static_cast<uint32_t>(static_cast<unsigned char>(s[off])) << 24) |
           (static_cast<uint32_t>(static_cast<unsigned char>(s[off + 1])) << 16) |
           (static_cast<uint32_t>(static_cast<unsigned char>(s[off + 2])) << 8) |
            static_cast<uint32_t>(static_cast<unsigned char>(s[off + 3]));
}

int b64_value(char c) {
    if (c >= 'A' && c <= 'Z') return c - 'A';
    if (c >= 'a' && c <= 'z') return c - 'a' + 26;
    if (c >= '0' && c <= '9') return c - '0' + 52;
    if (c == '+') return 62;
    if (c == '/') return 63;
    return -1;
}

} // anonymous namespace

bool is_png(const std::string& bytes) {
    return bytes.size() >= sizeof(PNG_SIGNATURE) &&
           std::memcmp(bytes.data(), PNG_SIGNATURE, sizeof(PNG_SIGNATURE)) == 0;
}

std::optional<ImageSize> read_png_dimensions(const std::string& bytes) {
    // signature(8) + length(4) + "IHDR"(4) + width(4) + height(4)
    if (!is_png(bytes) || bytes.size() < 24) return std::nullopt;
    if (bytes.compare(12, 4, "IHDR") != 0) return std::nullopt;

    uint32_t w = read_be32(bytes, 16);
    uint32_t h = read_be32(bytes, 20);
    if (w == 0 || h == 0 || w > 0x7FFFFFFF || h > 0x7FFFFFFF) return std::nullopt;
    return ImageSize{static_cast<int>(w), static_cast<int>(h)};
}

std::string base64_encode(const std::string& bytes) {
    const size_t size = bytes.size();
    std::string encoded;
    encoded.reserve(((size + 2) / 3) * 4);
    for (size_t i = 0; i < size; i += 3) {
        uint32_t n = static_cast<uint32_t>(static_cast<unsigned char>(bytes[i])) << 16;
        if (i + 1 < size) n |= static_cast<uint32_t>(static_cast<unsigned char>(bytes[i + 1])) << 8;
        if (i + 2 < size) n |= static_cast<unsigned char>(bytes[i + 2]);
        encoded += B64_ALPHABET[(n >> 18) & 0x3F];
        encoded += B64_ALPHABET[(n >> 12) & 0x3F];
        encoded += (i + 1 < size) ? B64_ALPHABET[(n >> 6) & 0x3F] : '=';
        encoded += (i + 2 < size) ? B64_ALPHABET[n & 0x3F] : '=';
    }
    return encoded;
}

Result<std::string> base64_decode(const std::string& text) {
    std::string out;
    out.reserve(text.size() / 4 * 3);

    uint32_t accum = 0;
    int bits = 0;
    size_t padding = 0;
    for (char c : text) {
        if (c == '\n' || c == '\r' || c == ' ' || c == '\t') continue;
        if (c == '=') { ++padding; continue; }
        if (padding > 0) {
            return Err<std::string>("base64: data after padding", ErrorKind::Framing);
        }
        int v = b64_value(c);
        if (v < 0) {
            return Err<std::string>(std::string("base64: invalid character '") + c + "'",
                                    ErrorKind::Framing);
        }
        accum = (accum << 6) | static_cast<uint32_t>(v);
        bits += 6;
        if (bits >= 8) {
            bits -= 8;
            out += static_cast<char>((accum >> bits) & 0xFF);
        }
    }
    if (padding > 2) {
        return Err<std::string>("base64: too much padding", ErrorKind::Framing);
    }
    return out;
}

} // namespace phonebridge::image
