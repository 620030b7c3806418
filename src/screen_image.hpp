#pragma once
// =============================================================================
// PhoneBridge - Screen Image Helpers
// =============================================================================
// PNG signature/IHDR inspection and base64 for screenshots on the wire.
// =============================================================================

#include <string>
#include <vector>
#include <cstdint>
#include <optional>

#include "result.hpp"

namespace phonebridge::image {

struct ImageSize {
    int width = 0;
    int height = 0;
};

bool is_png(const std::string& bytes);

// Width/height from the IHDR chunk; nullopt when the header is truncated
// or does not start with IHDR.
std::optional<ImageSize> read_png_dimensions(const std::string& bytes);

std::string base64_encode(const std::string& bytes);
Result<std::string> base64_decode(const std::string& text);

} // namespace phonebridge::image
