#ifndef STAMPBOOK_PIXEL_H
#define STAMPBOOK_PIXEL_H

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace stampbook {

// Decoded RGBA8 sample. Sources without alpha decode as fully opaque.
struct pixel {
    std::uint8_t red;
    std::uint8_t green;
    std::uint8_t blue;
    std::uint8_t alpha;
};

bool operator==(const pixel& lhs, const pixel& rhs);
bool operator!=(const pixel& lhs, const pixel& rhs);

// "#rrggbbaa"
std::string to_string(const pixel& p);

struct raster {
    size_t width = 0;
    size_t height = 0;
    std::vector<pixel> pixels; // row-major, size = width * height
};

} // namespace stampbook

#endif // STAMPBOOK_PIXEL_H
