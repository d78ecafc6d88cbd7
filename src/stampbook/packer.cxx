#include "stampbook/packer.h"

#include <cstdint>
#include <utility>
#include "stampbook/classify.h"
#include "stampbook/errors.h"

namespace stampbook {

namespace {

void check_dimensions(size_t width, size_t height, size_t cells)
{
    if (width == 0 || height == 0)
        throw pack_error::zero_dimension(width, height);
    // A product that overflows cannot match any real cell count; report it
    // saturated.
    if (height > SIZE_MAX / width)
        throw pack_error::size_mismatch(SIZE_MAX, cells);
    if (cells != width * height)
        throw pack_error::size_mismatch(width * height, cells);
}

} // namespace

packed_bitmap pack(const std::vector<color>& grid, size_t width, size_t height)
{
    check_dimensions(width, height, grid.size());

    const size_t stride = row_bytes_for(width);
    std::vector<std::uint8_t> bytes(stride * height, 0);

    for (size_t y = 0; y < height; ++y) {
        for (size_t x = 0; x < width; ++x) {
            if (grid[y * width + x] == color::white)
                bytes[y * stride + x / 8] |= static_cast<std::uint8_t>(0x80u >> (x % 8));
        }
    }

    return packed_bitmap(width, height, std::move(bytes));
}

packed_bitmap pack(const raster& image)
{
    check_dimensions(image.width, image.height, image.pixels.size());

    std::vector<color> grid;
    grid.reserve(image.pixels.size());
    for (size_t y = 0; y < image.height; ++y) {
        for (size_t x = 0; x < image.width; ++x) {
            const pixel& p = image.pixels[y * image.width + x];
            auto c = classify(p);
            if (!c)
                throw pack_error::unrecognized_color(x, y, p);
            grid.push_back(*c);
        }
    }

    return pack(grid, image.width, image.height);
}

} // namespace stampbook
