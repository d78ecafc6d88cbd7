#ifndef STAMPBOOK_PACKER_H
#define STAMPBOOK_PACKER_H

#include <cstddef>
#include <vector>
#include "stampbook/bitmap.h"
#include "stampbook/color.h"
#include "stampbook/pixel.h"

namespace stampbook {

// Packs a row-major grid of width * height colors, 8 pixels per byte,
// MSB-first, each row padded to a whole byte with zero bits.
// Throws pack_error (zero_dimension, size_mismatch).
packed_bitmap pack(const std::vector<color>& grid, size_t width, size_t height);

// Classifies every pixel of a decoded image, then packs it. The first pixel
// in row-major order that is neither pure black nor pure white fails the
// whole image with pack_error::kind::unrecognized_color.
packed_bitmap pack(const raster& image);

} // namespace stampbook

#endif // STAMPBOOK_PACKER_H
