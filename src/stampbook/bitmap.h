#ifndef STAMPBOOK_BITMAP_H
#define STAMPBOOK_BITMAP_H

#include <cstddef>
#include <cstdint>
#include <vector>
#include "stampbook/stamp.h"

namespace stampbook {

// Packed 1-bit image as produced by pack(): rows of row_bytes() bytes,
// MSB-first, unused trailing bits of each row cleared.
struct packed_bitmap {
public:
    // Throws pack_error if a dimension is zero, bytes has the wrong length or
    // a padding bit is set.
    packed_bitmap(size_t width, size_t height, std::vector<std::uint8_t> bytes);

    size_t width() const;
    size_t height() const;
    size_t row_bytes() const;
    // Byte count, row_bytes() * height().
    size_t size() const;
    const std::vector<std::uint8_t>& bytes() const;

    // The returned stamp points into this bitmap and must not outlive it.
    stamp view() const;

private:
    size_t m_width;
    size_t m_height;
    std::vector<std::uint8_t> m_bytes;
};

bool operator==(const packed_bitmap& lhs, const packed_bitmap& rhs);
bool operator!=(const packed_bitmap& lhs, const packed_bitmap& rhs);

} // namespace stampbook

#endif // STAMPBOOK_BITMAP_H
