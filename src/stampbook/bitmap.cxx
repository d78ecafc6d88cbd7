#include "stampbook/bitmap.h"

#include <utility>
#include "stampbook/errors.h"

namespace stampbook {

packed_bitmap::packed_bitmap(size_t width, size_t height, std::vector<std::uint8_t> bytes)
    : m_width(width)
    , m_height(height)
    , m_bytes(std::move(bytes))
{
    if (m_width == 0 || m_height == 0)
        throw pack_error::zero_dimension(m_width, m_height);
    if (m_height > SIZE_MAX / row_bytes() || m_bytes.size() != row_bytes() * m_height)
        throw pack_error::byte_count_mismatch(row_bytes() * m_height, m_bytes.size());

    if (m_width % 8 != 0) {
        const std::uint8_t unused = static_cast<std::uint8_t>(0xFFu >> (m_width % 8));
        for (size_t y = 0; y < m_height; ++y) {
            if (m_bytes[(y + 1) * row_bytes() - 1] & unused)
                throw pack_error::nonzero_padding(y);
        }
    }
}

size_t packed_bitmap::width() const { return m_width; }

size_t packed_bitmap::height() const { return m_height; }

size_t packed_bitmap::row_bytes() const { return row_bytes_for(m_width); }

size_t packed_bitmap::size() const { return m_bytes.size(); }

const std::vector<std::uint8_t>& packed_bitmap::bytes() const { return m_bytes; }

stamp packed_bitmap::view() const
{
    return stamp(m_width, m_height, m_bytes.data());
}

bool operator==(const packed_bitmap& lhs, const packed_bitmap& rhs)
{
    return lhs.width() == rhs.width() && lhs.height() == rhs.height()
        && lhs.bytes() == rhs.bytes();
}

bool operator!=(const packed_bitmap& lhs, const packed_bitmap& rhs)
{
    return !(lhs == rhs);
}

} // namespace stampbook
