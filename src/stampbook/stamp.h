#ifndef STAMPBOOK_STAMP_H
#define STAMPBOOK_STAMP_H

#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <iterator>
#include "stampbook/color.h"
#include "stampbook/storage.h"

namespace stampbook {

// Bytes taken by one row of a packed bitmap: rows start on a byte boundary.
constexpr std::size_t row_bytes_for(std::size_t width)
{
    return width / 8 + (width % 8 != 0 ? 1 : 0);
}

enum class accessor_error {
    none,
    size_mismatch,
};

struct stamp_size {
    std::size_t width;
    std::size_t height;
};

// One pixel yielded by stamp::pixels().
struct stamp_pixel {
    std::size_t x;
    std::size_t y;
    color value;
};

constexpr bool operator==(const stamp_pixel& lhs, const stamp_pixel& rhs)
{
    return lhs.x == rhs.x && lhs.y == rhs.y && lhs.value == rhs.value;
}

constexpr bool operator!=(const stamp_pixel& lhs, const stamp_pixel& rhs)
{
    return !(lhs == rhs);
}

class pixel_range;

/*
 * Read-only view of a 1-bit image: its size plus a pointer to the packed
 * pixel bytes. Coordinate (0, 0) is the top-left corner.
 *
 * Pixel (x, y) is bit 7 - x % 8 of byte y * row_bytes() + x / 8; a set bit
 * is white. The stamp never owns the bytes, they must outlive it. Stamps are
 * normally generated by stampbook-embed as constexpr globals.
 */
class stamp {
public:
    constexpr stamp()
        : m_width(0)
        , m_height(0)
        , m_data(nullptr)
        , m_domain(storage::domain::ram)
    {
    }

    // No validation: data must hold row_bytes_for(width) * height bytes in
    // the given storage domain. Generated stamps pass storage::domain::flash.
    constexpr stamp(std::size_t width, std::size_t height, const std::uint8_t* data,
                    storage::domain where = storage::domain::ram)
        : m_width(width)
        , m_height(height)
        , m_data(data)
        , m_domain(where)
    {
    }

    // Validating constructor for buffers that did not come out of the
    // packer, e.g. received at runtime into RAM. On error out is left
    // untouched.
    static accessor_error from_buffer(std::size_t width, std::size_t height,
                                      const std::uint8_t* data, std::size_t size,
                                      stamp& out)
    {
        if (width == 0 || height == 0 || data == nullptr
            || height > SIZE_MAX / row_bytes_for(width)
            || size != row_bytes_for(width) * height) {
            return accessor_error::size_mismatch;
        }
        out = stamp(width, height, data, storage::domain::ram);
        return accessor_error::none;
    }

    constexpr std::size_t width() const { return m_width; }
    constexpr std::size_t height() const { return m_height; }
    constexpr stamp_size size() const { return stamp_size{m_width, m_height}; }
    constexpr std::size_t pixel_count() const { return m_width * m_height; }
    constexpr std::size_t row_bytes() const { return row_bytes_for(m_width); }
    constexpr std::size_t byte_count() const { return row_bytes() * m_height; }
    constexpr const std::uint8_t* data() const { return m_data; }
    constexpr storage::domain domain() const { return m_domain; }

    constexpr bool is_within_bounds(std::size_t x, std::size_t y) const
    {
        return x < m_width && y < m_height;
    }

    // Out-of-bounds coordinates are a caller bug and abort the program.
    color get(std::size_t x, std::size_t y) const
    {
        if (!is_within_bounds(x, y))
            std::abort();
        return get_unchecked(x, y);
    }

    bool try_get(std::size_t x, std::size_t y, color& out) const
    {
        if (!is_within_bounds(x, y))
            return false;
        out = get_unchecked(x, y);
        return true;
    }

    color get_unchecked(std::size_t x, std::size_t y) const
    {
        const std::uint8_t byte = storage::read_byte(m_data + y * row_bytes() + x / 8, m_domain);
        const std::uint8_t mask = static_cast<std::uint8_t>(0x80u >> (x % 8));
        return (byte & mask) ? color::white : color::black;
    }

    pixel_range pixels() const;

private:
    std::size_t m_width;
    std::size_t m_height;
    const std::uint8_t* m_data;
    storage::domain m_domain;
};

// Row-major walk over a stamp: x ascending within a row, rows top to bottom.
// Holds a copy of the stamp, so it stays valid after the stamp goes away as
// long as the pixel bytes do. Pixels are yielded by value, hence an input
// iterator; call pixels() again to restart.
class pixel_iterator {
public:
    using iterator_category = std::input_iterator_tag;
    using value_type = stamp_pixel;
    using difference_type = std::ptrdiff_t;
    using pointer = const stamp_pixel*;
    using reference = stamp_pixel;

    constexpr pixel_iterator()
        : m_stamp()
        , m_x(0)
        , m_y(0)
    {
    }

    constexpr pixel_iterator(const stamp& s, std::size_t x, std::size_t y)
        : m_stamp(s)
        , m_x(x)
        , m_y(y)
    {
    }

    stamp_pixel operator*() const
    {
        return stamp_pixel{m_x, m_y, m_stamp.get_unchecked(m_x, m_y)};
    }

    pixel_iterator& operator++()
    {
        if (++m_x == m_stamp.width()) {
            m_x = 0;
            ++m_y;
        }
        return *this;
    }

    pixel_iterator operator++(int)
    {
        pixel_iterator prev = *this;
        ++*this;
        return prev;
    }

    friend bool operator==(const pixel_iterator& lhs, const pixel_iterator& rhs)
    {
        return lhs.m_x == rhs.m_x && lhs.m_y == rhs.m_y;
    }

    friend bool operator!=(const pixel_iterator& lhs, const pixel_iterator& rhs)
    {
        return !(lhs == rhs);
    }

private:
    stamp m_stamp;
    std::size_t m_x;
    std::size_t m_y;
};

class pixel_range {
public:
    constexpr explicit pixel_range(const stamp& s)
        : m_stamp(s)
    {
    }

    pixel_iterator begin() const
    {
        if (m_stamp.pixel_count() == 0)
            return end();
        return pixel_iterator(m_stamp, 0, 0);
    }

    pixel_iterator end() const { return pixel_iterator(m_stamp, 0, m_stamp.height()); }

    constexpr std::size_t size() const { return m_stamp.pixel_count(); }

private:
    stamp m_stamp;
};

inline pixel_range stamp::pixels() const
{
    return pixel_range(*this);
}

} // namespace stampbook

#endif // STAMPBOOK_STAMP_H
