#include "stampbook/errors.h"

#include <sstream>

namespace stampbook {

pack_error::pack_error(kind code, const std::string& what, size_t x, size_t y, const pixel& value)
    : std::runtime_error(what)
    , m_code(code)
    , m_x(x)
    , m_y(y)
    , m_value(value)
{
}

pack_error pack_error::zero_dimension(size_t width, size_t height)
{
    std::ostringstream os;
    os << "image has a zero dimension (" << width << "x" << height << ")";
    return pack_error(kind::zero_dimension, os.str(), 0, 0, pixel{});
}

pack_error pack_error::size_mismatch(size_t expected, size_t actual)
{
    std::ostringstream os;
    os << "expected " << expected << " pixels, got " << actual;
    return pack_error(kind::size_mismatch, os.str(), 0, 0, pixel{});
}

pack_error pack_error::unrecognized_color(size_t x, size_t y, const pixel& value)
{
    std::ostringstream os;
    os << "pixel (" << x << ", " << y << ") has color " << to_string(value)
       << ", expected pure black (#000000ff) or pure white (#ffffffff)";
    return pack_error(kind::unrecognized_color, os.str(), x, y, value);
}

pack_error pack_error::byte_count_mismatch(size_t expected, size_t actual)
{
    std::ostringstream os;
    os << "expected " << expected << " packed bytes, got " << actual;
    return pack_error(kind::size_mismatch, os.str(), 0, 0, pixel{});
}

pack_error pack_error::nonzero_padding(size_t row)
{
    std::ostringstream os;
    os << "row " << row << " has non-zero padding bits";
    return pack_error(kind::nonzero_padding, os.str(), 0, row, pixel{});
}

pack_error::kind pack_error::code() const { return m_code; }

size_t pack_error::x() const { return m_x; }

size_t pack_error::y() const { return m_y; }

pixel pack_error::value() const { return m_value; }

decode_error::decode_error(const std::string& path, const std::string& reason)
    : std::runtime_error("cannot decode " + path + ": " + reason)
    , m_path(path)
{
}

const std::string& decode_error::path() const { return m_path; }

} // namespace stampbook
