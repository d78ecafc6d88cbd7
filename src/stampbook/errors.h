#ifndef STAMPBOOK_ERRORS_H
#define STAMPBOOK_ERRORS_H

#include <cstddef>
#include <stdexcept>
#include <string>
#include "stampbook/pixel.h"

namespace stampbook {

// Build-time failures. None of these are recoverable: the asset is not
// embedded and the generator exits with an error.

class pack_error : public std::runtime_error {
public:
    enum class kind {
        zero_dimension,
        size_mismatch,
        unrecognized_color,
        nonzero_padding,
    };

    static pack_error zero_dimension(size_t width, size_t height);
    static pack_error size_mismatch(size_t expected, size_t actual);
    static pack_error unrecognized_color(size_t x, size_t y, const pixel& value);
    // Raised by packed_bitmap for packed input that breaks its layout.
    static pack_error byte_count_mismatch(size_t expected, size_t actual);
    static pack_error nonzero_padding(size_t row);

    kind code() const;
    // x is only meaningful for kind::unrecognized_color, y also for
    // kind::nonzero_padding.
    size_t x() const;
    size_t y() const;
    pixel value() const;

private:
    pack_error(kind code, const std::string& what, size_t x, size_t y, const pixel& value);

    kind m_code;
    size_t m_x;
    size_t m_y;
    pixel m_value;
};

class decode_error : public std::runtime_error {
public:
    decode_error(const std::string& path, const std::string& reason);

    const std::string& path() const;

private:
    std::string m_path;
};

class embed_error : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

} // namespace stampbook

#endif // STAMPBOOK_ERRORS_H
