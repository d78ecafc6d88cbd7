#ifndef STAMPBOOK_DECODE_H
#define STAMPBOOK_DECODE_H

#include <string>
#include "stampbook/pixel.h"

namespace stampbook {

enum class image_format {
    png,
    bmp,
    pnm,
    unknown,
};

// Picks the codec from the file extension, case-insensitively.
image_format format_of(const std::string& path);

// Reads an image and converts it to RGBA8. Throws decode_error if the file
// is missing, unreadable, corrupt, or of an unsupported format.
raster decode(const std::string& path);

} // namespace stampbook

#endif // STAMPBOOK_DECODE_H
