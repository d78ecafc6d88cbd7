#include "stampbook/decode.h"

#include <exception>
#include <boost/algorithm/string/case_conv.hpp>
#include <boost/filesystem.hpp>
#include <boost/filesystem/fstream.hpp>
#include <boost/gil.hpp>
#include <boost/gil/extension/io/bmp.hpp>
#include <boost/gil/extension/io/png.hpp>
#include <boost/gil/extension/io/pnm.hpp>
#include "stampbook/errors.h"

namespace fs = boost::filesystem;
namespace gil = boost::gil;

namespace stampbook {

namespace {

raster to_raster(const gil::rgba8_image_t& image)
{
    auto view = gil::const_view(image);

    raster out;
    out.width = static_cast<size_t>(view.width());
    out.height = static_cast<size_t>(view.height());
    out.pixels.reserve(out.width * out.height);

    for (std::ptrdiff_t y = 0; y < view.height(); ++y) {
        auto it = view.row_begin(y);
        for (std::ptrdiff_t x = 0; x < view.width(); ++x) {
            const auto& p = it[x];
            out.pixels.push_back(pixel{
                gil::at_c<0>(p),
                gil::at_c<1>(p),
                gil::at_c<2>(p),
                gil::at_c<3>(p),
            });
        }
    }
    return out;
}

// Binary PBM stores 1 for black, but GIL reads P4 rows as plain gray1 so
// the decoded colors come out flipped. ASCII P1 is converted correctly.
bool is_binary_pbm(const std::string& path)
{
    fs::ifstream in(fs::path(path), std::ios::binary);
    char magic[2] = {};
    in.read(magic, sizeof(magic));
    return in && magic[0] == 'P' && magic[1] == '4';
}

void invert_gray(raster& image)
{
    for (auto& p : image.pixels) {
        p.red = static_cast<std::uint8_t>(255 - p.red);
        p.green = static_cast<std::uint8_t>(255 - p.green);
        p.blue = static_cast<std::uint8_t>(255 - p.blue);
    }
}

} // namespace

image_format format_of(const std::string& path)
{
    const auto ext = boost::algorithm::to_lower_copy(fs::path(path).extension().string());
    if (ext == ".png")
        return image_format::png;
    if (ext == ".bmp")
        return image_format::bmp;
    if (ext == ".pbm" || ext == ".pgm" || ext == ".ppm" || ext == ".pnm")
        return image_format::pnm;
    return image_format::unknown;
}

raster decode(const std::string& path)
{
    boost::system::error_code ec;
    if (!fs::is_regular_file(path, ec))
        throw decode_error(path, "no such file");

    const image_format format = format_of(path);
    if (format == image_format::unknown) {
        throw decode_error(path, "unsupported image format '"
                                 + fs::path(path).extension().string() + "'");
    }

    gil::rgba8_image_t image;
    try {
        switch (format) {
        case image_format::png:
            gil::read_and_convert_image(path, image, gil::png_tag());
            break;
        case image_format::bmp:
            gil::read_and_convert_image(path, image, gil::bmp_tag());
            break;
        case image_format::pnm:
            gil::read_and_convert_image(path, image, gil::pnm_tag());
            break;
        case image_format::unknown:
            break;
        }
    } catch (const std::exception& e) {
        throw decode_error(path, e.what());
    }

    if (image.width() == 0 || image.height() == 0)
        throw decode_error(path, "image is empty");

    raster out = to_raster(image);
    if (format == image_format::pnm && is_binary_pbm(path))
        invert_gray(out);
    return out;
}

} // namespace stampbook
