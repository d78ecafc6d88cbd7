#include "stampbook/classify.h"

namespace stampbook {

namespace {

bool all_channels(const pixel& p, std::uint8_t value)
{
    return p.red == value && p.green == value && p.blue == value;
}

} // namespace

boost::optional<color> classify(const pixel& p)
{
    if (p.alpha != kMaxChannelValue)
        return boost::none;
    if (all_channels(p, kMaxChannelValue))
        return color::white;
    if (all_channels(p, kMinChannelValue))
        return color::black;
    return boost::none;
}

} // namespace stampbook
