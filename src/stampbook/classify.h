#ifndef STAMPBOOK_CLASSIFY_H
#define STAMPBOOK_CLASSIFY_H

#include <cstdint>
#include <boost/optional.hpp>
#include "stampbook/color.h"
#include "stampbook/pixel.h"

namespace stampbook {

constexpr std::uint8_t kMinChannelValue{0};
constexpr std::uint8_t kMaxChannelValue{255};

// Exactly #ffffffff is white and exactly #000000ff is black. There is no
// tolerance: anything else, including translucent pixels, is none.
boost::optional<color> classify(const pixel& p);

} // namespace stampbook

#endif // STAMPBOOK_CLASSIFY_H
