#include "stampbook/pixel.h"

#include <iomanip>
#include <sstream>

namespace stampbook {

bool operator==(const pixel& lhs, const pixel& rhs)
{
    return lhs.red == rhs.red && lhs.green == rhs.green
        && lhs.blue == rhs.blue && lhs.alpha == rhs.alpha;
}

bool operator!=(const pixel& lhs, const pixel& rhs)
{
    return !(lhs == rhs);
}

std::string to_string(const pixel& p)
{
    std::ostringstream os;
    os << '#' << std::hex << std::setfill('0')
       << std::setw(2) << static_cast<int>(p.red)
       << std::setw(2) << static_cast<int>(p.green)
       << std::setw(2) << static_cast<int>(p.blue)
       << std::setw(2) << static_cast<int>(p.alpha);
    return os.str();
}

} // namespace stampbook
