#ifndef STAMPBOOK_COLOR_H
#define STAMPBOOK_COLOR_H

namespace stampbook {

// Color of a stamp pixel. The numeric value is the stored bit.
enum class color {
    black = 0,
    white = 1,
};

} // namespace stampbook

#endif // STAMPBOOK_COLOR_H
