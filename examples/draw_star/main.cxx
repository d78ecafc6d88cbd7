// Draws the embedded star as text, treating black as transparent. The star
// header is generated at build time from assets/star.pgm.
#include <iostream>
#include <string>
#include <vector>
#include "star.h"

int main()
{
    std::vector<std::string> canvas(sprites::star.height(), std::string(sprites::star.width(), '.'));

    for (auto p : sprites::star.pixels()) {
        if (p.value == stampbook::color::white)
            canvas[p.y][p.x] = '#';
    }

    for (const auto& row : canvas)
        std::cout << row << '\n';
    return 0;
}
