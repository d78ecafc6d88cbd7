#ifndef STAMPBOOK_STORAGE_H
#define STAMPBOOK_STORAGE_H

#include <cstdint>

#if defined(__AVR__)
#include <avr/pgmspace.h>
#define STAMPBOOK_PROGMEM PROGMEM
#else
#define STAMPBOOK_PROGMEM
#endif

namespace stampbook {
namespace storage {

// Where a stamp's bytes live. Generated stamps are declared with
// STAMPBOOK_PROGMEM and use flash; buffers handed in at runtime use ram.
enum class domain {
    ram,
    flash,
};

// On AVR flash bytes must be read with pgm_read_byte; everywhere else both
// domains are a plain load.
inline std::uint8_t read_byte(const std::uint8_t* p, domain where)
{
#if defined(__AVR__)
    if (where == domain::flash)
        return pgm_read_byte(p);
#else
    (void)where;
#endif
    return *p;
}

} // namespace storage
} // namespace stampbook

#endif // STAMPBOOK_STORAGE_H
