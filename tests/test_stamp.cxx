// Runtime accessor over hand-packed constants: no packer involved.
#include <cassert>
#include <csignal>
#include <cstdint>
#include <iostream>
#include <iterator>
#include <type_traits>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>
#include "stampbook/stamp.h"

using stampbook::accessor_error;
using stampbook::color;
using stampbook::stamp;
using stampbook::stamp_pixel;
using stampbook::storage::domain;

namespace {

// 3x3 checkerboard, one byte per row.
const std::uint8_t kCheckerboard[] = {0b10100000, 0b01000000, 0b10100000};
constexpr stamp kCheckerStamp{3, 3, kCheckerboard};

// 12x12 white star on black, two bytes per row.
const std::uint8_t kStar[] = {
    0b00000110, 0b00000000,
    0b00000110, 0b00000000,
    0b00001111, 0b00000000,
    0b00001111, 0b00000000,
    0b11111111, 0b11110000,
    0b01111111, 0b11100000,
    0b00111111, 0b11000000,
    0b00011111, 0b10000000,
    0b00111111, 0b11000000,
    0b00111001, 0b11000000,
    0b01110000, 0b11100000,
    0b01100000, 0b01100000,
};
constexpr stamp kStarStamp{12, 12, kStar};

static_assert(kCheckerStamp.width() == 3, "width");
static_assert(kCheckerStamp.pixel_count() == 9, "pixel count");
static_assert(kStarStamp.byte_count() == 24, "star byte count");
static_assert(kStarStamp.is_within_bounds(11, 11), "in bounds");
static_assert(!kStarStamp.is_within_bounds(12, 0), "out of bounds");
static_assert(kStarStamp.domain() == domain::ram, "plain constants live in ram");
static_assert(std::is_same<std::iterator_traits<stampbook::pixel_iterator>::iterator_category,
                           std::input_iterator_tag>::value,
              "pixels are yielded by value");

void test_dimensions()
{
    assert(kCheckerStamp.height() == 3);
    assert(kCheckerStamp.size().width == 3);
    assert(kCheckerStamp.size().height == 3);
    assert(kCheckerStamp.row_bytes() == 1);
    assert(kStarStamp.row_bytes() == 2);
}

void test_get()
{
    assert(kCheckerStamp.get(0, 0) == color::white);
    assert(kCheckerStamp.get(1, 0) == color::black);
    assert(kCheckerStamp.get(0, 1) == color::black);
    assert(kCheckerStamp.get(1, 1) == color::white);
    assert(kCheckerStamp.get(2, 2) == color::white);

    assert(kStarStamp.get(0, 0) == color::black);
    assert(kStarStamp.get(11, 11) == color::black);
    assert(kStarStamp.get(5, 0) == color::white);
    assert(kStarStamp.get(6, 6) == color::white);
    assert(kStarStamp.get(11, 4) == color::white);
    assert(kStarStamp.get(5, 9) == color::black);
}

void test_try_get()
{
    color c = color::black;
    assert(kCheckerStamp.try_get(0, 0, c) && c == color::white);
    assert(kCheckerStamp.try_get(1, 0, c) && c == color::black);
    c = color::white;
    assert(!kCheckerStamp.try_get(3, 0, c));
    assert(!kCheckerStamp.try_get(0, 3, c));
    assert(c == color::white);
}

void test_pixels_order()
{
    auto pixels = kCheckerStamp.pixels();
    assert(pixels.size() == 9);

    auto it = pixels.begin();
    assert(*it++ == (stamp_pixel{0, 0, color::white}));
    assert(*it++ == (stamp_pixel{1, 0, color::black}));
    assert(*it++ == (stamp_pixel{2, 0, color::white}));
    assert(*it++ == (stamp_pixel{0, 1, color::black}));
    std::advance(it, 4);
    assert(*it++ == (stamp_pixel{2, 2, color::white}));
    assert(it == pixels.end());
}

void test_pixels_row_major()
{
    size_t i = 0;
    size_t white = 0;
    for (auto p : kStarStamp.pixels()) {
        assert(p.x == i % kStarStamp.width());
        assert(p.y == i / kStarStamp.width());
        assert(p.value == kStarStamp.get(p.x, p.y));
        if (p.value == color::white)
            ++white;
        ++i;
    }
    assert(i == 144);
    assert(white == 72);
    assert(std::distance(kStarStamp.pixels().begin(), kStarStamp.pixels().end()) == 144);
}

void test_pixels_restartable()
{
    auto first = kStarStamp.pixels().begin();
    std::advance(first, 30);

    auto fresh = kStarStamp.pixels().begin();
    assert((*fresh).x == 0);
    assert((*fresh).y == 0);

    // Iterators are copies: advancing one leaves the other alone.
    auto copy = first;
    ++copy;
    assert((*first).x == 6 && (*first).y == 2);
    assert((*copy).x == 7 && (*copy).y == 2);
}

void test_empty_stamp()
{
    stamp empty;
    assert(empty.pixel_count() == 0);
    assert(empty.pixels().begin() == empty.pixels().end());
    color c;
    assert(!empty.try_get(0, 0, c));
}

void test_from_buffer()
{
    stamp s;
    assert(stamp::from_buffer(12, 12, kStar, sizeof(kStar), s) == accessor_error::none);
    assert(s.width() == 12 && s.height() == 12);
    assert(s.get(6, 6) == color::white);
    assert(s.domain() == domain::ram);

    stamp untouched;
    assert(stamp::from_buffer(12, 12, kStar, 18, untouched) == accessor_error::size_mismatch);
    assert(stamp::from_buffer(12, 12, kStar, 25, untouched) == accessor_error::size_mismatch);
    assert(stamp::from_buffer(0, 12, kStar, 0, untouched) == accessor_error::size_mismatch);
    assert(stamp::from_buffer(3, 3, nullptr, 3, untouched) == accessor_error::size_mismatch);
    // row_bytes * height does not fit in size_t.
    assert(stamp::from_buffer(SIZE_MAX, 9, kStar, sizeof(kStar), untouched)
           == accessor_error::size_mismatch);
    assert(untouched.width() == 0);
}

// Off AVR both domains are ordinary memory and read identically.
void test_storage_domains_agree()
{
    constexpr stamp flash{12, 12, kStar, domain::flash};
    static_assert(flash.domain() == domain::flash, "domain is kept");

    stamp ram;
    assert(stamp::from_buffer(12, 12, kStar, sizeof(kStar), ram) == accessor_error::none);

    auto it = ram.pixels().begin();
    for (auto p : flash.pixels()) {
        assert(p == *it);
        ++it;
    }
    assert(it == ram.pixels().end());
}

// get() outside the stamp must stop the process, not return a color.
void test_out_of_bounds_aborts()
{
    const size_t coords[][2] = {{3, 0}, {0, 3}, {100, 100}};
    for (const auto& xy : coords) {
        pid_t pid = fork();
        assert(pid >= 0);
        if (pid == 0) {
            volatile color c = kCheckerStamp.get(xy[0], xy[1]);
            (void)c;
            _exit(0);
        }
        int status = 0;
        assert(waitpid(pid, &status, 0) == pid);
        assert(WIFSIGNALED(status));
        assert(WTERMSIG(status) == SIGABRT);
    }
}

} // namespace

int main()
{
    test_dimensions();
    test_get();
    test_try_get();
    test_pixels_order();
    test_pixels_row_major();
    test_pixels_restartable();
    test_empty_stamp();
    test_from_buffer();
    test_storage_domains_agree();
    test_out_of_bounds_aborts();
    std::cout << "Test passed\n";
    return 0;
}
