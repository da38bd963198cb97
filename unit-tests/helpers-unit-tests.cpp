/****************************************************************************

    MIT License

    Copyright (c) 2021 Aria Janke

    Permission is hereby granted, free of charge, to any person obtaining a copy
    of this software and associated documentation files (the "Software"), to deal
    in the Software without restriction, including without limitation the rights
    to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
    copies of the Software, and to permit persons to whom the Software is
    furnished to do so, subject to the following conditions:

    The above copyright notice and this permission notice shall be included in all
    copies or substantial portions of the Software.

    THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
    IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
    FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
    AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
    LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
    OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE
    SOFTWARE.

*****************************************************************************/

#include <common/TestSuite.hpp>

#include "../src/helpers.hpp"
#include "test-helpers.hpp"

#include <cmath>

namespace {

using cul::ts::TestSuite, cul::ts::test, cul::ts::set_context, cul::ts::Unit,
      mcol::Rectangle, mcol::RectangleI, mcol::Vector, mcol::Size, mcol::Real,
      mcol::Side, mcol::k_horizontal, mcol::k_vertical;

#define mark MACRO_MARK_POSITION_OF_CUL_TEST_SUITE

bool are_same(const RectangleI & a, const RectangleI & b) {
    return    a.left  == b.left  && a.top    == b.top
           && a.width == b.width && a.height == b.height;
}

const Size   k_cell_size{10, 10};
const Vector k_no_offset{0, 0};
const RectangleI k_wide_limits{-100, -100, 200, 200};

} // end of <anonymous> namespace

// - find_sweep
// - overlaps_strictly / overlaps_or_touches
// - find_cell_range
// - find_contact_sides
void do_helpers_tests(TestSuite &);

// - find_flush_low
// - find_flush_position
// ahead, behind, passing by on the other axis, both directions
void do_find_flush_position_tests(TestSuite &);

// These are skipped:
//   - displace
//   - low_of / high_of / set_low_of

void do_helpers_tests(TestSuite & suite) {
    using namespace mcol;
    suite.start_series("helpers - find_sweep");
    mark(suite).test([] {
        auto sweep = find_sweep(Rectangle{0, 0, 10, 10}, Rectangle{5, -3, 10, 10});
        return test(are_same(sweep, Rectangle{0, -3, 15, 13}));
    });
    mark(suite).test([] {
        // order does not matter
        auto a = find_sweep(Rectangle{5, -3, 10, 10}, Rectangle{0, 0, 10, 10});
        auto b = find_sweep(Rectangle{0, 0, 10, 10}, Rectangle{5, -3, 10, 10});
        return test(are_same(a, b));
    });

    suite.start_series("helpers - overlaps");
    set_context(suite, [](TestSuite & suite, Unit & unit) {
        Rectangle a{ 0, 0, 10, 10};
        Rectangle touching{10, 0, 10, 10};
        Rectangle corner  {10, 10, 5, 5};
        Rectangle inside  { 2, 2, 3, 3};
        Rectangle apart   {11, 0, 10, 10};
        unit.start(mark(suite), [&] {
            return test(!overlaps_strictly(a, touching) && overlaps_or_touches(a, touching));
        });
        unit.start(mark(suite), [&] {
            return test(!overlaps_strictly(a, corner) && overlaps_or_touches(a, corner));
        });
        unit.start(mark(suite), [&] {
            return test(overlaps_strictly(a, inside) && overlaps_strictly(inside, a));
        });
        unit.start(mark(suite), [&] {
            return test(!overlaps_strictly(a, apart) && !overlaps_or_touches(a, apart));
        });
    });

    suite.start_series("helpers - find_cell_range");
    mark(suite).test([] {
        // strictly inside one cell
        auto range = find_cell_range(Rectangle{5, 5, 2, 2}, k_cell_size, k_no_offset, k_wide_limits);
        return test(are_same(range, RectangleI{0, 0, 1, 1}));
    });
    mark(suite).test([] {
        // exactly one cell, so all eight neighbors touch it
        auto range = find_cell_range(Rectangle{0, 0, 10, 10}, k_cell_size, k_no_offset, k_wide_limits);
        return test(are_same(range, RectangleI{-1, -1, 3, 3}));
    });
    mark(suite).test([] {
        auto range = find_cell_range(Rectangle{-15, 5, 10, 2}, k_cell_size, k_no_offset, k_wide_limits);
        return test(are_same(range, RectangleI{-2, 0, 2, 1}));
    });
    mark(suite).test([] {
        // offset shifts the whole grid
        auto range = find_cell_range(Rectangle{105, 5, 2, 2}, k_cell_size, Vector{100, 0}, k_wide_limits);
        return test(are_same(range, RectangleI{0, 0, 1, 1}));
    });
    mark(suite).test([] {
        auto range = find_cell_range(Rectangle{5, 5, 2, 2}, Size{}, k_no_offset, k_wide_limits);
        return test(range.width == 0 && range.height == 0);
    });
    mark(suite).test([] {
        // a long way off, nothing past the limits
        auto range = find_cell_range(Rectangle{1e12, 5, 1, 2}, k_cell_size, k_no_offset,
                                     RectangleI{-1, -1, 5, 5});
        return test(range.width == 0 && range.height == 1);
    });
    mark(suite).test([] {
        auto range = find_cell_range(Rectangle{-1e12, 0, 2e12, 5}, k_cell_size, k_no_offset,
                                     RectangleI{-1, -1, 5, 5});
        return test(are_same(range, RectangleI{-1, -1, 5, 2}));
    });

    suite.start_series("helpers - find_contact_sides");
    mark(suite).test([] {
        auto gv = find_contact_sides<k_horizontal>(1);
        return test(   std::get<0>(gv) == Side::k_right
                    && std::get<1>(gv) == Side::k_left);
    });
    mark(suite).test([] {
        auto gv = find_contact_sides<k_horizontal>(-0.5);
        return test(   std::get<0>(gv) == Side::k_left
                    && std::get<1>(gv) == Side::k_right);
    });
    mark(suite).test([] {
        // falling, the actor's bottom lands on something's top
        auto gv = find_contact_sides<k_vertical>(3);
        return test(   std::get<0>(gv) == Side::k_bottom
                    && std::get<1>(gv) == Side::k_top);
    });
    mark(suite).test([] {
        auto gv = find_contact_sides<k_vertical>(-3);
        return test(   std::get<0>(gv) == Side::k_top
                    && std::get<1>(gv) == Side::k_bottom);
    });
}

void do_find_flush_position_tests(TestSuite & suite) {
    using namespace mcol;
    suite.start_series("helpers - find_flush_low");
    mark(suite).test([] {
        return test(find_flush_low(20, 10) == 10);
    });
    mark(suite).test([] {
        // 0.3 - 0.1 + 0.1 lands right back on 0.3
        auto low = find_flush_low(0.3, 0.1);
        return test(low + 0.1 == 0.3);
    });
    mark(suite).test([] {
        // 0.3 - 0.8 + 0.8 would pass 0.3
        auto low = find_flush_low(0.3, 0.8);
        return test(   low + 0.8 <= 0.3
                    && std::nextafter(low, k_inf) + 0.8 > 0.3);
    });
    mark(suite).test([] {
        auto low = find_flush_low(0.9, 0.3);
        return test(   low + 0.3 <= 0.9
                    && std::nextafter(low, k_inf) + 0.3 > 0.9);
    });

    suite.start_series("helpers - find_flush_position");
    set_context(suite, [](TestSuite & suite, Unit & unit) {
        const Rectangle start{0, 0, 10, 10};
        const Rectangle moved{5, 0, 10, 10};
        unit.start(mark(suite), [&] {
            auto pos = find_flush_position<k_horizontal>
                (start, moved, Rectangle{12, 0, 10, 10}, 1);
            return test(pos == 2);
        });
        unit.start(mark(suite), [&] {
            // already flush, still moving into it
            auto pos = find_flush_position<k_horizontal>
                (start, moved, Rectangle{10, 0, 10, 10}, 1);
            return test(pos == 0);
        });
        unit.start(mark(suite), [&] {
            // too far away to be reached
            auto pos = find_flush_position<k_horizontal>
                (start, moved, Rectangle{15, 0, 10, 10}, 1);
            return test(!cul::is_real(pos));
        });
        unit.start(mark(suite), [&] {
            // behind
            auto pos = find_flush_position<k_horizontal>
                (start, moved, Rectangle{-20, 0, 10, 10}, 1);
            return test(!cul::is_real(pos));
        });
        unit.start(mark(suite), [&] {
            // only shares a corner
            auto pos = find_flush_position<k_horizontal>
                (start, moved, Rectangle{12, 10, 10, 10}, 1);
            return test(!cul::is_real(pos));
        });
        unit.start(mark(suite), [&] {
            // already overlapping start
            auto pos = find_flush_position<k_horizontal>
                (start, moved, Rectangle{8, 0, 10, 10}, 1);
            return test(!cul::is_real(pos));
        });
    });
    mark(suite).test([] {
        auto pos = find_flush_position<k_horizontal>
            (Rectangle{20, 0, 10, 10}, Rectangle{14, 0, 10, 10},
             Rectangle{0, 0, 15, 10}, -1);
        return test(pos == 15);
    });
    mark(suite).test([] {
        auto pos = find_flush_position<k_vertical>
            (Rectangle{0, 0, 10, 10}, Rectangle{0, 7, 10, 10},
             Rectangle{-5, 12, 30, 5}, 1);
        return test(pos == 2);
    });
    mark(suite).test([] {
        auto pos = find_flush_position<k_vertical>
            (Rectangle{0, 20, 10, 10}, Rectangle{0, 14, 10, 10},
             Rectangle{-5, 10, 30, 5}, -1);
        return test(pos == 15);
    });
}
