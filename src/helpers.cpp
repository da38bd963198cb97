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

#include "helpers.hpp"

#include <algorithm>
#include <cmath>

#include <cassert>

namespace {

using cul::right_of, cul::bottom_of, std::floor, std::min, std::max;
using mcol::Rectangle, mcol::Real, mcol::Tuple;

// [first, last) cells along one axis overlapping or touching [low, high]
Tuple<int, int> find_cell_span
    (Real low, Real high, Real cell_length, Real offset, int limit_low,
     int limit_high);

} // end of <anonymous> namespace

namespace mcol {

bool is_real(const Rectangle & rect) {
    using cul::is_real;
    return    is_real(rect.left ) && is_real(rect.top   )
           && is_real(rect.width) && is_real(rect.height);
}

Rectangle displace(Rectangle rv, Vector r) {
    rv.left += r.x;
    rv.top  += r.y;
    return rv;
}

Rectangle find_sweep(const Rectangle & lhs, const Rectangle & rhs) {
    const auto low_x  = min(lhs.left, rhs.left);
    const auto low_y  = min(lhs.top , rhs.top );
    const auto high_x = max(right_of (lhs), right_of (rhs));
    const auto high_y = max(bottom_of(lhs), bottom_of(rhs));
    return Rectangle{low_x, low_y, high_x - low_x, high_y - low_y};
}

bool overlaps_strictly(const Rectangle & lhs, const Rectangle & rhs) {
    return    spans_overlap<k_horizontal>(lhs, rhs)
           && spans_overlap<k_vertical  >(lhs, rhs);
}

bool overlaps_or_touches(const Rectangle & lhs, const Rectangle & rhs) {
    return    lhs.left <= right_of (rhs) && rhs.left <= right_of (lhs)
           && lhs.top  <= bottom_of(rhs) && rhs.top  <= bottom_of(lhs);
}

Real find_flush_low(Real high_edge, Real extent) {
    assert(cul::is_real(high_edge) && cul::is_real(extent) && extent >= 0);
    // the subtraction may round either way, step by ulps until the sum sits
    // on, or just short of, the edge
    auto low = high_edge - extent;
    while (low + extent > high_edge)
        { low = std::nextafter(low, -k_inf); }
    for (auto next = std::nextafter(low, k_inf); next + extent <= high_edge;
         next = std::nextafter(low, k_inf))
    { low = next; }
    return low;
}

RectangleI find_cell_range
    (const Rectangle & rect, const Size & cell_size, const Vector & offset,
     const RectangleI & limits)
{
    assert(cell_size.width >= 0 && cell_size.height >= 0);
    assert(is_real(rect) && rect.width >= 0 && rect.height >= 0);

    if (cell_size.width == 0 || cell_size.height == 0) return RectangleI{};

    const auto x_span = find_cell_span(rect.left, right_of(rect), cell_size.width,
                                       offset.x, limits.left, right_of(limits));
    const auto y_span = find_cell_span(rect.top, bottom_of(rect), cell_size.height,
                                       offset.y, limits.top, bottom_of(limits));
    const auto x = std::get<0>(x_span), y = std::get<0>(y_span);
    return RectangleI{x, y, std::get<1>(x_span) - x, std::get<1>(y_span) - y};
}

Rectangle find_cell_bounds
    (VectorI cell, const Size & cell_size, const Vector & offset)
{
    return Rectangle{cell.x*cell_size.width  + offset.x,
                     cell.y*cell_size.height + offset.y,
                     cell_size.width, cell_size.height};
}

} // end of mcol namespace

namespace {

Tuple<int, int> find_cell_span
    (Real low, Real high, Real cell_length, Real offset, int limit_low,
     int limit_high)
{
    // cells whose edge lies exactly on the high end are included
    auto first = floor((low  - offset) / cell_length);
    auto last  = floor((high - offset) / cell_length) + 1;
    // likewise for the low end
    if (first*cell_length + offset == low) first -= 1;
    // clamped while still real, int cannot hold just any real value
    first = std::clamp(first, Real(limit_low), Real(limit_high));
    last  = std::clamp(last , first          , Real(limit_high));
    return std::make_tuple(int(first), int(last));
}

} // end of <anonymous> namespace
