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

#pragma once

#include <mapcol/collider.hpp>

#include <common/Vector2Util.hpp>
#include <common/Util.hpp>

#include <algorithm>
#include <tuple>
#include <vector>

// Everything in this file is meant to contain implementation details that a
// client coder need not see
//
// however for the purposes of testing it's important to at some level reveal
// the code

namespace mcol {

template <typename ... Types>
using Tuple = std::tuple<Types...>;

constexpr const Real k_inf = std::numeric_limits<Real>::infinity();

enum Dimension { k_horizontal, k_vertical };

bool is_real(const Rectangle &);

Rectangle displace(Rectangle, Vector);

/// @returns smallest rectangle containing both
Rectangle find_sweep(const Rectangle &, const Rectangle &);

/// @returns true if the two rectangles share some area, touching edges do
///          not count
bool overlaps_strictly(const Rectangle &, const Rectangle &);

/// @returns true if the two rectangles share some area or an edge
bool overlaps_or_touches(const Rectangle &, const Rectangle &);

/// @returns the greatest low edge such that low + extent does not pass the
///          given edge, it is flush whenever the sum can be exact
Real find_flush_low(Real high_edge, Real extent);

/// @param limits only cells inside these are ever part of the range, which
///               keeps far away rectangles from overflowing int
/// @returns range of cells overlapping or touching the given rectangle
RectangleI find_cell_range
    (const Rectangle &, const Size & cell_size, const Vector & offset,
     const RectangleI & limits);

Rectangle find_cell_bounds
    (VectorI cell, const Size & cell_size, const Vector & offset);

// ----------------------------------------------------------------------------

template <Dimension kt_dim>
Real low_of(const Rectangle & rect) {
    if constexpr (kt_dim == k_horizontal) return rect.left;
    else return rect.top;
}

template <Dimension kt_dim>
Real high_of(const Rectangle & rect) {
    if constexpr (kt_dim == k_horizontal) return cul::right_of(rect);
    else return cul::bottom_of(rect);
}

template <Dimension kt_dim>
Real extent_of(const Rectangle & rect) {
    if constexpr (kt_dim == k_horizontal) return rect.width;
    else return rect.height;
}

template <Dimension kt_dim>
Real get_component(const Vector & r) {
    if constexpr (kt_dim == k_horizontal) return r.x;
    else return r.y;
}

template <Dimension kt_dim>
Rectangle set_low_of(Rectangle rect, Real low) {
    if constexpr (kt_dim == k_horizontal) rect.left = low;
    else rect.top = low;
    return rect;
}

template <Dimension kt_dim>
constexpr Dimension other_dimension()
    { return kt_dim == k_horizontal ? k_vertical : k_horizontal; }

/// @returns true if both rectangles share some length along the dimension,
///          sharing only an end point does not count
template <Dimension kt_dim>
bool spans_overlap(const Rectangle & lhs, const Rectangle & rhs)
    { return low_of<kt_dim>(lhs) < high_of<kt_dim>(rhs) && low_of<kt_dim>(rhs) < high_of<kt_dim>(lhs); }

/// @param direction sign of movement along the dimension, must not be zero
/// @returns the face of the actor which leads the movement, and the face of
///          any obstacle it could run into
template <Dimension kt_dim>
Tuple<Side, Side> find_contact_sides(Real direction) {
    if constexpr (kt_dim == k_horizontal) {
        return direction > 0 ? std::make_tuple(Side::k_right, Side::k_left)
                             : std::make_tuple(Side::k_left , Side::k_right);
    } else {
        // y grows downward
        return direction > 0 ? std::make_tuple(Side::k_bottom, Side::k_top   )
                             : std::make_tuple(Side::k_top   , Side::k_bottom);
    }
}

/// Finds where the moving rectangle would have to stop along one dimension,
/// in order to be flush against the obstacle.
///
/// The obstacle must be ahead of start's leading edge (or exactly on it),
/// the moving rectangle's leading edge must pass it, and both must share
/// some length in the other dimension.
///
/// @param start  rectangle before movement along this dimension
/// @param moved  rectangle after movement along this dimension
/// @param direction sign of movement, must not be zero
/// @returns the new low side (left or top) of moved, infinity if the
///          obstacle is not run into
template <Dimension kt_dim>
Real find_flush_position
    (const Rectangle & start, const Rectangle & moved, const Rectangle & obstacle,
     Real direction)
{
    constexpr const auto k_other = other_dimension<kt_dim>();
    if (!spans_overlap<k_other>(moved, obstacle)) return k_inf;
    if (direction > 0) {
        const auto near_edge = low_of<kt_dim>(obstacle);
        if (high_of<kt_dim>(start) <= near_edge && near_edge < high_of<kt_dim>(moved))
            { return find_flush_low(near_edge, extent_of<kt_dim>(moved)); }
    } else if (direction < 0) {
        const auto near_edge = high_of<kt_dim>(obstacle);
        if (low_of<kt_dim>(start) >= near_edge && near_edge > low_of<kt_dim>(moved))
            { return near_edge; }
    }
    return k_inf;
}

/// Clips the moving rectangle along one dimension against everything in the
/// sweep that blocks.
///
/// @param moved rectangle after movement along this dimension only, it is
///              set flush against the nearest blocker if there are any
/// @param events every blocker found is appended here
/// @returns true if anything blocked
template <Dimension kt_dim>
bool clip_along
    (const ObstacleSource & source, const Rectangle & last, Rectangle & moved,
     Real velocity_i, std::vector<BumpEvent> & events)
{
    if (velocity_i == 0) return false;

    const auto start = set_low_of<kt_dim>(moved, low_of<kt_dim>(last));
    const auto sides = find_contact_sides<kt_dim>(velocity_i);
    const Side actor_side    = std::get<0>(sides);
    const Side obstacle_side = std::get<1>(sides);
    const auto events_before = events.size();
    // nearest is the least displacement from start, whichever the direction
    Real nearest = velocity_i > 0 ? k_inf : -k_inf;
    source.for_each_obstacle(find_sweep(start, moved),
        [&](const Obstacle & obstacle)
    {
        const auto pos = find_flush_position<kt_dim>(start, moved, obstacle.bounds, velocity_i);
        if (!cul::is_real(pos)) return;
        if (!source.blocks(obstacle, obstacle_side)) return;
        events.emplace_back(obstacle, actor_side);
        nearest = velocity_i > 0 ? std::min(nearest, pos) : std::max(nearest, pos);
    });
    if (events.size() == events_before) return false;
    moved = set_low_of<kt_dim>(moved, nearest);
    return true;
}

} // end of mcol namespace
