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

#include <common/Vector2.hpp>

#include <cstdint>

namespace mcol {

/// Real number, defined using double
using Real = double;

/// Rectangle defined with real numbers, used for actor bounds and obstacle
/// bounds everywhere in this library
///
/// y grows downward, so "top" is the lower y value
using Rectangle = cul::Rectangle<Real>;

/// Vector, as in 2D direction and magnitude, defined with real number type
using Vector = cul::Vector2<Real>;

/// Size object, used for cell sizes and actor sizes
using Size = cul::Size2<Real>;

/// Integer vector, used to address tile grid cells
using VectorI    = cul::Vector2  <int>;
using RectangleI = cul::Rectangle<int>;
using SizeI      = cul::Size2    <int>;

/// Opaque reference to some client object (e.g. a moving platform), never
/// dereferenced by this library
using ObjectRef = const void *;

/// Names one face of a rectangle.
///
/// For bump notifications this is the face of the actor which made contact.
/// For ObstacleSource::blocks this is the face of the obstacle being hit.
enum class Side : uint8_t { k_left, k_right, k_top, k_bottom };

namespace sides {

constexpr const auto k_left   = Side::k_left;
constexpr const auto k_right  = Side::k_right;
constexpr const auto k_top    = Side::k_top;
constexpr const auto k_bottom = Side::k_bottom;

} // end of sides namespace -> into ::mcol

} // end of mcol namespace
