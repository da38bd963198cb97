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

#include <mapcol/collider.hpp>

#include <common/Util.hpp>

namespace {

using namespace cul::exceptions_abbr;

} // end of <anonymous> namespace

namespace mcol {

Vector bump_stop(const Vector & r, bool bumped_x, bool bumped_y)
    { return Vector{bumped_x ? Real(0) : r.x, bumped_y ? Real(0) : r.y}; }

Vector bump_stop_all(const Vector & r, bool bumped_x, bool bumped_y)
    { return (bumped_x || bumped_y) ? Vector{} : r; }

Vector bump_bounce
    (const Vector & r, bool bumped_x, bool bumped_y, Real damping)
{
    return Vector{bumped_x ? -r.x*damping : r.x,
                  bumped_y ? -r.y*damping : r.y};
}

/* static */ BumpPolicy BumpPolicy::make_stop_all()
    { return BumpPolicy{k_stop_all, 1, CustomFunction{}}; }

/* static */ BumpPolicy BumpPolicy::make_bounce(Real damping) {
    if (!cul::is_real(damping) || damping < 0) {
        throw InvArg("BumpPolicy::make_bounce: damping must be a non-negative "
                     "real number.");
    }
    return BumpPolicy{k_bounce, damping, CustomFunction{}};
}

/* static */ BumpPolicy BumpPolicy::make_custom(CustomFunction f) {
    if (!f) {
        throw InvArg("BumpPolicy::make_custom: custom function must not be "
                     "empty.");
    }
    return BumpPolicy{k_custom, 1, std::move(f)};
}

Vector BumpPolicy::operator ()
    (const Vector & velocity, bool bumped_x, bool bumped_y) const
{
    switch (m_type) {
    case k_stop    : return bump_stop    (velocity, bumped_x, bumped_y);
    case k_stop_all: return bump_stop_all(velocity, bumped_x, bumped_y);
    case k_bounce  : return bump_bounce  (velocity, bumped_x, bumped_y, m_damping);
    case k_custom  : return m_custom     (velocity, bumped_x, bumped_y);
    }
    throw RtError("BumpPolicy::operator(): bad policy type.");
}

} // end of mcol namespace
