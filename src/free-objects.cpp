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

#include "free-objects.hpp"

namespace {

using namespace cul::exceptions_abbr;

} // end of <anonymous> namespace

namespace mcol {

bool FreeObjectSourceImpl::blocks(const Obstacle & obstacle, Side side) const {
    verify_index("FreeObjectSourceImpl::blocks", obstacle.index);
    return m_objects[obstacle.index].sides.blocks(side);
}

std::size_t FreeObjectSourceImpl::add_object(const Object & obj) {
    verify_bounds("FreeObjectSourceImpl::add_object", obj.bounds);
    m_objects.push_back(obj);
    return m_objects.size() - 1;
}

void FreeObjectSourceImpl::set_object_bounds
    (std::size_t index, const Rectangle & bounds)
{
    static constexpr const auto k_caller = "FreeObjectSourceImpl::set_object_bounds";
    verify_index(k_caller, index);
    verify_bounds(k_caller, bounds);
    m_objects[index].bounds = bounds;
}

const FreeObjectSource::Object & FreeObjectSourceImpl::object
    (std::size_t index) const
{
    verify_index("FreeObjectSourceImpl::object", index);
    return m_objects[index];
}

/* private */ void FreeObjectSourceImpl::for_each_obstacle_
    (const Rectangle & region, const ObstacleInquiry & f) const
{
    verify_region("FreeObjectSourceImpl::for_each_obstacle_", region);
    for (std::size_t i = 0; i != m_objects.size(); ++i) {
        const auto & obj = m_objects[i];
        if (!overlaps_or_touches(obj.bounds, region)) continue;
        Obstacle obstacle;
        obstacle.bounds = obj.bounds;
        obstacle.object = obj.reference;
        obstacle.index  = i;
        f(obstacle);
    }
}

/* private */ void FreeObjectSourceImpl::verify_index
    (const char * caller, std::size_t index) const
{
    if (index < m_objects.size()) return;
    throw InvArg(std::string(caller) + ": index " + std::to_string(index)
                 + " does not refer to any object.");
}

/* private static */ void FreeObjectSourceImpl::verify_bounds
    (const char * caller, const Rectangle & bounds)
{
    if (!is_real(bounds)) {
        throw InvArg(std::string(caller) + ": object bounds must be real in "
                     "every field.");
    }
    if (bounds.width < 0 || bounds.height < 0) {
        throw InvArg(std::string(caller) + ": object bounds size must be "
                     "non-negative.");
    }
}

} // end of mcol namespace
