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

#include <mapcol/obstacles.hpp>

#include "helpers.hpp"

namespace mcol {

/// Trivial linear implementation, every query checks every object.
///
/// Object layers are expected to be small, a handful of platforms and walls
/// per screen.
class FreeObjectSourceImpl final : public FreeObjectSource {
public:
    bool blocks(const Obstacle &, Side) const final;

    std::size_t add_object(const Object &) final;

    void set_object_bounds(std::size_t index, const Rectangle &) final;

    const Object & object(std::size_t index) const final;

    std::size_t object_count() const final { return m_objects.size(); }

    void clear_objects() final { m_objects.clear(); }

private:
    void for_each_obstacle_(const Rectangle &, const ObstacleInquiry &) const final;

    void verify_index(const char * caller, std::size_t index) const;

    static void verify_bounds(const char * caller, const Rectangle &);

    std::vector<Object> m_objects;
};

} // end of mcol namespace
