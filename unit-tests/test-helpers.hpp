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

#include <algorithm>
#include <vector>

// shared among test series, records every bump it is sent
class BumpRecorder final : public mcol::BumpHandler {
public:
    using Obstacle  = mcol::Obstacle;
    using Side      = mcol::Side;
    using BumpEvent = mcol::BumpEvent;

    void on_bump_left(const Obstacle & obstacle) final
        { m_events.push_back(BumpEvent{obstacle, Side::k_left}); }

    void on_bump_right(const Obstacle & obstacle) final
        { m_events.push_back(BumpEvent{obstacle, Side::k_right}); }

    void on_bump_top(const Obstacle & obstacle) final
        { m_events.push_back(BumpEvent{obstacle, Side::k_top}); }

    void on_bump_bottom(const Obstacle & obstacle) final
        { m_events.push_back(BumpEvent{obstacle, Side::k_bottom}); }

    const std::vector<BumpEvent> & events() const { return m_events; }

    int count(Side side) const {
        return int(std::count_if(m_events.begin(), m_events.end(),
            [side](const BumpEvent & event) { return event.side == side; }));
    }

    int count(Side side, const Obstacle & obstacle) const {
        return int(std::count_if(m_events.begin(), m_events.end(),
            [side, &obstacle](const BumpEvent & event)
            { return event.side == side && event.obstacle == obstacle; }));
    }

    void clear() { m_events.clear(); }

private:
    std::vector<BumpEvent> m_events;
};

inline bool are_same(const mcol::Rectangle & a, const mcol::Rectangle & b) {
    return    a.left  == b.left  && a.top    == b.top
           && a.width == b.width && a.height == b.height;
}

inline bool are_same(const mcol::Vector & a, const mcol::Vector & b)
    { return a.x == b.x && a.y == b.y; }
