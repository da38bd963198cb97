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

#include "helpers.hpp"

#include <cassert>

namespace {

using namespace cul::exceptions_abbr;
using mcol::Rectangle, mcol::Vector, mcol::BumpHandler, mcol::Obstacle,
      mcol::k_horizontal, mcol::k_vertical;

class NullBumpHandler final : public BumpHandler {
public:
    void on_bump_left  (const Obstacle &) final {}
    void on_bump_right (const Obstacle &) final {}
    void on_bump_top   (const Obstacle &) final {}
    void on_bump_bottom(const Obstacle &) final {}
};

void verify_rectangle(const char * name, const Rectangle &);

} // end of <anonymous> namespace

namespace mcol {

/* static */ BumpHandler & BumpHandler::null_instance() {
    static NullBumpHandler inst;
    return inst;
}

void BumpEvent::send_to(BumpHandler & handler) const {
    switch (side) {
    case Side::k_left  : handler.on_bump_left  (obstacle); break;
    case Side::k_right : handler.on_bump_right (obstacle); break;
    case Side::k_top   : handler.on_bump_top   (obstacle); break;
    case Side::k_bottom: handler.on_bump_bottom(obstacle); break;
    }
}

CollisionResult resolve_map_collision
    (const Rectangle & last, const Rectangle & tentative, const Vector & velocity,
     const ObstacleSource & source, const BumpPolicy & policy, BumpHandler & handler)
{
    verify_rectangle("last", last);
    verify_rectangle("tentative", tentative);
    if (!cul::is_real(velocity)) {
        throw InvArg("resolve_map_collision: velocity must be a real vector.");
    }

    // events from both axises are gathered before any are sent
    std::vector<BumpEvent> events;
    CollisionResult rv;

    // x first, y keeps its last position for this sweep
    rv.bounds = tentative;
    rv.bounds.top = last.top;
    rv.bumped_x = clip_along<k_horizontal>(source, last, rv.bounds, velocity.x, events);
    assert(rv.bumped_x || rv.bounds.left == tentative.left);

    // y second, sweeping with the already corrected x position
    rv.bounds.top = tentative.top;
    rv.bumped_y = clip_along<k_vertical>(source, last, rv.bounds, velocity.y, events);
    assert(rv.bumped_y || rv.bounds.top == tentative.top);

    for (const auto & event : events)
        { event.send_to(handler); }

    rv.velocity = policy(velocity, rv.bumped_x, rv.bumped_y);
    return rv;
}

CollisionStep make_collision_step(const MapCollider & collider, BumpHandler & handler) {
    return [&collider, &handler]
        (const Rectangle & last, const Rectangle & tentative, const Vector & velocity)
    { return collider.resolve(last, tentative, velocity, handler); };
}

} // end of mcol namespace

namespace {

void verify_rectangle(const char * name, const Rectangle & rect) {
    if (!mcol::is_real(rect)) {
        throw InvArg(std::string("resolve_map_collision: ") + name + " bounds "
                     "must be real in every field.");
    }
    if (rect.width < 0 || rect.height < 0) {
        throw InvArg(std::string("resolve_map_collision: ") + name + " bounds "
                     "size must be non-negative.");
    }
}

} // end of <anonymous> namespace
