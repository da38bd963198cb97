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

#include <mapcol/collider.hpp>

#include "test-helpers.hpp"

#include <cmath>

namespace {

using cul::ts::TestSuite, cul::ts::Unit, cul::ts::test, cul::ts::set_context,
      mcol::Rectangle, mcol::Vector, mcol::VectorI, mcol::Real, mcol::Obstacle,
      mcol::BumpHandler, mcol::BumpPolicy, mcol::MapCollider,
      mcol::TileGridSource, mcol::TileObstacleSource, mcol::PropertyTileSource,
      mcol::FreeObjectSource;

using TileGrid = TileGridSource::TileGrid;

#define mark MACRO_MARK_POSITION_OF_CUL_TEST_SUITE

constexpr const Real k_gravity = 1;

// a platformer style actor, one step is one frame of unit length
class Actor final : public BumpHandler {
public:
    Actor(Rectangle bounds_, Vector velocity_):
        bounds(bounds_), velocity(velocity_) {}

    void step(const MapCollider & collider, Real gravity = k_gravity) {
        on_ground = false;
        velocity.y += gravity;
        auto tentative = bounds;
        tentative.left += velocity.x;
        tentative.top  += velocity.y;
        auto res = collider.resolve(bounds, tentative, velocity, *this);
        bounds   = res.bounds;
        velocity = res.velocity;
    }

    void on_bump_left(const Obstacle &) final { ++left_bumps; }

    void on_bump_right(const Obstacle &) final { ++right_bumps; }

    void on_bump_top(const Obstacle &) final { ++top_bumps; }

    void on_bump_bottom(const Obstacle & obstacle) final {
        on_ground = true;
        ++bottom_bumps;
        last_floor = obstacle;
    }

    Rectangle bounds;
    Vector velocity;
    bool on_ground = false;
    int left_bumps = 0, right_bumps = 0, top_bumps = 0, bottom_bumps = 0;
    Obstacle last_floor;
};

// 10x6, open room with a floor along the bottom row, optionally a wall at
// column seven
std::unique_ptr<TileObstacleSource> make_room(bool with_wall) {
    TileGrid tiles;
    tiles.set_size(10, 6, 0);
    for (int x = 0; x != tiles.width(); ++x)
        { tiles(x, 5) = 1; }
    if (with_wall) {
        for (int y = 0; y != tiles.height(); ++y)
            { tiles(7, y) = 1; }
    }
    auto source = TileObstacleSource::make_instance();
    source->set_tiles(std::move(tiles));
    source->set_cell_size(10, 10);
    return source;
}

} // end of <anonymous> namespace

void do_integration_tests(TestSuite & suite) {
    suite.start_series("integration - falling onto a floor");
    set_context(suite, [](TestSuite & suite, Unit & unit) {
        auto source = make_room(false);
        MapCollider collider{*source};
        Actor actor{Rectangle{20, 0, 10, 10}, Vector{}};
        for (int i = 0; i != 30; ++i)
            { actor.step(collider); }
        unit.start(mark(suite), [&] {
            return test(actor.bounds.top == 40 && actor.bounds.left == 20);
        });
        unit.start(mark(suite), [&] {
            // still pressing into the floor every frame
            return test(actor.on_ground && actor.last_floor.cell.y == 5);
        });
        unit.start(mark(suite), [&] {
            // gravity pulls for one frame, and it is taken away again
            return test(actor.velocity.y == 0);
        });
        unit.start(mark(suite), [&] {
            return test(   actor.left_bumps == 0 && actor.right_bumps == 0
                        && actor.top_bumps  == 0);
        });
    });

    suite.start_series("integration - walking into a wall");
    set_context(suite, [](TestSuite & suite, Unit & unit) {
        auto source = make_room(true);
        MapCollider collider{*source};
        Actor actor{Rectangle{20, 40, 10, 10}, Vector{}};
        for (int i = 0; i != 30; ++i) {
            actor.velocity.x = 3;
            actor.step(collider);
        }
        unit.start(mark(suite), [&] {
            return test(actor.bounds.left == 60 && actor.bounds.top == 40);
        });
        unit.start(mark(suite), [&] {
            return test(actor.right_bumps > 0 && actor.left_bumps == 0);
        });
        unit.start(mark(suite), [&] {
            // walking the whole time never lifts the actor off the floor
            return test(actor.on_ground && actor.bottom_bumps == 30);
        });
    });

    suite.start_series("integration - jumping through a one way platform");
    set_context(suite, [](TestSuite & suite, Unit & unit) {
        static constexpr const int k_floor_tile    = 1;
        static constexpr const int k_platform_tile = 2;
        TileGrid tiles;
        tiles.set_size(10, 6, 0);
        for (int x = 0; x != tiles.width(); ++x)
            { tiles(x, 5) = k_floor_tile; }
        for (int x = 1; x != 5; ++x)
            { tiles(x, 2) = k_platform_tile; }
        auto source = PropertyTileSource::make_instance();
        source->set_tiles(std::move(tiles));
        source->set_cell_size(10, 10);
        source->set_tile_sides(k_floor_tile   , mcol::k_solid_sides  );
        source->set_tile_sides(k_platform_tile, mcol::k_one_way_sides);

        MapCollider collider{*source};
        Actor actor{Rectangle{20, 40, 10, 10}, Vector{0, -12}};
        for (int i = 0; i != 60; ++i)
            { actor.step(collider); }
        unit.start(mark(suite), [&] {
            return test(actor.bounds.top == 10 && actor.on_ground);
        });
        unit.start(mark(suite), [&] {
            return test(actor.last_floor.cell == VectorI{2, 2});
        });
        unit.start(mark(suite), [&] {
            // passing upward through the platform is never a bump
            return test(actor.top_bumps == 0);
        });
    });

    suite.start_series("integration - ball in a box");
    set_context(suite, [](TestSuite & suite, Unit & unit) {
        auto source = FreeObjectSource::make_instance();
        for (auto rect : { Rectangle{ -10, -10,  10, 120}, Rectangle{100, -10, 10, 120},
                           Rectangle{   0, -10, 100,  10}, Rectangle{  0, 100, 100, 10} })
        {
            FreeObjectSource::Object wall;
            wall.bounds = rect;
            (void)source->add_object(wall);
        }
        MapCollider collider{*source, BumpPolicy::make_bounce()};
        Actor ball{Rectangle{45, 45, 10, 10}, Vector{7, -5}};
        bool stays_inside = true;
        bool keeps_speed  = true;
        for (int i = 0; i != 200; ++i) {
            ball.step(collider, 0);
            stays_inside =    stays_inside
                           && ball.bounds.left >= 0 && cul::right_of (ball.bounds) <= 100
                           && ball.bounds.top  >= 0 && cul::bottom_of(ball.bounds) <= 100;
            keeps_speed =    keeps_speed
                          && std::abs(ball.velocity.x) == 7 && std::abs(ball.velocity.y) == 5;
        }
        unit.start(mark(suite), [&] {
            return test(stays_inside);
        });
        unit.start(mark(suite), [&] {
            return test(keeps_speed);
        });
        unit.start(mark(suite), [&] {
            // hit every wall along the way
            return test(   ball.left_bumps > 0 && ball.right_bumps  > 0
                        && ball.top_bumps  > 0 && ball.bottom_bumps > 0);
        });
    });
}
