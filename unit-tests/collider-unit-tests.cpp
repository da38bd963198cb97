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

#include <stdexcept>
#include <limits>

namespace {

using cul::ts::TestSuite, cul::ts::test, cul::ts::set_context, cul::ts::Unit,
      mcol::Rectangle, mcol::Vector, mcol::VectorI, mcol::Real, mcol::Side,
      mcol::Obstacle, mcol::BumpPolicy, mcol::MapCollider,
      mcol::CollisionResult, mcol::TileGridSource, mcol::TileObstacleSource,
      mcol::FreeObjectSource, mcol::resolve_map_collision;

using TileGrid = TileGridSource::TileGrid;

#define mark MACRO_MARK_POSITION_OF_CUL_TEST_SUITE

std::unique_ptr<FreeObjectSource> make_objects(std::initializer_list<Rectangle> rects) {
    auto source = FreeObjectSource::make_instance();
    for (const auto & rect : rects) {
        FreeObjectSource::Object obj;
        obj.bounds = rect;
        (void)source->add_object(obj);
    }
    return source;
}

Obstacle obstacle_for(const FreeObjectSource & source, std::size_t index) {
    Obstacle rv;
    rv.bounds = source.object(index).bounds;
    rv.object = source.object(index).reference;
    rv.index  = index;
    return rv;
}

// an inner corner: a wall on the right, and a floor beneath it
//
// . . . #
// . . . #
// # # # #
std::unique_ptr<TileObstacleSource> make_corner_source() {
    auto source = TileObstacleSource::make_instance();
    source->set_tiles(TileGrid({
        { 0, 0, 0, 1 },
        { 0, 0, 0, 1 },
        { 1, 1, 1, 1 }
    }));
    source->set_cell_size(10, 10);
    return source;
}

bool has_no_bumps(const CollisionResult & res)
    { return !res.bumped_x && !res.bumped_y; }

} // end of <anonymous> namespace

void do_bump_policy_tests(TestSuite & suite) {
    using namespace mcol;
    suite.start_series("stock bump policies");
    mark(suite).test([] {
        return test(are_same(bump_stop(Vector{3, 4}, true, false), Vector{0, 4}));
    });
    mark(suite).test([] {
        return test(are_same(bump_stop(Vector{3, 4}, false, true), Vector{3, 0}));
    });
    mark(suite).test([] {
        return test(are_same(bump_stop(Vector{3, 4}, false, false), Vector{3, 4}));
    });
    mark(suite).test([] {
        return test(are_same(bump_stop_all(Vector{3, 4}, false, true), Vector{0, 0}));
    });
    mark(suite).test([] {
        return test(are_same(bump_stop_all(Vector{3, 4}, false, false), Vector{3, 4}));
    });
    mark(suite).test([] {
        return test(are_same(bump_bounce(Vector{3, -4}, true, true), Vector{-3, 4}));
    });
    mark(suite).test([] {
        return test(are_same(bump_bounce(Vector{3, -4}, false, true, 0.5), Vector{3, 2}));
    });

    suite.start_series("BumpPolicy");
    mark(suite).test([] {
        BumpPolicy policy;
        return test(   policy.type() == BumpPolicy::k_stop
                    && are_same(policy(Vector{3, 4}, true, false), Vector{0, 4}));
    });
    mark(suite).test([] {
        auto policy = BumpPolicy::make_stop_all();
        return test(   policy.type() == BumpPolicy::k_stop_all
                    && are_same(policy(Vector{3, 4}, true, false), Vector{0, 0}));
    });
    mark(suite).test([] {
        auto policy = BumpPolicy::make_bounce(0.5);
        return test(   policy.type() == BumpPolicy::k_bounce && policy.damping() == 0.5
                    && are_same(policy(Vector{4, 4}, true, false), Vector{-2, 4}));
    });
    mark(suite).test([] {
        auto policy = BumpPolicy::make_custom([](const Vector & r, bool bx, bool by)
            { return (bx || by) ? r*0.25 : r; });
        return test(   policy.type() == BumpPolicy::k_custom
                    && are_same(policy(Vector{4, 8}, false, true), Vector{1, 2}));
    });
    mark(suite).test([] {
        try {
            (void)BumpPolicy::make_bounce(-1);
        } catch (std::invalid_argument &) {
            return test(true);
        }
        return test(false);
    });
    mark(suite).test([] {
        try {
            (void)BumpPolicy::make_custom(BumpPolicy::CustomFunction{});
        } catch (std::invalid_argument &) {
            return test(true);
        }
        return test(false);
    });
}

void do_resolution_tests(TestSuite & suite) {
    suite.start_series("resolve - no obstacles");
    mark(suite).test([] {
        auto source = make_objects({});
        MapCollider collider{*source};
        auto res = collider.resolve(Rectangle{0, 0, 10, 10}, Rectangle{5, 3, 10, 10}, Vector{5, 3});
        return test(   are_same(res.bounds, Rectangle{5, 3, 10, 10})
                    && are_same(res.velocity, Vector{5, 3}) && has_no_bumps(res));
    });
    mark(suite).test([] {
        // obstacles nearby, but none in the way
        auto source = make_objects({ Rectangle{0, 20, 50, 10}, Rectangle{40, 0, 10, 10} });
        MapCollider collider{*source};
        BumpRecorder recorder;
        auto res = collider.resolve(Rectangle{0, 0, 10, 10}, Rectangle{5, 3, 10, 10},
                                    Vector{5, 3}, recorder);
        return test(   are_same(res.bounds, Rectangle{5, 3, 10, 10})
                    && has_no_bumps(res) && recorder.events().empty());
    });

    suite.start_series("resolve - single blocker");
    set_context(suite, [](TestSuite & suite, Unit & unit) {
        auto source = make_objects({ Rectangle{20, 0, 10, 10} });
        MapCollider collider{*source};
        BumpRecorder recorder;
        auto res = collider.resolve(Rectangle{0, 0, 10, 10}, Rectangle{15, 0, 10, 10},
                                    Vector{15, 0}, recorder);
        unit.start(mark(suite), [&] {
            return test(cul::right_of(res.bounds) == 20 && res.bounds.left == 10);
        });
        unit.start(mark(suite), [&] {
            return test(res.bumped_x && !res.bumped_y);
        });
        unit.start(mark(suite), [&] {
            return test(   recorder.events().size() == 1
                        && recorder.count(Side::k_right, obstacle_for(*source, 0)) == 1);
        });
        unit.start(mark(suite), [&] {
            return test(are_same(res.velocity, Vector{0, 0}));
        });
    });
    mark(suite).test([] {
        // moving left into a wall
        auto source = make_objects({ Rectangle{-30, -5, 20, 20} });
        MapCollider collider{*source};
        BumpRecorder recorder;
        auto res = collider.resolve(Rectangle{0, 0, 10, 10}, Rectangle{-15, 0, 10, 10},
                                    Vector{-15, 0}, recorder);
        return test(   res.bounds.left == -10 && res.bumped_x
                    && recorder.count(Side::k_left) == 1);
    });
    mark(suite).test([] {
        // jumping into a ceiling
        auto source = make_objects({ Rectangle{-30, -30, 100, 20} });
        MapCollider collider{*source};
        BumpRecorder recorder;
        auto res = collider.resolve(Rectangle{0, 0, 10, 10}, Rectangle{0, -15, 10, 10},
                                    Vector{0, -15}, recorder);
        return test(   res.bounds.top == -10 && res.bumped_y && !res.bumped_x
                    && recorder.count(Side::k_top) == 1);
    });

    suite.start_series("resolve - one way platform");
    set_context(suite, [](TestSuite & suite, Unit & unit) {
        auto source = FreeObjectSource::make_instance();
        FreeObjectSource::Object platform;
        platform.bounds = Rectangle{0, 20, 30, 5};
        platform.sides  = mcol::k_one_way_sides;
        (void)source->add_object(platform);
        MapCollider collider{*source};
        BumpRecorder recorder;
        unit.start(mark(suite), [&] {
            // from below, passes right through
            recorder.clear();
            auto res = collider.resolve(Rectangle{5, 30, 10, 10}, Rectangle{5, 20, 10, 10},
                                        Vector{0, -10}, recorder);
            return test(   are_same(res.bounds, Rectangle{5, 20, 10, 10})
                        && has_no_bumps(res) && recorder.events().empty());
        });
        unit.start(mark(suite), [&] {
            // from above, lands on top
            recorder.clear();
            auto res = collider.resolve(Rectangle{5, 5, 10, 10}, Rectangle{5, 15, 10, 10},
                                        Vector{0, 10}, recorder);
            return test(   cul::bottom_of(res.bounds) == 20 && res.bumped_y
                        && recorder.count(Side::k_bottom) == 1);
        });
        unit.start(mark(suite), [&] {
            // walking into its side
            recorder.clear();
            auto res = collider.resolve(Rectangle{-15, 18, 10, 10}, Rectangle{-2, 18, 10, 10},
                                        Vector{13, 0}, recorder);
            return test(!res.bumped_x && recorder.events().empty());
        });
    });

    suite.start_series("resolve - many blockers");
    mark(suite).test([] {
        auto source = make_objects({ Rectangle{20, 0, 5, 10}, Rectangle{30, 0, 5, 10} });
        MapCollider collider{*source};
        BumpRecorder recorder;
        auto res = collider.resolve(Rectangle{0, 0, 10, 10}, Rectangle{30, 0, 10, 10},
                                    Vector{30, 0}, recorder);
        return test(   res.bounds.left == 10 && res.bumped_x
                    && recorder.count(Side::k_right) == 2);
    });
    mark(suite).test([] {
        // order of enumeration must not matter
        auto source = make_objects({ Rectangle{30, 0, 5, 10}, Rectangle{20, 0, 5, 10} });
        MapCollider collider{*source};
        BumpRecorder recorder;
        auto res = collider.resolve(Rectangle{0, 0, 10, 10}, Rectangle{30, 0, 10, 10},
                                    Vector{30, 0}, recorder);
        return test(   res.bounds.left == 10 && res.bumped_x
                    && recorder.count(Side::k_right, obstacle_for(*source, 0)) == 1
                    && recorder.count(Side::k_right, obstacle_for(*source, 1)) == 1);
    });
    mark(suite).test([] {
        // going left, nearest is now the one with the greatest right edge
        auto source = make_objects({ Rectangle{-40, 0, 5, 10}, Rectangle{-20, 0, 5, 10} });
        MapCollider collider{*source};
        auto res = collider.resolve(Rectangle{0, 0, 10, 10}, Rectangle{-45, 0, 10, 10},
                                    Vector{-45, 0});
        return test(res.bounds.left == -15 && res.bumped_x);
    });

    suite.start_series("resolve - resting");
    mark(suite).test([] {
        auto source = make_objects({ Rectangle{20, 0, 10, 10} });
        MapCollider collider{*source};
        BumpRecorder recorder;
        const Rectangle r{10, 0, 10, 10};
        auto res = collider.resolve(r, r, Vector{}, recorder);
        return test(   are_same(res.bounds, r) && are_same(res.velocity, Vector{})
                    && has_no_bumps(res) && recorder.events().empty());
    });
    mark(suite).test([] {
        // leaning on a wall, moving only downward
        auto source = make_objects({ Rectangle{20, -50, 10, 100} });
        MapCollider collider{*source};
        BumpRecorder recorder;
        auto res = collider.resolve(Rectangle{10, 0, 10, 10}, Rectangle{10, 5, 10, 10},
                                    Vector{0, 5}, recorder);
        return test(   are_same(res.bounds, Rectangle{10, 5, 10, 10})
                    && has_no_bumps(res) && recorder.events().empty());
    });
    mark(suite).test([] {
        // pressing into a floor that is already flush bumps again
        auto source = make_objects({ Rectangle{-50, 10, 100, 10} });
        MapCollider collider{*source};
        auto res = collider.resolve(Rectangle{0, 0, 10, 10}, Rectangle{0, 1, 10, 10},
                                    Vector{0, 1});
        return test(res.bounds.top == 0 && res.bumped_y && res.velocity.y == 0);
    });

    suite.start_series("resolve - inner corner");
    set_context(suite, [](TestSuite & suite, Unit & unit) {
        auto source = make_corner_source();
        MapCollider collider{*source};
        BumpRecorder recorder;
        auto res = collider.resolve(Rectangle{12, 5, 10, 10}, Rectangle{22, 15, 10, 10},
                                    Vector{10, 10}, recorder);
        unit.start(mark(suite), [&] {
            return test(are_same(res.bounds, Rectangle{20, 10, 10, 10}));
        });
        unit.start(mark(suite), [&] {
            return test(res.bumped_x && res.bumped_y);
        });
        unit.start(mark(suite), [&] {
            // two wall tiles share the right face, one floor tile below
            return test(   recorder.count(Side::k_right ) == 2
                        && recorder.count(Side::k_bottom) == 1);
        });
        unit.start(mark(suite), [&] {
            // x is resolved first, so its events come first
            const auto & events = recorder.events();
            return test(   events.size() == 3
                        && events[0].side == Side::k_right
                        && events[1].side == Side::k_right
                        && events[2].side == Side::k_bottom
                        && events[2].obstacle.cell == VectorI{2, 2});
        });
    });

    suite.start_series("resolve - policies");
    set_context(suite, [](TestSuite & suite, Unit & unit) {
        auto source = make_objects({ Rectangle{20, -50, 10, 100} });
        const Rectangle last{0, 0, 10, 10};
        const Rectangle tentative{15, 3, 10, 10};
        const Vector velocity{15, 3};
        unit.start(mark(suite), [&] {
            MapCollider collider{*source};
            auto res = collider.resolve(last, tentative, velocity);
            return test(   are_same(res.bounds, Rectangle{10, 3, 10, 10})
                        && res.bumped_x && !res.bumped_y
                        && are_same(res.velocity, Vector{0, 3}));
        });
        unit.start(mark(suite), [&] {
            MapCollider collider{*source, BumpPolicy::make_stop_all()};
            auto res = collider.resolve(last, tentative, velocity);
            return test(are_same(res.velocity, Vector{0, 0}));
        });
        unit.start(mark(suite), [&] {
            MapCollider collider{*source, BumpPolicy::make_bounce()};
            auto res = collider.resolve(last, tentative, velocity);
            return test(are_same(res.velocity, Vector{-15, 3}));
        });
        unit.start(mark(suite), [&] {
            MapCollider collider{*source, BumpPolicy::make_custom(
                [](const Vector &, bool, bool) { return Vector{42, 42}; })};
            auto res = collider.resolve(last, tentative, velocity);
            return test(are_same(res.velocity, Vector{42, 42}));
        });
    });
    mark(suite).test([] {
        // a ball landing on the floor
        auto source = make_objects({ Rectangle{-100, 20, 200, 10} });
        MapCollider collider{*source, BumpPolicy::make_bounce()};
        auto res = collider.resolve(Rectangle{0, 0, 10, 10}, Rectangle{2, 15, 10, 10},
                                    Vector{2, 15});
        return test(   are_same(res.bounds, Rectangle{2, 10, 10, 10})
                    && are_same(res.velocity, Vector{2, -15}));
    });

    suite.start_series("resolve - reuse");
    mark(suite).test([] {
        // flags are about one call only
        auto source = make_objects({ Rectangle{20, 0, 10, 10} });
        MapCollider collider{*source};
        auto first  = collider.resolve(Rectangle{0, 0, 10, 10}, Rectangle{15, 0, 10, 10},
                                       Vector{15, 0});
        auto second = collider.resolve(Rectangle{0, 40, 10, 10}, Rectangle{15, 40, 10, 10},
                                       Vector{15, 0});
        return test(first.bumped_x && has_no_bumps(second));
    });
    mark(suite).test([] {
        auto source = make_objects({ Rectangle{20, 0, 10, 10} });
        MapCollider collider{*source};
        BumpRecorder recorder;
        auto step = mcol::make_collision_step(collider, recorder);
        auto res = step(Rectangle{0, 0, 10, 10}, Rectangle{15, 0, 10, 10}, Vector{15, 0});
        return test(res.bounds.left == 10 && recorder.count(Side::k_right) == 1);
    });
    mark(suite).test([] {
        // the free function takes the same parts as the collider
        auto source = make_objects({ Rectangle{20, 0, 10, 10} });
        BumpRecorder recorder;
        auto res = resolve_map_collision(
            Rectangle{0, 0, 10, 10}, Rectangle{15, 0, 10, 10}, Vector{15, 0},
            *source, BumpPolicy::make_stop_all(), recorder);
        return test(   res.bounds.left == 10 && res.bumped_x
                    && recorder.events().size() == 1);
    });

    suite.start_series("resolve - fractional geometry");
    mark(suite).test([] {
        // -0.5 + 0.8 is a hair past 0.3, landing must not leave the actor
        // inside the floor, nor let it fall through on the next frame
        auto source = make_objects({ Rectangle{-10, 0.3, 20, 1} });
        MapCollider collider{*source};
        Rectangle bounds{0, -1.0, 1, 0.8};
        bool always_above = true, always_bumped = true;
        for (int i = 0; i != 4; ++i) {
            auto tentative = bounds;
            tentative.top += 0.5;
            auto res = collider.resolve(bounds, tentative, Vector{0, 0.5});
            bounds = res.bounds;
            always_above  = always_above  && cul::bottom_of(bounds) <= 0.3;
            always_bumped = always_bumped && res.bumped_y;
        }
        return test(always_above && always_bumped);
    });
    mark(suite).test([] {
        auto source = make_objects({ Rectangle{0.9, -5, 1, 10} });
        MapCollider collider{*source};
        BumpRecorder recorder;
        Rectangle bounds{0, 0, 0.3, 1};
        bool never_inside = true;
        for (int i = 0; i != 6; ++i) {
            auto tentative = bounds;
            tentative.left += 0.35;
            bounds = collider.resolve(bounds, tentative, Vector{0.35, 0}, recorder).bounds;
            never_inside = never_inside && cul::right_of(bounds) <= 0.9;
        }
        // one bump per frame from the second frame on
        return test(never_inside && recorder.count(Side::k_right) == 5);
    });

    suite.start_series("resolve - far from the map");
    mark(suite).test([] {
        auto source = make_corner_source();
        MapCollider collider{*source};
        auto res = collider.resolve(Rectangle{1e12, 0, 1, 1}, Rectangle{1e12 + 1, 0, 1, 1},
                                    Vector{1, 0});
        return test(   are_same(res.bounds, Rectangle{1e12 + 1, 0, 1, 1})
                    && has_no_bumps(res));
    });
    mark(suite).test([] {
        auto source = make_corner_source();
        source->set_out_of_bounds_policy(TileGridSource::OutOfBounds::k_as_solid);
        MapCollider collider{*source};
        auto res = collider.resolve(Rectangle{-1e12, 1e12, 1, 1}, Rectangle{-1e12, 1e12 - 5, 1, 1},
                                    Vector{0, -5});
        return test(res.bounds.top == 1e12 - 5 && has_no_bumps(res));
    });

    suite.start_series("resolve - bad input");
    mark(suite).test([] {
        auto source = make_objects({});
        MapCollider collider{*source};
        try {
            (void)collider.resolve(Rectangle{0, 0, 10, 10}, Rectangle{1, 0, 10, 10},
                                   Vector{std::numeric_limits<Real>::quiet_NaN(), 0});
        } catch (std::invalid_argument &) {
            return test(true);
        }
        return test(false);
    });
    mark(suite).test([] {
        auto source = make_objects({});
        MapCollider collider{*source};
        try {
            (void)collider.resolve(Rectangle{0, 0, -10, 10}, Rectangle{1, 0, -10, 10},
                                   Vector{1, 0});
        } catch (std::invalid_argument &) {
            return test(true);
        }
        return test(false);
    });
    mark(suite).test([] {
        // already inside a wall, which is ignored rather than corrected
        auto source = make_objects({ Rectangle{5, 0, 10, 10} });
        MapCollider collider{*source};
        auto res = collider.resolve(Rectangle{0, 0, 10, 10}, Rectangle{3, 0, 10, 10},
                                    Vector{3, 0});
        return test(are_same(res.bounds, Rectangle{3, 0, 10, 10}) && has_no_bumps(res));
    });
    mark(suite).test([] {
        // a broken map query is not swallowed
        auto source = make_corner_source();
        source->set_out_of_bounds_policy(TileGridSource::OutOfBounds::k_throw);
        MapCollider collider{*source};
        try {
            (void)collider.resolve(Rectangle{5, 5, 10, 10}, Rectangle{-5, 5, 10, 10},
                                   Vector{-10, 0});
        } catch (std::out_of_range &) {
            return test(true);
        }
        return test(false);
    });
}
