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

#include <mapcol/obstacles.hpp>

#include "test-helpers.hpp"

#include <stdexcept>
#include <limits>

namespace {

using cul::ts::TestSuite, cul::ts::test, cul::ts::set_context, cul::ts::Unit,
      mcol::Rectangle, mcol::Vector, mcol::VectorI, mcol::Side, mcol::Obstacle,
      mcol::TileGridSource, mcol::TileObstacleSource, mcol::PropertyTileSource,
      mcol::FreeObjectSource, mcol::BlockingSides;

using TileGrid    = TileGridSource::TileGrid;
using OutOfBounds = TileGridSource::OutOfBounds;

#define mark MACRO_MARK_POSITION_OF_CUL_TEST_SUITE

constexpr const Side k_all_sides[] =
    { Side::k_left, Side::k_right, Side::k_top, Side::k_bottom };

bool has_cell(const std::vector<Obstacle> & obstacles, VectorI cell) {
    return std::any_of(obstacles.begin(), obstacles.end(),
        [cell](const Obstacle & obstacle) { return obstacle.cell == cell; });
}

const Obstacle * find_cell(const std::vector<Obstacle> & obstacles, VectorI cell) {
    auto itr = std::find_if(obstacles.begin(), obstacles.end(),
        [cell](const Obstacle & obstacle) { return obstacle.cell == cell; });
    return itr == obstacles.end() ? nullptr : &*itr;
}

// 3x3, an "L" shaped pile of blocks
std::unique_ptr<TileObstacleSource> make_uniform_source() {
    auto source = TileObstacleSource::make_instance();
    source->set_tiles(TileGrid({
        { 0, 0, 0 },
        { 0, 1, 0 },
        { 1, 1, 1 }
    }));
    source->set_cell_size(10, 10);
    return source;
}

constexpr const int k_solid_tile   = 1;
constexpr const int k_one_way_tile = 2;
constexpr const int k_bare_tile    = 3;

std::unique_ptr<PropertyTileSource> make_property_source() {
    auto source = PropertyTileSource::make_instance();
    source->set_tiles(TileGrid({
        { k_solid_tile, k_one_way_tile, k_bare_tile, 0 }
    }));
    source->set_cell_size(10, 10);
    source->set_tile_sides(k_solid_tile  , mcol::k_solid_sides  );
    source->set_tile_sides(k_one_way_tile, mcol::k_one_way_sides);
    return source;
}

template <typename Func>
bool throws_invalid_argument(Func && f) {
    try {
        f();
    } catch (std::invalid_argument &) {
        return true;
    }
    return false;
}

} // end of <anonymous> namespace

void do_tile_source_tests(TestSuite & suite) {
    suite.start_series("TileObstacleSource");
    mark(suite).test([] {
        // all nearby cells are empty
        auto source = make_uniform_source();
        return test(source->query(Rectangle{0, 0, 5, 5}).empty());
    });
    set_context(suite, [](TestSuite & suite, Unit & unit) {
        auto source = make_uniform_source();
        // exactly covering the middle cell, touches everything else
        auto obstacles = source->query(Rectangle{10, 10, 10, 10});
        unit.start(mark(suite), [&] {
            return test(obstacles.size() == 4);
        });
        unit.start(mark(suite), [&] {
            const auto * middle = find_cell(obstacles, VectorI{1, 1});
            return test(middle && are_same(middle->bounds, Rectangle{10, 10, 10, 10}));
        });
        unit.start(mark(suite), [&] {
            return test(   has_cell(obstacles, VectorI{0, 2})
                        && has_cell(obstacles, VectorI{2, 2}));
        });
        unit.start(mark(suite), [&] {
            bool all_block = true;
            for (const auto & obstacle : obstacles) {
                for (auto side : k_all_sides)
                    all_block = all_block && source->blocks(obstacle, side);
            }
            return test(all_block);
        });
    });
    mark(suite).test([] {
        auto source = make_uniform_source();
        return test(   source->tile_at(VectorI{1, 1}) == 1
                    && source->tile_at(VectorI{0, 0}) == TileGridSource::k_empty_tile
                    && source->tile_at(VectorI{-1, 0}) == TileGridSource::k_empty_tile);
    });
    mark(suite).test([] {
        auto source = make_uniform_source();
        source->set_offset(Vector{100, 0});
        return test(are_same(source->cell_bounds(VectorI{1, 0}), Rectangle{110, 0, 10, 10}));
    });
    mark(suite).test([] {
        auto source = make_uniform_source();
        source->set_tile(VectorI{0, 0}, 7);
        auto obstacles = source->query(Rectangle{1, 1, 2, 2});
        return test(obstacles.size() == 1 && obstacles.front().cell == VectorI{0, 0});
    });
    mark(suite).test([] {
        auto source = make_uniform_source();
        return test(throws_invalid_argument([&source] { source->set_tile(VectorI{3, 0}, 1); }));
    });
    mark(suite).test([] {
        auto source = make_uniform_source();
        return test(throws_invalid_argument([&source] { source->set_cell_size(0, 10); }));
    });
    mark(suite).test([] {
        auto source = make_uniform_source();
        return test(throws_invalid_argument([&source] {
            source->set_offset(Vector{std::numeric_limits<mcol::Real>::quiet_NaN(), 0});
        }));
    });
    mark(suite).test([] {
        auto source = make_uniform_source();
        return test(throws_invalid_argument([&source]
            { (void)source->query(Rectangle{0, 0, -1, 5}); }));
    });

    suite.start_series("TileObstacleSource - out of bounds");
    mark(suite).test([] {
        auto source = make_uniform_source();
        source->set_out_of_bounds_policy(OutOfBounds::k_throw);
        try {
            (void)source->query(Rectangle{-5, 0, 10, 10});
        } catch (std::out_of_range &) {
            return test(true);
        }
        return test(false);
    });
    mark(suite).test([] {
        // merely touching the edge of the grid is fine
        auto source = make_uniform_source();
        source->set_out_of_bounds_policy(OutOfBounds::k_throw);
        return test(source->query(Rectangle{0, 0, 5, 5}).empty());
    });
    mark(suite).test([] {
        auto source = make_uniform_source();
        source->set_out_of_bounds_policy(OutOfBounds::k_as_solid);
        auto obstacles = source->query(Rectangle{0, 0, 10, 10});
        // five cells off the grid, and the middle cell
        return test(   obstacles.size() == 6
                    && has_cell(obstacles, VectorI{-1, 0})
                    && has_cell(obstacles, VectorI{1, 1}));
    });
    mark(suite).test([] {
        // a very long region only ever sees the ring of cells around the
        // grid
        auto source = make_uniform_source();
        source->set_out_of_bounds_policy(OutOfBounds::k_as_solid);
        auto obstacles = source->query(Rectangle{-1e9, 0, 2e9, 5});
        return test(   obstacles.size() == 7
                    && has_cell(obstacles, VectorI{-1, -1})
                    && has_cell(obstacles, VectorI{ 3,  0}));
    });
    mark(suite).test([] {
        auto source = make_uniform_source();
        return test(source->query(Rectangle{1e12, 1e12, 10, 10}).empty());
    });
    mark(suite).test([] {
        auto source = make_uniform_source();
        return test(   source->query(Rectangle{-100, -100, 50, 50}).empty()
                    && source->out_of_bounds_policy() == OutOfBounds::k_as_empty);
    });
}

void do_property_tile_source_tests(TestSuite & suite) {
    suite.start_series("PropertyTileSource");
    set_context(suite, [](TestSuite & suite, Unit & unit) {
        auto source = make_property_source();
        auto obstacles = source->query(Rectangle{0, 0, 30, 10});
        unit.start(mark(suite), [&] {
            // the empty cell is not an obstacle, but the bare tile is one
            return test(obstacles.size() == 3 && !has_cell(obstacles, VectorI{3, 0}));
        });
        unit.start(mark(suite), [&] {
            const auto * solid = find_cell(obstacles, VectorI{0, 0});
            bool all_block = solid != nullptr;
            for (auto side : k_all_sides)
                all_block = all_block && source->blocks(*solid, side);
            return test(all_block);
        });
        unit.start(mark(suite), [&] {
            const auto * one_way = find_cell(obstacles, VectorI{1, 0});
            return test(   one_way
                        &&  source->blocks(*one_way, Side::k_top   )
                        && !source->blocks(*one_way, Side::k_bottom)
                        && !source->blocks(*one_way, Side::k_left  )
                        && !source->blocks(*one_way, Side::k_right ));
        });
        unit.start(mark(suite), [&] {
            // tiles without any set sides do not block
            const auto * bare = find_cell(obstacles, VectorI{2, 0});
            bool none_block = bare != nullptr;
            for (auto side : k_all_sides)
                none_block = none_block && !source->blocks(*bare, side);
            return test(none_block);
        });
    });
    set_context(suite, [](TestSuite & suite, Unit & unit) {
        // secret passage: solid tile that lets the player walk in from the
        // left
        auto source = make_property_source();
        source->set_cell_sides(VectorI{0, 0}, BlockingSides{false, true, true, true});
        unit.start(mark(suite), [&] {
            return test(   !source->sides_at(VectorI{0, 0}).left
                        &&  source->sides_at(VectorI{0, 0}).right);
        });
        unit.start(mark(suite), [&] {
            // only the one cell is affected
            return test(source->sides_at(VectorI{1, 0}) == mcol::k_one_way_sides);
        });
        unit.start(mark(suite), [&] {
            source->clear_cell_sides(VectorI{0, 0});
            return test(source->sides_at(VectorI{0, 0}) == mcol::k_solid_sides);
        });
    });
    mark(suite).test([] {
        auto source = make_property_source();
        return test(throws_invalid_argument([&source]
            { source->set_cell_sides(VectorI{0, 1}, mcol::k_passable_sides); }));
    });
    mark(suite).test([] {
        auto source = make_property_source();
        source->set_out_of_bounds_policy(OutOfBounds::k_as_solid);
        return test(source->sides_at(VectorI{-1, 0}) == mcol::k_solid_sides);
    });
}

void do_free_object_source_tests(TestSuite & suite) {
    suite.start_series("FreeObjectSource");
    set_context(suite, [](TestSuite & suite, Unit & unit) {
        int platform_tag = 0, wall_tag = 0;
        auto source = FreeObjectSource::make_instance();
        FreeObjectSource::Object platform;
        platform.bounds    = Rectangle{0, 50, 40, 5};
        platform.reference = &platform_tag;
        platform.sides     = mcol::k_one_way_sides;
        FreeObjectSource::Object wall;
        wall.bounds    = Rectangle{100, 0, 10, 100};
        wall.reference = &wall_tag;
        const auto platform_idx = source->add_object(platform);
        const auto wall_idx     = source->add_object(wall);
        unit.start(mark(suite), [&] {
            return test(   platform_idx == 0 && wall_idx == 1
                        && source->object_count() == 2);
        });
        unit.start(mark(suite), [&] {
            // touching counts
            auto obstacles = source->query(Rectangle{10, 40, 10, 10});
            return test(   obstacles.size() == 1
                        && obstacles.front().object == &platform_tag
                        && obstacles.front().index  == platform_idx
                        && are_same(obstacles.front().bounds, platform.bounds));
        });
        unit.start(mark(suite), [&] {
            return test(source->query(Rectangle{50, 0, 10, 10}).empty());
        });
        unit.start(mark(suite), [&] {
            auto obstacles = source->query(Rectangle{0, 0, 200, 200});
            bool wall_blocks = false, platform_one_way = false;
            for (const auto & obstacle : obstacles) {
                if (obstacle.object == &wall_tag) {
                    wall_blocks =    source->blocks(obstacle, Side::k_left)
                                  && source->blocks(obstacle, Side::k_bottom);
                } else if (obstacle.object == &platform_tag) {
                    platform_one_way =    source->blocks(obstacle, Side::k_top)
                                      && !source->blocks(obstacle, Side::k_bottom);
                }
            }
            return test(obstacles.size() == 2 && wall_blocks && platform_one_way);
        });
        unit.start(mark(suite), [&] {
            // moving platform
            source->set_object_bounds(platform_idx, Rectangle{60, 50, 40, 5});
            return test(   source->query(Rectangle{10, 40, 10, 10}).empty()
                        && source->query(Rectangle{70, 40, 10, 10}).size() == 1);
        });
        unit.start(mark(suite), [&] {
            return test(throws_invalid_argument([&source]
                { source->set_object_bounds(2, Rectangle{}); }));
        });
        unit.start(mark(suite), [&] {
            source->clear_objects();
            return test(source->object_count() == 0);
        });
    });
    mark(suite).test([] {
        auto source = FreeObjectSource::make_instance();
        FreeObjectSource::Object obj;
        obj.bounds = Rectangle{0, 0, -5, 5};
        return test(throws_invalid_argument([&source, &obj] { (void)source->add_object(obj); }));
    });
}
