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

// We want to cover as much code as possible...

// helpers...
// obstacle sources...
// bump policies...
// resolution...

#include <common/TestSuite.hpp>

// A todo list of functions and features... of course!
// helpers.hpp
// - Helper Free Functions:
//   - find_sweep
//   - overlaps_strictly / overlaps_or_touches
//   - find_cell_range
//   - find_flush_position
//   - find_contact_sides
// obstacles.hpp
// - TileObstacleSource (uniform)
// - PropertyTileSource (per side)
// - FreeObjectSource
// collider.hpp
// - stock bump policies and BumpPolicy
// - resolve_map_collision / MapCollider
// - several frames of platformer style movement
namespace {

using cul::ts::TestSuite;

} // end of <anonymous> namespace

void do_helpers_tests(TestSuite &);
void do_find_flush_position_tests(TestSuite &);

void do_tile_source_tests(TestSuite &);
void do_property_tile_source_tests(TestSuite &);
void do_free_object_source_tests(TestSuite &);

void do_bump_policy_tests(TestSuite &);
void do_resolution_tests(TestSuite &);

void do_integration_tests(TestSuite &);

int main() {
    TestSuite suite;
    suite.hide_successes();
    // the flag resets for every series
    auto k_test_functions = {
        do_helpers_tests,
        do_find_flush_position_tests,
        do_tile_source_tests,
        do_property_tile_source_tests,
        do_free_object_source_tests,
        do_bump_policy_tests,
        do_resolution_tests,
        do_integration_tests
    };
    bool all_successes = true;
    for (auto f : k_test_functions) {
        f(suite);
        if (!suite.has_successes_only())
            all_successes = false;
    }
    return !all_successes;
}
