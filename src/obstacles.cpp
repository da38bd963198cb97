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

#include <mapcol/obstacles.hpp>

#include "tile-sources.hpp"
#include "free-objects.hpp"

namespace {

using namespace cul::exceptions_abbr;
using std::make_unique;

} // end of <anonymous> namespace

namespace mcol {

bool BlockingSides::blocks(Side side) const noexcept {
    switch (side) {
    case Side::k_left  : return left  ;
    case Side::k_right : return right ;
    case Side::k_top   : return top   ;
    case Side::k_bottom: return bottom;
    }
    return false;
}

bool operator == (const Obstacle & lhs, const Obstacle & rhs) {
    return    lhs.bounds.left  == rhs.bounds.left  && lhs.bounds.top    == rhs.bounds.top
           && lhs.bounds.width == rhs.bounds.width && lhs.bounds.height == rhs.bounds.height
           && lhs.cell == rhs.cell && lhs.object == rhs.object
           && lhs.index == rhs.index;
}

std::vector<Obstacle> ObstacleSource::query(const Rectangle & region) const {
    std::vector<Obstacle> rv;
    for_each_obstacle(region, [&rv](const Obstacle & obstacle)
        { rv.push_back(obstacle); });
    return rv;
}

/* protected static */ void ObstacleSource::verify_region
    (const char * caller, const Rectangle & region)
{
    if (!is_real(region)) {
        throw InvArg(std::string(caller) + ": region must be real in every "
                     "field.");
    }
    if (region.width < 0 || region.height < 0) {
        throw InvArg(std::string(caller) + ": region size must be "
                     "non-negative.");
    }
}

void TileGridSource::set_tiles(TileGrid && tiles)
    { set_tiles_(std::move(tiles)); }

void TileGridSource::set_tiles(const TileGrid & tiles) {
    auto t = tiles;
    set_tiles_(std::move(t));
}

/* static */ std::unique_ptr<TileObstacleSource>
    TileObstacleSource::make_instance()
{ return make_unique<TileObstacleSourceImpl>(); }

/* static */ std::unique_ptr<PropertyTileSource>
    PropertyTileSource::make_instance()
{ return make_unique<PropertyTileSourceImpl>(); }

/* static */ std::unique_ptr<FreeObjectSource>
    FreeObjectSource::make_instance()
{ return make_unique<FreeObjectSourceImpl>(); }

} // end of mcol namespace
