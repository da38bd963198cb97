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

#include "tile-sources.hpp"

#include <stdexcept>

namespace {

using namespace cul::exceptions_abbr;
using mcol::VectorI;

std::string cell_to_string(VectorI r)
    { return "(" + std::to_string(r.x) + ", " + std::to_string(r.y) + ")"; }

} // end of <anonymous> namespace

namespace mcol {

TileGridBase::TileGridBase() {}

void TileGridBase::set_tile(VectorI cell, int tile_id) {
    verify_on_grid("TileGridBase::set_tile", cell);
    m_tiles(cell.x, cell.y) = tile_id;
}

int TileGridBase::tile_at(VectorI cell) const
    { return has_cell(cell) ? m_tiles(cell.x, cell.y) : k_empty_tile; }

bool TileGridBase::has_cell(VectorI cell) const {
    return    cell.x >= 0 && cell.x < m_tiles.width ()
           && cell.y >= 0 && cell.y < m_tiles.height();
}

Rectangle TileGridBase::cell_bounds(VectorI cell) const
    { return find_cell_bounds(cell, m_cell_size, m_offset); }

void TileGridBase::set_cell_size(Real cell_width, Real cell_height) {
    for (auto dim : { cell_width, cell_height }) {
        if (dim > 0 && cul::is_real(dim)) continue;
        throw InvArg("TileGridBase::set_cell_size: both width and height must "
                     "be positive real numbers.");
    }
    m_cell_size = Size{cell_width, cell_height};
}

void TileGridBase::set_offset(Vector offset) {
    if (!cul::is_real(offset)) {
        throw InvArg("TileGridBase::set_offset: offset must be a real vector.");
    }
    m_offset = offset;
}

/* protected */ Obstacle TileGridBase::make_obstacle(VectorI cell) const {
    Obstacle obstacle;
    obstacle.bounds = cell_bounds(cell);
    obstacle.cell   = cell;
    return obstacle;
}

/* protected */ void TileGridBase::verify_on_grid
    (const char * caller, VectorI cell) const
{
    if (has_cell(cell)) return;
    throw InvArg(std::string(caller) + ": cell " + cell_to_string(cell) + " is not "
                 "on the tile grid.");
}

/* private */ void TileGridBase::set_tiles_(TileGrid && tiles)
    { m_tiles = std::move(tiles); }

/* private */ void TileGridBase::for_each_obstacle_
    (const Rectangle & region, const ObstacleInquiry & f) const
{
    verify_region("TileGridBase::for_each_obstacle_", region);
    // the grid and one ring of cells around it, cells past the ring are never
    // reached without first passing through it
    const RectangleI limits{-1, -1, m_tiles.width() + 2, m_tiles.height() + 2};
    const auto range = find_cell_range(region, m_cell_size, m_offset, limits);
    for (int y = range.top ; y != cul::bottom_of(range); ++y) {
    for (int x = range.left; x != cul::right_of (range); ++x) {
        const VectorI r{x, y};
        if (has_cell(r)) {
            if (m_tiles(x, y) != k_empty_tile) f(make_obstacle(r));
            continue;
        }
        switch (m_out_of_bounds) {
        case OutOfBounds::k_as_empty: break;
        case OutOfBounds::k_as_solid: f(make_obstacle(r)); break;
        case OutOfBounds::k_throw:
            // merely touching cells off the grid is fine
            if (!overlaps_strictly(cell_bounds(r), region)) break;
            throw std::out_of_range(
                "TileGridBase::for_each_obstacle_: region reaches cell "
                + cell_to_string(r) + " which is outside of the tile grid.");
        }
    }}
}

// ----------------------------------------------------------------------------

bool PropertyTileSourceImpl::blocks(const Obstacle & obstacle, Side side) const
    { return sides_at(obstacle.cell).blocks(side); }

void PropertyTileSourceImpl::set_cell_sides(VectorI cell, BlockingSides sides) {
    verify_on_grid("PropertyTileSourceImpl::set_cell_sides", cell);
    m_cell_sides[cell] = sides;
}

BlockingSides PropertyTileSourceImpl::sides_at(VectorI cell) const {
    // cells off the grid only come up as obstacles when the map's edge is
    // treated as a wall
    if (!has_cell(cell)) {
        return out_of_bounds_policy() == OutOfBounds::k_as_solid
            ? k_solid_sides : k_passable_sides;
    }
    auto cell_itr = m_cell_sides.find(cell);
    if (cell_itr != m_cell_sides.end()) return cell_itr->second;
    auto tile_itr = m_tile_sides.find(tile_at(cell));
    if (tile_itr != m_tile_sides.end()) return tile_itr->second;
    return k_passable_sides;
}

} // end of mcol namespace
