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

#include <unordered_map>

namespace mcol {

struct VectorIHasher {
    std::size_t operator () (const VectorI & r) const {
        std::hash<int> int_hash{};
        return int_hash(r.x) ^ (int_hash(r.y) << 16 | int_hash(r.y) >> 16);
    }
};

/// This describes the grid, its geometry, and the enumeration of tiles
/// common to all tile sources.
///
/// Implementations should inherit this class
class TileGridBase : virtual public TileGridSource {
public:
    TileGridBase();

    virtual ~TileGridBase() {}

    void set_tile(VectorI cell, int tile_id) final;

    int tile_at(VectorI cell) const final;

    bool has_cell(VectorI cell) const final;

    Rectangle cell_bounds(VectorI cell) const final;

    void set_cell_size(Real cell_width, Real cell_height) final;

    void set_offset(Vector offset) final;

    void set_out_of_bounds_policy(OutOfBounds policy) final
        { m_out_of_bounds = policy; }

    Size cell_size() const final { return m_cell_size; }

    Vector offset() const final { return m_offset; }

    OutOfBounds out_of_bounds_policy() const final { return m_out_of_bounds; }

protected:
    Obstacle make_obstacle(VectorI cell) const;

    void verify_on_grid(const char * caller, VectorI cell) const;

private:
    void set_tiles_(TileGrid &&) final;

    void for_each_obstacle_(const Rectangle &, const ObstacleInquiry &) const final;

    TileGrid m_tiles;
    Size m_cell_size = Size{1, 1};
    Vector m_offset;
    OutOfBounds m_out_of_bounds = OutOfBounds::k_as_empty;
};

class TileObstacleSourceImpl final :
    public TileObstacleSource, public TileGridBase
{
public:
    bool blocks(const Obstacle &, Side) const final { return true; }
};

class PropertyTileSourceImpl final :
    public PropertyTileSource, public TileGridBase
{
public:
    bool blocks(const Obstacle &, Side) const final;

    void set_tile_sides(int tile_id, BlockingSides sides) final
        { m_tile_sides[tile_id] = sides; }

    void set_cell_sides(VectorI cell, BlockingSides) final;

    void clear_cell_sides(VectorI cell) final
        { (void)m_cell_sides.erase(cell); }

    BlockingSides sides_at(VectorI cell) const final;

private:
    std::unordered_map<int, BlockingSides> m_tile_sides;
    std::unordered_map<VectorI, BlockingSides, VectorIHasher> m_cell_sides;
};

} // end of mcol namespace
