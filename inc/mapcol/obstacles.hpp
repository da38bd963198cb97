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

#include <mapcol/defs.hpp>

#include <common/Grid.hpp>

#include <limits>
#include <memory>
#include <vector>

namespace mcol {

/// Which faces of an obstacle stop movement.
///
/// Each face is independent, a one-way platform for instance only blocks
/// from its top face.
struct BlockingSides final {
    constexpr BlockingSides() {}

    constexpr BlockingSides(bool left_, bool right_, bool top_, bool bottom_):
        left(left_), right(right_), top(top_), bottom(bottom_)
    {}

    /// @returns true if the given face blocks movement
    bool blocks(Side) const noexcept;

    bool left   = true;
    bool right  = true;
    bool top    = true;
    bool bottom = true;
};

inline bool operator == (const BlockingSides & lhs, const BlockingSides & rhs) {
    return    lhs.left == rhs.left && lhs.right  == rhs.right
           && lhs.top  == rhs.top  && lhs.bottom == rhs.bottom;
}

inline bool operator != (const BlockingSides & lhs, const BlockingSides & rhs)
    { return !(lhs == rhs); }

constexpr const BlockingSides k_solid_sides   { true , true , true , true  };
constexpr const BlockingSides k_one_way_sides { false, false, true , false };
constexpr const BlockingSides k_passable_sides{ false, false, false, false };

/// An obstacle record as produced by an ObstacleSource.
///
/// This is a value type, the source owns whatever it was made from. Which
/// members are meaningful depends on the source that produced it.
struct Obstacle final {
    static constexpr const int k_no_cell = std::numeric_limits<int>::min();

    /// world bounds of the obstacle
    Rectangle bounds;

    /// grid cell this obstacle was made from (tile sources only)
    VectorI cell = VectorI{k_no_cell, k_no_cell};

    /// client reference (free object source only)
    ObjectRef object = nullptr;

    /// position of the record in its source (free object source only)
    std::size_t index = 0;
};

bool operator == (const Obstacle &, const Obstacle &);

inline bool operator != (const Obstacle & lhs, const Obstacle & rhs)
    { return !(lhs == rhs); }

/// Something which can be asked for obstacles near a region, and whether any
/// one of those obstacles blocks movement from a given side.
///
/// Implementations must be read-only with respect to queries. A single
/// collision resolution may query a source twice (once per axis).
class ObstacleSource {
public:
    virtual ~ObstacleSource() {}

    /// Finds every obstacle overlapping or touching the given region.
    ///
    /// @param f a function which must have the following signature:
    ///          void(const Obstacle &)
    /// @note order of enumeration is unspecified
    /// @throws if the region is not real, has negative size, or if the
    ///         source cannot answer for this region
    template <typename Func>
    void for_each_obstacle(const Rectangle &, Func && f) const;

    /// @returns all obstacles overlapping or touching the region
    /// @copydetails ObstacleSource::for_each_obstacle
    std::vector<Obstacle> query(const Rectangle &) const;

    /// @param side the face of the obstacle being contacted
    /// @returns true if the obstacle stops movement through the given face
    virtual bool blocks(const Obstacle &, Side side) const = 0;

protected:
    struct ObstacleInquiry {
        virtual ~ObstacleInquiry() {}
        virtual void operator () (const Obstacle &) const = 0;
    };

    virtual void for_each_obstacle_(const Rectangle &, const ObstacleInquiry &) const = 0;

    static void verify_region(const char * caller, const Rectangle &);
};

/// Base for obstacle sources backed by a grid of tile ids.
///
/// Cells are located at (x*cell_width + offset.x, y*cell_height + offset.y).
/// A cell holding k_empty_tile is never an obstacle.
class TileGridSource : public ObstacleSource {
public:
    using TileGrid = cul::Grid<int>;

    static constexpr const int k_empty_tile = 0;

    /// What a query does for cells outside of the grid.
    enum class OutOfBounds : uint8_t {
        /// cells outside are empty space (default)
        k_as_empty,
        /// cells outside are solid, the edge of the map acts as a wall
        ///
        /// only the ring of cells bordering the grid is ever enumerated
        k_as_solid,
        /// queries that reach outside the grid throw std::out_of_range
        k_throw
    };

    /// Replaces all tiles.
    void set_tiles(TileGrid &&);

    /// @copydoc TileGridSource::set_tiles(TileGrid&&)
    void set_tiles(const TileGrid &);

    /// Changes a single tile.
    /// @throws if the cell is not on the grid
    virtual void set_tile(VectorI cell, int tile_id) = 0;

    /// @returns tile id at the cell, k_empty_tile for cells outside the grid
    virtual int tile_at(VectorI cell) const = 0;

    virtual bool has_cell(VectorI cell) const = 0;

    /// @returns world bounds of any cell (on the grid or not)
    virtual Rectangle cell_bounds(VectorI cell) const = 0;

    /// @throws if either dimension is not a positive real number
    virtual void set_cell_size(Real cell_width, Real cell_height) = 0;

    /// @param offset top left of the origin grid cell
    /// @throws if offset is not a real vector
    virtual void set_offset(Vector offset) = 0;

    virtual void set_out_of_bounds_policy(OutOfBounds) = 0;

    virtual Size cell_size() const = 0;

    virtual Vector offset() const = 0;

    virtual OutOfBounds out_of_bounds_policy() const = 0;

protected:
    virtual void set_tiles_(TileGrid &&) = 0;
};

/// Every non-empty tile is completely solid.
class TileObstacleSource : virtual public TileGridSource {
public:
    static std::unique_ptr<TileObstacleSource> make_instance();
};

/// Each tile id carries its own blocking faces (much like tileset
/// properties), which any single cell may override (much like map cell
/// properties).
///
/// Tile ids without any set sides block nothing.
class PropertyTileSource : virtual public TileGridSource {
public:
    static std::unique_ptr<PropertyTileSource> make_instance();

    virtual void set_tile_sides(int tile_id, BlockingSides) = 0;

    /// Overrides sides for one cell, regardless of its tile id.
    ///
    /// Secret passages may be made by clearing faces of a solid tile.
    /// @throws if the cell is not on the grid
    virtual void set_cell_sides(VectorI cell, BlockingSides) = 0;

    virtual void clear_cell_sides(VectorI cell) = 0;

    /// @returns effective sides of a cell, after any overrides
    virtual BlockingSides sides_at(VectorI cell) const = 0;
};

/// Obstacles which are arbitrary rectangles, not bound to any grid (e.g.
/// moving platforms or object layer rectangles).
class FreeObjectSource : public ObstacleSource {
public:
    struct Object final {
        Rectangle bounds;
        ObjectRef reference = nullptr;
        BlockingSides sides = k_solid_sides;
    };

    static std::unique_ptr<FreeObjectSource> make_instance();

    /// @returns index of the new object, which is also the index member of
    ///          obstacles made from it
    /// @throws if bounds are not real or have negative size
    virtual std::size_t add_object(const Object &) = 0;

    /// Moves or resizes an object, intended to be called between
    /// resolutions.
    /// @throws if index is out of range, or bounds are invalid
    virtual void set_object_bounds(std::size_t index, const Rectangle &) = 0;

    virtual const Object & object(std::size_t index) const = 0;

    virtual std::size_t object_count() const = 0;

    virtual void clear_objects() = 0;
};

// ----------------------------------------------------------------------------

template <typename Func>
void ObstacleSource::for_each_obstacle(const Rectangle & region, Func && f) const {
    struct Inst final : public ObstacleInquiry {
        explicit Inst(Func && f): m_func(std::forward<Func>(f)) {}
        void operator () (const Obstacle & obstacle) const final { m_func(obstacle); }
        Func m_func;
    };
    Inst inst(std::forward<Func>(f));
    for_each_obstacle_(region, inst);
}

} // end of mcol namespace
