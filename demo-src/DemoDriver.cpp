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

#include "DemoDriver.hpp"

#include <algorithm>
#include <cmath>
#include <cstring>

namespace {

using namespace cul::exceptions_abbr;
using mcol::TileGridSource, mcol::FreeObjectSource, mcol::PropertyTileSource,
      mcol::BumpPolicy, mcol::MapCollider, mcol::BlockingSides;

constexpr const int k_solid_tile   = 1;
constexpr const int k_one_way_tile = 2;

// # solid
// = one way platform
// > solid, except the player may walk into it from the left
// p player start, b ball start
constexpr const char * k_layout[] = {
    "##########################",
    "#........................#",
    "#........................#",
    "#....b...................#",
    "#..............====......#",
    "#........................#",
    "#.........=====......#####",
    "#...................>#...#",
    "#....=====..........>#...#",
    "#...................>#...#",
    "#..p.......##.......##...#",
    "##########################"
};

constexpr const int k_layout_height = int(sizeof(k_layout) / sizeof(k_layout[0]));

Vector cell_location(VectorI cell)
    { return Vector{cell.x*k_tile_size, cell.y*k_tile_size}; }

const char * side_to_string(Side side) {
    switch (side) {
    case Side::k_left  : return "left"  ;
    case Side::k_right : return "right" ;
    case Side::k_top   : return "top"   ;
    case Side::k_bottom: return "bottom";
    }
    throw InvArg("side_to_string: bad side value.");
}

const char * yes_no(bool b) { return b ? "yes" : "no"; }

} // end of <anonymous> namespace

bool LayeredSource::blocks(const Obstacle & obstacle, Side side) const {
    if (obstacle.cell != VectorI{Obstacle::k_no_cell, Obstacle::k_no_cell})
        { return m_tiles->blocks(obstacle, side); }
    return m_objects->blocks(obstacle, side);
}

/* private */ void LayeredSource::for_each_obstacle_
    (const Rectangle & region, const ObstacleInquiry & inquiry) const
{
    auto f = [&inquiry](const Obstacle & obstacle) { inquiry(obstacle); };
    m_tiles  ->for_each_obstacle(region, f);
    m_objects->for_each_obstacle(region, f);
}

// ----------------------------------------------------------------------------

void Actor::update(const MapCollider & collider, Real gravity, Real et) {
    m_velocity.y += gravity*et;
    auto tentative = m_bounds;
    tentative.left += m_velocity.x*et;
    tentative.top  += m_velocity.y*et;
    auto res = collider.resolve(m_bounds, tentative, m_velocity, *this);
    m_bounds   = res.bounds;
    m_velocity = res.velocity;
    m_bumped_x = res.bumped_x;
    m_bumped_y = res.bumped_y;
}

void Player::handle_controls(int walk_direction, bool jump_pressed) {
    auto r = velocity();
    r.x = Real(walk_direction)*k_walk_speed;
    if (jump_pressed && m_on_ground) r.y = -k_jump_speed;
    set_velocity(r);
    // set again by bumps during the update
    m_on_ground = false;
}

void Player::on_bump_left(const Obstacle &) { record(Side::k_left); }

void Player::on_bump_right(const Obstacle &) { record(Side::k_right); }

void Player::on_bump_top(const Obstacle &) { record(Side::k_top); }

void Player::on_bump_bottom(const Obstacle &) {
    m_on_ground = true;
    record(Side::k_bottom);
}

/* private */ void Player::record(Side side) {
    m_last_side = side;
    ++m_bump_count;
}

MovingPlatform::MovingPlatform
    (FreeObjectSource & objects, const Rectangle & start, Real travel, Real speed):
    m_objects(&objects),
    m_home_x(start.left),
    m_travel(travel),
    m_speed(speed)
{
    FreeObjectSource::Object obj;
    obj.bounds    = start;
    obj.reference = this;
    obj.sides     = mcol::k_one_way_sides;
    m_index = m_objects->add_object(obj);
}

void MovingPlatform::update(Real et) {
    m_elapsed += et;
    auto rect = bounds();
    rect.left = m_home_x + m_travel*(0.5 - 0.5*std::cos(m_elapsed*m_speed));
    m_objects->set_object_bounds(m_index, rect);
}

const Rectangle & MovingPlatform::bounds() const
    { return m_objects->object(m_index).bounds; }

// ----------------------------------------------------------------------------

DemoDriver::DemoDriver() {
    std::fill(m_controls.begin(), m_controls.end(), false);
}

void DemoDriver::load_scene() {
    const int width = int(std::strlen(k_layout[0]));
    TileGridSource::TileGrid tiles;
    tiles.set_size(width, k_layout_height, TileGridSource::k_empty_tile);
    std::vector<VectorI> secret_cells;
    Vector player_start, ball_start;
    for (int y = 0; y != k_layout_height; ++y) {
        for (int x = 0; x != width; ++x) {
            switch (k_layout[y][x]) {
            case '#': tiles(x, y) = k_solid_tile  ; break;
            case '=': tiles(x, y) = k_one_way_tile; break;
            case '>':
                tiles(x, y) = k_solid_tile;
                secret_cells.emplace_back(x, y);
                break;
            case 'p': player_start = cell_location(VectorI{x, y}); break;
            case 'b': ball_start   = cell_location(VectorI{x, y}); break;
            case '.': break;
            default: throw RtError("DemoDriver::load_scene: unknown layout character.");
            }
        }
    }

    m_tiles = PropertyTileSource::make_instance();
    m_tiles->set_tiles(std::move(tiles));
    m_tiles->set_cell_size(k_tile_size, k_tile_size);
    m_tiles->set_out_of_bounds_policy(TileGridSource::OutOfBounds::k_as_solid);
    m_tiles->set_tile_sides(k_solid_tile  , mcol::k_solid_sides  );
    m_tiles->set_tile_sides(k_one_way_tile, mcol::k_one_way_sides);
    for (auto cell : secret_cells)
        { m_tiles->set_cell_sides(cell, BlockingSides{false, true, true, true}); }

    m_objects = FreeObjectSource::make_instance();
    m_platforms.clear();
    // platforms keep their address as a reference
    m_platforms.reserve(2);
    m_platforms.emplace_back(*m_objects, Rectangle{2*k_tile_size, 2*k_tile_size, 3*k_tile_size, 8},
                             6*k_tile_size, 0.9);
    m_platforms.emplace_back(*m_objects, Rectangle{12*k_tile_size, 8*k_tile_size, 2*k_tile_size, 8},
                             4*k_tile_size, 1.4);

    m_layered = std::make_unique<LayeredSource>(*m_tiles, *m_objects);
    m_player_collider = std::make_unique<MapCollider>(*m_layered);
    m_ball_collider = std::make_unique<MapCollider>(*m_layered, BumpPolicy::make_bounce(0.85));

    m_player = std::make_unique<Player>(player_start);
    m_ball = std::make_unique<Actor>(
        Rectangle{ball_start.x, ball_start.y, 12, 12}, colors::k_ball);
    m_ball->set_velocity(Vector{160, -120});

    m_last_status.clear();
    m_status_change.clear();
}

void DemoDriver::on_press(Key k) {
    switch (k) {
    case Key::left : m_controls[k_left_idx ] = true; break;
    case Key::right: m_controls[k_right_idx] = true; break;
    case Key::jump : m_controls[k_jump_idx ] = true; break;
    default: break;
    }
}

void DemoDriver::on_release(Key k) {
    switch (k) {
    case Key::left : m_controls[k_left_idx ] = false; break;
    case Key::right: m_controls[k_right_idx] = false; break;
    case Key::jump : m_controls[k_jump_idx ] = false; break;
    case Key::pause: m_paused = !m_paused; break;
    case Key::frame_advance: m_frame_advancing = true; break;
    case Key::restart: load_scene(); break;
    default: break;
    }
}

void DemoDriver::on_update(Real et) {
    m_status_change.clear();
    if (!m_player) return;
    if (m_paused && !m_frame_advancing) return;
    m_frame_advancing = false;

    // platforms move between resolutions, never during
    for (auto & platform : m_platforms)
        { platform.update(et); }

    int walk_direction = (m_controls[k_left_idx] ? -1 : 0) + (m_controls[k_right_idx] ? 1 : 0);
    m_player->handle_controls(walk_direction, m_controls[k_jump_idx]);
    m_player->update(*m_player_collider, k_gravity, et);
    m_ball->update(*m_ball_collider, k_gravity, et);

    auto status = describe_contact(*m_player);
    if (status != m_last_status) {
        m_status_change = status;
        m_last_status = std::move(status);
    }
}

void DemoDriver::on_draw_field(DrawInterface & intf) const {
    if (!m_tiles) return;
    for (int y = 0; y != k_layout_height; ++y) {
        for (int x = 0; x != int(std::strlen(k_layout[0])); ++x) {
            VectorI cell{x, y};
            switch (m_tiles->tile_at(cell)) {
            case k_solid_tile:
                intf.draw_rectangle(m_tiles->cell_bounds(cell),
                    m_tiles->sides_at(cell) == mcol::k_solid_sides ? colors::k_wall : colors::k_passage);
                break;
            case k_one_way_tile: {
                auto rect = m_tiles->cell_bounds(cell);
                rect.height = 6;
                intf.draw_rectangle(rect, colors::k_one_way);
                }
                break;
            default: break;
            }
        }
    }
    for (const auto & platform : m_platforms)
        { intf.draw_rectangle(platform.bounds(), colors::k_platform); }
    intf.draw_rectangle(m_ball->bounds(), m_ball->color());
    intf.draw_rectangle(m_player->bounds(),
                        m_player->on_ground() ? colors::k_grounded : m_player->color());
}

void DemoDriver::on_draw_hud(DrawInterface & intf) const {
    if (!m_player) return;
    intf.draw_string_top_left(m_last_status, Vector{4, 4});
    if (m_paused) {
        intf.draw_string_top_left("paused", Vector{4, 16});
    }
}

/* private static */ std::string DemoDriver::describe_contact(const Player & player) {
    std::string rv = "ground: ";
    rv += yes_no(player.on_ground());
    rv += " bumped x: ";
    rv += yes_no(player.bumped_x());
    rv += " bumped y: ";
    rv += yes_no(player.bumped_y());
    if (player.bump_count() > 0) {
        rv += " last bump: ";
        rv += side_to_string(player.last_bump_side());
    }
    return rv;
}
