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

#include "defs.hpp"

#include <array>
#include <cstdint>
#include <string>
#include <vector>

enum class Key {
    left, right, jump, pause, frame_advance, restart, none
};

struct Color final {
    std::uint8_t r = 0, g = 0, b = 0;
};

namespace colors {

constexpr const Color k_wall     { 0x77, 0x77, 0x77 };
constexpr const Color k_passage  { 0x66, 0x66, 0x66 };
constexpr const Color k_one_way  { 0xAA, 0x77, 0x00 };
constexpr const Color k_platform { 0xCC, 0x99, 0x22 };
constexpr const Color k_ball     { 0xFF, 0x88, 0x00 };
constexpr const Color k_player   { 0x00, 0xAA, 0xFF };
constexpr const Color k_grounded { 0x00, 0xCC, 0xFF };

} // end of colors namespace

// keeps SFML out of the driver
class DrawInterface {
public:
    virtual ~DrawInterface() {}

    virtual void draw_rectangle(const Rectangle &, Color) = 0;

    virtual void draw_string_top_left(const std::string &, Vector top_left) = 0;
};

// Tiles first, then free objects. Any obstacle with a cell came from the
// tile map.
class LayeredSource final : public mcol::ObstacleSource {
public:
    LayeredSource(const mcol::TileGridSource & tiles, const mcol::FreeObjectSource & objects):
        m_tiles(&tiles), m_objects(&objects) {}

    bool blocks(const Obstacle &, Side) const final;

private:
    void for_each_obstacle_(const Rectangle &, const ObstacleInquiry &) const final;

    const mcol::TileGridSource * m_tiles;
    const mcol::FreeObjectSource * m_objects;
};

// ----------------------------------------------------------------------------

// anything that moves and runs into the map
class Actor : public mcol::BumpHandler {
public:
    Actor(const Rectangle & bounds_, Color color_):
        m_bounds(bounds_), m_color(color_) {}

    void update(const mcol::MapCollider &, Real gravity, Real et);

    const Rectangle & bounds() const { return m_bounds; }

    Color color() const { return m_color; }

    bool bumped_x() const { return m_bumped_x; }

    bool bumped_y() const { return m_bumped_y; }

    const Vector & velocity() const { return m_velocity; }

    void set_velocity(const Vector & r) { m_velocity = r; }

    void on_bump_left(const Obstacle &) override {}

    void on_bump_right(const Obstacle &) override {}

    void on_bump_top(const Obstacle &) override {}

    void on_bump_bottom(const Obstacle &) override {}

private:
    Rectangle m_bounds;
    Vector m_velocity;
    Color m_color;
    bool m_bumped_x = false, m_bumped_y = false;
};

class Player final : public Actor {
public:
    static constexpr const Real k_walk_speed   = 180;
    static constexpr const Real k_jump_speed   = 420;

    explicit Player(Vector location):
        Actor(Rectangle{location.x, location.y, 20, 28}, colors::k_player) {}

    // run before update
    void handle_controls(int walk_direction, bool jump_pressed);

    bool on_ground() const { return m_on_ground; }

    Side last_bump_side() const { return m_last_side; }

    int bump_count() const { return m_bump_count; }

    void on_bump_left(const Obstacle &) final;

    void on_bump_right(const Obstacle &) final;

    void on_bump_top(const Obstacle &) final;

    void on_bump_bottom(const Obstacle &) final;

private:
    void record(Side);

    bool m_on_ground = false;
    Side m_last_side = Side::k_bottom;
    int m_bump_count = 0;
};

// a free object one-way platform which paces back and forth
class MovingPlatform final {
public:
    MovingPlatform(mcol::FreeObjectSource &, const Rectangle & start, Real travel, Real speed);

    void update(Real et);

    const Rectangle & bounds() const;

private:
    mcol::FreeObjectSource * m_objects;
    std::size_t m_index;
    Real m_home_x, m_travel, m_speed;
    Real m_elapsed = 0;
};

// ----------------------------------------------------------------------------

class DemoDriver final {
public:
    static constexpr const Real k_gravity = 980;

    DemoDriver();

    void load_scene();

    void on_press(Key k);

    void on_release(Key k);

    void on_update(Real elapsed_time);

    void on_draw_field(DrawInterface &) const;

    void on_draw_hud(DrawInterface &) const;

    Vector camera_center() const
        { return m_player ? center_of(m_player->bounds()) : Vector{}; }

    // non-empty only if the player's contact state changed this frame
    const std::string & status_change() const { return m_status_change; }

private:
    static std::string describe_contact(const Player &);

    static constexpr const auto k_left_idx  = 0;
    static constexpr const auto k_right_idx = 1;
    static constexpr const auto k_jump_idx  = 2;
    static constexpr const auto k_control_count = 3;

    std::array<bool, k_control_count> m_controls;
    bool m_paused = false, m_frame_advancing = false;

    std::unique_ptr<mcol::PropertyTileSource> m_tiles;
    std::unique_ptr<mcol::FreeObjectSource> m_objects;
    std::unique_ptr<LayeredSource> m_layered;

    // the player slides, the ball bounces
    std::unique_ptr<mcol::MapCollider> m_player_collider;
    std::unique_ptr<mcol::MapCollider> m_ball_collider;

    std::unique_ptr<Player> m_player;
    std::unique_ptr<Actor> m_ball;
    std::vector<MovingPlatform> m_platforms;

    std::string m_last_status;
    std::string m_status_change;
};
