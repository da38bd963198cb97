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

#include <functional>

namespace mcol {

/// Acts as the interface whose methods are called whenever the actor bumps
/// into an obstacle.
///
/// This class is meant to be implemented by the actor (or whatever owns the
/// actor's state). Each method is named by the face of the actor which made
/// contact, e.g. on_bump_bottom is called when landing on a floor.
///
/// @note any method maybe called many times in a single resolution, once
///       for every obstacle contacted on that face
struct BumpHandler {
    virtual ~BumpHandler() {}

    virtual void on_bump_left(const Obstacle &) = 0;

    virtual void on_bump_right(const Obstacle &) = 0;

    virtual void on_bump_top(const Obstacle &) = 0;

    virtual void on_bump_bottom(const Obstacle &) = 0;

    /// @returns a handler which ignores all bumps
    static BumpHandler & null_instance();
};

/// One blocking contact found during a resolution.
struct BumpEvent final {
    BumpEvent() {}

    BumpEvent(const Obstacle & obstacle_, Side side_):
        obstacle(obstacle_), side(side_)
    {}

    /// calls the handler's method for this event's side
    void send_to(BumpHandler &) const;

    Obstacle obstacle;
    /// face of the actor which made contact
    Side side = Side::k_left;
};

/// The outcome of a single resolution.
///
/// Flags are only ever about the call that produced this value.
struct CollisionResult final {
    Rectangle bounds;
    Vector velocity;
    bool bumped_x = false;
    bool bumped_y = false;
};

// ---------------------------- stock bump policies ---------------------------

/// Zeroes only velocity components of bumped axises, so the actor slides
/// along whatever it hit.
Vector bump_stop(const Vector & velocity, bool bumped_x, bool bumped_y);

/// Zeroes the entire velocity if either axis bumped.
Vector bump_stop_all(const Vector & velocity, bool bumped_x, bool bumped_y);

/// Negates velocity components of bumped axises.
///
/// @param damping scales the reflected component, 1 is perfectly elastic
Vector bump_bounce
    (const Vector & velocity, bool bumped_x, bool bumped_y, Real damping = 1);

/// Maps the pre-resolution velocity and bump flags to a new velocity.
///
/// This is a tagged strategy, and cannot be changed once made.
class BumpPolicy final {
public:
    using CustomFunction =
        std::function<Vector(const Vector & velocity, bool bumped_x, bool bumped_y)>;

    enum Type : uint8_t { k_stop, k_stop_all, k_bounce, k_custom };

    /// @returns the "slide" policy, this is the default
    static BumpPolicy make_stop() { return BumpPolicy{}; }

    static BumpPolicy make_stop_all();

    /// @throws if damping is not a non-negative real number
    static BumpPolicy make_bounce(Real damping = 1);

    /// @throws if the function is empty
    static BumpPolicy make_custom(CustomFunction);

    BumpPolicy() {}

    Vector operator () (const Vector & velocity, bool bumped_x, bool bumped_y) const;

    Type type() const { return m_type; }

    /// @returns damping factor, only meaningful for bounce
    Real damping() const { return m_damping; }

private:
    BumpPolicy(Type type_, Real damping_, CustomFunction && f_):
        m_type(type_), m_damping(damping_), m_custom(std::move(f_))
    {}

    Type m_type = k_stop;
    Real m_damping = 1;
    CustomFunction m_custom;
};

/// Resolves one step of an actor's motion against a source of obstacles.
///
/// The x axis is resolved first, then the y axis using the x corrected
/// position, which makes actors slide around corners in the fashion most
/// platformers expect. Every blocking obstacle in either sweep is sent to
/// the handler, the actor stops flush against the nearest one.
///
/// @param last      actor bounds before motion, assumed to overlap nothing
///                  that blocks (such obstacles are ignored)
/// @param tentative actor bounds after motion, that is last displaced by
///                  velocity times the time step
/// @param velocity  actor velocity, its sign on each axis decides which
///                  faces may be hit, zero components are never checked
/// @throws if any rectangle or velocity is not real, if sizes are negative,
///         or whatever the obstacle source throws
CollisionResult resolve_map_collision
    (const Rectangle & last, const Rectangle & tentative, const Vector & velocity,
     const ObstacleSource &, const BumpPolicy &, BumpHandler &);

/// Binds an obstacle source and bump policy, so that an actor need only
/// keep this object around.
///
/// A collider holds no state between resolutions, so it may be shared by
/// several actors, so long as resolutions are run one at a time.
class MapCollider final {
public:
    explicit MapCollider
        (const ObstacleSource & source, BumpPolicy policy = BumpPolicy::make_stop()):
        m_source(&source), m_policy(std::move(policy))
    {}

    /// @copydoc resolve_map_collision
    CollisionResult resolve
        (const Rectangle & last, const Rectangle & tentative,
         const Vector & velocity, BumpHandler & handler) const
    { return resolve_map_collision(last, tentative, velocity, *m_source, m_policy, handler); }

    /// Resolves without sending bump events anywhere.
    CollisionResult resolve
        (const Rectangle & last, const Rectangle & tentative,
         const Vector & velocity) const
    { return resolve(last, tentative, velocity, BumpHandler::null_instance()); }

    const ObstacleSource & obstacle_source() const { return *m_source; }

    const BumpPolicy & bump_policy() const { return m_policy; }

private:
    const ObstacleSource * m_source;
    BumpPolicy m_policy;
};

using CollisionStep = std::function<CollisionResult
    (const Rectangle & last, const Rectangle & tentative, const Vector & velocity)>;

/// @returns a function which resolves with the given collider, sending
///          events to the given handler
/// @warning both collider and handler must outlive the returned function
CollisionStep make_collision_step(const MapCollider &, BumpHandler &);

} // end of mcol namespace
