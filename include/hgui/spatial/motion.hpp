/**
 * @file motion.hpp
 * @brief fixed-step kinematics for cursors/probes bouncing off planes uwu
 *
 * the smallest useful consumer of the Vec3 core: bodies integrate with
 * semi-implicit Euler, collide with infinite planes, and report headings via
 * try_normalize so a stationary body is an explicit case instead of a NaN.
 * every helper except simulate() is a pure function over value types, which
 * keeps the regression tests trivially deterministic.
 *
 * @note contact tolerance reuses common::kSpatialEpsilon
 */
#pragma once

#include <cstdint>
#include <expected>
#include <optional>
#include <string>
#include <vector>

#include "hgui/common/vec3.hpp"
#include "hgui/config/config.hpp"

namespace hgui::spatial::motion
{

/**
 * @brief kinematic state of one body
 */
struct Body
{
    std::string  name;
    common::Vec3 position;
    common::Vec3 velocity;
    common::Vec3 acceleration;
};

/**
 * @brief infinite plane dot(normal, p) == offset, normal assumed unit length
 */
struct Plane
{
    std::string  name;
    common::Vec3 normal;
    float        offset;
    float        restitution;
};

/**
 * @brief snapshot of every body position at one frame
 */
struct TraceSample
{
    std::uint32_t             frame; ///< 1-based frame index
    double                    time;  ///< frame * dt [s]
    std::vector<common::Vec3> positions;
};

/**
 * @brief everything simulate() learned along the way
 */
struct SimulationResult
{
    std::vector<Body>        bodies;       ///< final states, same order as the scenario
    std::vector<TraceSample> trace;        ///< every trace_stride frames + the last frame
    std::vector<float>       path_lengths; ///< distance travelled per body
    std::uint32_t            contacts{0U}; ///< total plane contacts resolved
};

/**
 * @brief builds runtime bodies from validated scenario settings
 */
[[nodiscard]] auto make_bodies(const config::Scenario &scenario) -> std::vector<Body>;

/**
 * @brief builds runtime planes from validated scenario settings
 */
[[nodiscard]] auto make_planes(const config::Scenario &scenario) -> std::vector<Plane>;

/**
 * @brief one semi-implicit Euler step
 *
 * ✨ PURE FUNCTION ✨
 *
 * v' = v + a * dt, then p' = p + v' * dt. updating velocity first keeps
 * constant-acceleration orbits from gaining energy the way explicit Euler does.
 */
[[nodiscard]] auto integrate(const Body &body, float dt) -> Body;

/**
 * @brief signed distance of a point from a plane (positive on the normal side)
 *
 * ✨ PURE FUNCTION ✨
 */
[[nodiscard]] auto signed_distance(const Plane &plane, const common::Vec3 &point) noexcept -> float;

/**
 * @brief pushes a penetrating body back onto the plane and bounces it
 *
 * ✨ PURE FUNCTION ✨
 *
 * a contact happens when the body sits more than kSpatialEpsilon behind the
 * plane while moving into it. the position is projected onto the plane and the
 * velocity becomes lerp(tangential, reflect(v, n), restitution): restitution 1
 * is a mirror bounce, 0 keeps only the sliding component.
 *
 * @return resolved body, or std::nullopt when there is no contact
 */
[[nodiscard]] auto resolve_contact(const Body &body, const Plane &plane) -> std::optional<Body>;

/**
 * @brief unit direction of travel, or DegenerateVector for a stationary body
 */
[[nodiscard]] auto heading(const Body &body) noexcept -> std::expected<common::Vec3, common::VectorError>;

/**
 * @brief runs the whole scenario
 *
 * ⚠️ IMPURE FUNCTION (allocates the trace)
 *
 * @pre scenario came out of the config loader (frame_rate > 0, frames >= 1,
 *      trace_stride >= 1, unit plane normals)
 */
[[nodiscard]] auto simulate(const config::Scenario &scenario) -> SimulationResult;

} // namespace hgui::spatial::motion
