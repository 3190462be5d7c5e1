/**
 * @file motion.cpp
 * @brief semi-implicit Euler + plane contacts on top of the Vec3 core uwu
 */
#include "hgui/spatial/motion.hpp"

#include <cstdint>
#include <utility>

namespace hgui::spatial::motion
{

auto make_bodies(const config::Scenario &scenario) -> std::vector<Body>
{
    std::vector<Body> bodies;
    bodies.reserve(scenario.bodies.size());
    for (const auto &settings : scenario.bodies)
    {
        bodies.push_back(Body{settings.name, settings.position, settings.velocity, settings.acceleration});
    }
    return bodies;
}

auto make_planes(const config::Scenario &scenario) -> std::vector<Plane>
{
    std::vector<Plane> planes;
    planes.reserve(scenario.planes.size());
    for (const auto &settings : scenario.planes)
    {
        planes.push_back(Plane{settings.name, settings.normal, settings.offset, settings.restitution});
    }
    return planes;
}

auto integrate(const Body &body, const float dt) -> Body
{
    Body next     = body;
    next.velocity = body.velocity + (body.acceleration * dt);
    next.position = body.position + (next.velocity * dt);
    return next;
}

auto signed_distance(const Plane &plane, const common::Vec3 &point) noexcept -> float
{
    return common::dot(plane.normal, point) - plane.offset;
}

auto resolve_contact(const Body &body, const Plane &plane) -> std::optional<Body>
{
    const auto distance = signed_distance(plane, body.position);
    if (distance >= -common::kSpatialEpsilon)
    {
        return std::nullopt;
    }
    const auto approach = common::dot(body.velocity, plane.normal);
    if (approach >= 0.0F)
    {
        return std::nullopt;
    }

    const auto tangential = body.velocity - (plane.normal * approach);

    Body resolved     = body;
    resolved.position = body.position - (plane.normal * distance);
    resolved.velocity = common::lerp(tangential, common::reflect(body.velocity, plane.normal), plane.restitution);
    return resolved;
}

auto heading(const Body &body) noexcept -> std::expected<common::Vec3, common::VectorError>
{
    return common::try_normalize(body.velocity);
}

auto simulate(const config::Scenario &scenario) -> SimulationResult
{
    SimulationResult result{};
    result.bodies = make_bodies(scenario);
    result.path_lengths.assign(result.bodies.size(), 0.0F);

    const auto planes = make_planes(scenario);
    const auto dt     = static_cast<float>(1.0 / scenario.timing.frame_rate);
    const auto stride = scenario.output.trace_stride;

    const std::uint64_t frames = scenario.timing.frames;
    for (std::uint64_t frame = 1U; frame <= frames; ++frame)
    {
        for (std::size_t i = 0; i < result.bodies.size(); ++i)
        {
            auto next = integrate(result.bodies[i], dt);
            for (const auto &plane : planes)
            {
                if (auto contact = resolve_contact(next, plane))
                {
                    next = std::move(*contact);
                    ++result.contacts;
                }
            }
            result.path_lengths[i] += common::distance_to(result.bodies[i].position, next.position);
            result.bodies[i] = std::move(next);
        }

        if ((frame % stride) == 0U || frame == frames)
        {
            TraceSample sample{};
            sample.frame = static_cast<std::uint32_t>(frame);
            sample.time  = static_cast<double>(frame) / scenario.timing.frame_rate;
            sample.positions.reserve(result.bodies.size());
            for (const auto &body : result.bodies)
            {
                sample.positions.push_back(body.position);
            }
            result.trace.push_back(std::move(sample));
        }
    }
    return result;
}

} // namespace hgui::spatial::motion
