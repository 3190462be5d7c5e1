/**
 * @file config.cpp
 * @brief implementation of the YAML scenario loader with bougie validation uwu
 *
 * this translation unit backs config.hpp with the full YAML parsing pipeline.
 * it leans on yaml-cpp 0.8.0+, wraps everything in std::expected, and emits
 * error breadcrumbs so humans can fix typos without doom scrolling logs.
 */
#include "hgui/config/config.hpp"

#include <cmath>
#include <cstdint>
#include <format>
#include <limits>
#include <string>
#include <unordered_set>
#include <utility>
#include <yaml-cpp/yaml.h>

namespace hgui::config
{
namespace
{

constexpr std::uint32_t kDefaultTraceStride = 1U;
constexpr float         kDefaultRestitution = 1.0F;

[[nodiscard]] auto make_error(std::string message, std::vector<std::string> ctx) -> ScenarioResult
{
    return std::unexpected(ConfigError{std::move(message), std::move(ctx)});
}

[[nodiscard]] auto node_to_vec3(const YAML::Node &node, std::vector<std::string> ctx)
    -> std::expected<common::Vec3, ConfigError>
{
    if (!node || !node.IsSequence() || node.size() != 3U)
    {
        return std::unexpected(ConfigError{"expected sequence[3] for vector", std::move(ctx)});
    }
    common::Vec3 value{};
    for (std::size_t i = 0; i < 3; ++i)
    {
        try
        {
            value[i] = node[i].as<float>();
        }
        catch (const YAML::Exception &ex)
        {
            auto child_ctx = ctx;
            child_ctx.emplace_back(std::format("[{}]", i));
            return std::unexpected(ConfigError{ex.what(), std::move(child_ctx)});
        }
    }
    if (!common::is_finite(value))
    {
        return std::unexpected(ConfigError{"vector components must be finite", std::move(ctx)});
    }
    return value;
}

[[nodiscard]] auto parse_timing(const YAML::Node &root, Scenario &scenario) -> std::expected<void, ConfigError>
{
    const auto timing_node = root["timing"];
    if (!timing_node || !timing_node.IsMap())
    {
        return std::unexpected(ConfigError{"missing 'timing' section", {"timing"}});
    }

    std::int64_t frames = 0;
    try
    {
        scenario.timing.frame_rate = timing_node["frame_rate"].as<double>();
        frames                     = timing_node["frames"].as<std::int64_t>();
    }
    catch (const YAML::Exception &ex)
    {
        return std::unexpected(ConfigError{ex.what(), {"timing"}});
    }

    if (!std::isfinite(scenario.timing.frame_rate) || scenario.timing.frame_rate <= 0.0)
    {
        return std::unexpected(ConfigError{"timing.frame_rate must be finite and > 0", {"timing", "frame_rate"}});
    }
    if (frames < 1 || frames > static_cast<std::int64_t>(kMaxFrames))
    {
        return std::unexpected(
            ConfigError{std::format("timing.frames must be within [1, {}]", kMaxFrames), {"timing", "frames"}});
    }
    scenario.timing.frames = static_cast<std::uint32_t>(frames);
    return {};
}

[[nodiscard]] auto parse_bodies(const YAML::Node &root, Scenario &scenario) -> std::expected<void, ConfigError>
{
    const auto bodies_node = root["bodies"];
    if (!bodies_node || !bodies_node.IsSequence() || bodies_node.size() == 0U)
    {
        return std::unexpected(ConfigError{"bodies must be a non-empty sequence", {"bodies"}});
    }

    std::unordered_set<std::string> names;
    scenario.bodies.reserve(bodies_node.size());
    for (std::size_t i = 0; i < bodies_node.size(); ++i)
    {
        const auto node  = bodies_node[i];
        const auto index = std::format("[{}]", i);
        if (!node.IsMap())
        {
            return std::unexpected(ConfigError{"body entry must be a map", {"bodies", index}});
        }

        BodySettings body{};
        try
        {
            body.name = node["name"].as<std::string>();
        }
        catch (const YAML::Exception &ex)
        {
            return std::unexpected(ConfigError{ex.what(), {"bodies", index, "name"}});
        }
        if (body.name.empty())
        {
            return std::unexpected(ConfigError{"body name must not be empty", {"bodies", index, "name"}});
        }
        if (!names.insert(body.name).second)
        {
            return std::unexpected(ConfigError{"body names must be unique", {"bodies", index, "name"}});
        }

        auto position = node_to_vec3(node["position"], {"bodies", index, "position"});
        if (!position)
        {
            return std::unexpected(std::move(position.error()));
        }
        auto velocity = node_to_vec3(node["velocity"], {"bodies", index, "velocity"});
        if (!velocity)
        {
            return std::unexpected(std::move(velocity.error()));
        }
        body.position = *position;
        body.velocity = *velocity;

        if (node["acceleration"].IsDefined() && !node["acceleration"].IsNull())
        {
            auto acceleration = node_to_vec3(node["acceleration"], {"bodies", index, "acceleration"});
            if (!acceleration)
            {
                return std::unexpected(std::move(acceleration.error()));
            }
            body.acceleration = *acceleration;
        }
        else
        {
            body.acceleration = common::Vec3::zero();
        }

        scenario.bodies.push_back(std::move(body));
    }
    return {};
}

[[nodiscard]] auto parse_planes(const YAML::Node &root, Scenario &scenario) -> std::expected<void, ConfigError>
{
    const auto planes_node = root["planes"];
    if (!planes_node || planes_node.IsNull())
    {
        return {};
    }
    if (!planes_node.IsSequence())
    {
        return std::unexpected(ConfigError{"planes must be a sequence", {"planes"}});
    }

    scenario.planes.reserve(planes_node.size());
    for (std::size_t i = 0; i < planes_node.size(); ++i)
    {
        const auto node  = planes_node[i];
        const auto index = std::format("[{}]", i);
        if (!node.IsMap())
        {
            return std::unexpected(ConfigError{"plane entry must be a map", {"planes", index}});
        }

        PlaneSettings plane{};
        try
        {
            plane.name   = node["name"].as<std::string>();
            plane.offset = node["offset"].as<float>();
            plane.restitution =
                node["restitution"].IsDefined() ? node["restitution"].as<float>() : kDefaultRestitution;
        }
        catch (const YAML::Exception &ex)
        {
            return std::unexpected(ConfigError{ex.what(), {"planes", index}});
        }

        auto normal = node_to_vec3(node["normal"], {"planes", index, "normal"});
        if (!normal)
        {
            return std::unexpected(std::move(normal.error()));
        }
        const auto unit_normal = common::try_normalize(*normal);
        if (!unit_normal)
        {
            return std::unexpected(ConfigError{std::format("plane normal is unusable: {}",
                                                           common::to_string(unit_normal.error())),
                                               {"planes", index, "normal"}});
        }
        plane.normal = *unit_normal;

        if (!std::isfinite(plane.offset))
        {
            return std::unexpected(ConfigError{"plane offset must be finite", {"planes", index, "offset"}});
        }
        if (!(plane.restitution >= 0.0F && plane.restitution <= 1.0F))
        {
            return std::unexpected(
                ConfigError{"plane restitution must be within [0, 1]", {"planes", index, "restitution"}});
        }

        scenario.planes.push_back(std::move(plane));
    }
    return {};
}

[[nodiscard]] auto parse_output(const YAML::Node &root, Scenario &scenario) -> std::expected<void, ConfigError>
{
    scenario.output.trace_stride = kDefaultTraceStride;

    const auto output_node = root["output"];
    if (!output_node || output_node.IsNull())
    {
        return {};
    }
    if (!output_node.IsMap())
    {
        return std::unexpected(ConfigError{"output must be a map", {"output"}});
    }
    if (!output_node["trace_stride"].IsDefined())
    {
        return {};
    }

    std::int64_t stride = 0;
    try
    {
        stride = output_node["trace_stride"].as<std::int64_t>();
    }
    catch (const YAML::Exception &ex)
    {
        return std::unexpected(ConfigError{ex.what(), {"output", "trace_stride"}});
    }
    if (stride < 1 || stride > static_cast<std::int64_t>(std::numeric_limits<std::uint32_t>::max()))
    {
        return std::unexpected(ConfigError{"output.trace_stride must be >= 1", {"output", "trace_stride"}});
    }
    scenario.output.trace_stride = static_cast<std::uint32_t>(stride);
    return {};
}

} // namespace

auto load_scenario_from_file(const std::filesystem::path &path) -> ScenarioResult
{
    try
    {
        const auto node = YAML::LoadFile(path.string());
        return parse_scenario_node(node);
    }
    catch (const YAML::BadFile &ex)
    {
        return make_error(std::format("unable to open scenario file: {}", ex.what()), {path.string()});
    }
    catch (const YAML::Exception &ex)
    {
        return make_error(std::format("YAML parse error: {}", ex.what()), {path.string()});
    }
}

auto load_scenario_from_string(std::string_view yaml_text) -> ScenarioResult
{
    try
    {
        const auto node = YAML::Load(std::string{yaml_text});
        return parse_scenario_node(node);
    }
    catch (const YAML::Exception &ex)
    {
        return make_error(std::format("YAML parse error: {}", ex.what()), {});
    }
}

auto parse_scenario_node(const YAML::Node &root) -> ScenarioResult
{
    if (!root || !root.IsMap())
    {
        return make_error("scenario root must be a mapping", {});
    }

    Scenario scenario{};

    if (auto timing = parse_timing(root, scenario); !timing)
    {
        return std::unexpected(std::move(timing.error()));
    }
    if (auto bodies = parse_bodies(root, scenario); !bodies)
    {
        return std::unexpected(std::move(bodies.error()));
    }
    if (auto planes = parse_planes(root, scenario); !planes)
    {
        return std::unexpected(std::move(planes.error()));
    }
    if (auto output = parse_output(root, scenario); !output)
    {
        return std::unexpected(std::move(output.error()));
    }

    return scenario;
}

auto format_context(const ConfigError &error) -> std::string
{
    std::string joined;
    for (const auto &crumb : error.context)
    {
        if (!joined.empty())
        {
            joined += '.';
        }
        joined += crumb;
    }
    return joined;
}

} // namespace hgui::config
