/**
 * @file config.hpp
 * @brief YAML-powered motion scenario loader that absolutely slaps uwu
 *
 * this header defines the configuration model for the spatial motion demo and
 * its tests. it parses YAML 1.2 documents into strongly typed C++26 structs,
 * validates them aggressively, and bubbles up ergonomic errors via
 * std::expected. vectors come in as sequence[3] and are checked for finiteness
 * before they ever reach the Vec3 math, and plane normals are normalized on
 * load (a degenerate normal is a config error, not a silent zero).
 *
 * @author LukeFrankio
 * @date 2025-11-05
 * @version 1.0
 *
 * @note requires GCC 15.2+ with -std=c++2c (aka C++26) for std::expected
 * @note yaml-cpp 0.8.0+ powers parsing but we stay dependency-light elsewhere
 *
 * example (basic usage):
 * @code
 * using hgui::config::load_scenario_from_file;
 * auto scenario_result = load_scenario_from_file("tests/data/bouncing_cursor.yaml");
 * if (!scenario_result) {
 *     std::print(stderr, "config error: {}\n", scenario_result.error().message);
 *     return EXIT_FAILURE;
 * }
 * const auto& scenario = *scenario_result;
 * // scenario.timing.frame_rate now holds the simulation rate uwu
 * @endcode
 */
#pragma once

#include <cstdint>
#include <expected>
#include <filesystem>
#include <limits>
#include <string>
#include <string_view>
#include <vector>

#include "hgui/common/vec3.hpp"

namespace YAML
{
class Node;
} // namespace YAML

namespace hgui::config
{

/**
 * @brief config error payload with context breadcrumbs for days
 *
 * the loader never throws; context strings form a breadcrumb trail (e.g.,
 * {"bodies", "[1]", "velocity"}) so YAML typos are painless to find.
 */
struct ConfigError
{
    std::string              message; ///< spicy human-readable error message uwu
    std::vector<std::string> context; ///< breadcrumb trail showing where things derailed
};

/**
 * @brief fixed-step timing, dt = 1 / frame_rate
 */
/// largest accepted timing.frames, one below the uint32 range so a 1-based frame counter never wraps
inline constexpr std::uint32_t kMaxFrames = std::numeric_limits<std::uint32_t>::max() - 1U;

struct TimingSettings
{
    double        frame_rate; ///< frames per second, must be > 0
    std::uint32_t frames;     ///< number of steps to simulate, in [1, kMaxFrames]
};

/**
 * @brief initial kinematic state of one body
 */
struct BodySettings
{
    std::string  name;         ///< unique body nickname
    common::Vec3 position;     ///< initial position
    common::Vec3 velocity;     ///< initial velocity [units/s]
    common::Vec3 acceleration; ///< constant acceleration, zero when omitted
};

/**
 * @brief infinite collision plane dot(normal, p) == offset
 */
struct PlaneSettings
{
    std::string  name;        ///< plane nickname (for logs)
    common::Vec3 normal;      ///< unit normal (normalized by the loader)
    float        offset;      ///< signed distance of the plane from the origin
    float        restitution; ///< 1 = perfect bounce, 0 = slide along the plane
};

/**
 * @brief output controls
 */
struct OutputSettings
{
    std::uint32_t trace_stride; ///< record a trace sample every N frames (>= 1)
};

/**
 * @brief main configuration object bundling all scenario inputs
 */
struct Scenario
{
    TimingSettings             timing; ///< step size + frame count
    std::vector<BodySettings>  bodies; ///< at least one body
    std::vector<PlaneSettings> planes; ///< optional collision planes
    OutputSettings             output; ///< trace cadence
};

/**
 * @brief convenience alias for the loader result type (std::expected wrapper)
 */
using ScenarioResult = std::expected<Scenario, ConfigError>;

/**
 * @brief parses a YAML scenario from a file path with aggressive validation
 *
 * ⚠️ IMPURE FUNCTION (has side effects)
 *
 * this helper is impure because:
 * - hits the file system to read YAML
 * - may throw yaml-cpp exceptions internally (captured into expected)
 *
 * @param[in] path filesystem location of YAML document
 * @return ScenarioResult containing parsed Scenario or detailed ConfigError
 *
 * @post returned Scenario obeys schema constraints when success
 *
 * example (edge case handling):
 * @code
 * auto scenario = load_scenario_from_file("missing.yaml");
 * ASSERT_FALSE(scenario.has_value());
 * EXPECT_THAT(scenario.error().message, testing::HasSubstr("unable to open"));
 * @endcode
 */
[[nodiscard]] auto load_scenario_from_file(const std::filesystem::path &path) -> ScenarioResult;

/**
 * @brief parses a YAML scenario directly from a string buffer (test-friendly)
 */
[[nodiscard]] auto load_scenario_from_string(std::string_view yaml_text) -> ScenarioResult;

/**
 * @brief low-level parser for already-loaded YAML nodes
 *
 * ⚠️ IMPURE FUNCTION (depends on yaml-cpp node state)
 */
[[nodiscard]] auto parse_scenario_node(const YAML::Node &root) -> ScenarioResult;

/**
 * @brief joins breadcrumbs with '.' for printing ("bodies.[1].velocity")
 */
[[nodiscard]] auto format_context(const ConfigError &error) -> std::string;

} // namespace hgui::config
