/**
 * @file motion_demo.cpp
 * @brief tiny harness that runs a YAML motion scenario through the Vec3 core uwu
 *
 * usage: hgui_motion_demo <scenario.yaml>
 *
 * loads + validates the scenario, steps every body at the configured frame
 * rate, prints the sampled trace, then a per-body summary (final position,
 * heading or "stationary", path length). config errors go to stderr with their
 * breadcrumb trail and a non-zero exit code.
 */

#include <cstddef>
#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <print>

#include "hgui/common/vec3.hpp"
#include "hgui/config/config.hpp"
#include "hgui/spatial/motion.hpp"

int main(int argc, char **argv)
{
    if (argc != 2)
    {
        std::print(stderr, "usage: {} <scenario.yaml>\n", (argc > 0) ? argv[0] : "hgui_motion_demo");
        return EXIT_FAILURE;
    }

    const auto scenario = hgui::config::load_scenario_from_file(std::filesystem::path{argv[1]});
    if (!scenario)
    {
        std::print(stderr, "config error: {} [{}]\n", scenario.error().message,
                   hgui::config::format_context(scenario.error()));
        return EXIT_FAILURE;
    }

    std::print("Simulating {} bodies against {} planes for {} frames at {} Hz\n", scenario->bodies.size(),
               scenario->planes.size(), scenario->timing.frames, scenario->timing.frame_rate);

    const auto result = hgui::spatial::motion::simulate(*scenario);

    for (const auto &sample : result.trace)
    {
        std::print("frame {:>6} t={:.4f}s", sample.frame, sample.time);
        for (const auto &position : sample.positions)
        {
            std::print(" {}", position);
        }
        std::print("\n");
    }

    std::print("Resolved {} plane contacts\n", result.contacts);
    for (std::size_t i = 0; i < result.bodies.size(); ++i)
    {
        const auto &body    = result.bodies[i];
        const auto  heading = hgui::spatial::motion::heading(body);
        if (heading)
        {
            std::print("{}: position {} heading {} path {:.3f}\n", body.name, body.position, *heading,
                       result.path_lengths[i]);
        }
        else
        {
            std::print("{}: position {} stationary ({}) path {:.3f}\n", body.name, body.position,
                       hgui::common::to_string(heading.error()), result.path_lengths[i]);
        }
    }

    return EXIT_SUCCESS;
}
