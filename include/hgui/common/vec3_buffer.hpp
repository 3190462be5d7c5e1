/**
 * @file vec3_buffer.hpp
 * @brief flat views + SoA packing for contiguous Vec3 runs (GPU upload prep)
 *
 * Vec3 is three packed floats with no padding, so a std::span<const Vec3> is
 * also a float stream of 3*n values. renderers and transmission layers want
 * exactly that, so these helpers hand out zero-copy spans over the same memory
 * plus the copying conversions (flat -> Vec3, AoS <-> SoA) that have to
 * validate their input. errors come back via std::expected, never exceptions.
 *
 * @note the views rely on the static_asserts in vec3.hpp (3 floats, no padding)
 * @note requires C++26 standard library (std::expected, std::span shenanigans)
 */
#pragma once

#include <cstddef>
#include <expected>
#include <span>
#include <string>
#include <vector>

#include "hgui/common/vec3.hpp"

namespace hgui::common::buffer
{

/**
 * @brief structured error describing why a buffer conversion failed
 */
struct BufferError
{
    std::string              message;
    std::vector<std::string> context;
};

/**
 * @brief structure-of-arrays split of a Vec3 run (one channel per axis)
 */
struct SoaBuffers
{
    std::vector<float> x;
    std::vector<float> y;
    std::vector<float> z;
};

/**
 * @brief zero-copy float view over a Vec3 run
 *
 * ✨ PURE FUNCTION ✨
 *
 * @return span of 3 * values.size() floats in x, y, z order per vector
 */
[[nodiscard]] auto as_floats(std::span<const Vec3> values) noexcept -> std::span<const float>;

/**
 * @brief writable flavour of as_floats(), writes land in the original vectors
 */
[[nodiscard]] auto as_writable_floats(std::span<Vec3> values) noexcept -> std::span<float>;

/**
 * @brief zero-copy byte view (12 bytes per vector) for staging uploads
 */
[[nodiscard]] auto as_bytes(std::span<const Vec3> values) noexcept -> std::span<const std::byte>;

/**
 * @brief rebuilds vectors from a flat float stream
 *
 * ⚠️ IMPURE FUNCTION (allocates the result vector)
 *
 * @param[in] flat x0, y0, z0, x1, y1, z1, ... (length must be a multiple of 3)
 * @return vectors, or BufferError when the length leaves a partial vector
 */
[[nodiscard]] auto unpack_floats(std::span<const float> flat) -> std::expected<std::vector<Vec3>, BufferError>;

/**
 * @brief splits vectors into per-axis channels
 *
 * ⚠️ IMPURE FUNCTION (allocates three channels)
 */
[[nodiscard]] auto pack_soa(std::span<const Vec3> values) -> SoaBuffers;

/**
 * @brief inverse of pack_soa()
 *
 * @return vectors, or BufferError when the channel lengths disagree
 */
[[nodiscard]] auto interleave(const SoaBuffers &channels) -> std::expected<std::vector<Vec3>, BufferError>;

} // namespace hgui::common::buffer
