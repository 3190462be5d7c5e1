/**
 * @file vec3_buffer.cpp
 * @brief flat/SoA conversions for Vec3 runs uwu
 */
#include "hgui/common/vec3_buffer.hpp"

#include <format>
#include <initializer_list>
#include <utility>

namespace hgui::common::buffer
{
namespace
{

constexpr std::size_t kComponents = 3U;

[[nodiscard]] auto make_error(std::string message, std::initializer_list<std::string> ctx = {}) -> BufferError
{
    BufferError err{};
    err.message = std::move(message);
    err.context.assign(ctx.begin(), ctx.end());
    return err;
}

} // namespace

auto as_floats(std::span<const Vec3> values) noexcept -> std::span<const float>
{
    if (values.empty())
    {
        return {};
    }
    // Vec3 is three packed floats (static_asserts in vec3.hpp)
    return {reinterpret_cast<const float *>(values.data()), values.size() * kComponents};
}

auto as_writable_floats(std::span<Vec3> values) noexcept -> std::span<float>
{
    if (values.empty())
    {
        return {};
    }
    return {reinterpret_cast<float *>(values.data()), values.size() * kComponents};
}

auto as_bytes(std::span<const Vec3> values) noexcept -> std::span<const std::byte>
{
    return std::as_bytes(values);
}

auto unpack_floats(std::span<const float> flat) -> std::expected<std::vector<Vec3>, BufferError>
{
    if ((flat.size() % kComponents) != 0U)
    {
        return std::unexpected(make_error("flat buffer length is not a multiple of 3",
                                          {std::format("size={}", flat.size())}));
    }

    std::vector<Vec3> result;
    result.reserve(flat.size() / kComponents);
    for (std::size_t i = 0; i < flat.size(); i += kComponents)
    {
        result.emplace_back(flat[i], flat[i + 1U], flat[i + 2U]);
    }
    return result;
}

auto pack_soa(std::span<const Vec3> values) -> SoaBuffers
{
    SoaBuffers channels{};
    channels.x.reserve(values.size());
    channels.y.reserve(values.size());
    channels.z.reserve(values.size());
    for (const auto &value : values)
    {
        channels.x.push_back(value.x);
        channels.y.push_back(value.y);
        channels.z.push_back(value.z);
    }
    return channels;
}

auto interleave(const SoaBuffers &channels) -> std::expected<std::vector<Vec3>, BufferError>
{
    if ((channels.x.size() != channels.y.size()) || (channels.x.size() != channels.z.size()))
    {
        return std::unexpected(make_error("SoA channel lengths disagree",
                                          {std::format("x={}", channels.x.size()),
                                           std::format("y={}", channels.y.size()),
                                           std::format("z={}", channels.z.size())}));
    }

    std::vector<Vec3> result;
    result.reserve(channels.x.size());
    for (std::size_t i = 0; i < channels.x.size(); ++i)
    {
        result.emplace_back(channels.x[i], channels.y[i], channels.z[i]);
    }
    return result;
}

} // namespace hgui::common::buffer
