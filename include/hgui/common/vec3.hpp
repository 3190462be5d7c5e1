/**
 * @file vec3.hpp
 * @brief the spatial core's Vec3 value type and every op that touches it uwu
 *
 * this header is the foundation of HapticGUI's spatial stack. cursors, haptic
 * probes, physics bodies and ray casts all speak Vec3, so it stays tiny, pure
 * and allocation-free. everything lives inline here so the optimizer can fold
 * the whole thing away on the 60+ FPS hot path.
 *
 * the numeric edge-case policy is the interesting part:
 * - a single process-wide epsilon (kEpsilon) decides when a vector is too short
 *   to have a direction. is_zero() is the one place that threshold is applied
 * - normalize() never fails observably. degenerate input gives Vec3::zero()
 * - try_normalize() reports the degenerate case through std::expected
 * - normalize_fast() trades a bounded relative error for a cheaper rsqrt
 * - NaN/Infinity are never rejected. they propagate per IEEE 754 and are
 *   observable through is_finite()/is_nan()
 *
 * @author LukeFrankio
 * @date 2025-11-05
 * @version 1.0
 *
 * @note compiled with GCC 15.2+ in -std=c++2c mode (C++26 baby!)
 * @note zero runtime allocation, verified by tests/vec3_allocation_test.cpp
 * @note layout is three packed floats so GPU uploads can view Vec3 runs flat
 *
 * example (basic usage):
 * @code
 * using namespace hgui::common;
 * constexpr Vec3 position{10.0F, 5.0F, 2.0F};
 * constexpr Vec3 velocity{-2.0F, 0.0F, 1.0F};
 * constexpr Vec3 next = position + velocity * 0.016F;
 * // next == {9.968, 5.0, 2.016}, one 60 FPS step later uwu
 * @endcode
 */
#pragma once

#include <algorithm>
#include <array>
#include <bit>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <format>
#include <limits>
#include <optional>
#include <ostream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <type_traits>

namespace hgui::common
{

/// vectors with length <= kEpsilon are degenerate (no direction)
inline constexpr float kEpsilon = 1.0e-6F;

/// squared threshold, compared against length_squared() so no sqrt is needed
inline constexpr float kEpsilonSquared = kEpsilon * kEpsilon;

/// looser tolerance for spatial comparisons (approx_equal, contact tests)
inline constexpr float kSpatialEpsilon = 1.0e-4F;

/**
 * @brief error codes for vector ops that can fail explicitly
 *
 * an enum rather than a message struct so the failure path of try_normalize()
 * stays allocation-free.
 */
enum class VectorError : std::uint8_t
{
    DegenerateVector = 0U ///< length within kEpsilon of zero, direction undefined
};

/**
 * @brief human-readable description for a VectorError
 *
 * ✨ PURE FUNCTION ✨
 */
[[nodiscard]] constexpr auto to_string(VectorError error) noexcept -> std::string_view
{
    switch (error)
    {
    case VectorError::DegenerateVector:
        return "degenerate vector (length within epsilon of zero)";
    }
    return "unknown vector error";
}

/**
 * @brief three packed floats, x then y then z, nothing else
 *
 * ✨ PURE VALUE TYPE ✨
 *
 * plain value semantics: copied by value, owns nothing, no identity beyond its
 * components. the constructor takes components verbatim (NaN and Infinity
 * included) because validation is the caller's call, not ours.
 */
struct Vec3
{
    float x{0.0F}; ///< X component
    float y{0.0F}; ///< Y component
    float z{0.0F}; ///< Z component

    constexpr Vec3() noexcept = default;
    constexpr Vec3(float x_value, float y_value, float z_value) noexcept : x{x_value}, y{y_value}, z{z_value} {}

    [[nodiscard]] static constexpr auto zero() noexcept -> Vec3 { return Vec3{0.0F, 0.0F, 0.0F}; }
    [[nodiscard]] static constexpr auto one() noexcept -> Vec3 { return Vec3{1.0F, 1.0F, 1.0F}; }
    [[nodiscard]] static constexpr auto unit_x() noexcept -> Vec3 { return Vec3{1.0F, 0.0F, 0.0F}; }
    [[nodiscard]] static constexpr auto unit_y() noexcept -> Vec3 { return Vec3{0.0F, 1.0F, 0.0F}; }
    [[nodiscard]] static constexpr auto unit_z() noexcept -> Vec3 { return Vec3{0.0F, 0.0F, 1.0F}; }
    [[nodiscard]] static constexpr auto splat(float value) noexcept -> Vec3 { return Vec3{value, value, value}; }

    [[nodiscard]] static constexpr auto from_array(const std::array<float, 3> &values) noexcept -> Vec3
    {
        return Vec3{values[0], values[1], values[2]};
    }

    /**
     * @brief component access by index (0 = x, 1 = y, 2 = z)
     *
     * @throws std::out_of_range for index > 2 (a programming error, never a
     *         numeric edge case)
     */
    [[nodiscard]] constexpr auto operator[](std::size_t index) const -> const float &
    {
        switch (index)
        {
        case 0U:
            return x;
        case 1U:
            return y;
        case 2U:
            return z;
        default:
            throw std::out_of_range("Vec3 index out of range");
        }
    }

    [[nodiscard]] constexpr auto operator[](std::size_t index) -> float &
    {
        switch (index)
        {
        case 0U:
            return x;
        case 1U:
            return y;
        case 2U:
            return z;
        default:
            throw std::out_of_range("Vec3 index out of range");
        }
    }

    constexpr auto operator+=(const Vec3 &rhs) noexcept -> Vec3 &
    {
        x += rhs.x;
        y += rhs.y;
        z += rhs.z;
        return *this;
    }

    constexpr auto operator-=(const Vec3 &rhs) noexcept -> Vec3 &
    {
        x -= rhs.x;
        y -= rhs.y;
        z -= rhs.z;
        return *this;
    }

    constexpr auto operator*=(float scalar) noexcept -> Vec3 &
    {
        x *= scalar;
        y *= scalar;
        z *= scalar;
        return *this;
    }

    constexpr auto operator/=(float scalar) noexcept -> Vec3 &
    {
        x /= scalar;
        y /= scalar;
        z /= scalar;
        return *this;
    }

    /// exact componentwise IEEE comparison (NaN never compares equal)
    [[nodiscard]] friend constexpr bool operator==(const Vec3 &, const Vec3 &) noexcept = default;
};

static_assert(sizeof(Vec3) == 3U * sizeof(float), "Vec3 must be three packed floats");
static_assert(alignof(Vec3) == alignof(float));
static_assert(std::is_standard_layout_v<Vec3>);
static_assert(std::is_trivially_copyable_v<Vec3>);
static_assert(offsetof(Vec3, x) == 0U);
static_assert(offsetof(Vec3, y) == sizeof(float));
static_assert(offsetof(Vec3, z) == 2U * sizeof(float));

// ============================================================================
// core algebra
// ============================================================================

[[nodiscard]] constexpr auto operator+(const Vec3 &lhs, const Vec3 &rhs) noexcept -> Vec3
{
    return Vec3{lhs.x + rhs.x, lhs.y + rhs.y, lhs.z + rhs.z};
}

[[nodiscard]] constexpr auto operator-(const Vec3 &lhs, const Vec3 &rhs) noexcept -> Vec3
{
    return Vec3{lhs.x - rhs.x, lhs.y - rhs.y, lhs.z - rhs.z};
}

[[nodiscard]] constexpr auto operator-(const Vec3 &value) noexcept -> Vec3
{
    return Vec3{-value.x, -value.y, -value.z};
}

[[nodiscard]] constexpr auto operator*(const Vec3 &value, float scalar) noexcept -> Vec3
{
    return Vec3{value.x * scalar, value.y * scalar, value.z * scalar};
}

[[nodiscard]] constexpr auto operator*(float scalar, const Vec3 &value) noexcept -> Vec3
{
    return value * scalar;
}

/**
 * @brief componentwise division by a scalar
 *
 * a zero divisor is not special-cased: each component becomes ±Infinity or
 * NaN exactly as IEEE 754 says and keeps propagating from there.
 */
[[nodiscard]] constexpr auto operator/(const Vec3 &value, float scalar) noexcept -> Vec3
{
    return Vec3{value.x / scalar, value.y / scalar, value.z / scalar};
}

[[nodiscard]] constexpr auto to_array(const Vec3 &value) noexcept -> std::array<float, 3>
{
    return {value.x, value.y, value.z};
}

/**
 * @brief 3D dot product, the workhorse of the whole module
 *
 * ✨ PURE FUNCTION ✨
 *
 * this function is pure because:
 * - referential transparency applies (same inputs = same output)
 * - no side effects, no throws, just math uwu
 *
 * @param[in] lhs left operand
 * @param[in] rhs right operand
 * @return scalar dot product, commutative and bilinear
 *
 * @complexity O(1) time (three multiplies + two adds)
 */
[[nodiscard]] constexpr auto dot(const Vec3 &lhs, const Vec3 &rhs) noexcept -> float
{
    return (lhs.x * rhs.x) + (lhs.y * rhs.y) + (lhs.z * rhs.z);
}

/**
 * @brief right-handed cross product
 *
 * ✨ PURE FUNCTION ✨
 *
 * anti-commutative (cross(a, b) == -cross(b, a)) and zero whenever the
 * operands are parallel or either one is zero.
 *
 * example (composition with other functions):
 * @code
 * auto triple = dot(Vec3::unit_x(), cross(Vec3::unit_y(), Vec3::unit_z()));
 * // triple == 1.0F because the standard basis is right-handed
 * @endcode
 */
[[nodiscard]] constexpr auto cross(const Vec3 &lhs, const Vec3 &rhs) noexcept -> Vec3
{
    return Vec3{
        (lhs.y * rhs.z) - (lhs.z * rhs.y),
        (lhs.z * rhs.x) - (lhs.x * rhs.z),
        (lhs.x * rhs.y) - (lhs.y * rhs.x)
    };
}

// ============================================================================
// magnitude + normalization
// ============================================================================

/**
 * @brief squared magnitude, dot(v, v)
 *
 * ✨ PURE FUNCTION ✨
 *
 * the cheap primitive: prefer it over length() whenever only relative
 * comparisons matter, because it skips the square root.
 *
 * @post return value >= 0 (or NaN when a component is NaN)
 */
[[nodiscard]] constexpr auto length_squared(const Vec3 &value) noexcept -> float
{
    return dot(value, value);
}

/**
 * @brief Euclidean magnitude
 *
 * @warning NaN inputs propagate per IEEE 754 (callers should guard if needed)
 */
[[nodiscard]] inline auto length(const Vec3 &value) noexcept -> float
{
    return std::sqrt(length_squared(value));
}

/**
 * @brief true when the vector is degenerate under the global epsilon policy
 *
 * ✨ PURE FUNCTION ✨
 *
 * the single home of the near-zero threshold: length_squared(v) <=
 * kEpsilonSquared. every normalize flavour routes through here so they can
 * never disagree about what "zero" means.
 */
[[nodiscard]] constexpr auto is_zero(const Vec3 &value) noexcept -> bool
{
    return length_squared(value) <= kEpsilonSquared;
}

/**
 * @brief approximate 1/sqrt(x) via the classic bit trick + two Newton steps
 *
 * ✨ PURE FUNCTION ✨
 *
 * one Newton step leaves ~1.7e-3 relative error, which misses the 1e-3 budget
 * promised by normalize_fast(). the second step brings it to ~5e-6.
 *
 * @pre value > 0 and finite
 */
[[nodiscard]] constexpr auto fast_inverse_sqrt(float value) noexcept -> float
{
    constexpr std::uint32_t kMagic = 0x5f3759dfU;
    const auto              half   = 0.5F * value;
    auto                    guess  = std::bit_cast<float>(kMagic - (std::bit_cast<std::uint32_t>(value) >> 1U));
    guess *= 1.5F - (half * guess * guess);
    guess *= 1.5F - (half * guess * guess);
    return guess;
}

[[nodiscard]] constexpr auto is_finite(const Vec3 &value) noexcept -> bool;
[[nodiscard]] constexpr auto max_component(const Vec3 &value) noexcept -> float;

/**
 * @brief pulls a finite vector whose length_squared overflows back into range
 *
 * ✨ PURE FUNCTION ✨
 *
 * components above ~1.8e19 square to Infinity even though the vector itself
 * is finite. dividing by the largest absolute component first keeps the
 * direction and brings length_squared into [1, 3]. every other input
 * (including NaN/Infinity components) is returned unchanged.
 */
[[nodiscard]] constexpr auto rescale_for_length(const Vec3 &value) noexcept -> Vec3
{
    if (length_squared(value) <= std::numeric_limits<float>::max() || !is_finite(value))
    {
        return value;
    }
    return value / max_component(value);
}

/**
 * @brief normalizes to unit length, degrading gracefully to Vec3::zero()
 *
 * ✨ PURE FUNCTION ✨
 *
 * this function is pure because:
 * - input fully determines output without touching global state
 * - no exceptions, no logging, no side effects whatsoever
 *
 * @param[in] value vector to normalize
 * @return value / length(value), or Vec3::zero() when is_zero(value)
 *
 * @note never divides by a near-zero length, so never invents NaN/Infinity
 * @note non-finite inputs that pass the guard still propagate (Infinity
 *       components give NaN, NaN stays NaN)
 */
[[nodiscard]] inline auto normalize(const Vec3 &value) noexcept -> Vec3
{
    if (is_zero(value))
    {
        return Vec3::zero();
    }
    const auto scaled = rescale_for_length(value);
    return scaled / length(scaled);
}

/**
 * @brief approximate normalize for hot loops that tolerate a little error
 *
 * ✨ PURE FUNCTION ✨
 *
 * same contract and same near-zero guard as normalize(), but scales by
 * fast_inverse_sqrt() instead of dividing by a precise sqrt.
 *
 * @return unit vector with relative error <= 1e-3, or Vec3::zero()
 *
 * @warning pick this one by name only where approximate directions are fine
 */
[[nodiscard]] constexpr auto normalize_fast(const Vec3 &value) noexcept -> Vec3
{
    if (is_zero(value))
    {
        return Vec3::zero();
    }
    const auto scaled = rescale_for_length(value);
    return scaled * fast_inverse_sqrt(length_squared(scaled));
}

/**
 * @brief normalizes or explicitly reports the degenerate case
 *
 * ✨ PURE FUNCTION ✨
 *
 * unlike normalize(), the caller learns that the input had no direction and
 * picks its own fallback.
 *
 * @return unit vector, or VectorError::DegenerateVector when is_zero(value)
 *
 * example (edge case handling):
 * @code
 * const auto heading = try_normalize(velocity);
 * if (!heading) {
 *     // body is stationary, keep the previous heading instead
 * }
 * @endcode
 */
[[nodiscard]] inline auto try_normalize(const Vec3 &value) noexcept -> std::expected<Vec3, VectorError>
{
    if (is_zero(value))
    {
        return std::unexpected(VectorError::DegenerateVector);
    }
    const auto scaled = rescale_for_length(value);
    return scaled / length(scaled);
}

/// |length_squared(v) - 1| < kEpsilon
[[nodiscard]] inline auto is_normalized(const Vec3 &value) noexcept -> bool
{
    return std::fabs(length_squared(value) - 1.0F) < kEpsilon;
}

// ============================================================================
// distance
// ============================================================================

/// preferred for comparisons since it skips the sqrt
[[nodiscard]] constexpr auto distance_squared_to(const Vec3 &from, const Vec3 &to) noexcept -> float
{
    return length_squared(from - to);
}

[[nodiscard]] inline auto distance_to(const Vec3 &from, const Vec3 &to) noexcept -> float
{
    return length(from - to);
}

/**
 * @brief tolerance-based equality: distance_squared_to(a, b) <= tolerance^2
 */
[[nodiscard]] constexpr auto approx_equal(const Vec3 &lhs, const Vec3 &rhs,
                                          float tolerance = kSpatialEpsilon) noexcept -> bool
{
    return distance_squared_to(lhs, rhs) <= tolerance * tolerance;
}

// ============================================================================
// geometric utilities
// ============================================================================

/**
 * @brief mirror reflection of an incident direction about a surface normal
 *
 * ✨ PURE FUNCTION ✨
 *
 * computes incident - normal * (2 * dot(incident, normal)).
 *
 * @pre normal is unit length. it is NOT normalized here: a non-unit normal
 *      yields a well-defined but non-reflective result
 */
[[nodiscard]] constexpr auto reflect(const Vec3 &incident, const Vec3 &normal) noexcept -> Vec3
{
    return incident - (normal * (2.0F * dot(incident, normal)));
}

/**
 * @brief linear interpolation a + (b - a) * t
 *
 * t is not clamped. values outside [0, 1] extrapolate along the line.
 */
[[nodiscard]] constexpr auto lerp(const Vec3 &from, const Vec3 &to, float t) noexcept -> Vec3
{
    return from + ((to - from) * t);
}

/**
 * @brief spherical interpolation between two unit vectors
 *
 * falls back to normalize(lerp(...)) when the inputs are (anti)parallel
 * within kEpsilon, where sin(angle) is too small to divide by.
 *
 * @pre from and to are unit length
 */
[[nodiscard]] inline auto slerp(const Vec3 &from, const Vec3 &to, float t) noexcept -> Vec3
{
    const auto cos_angle = std::clamp(dot(from, to), -1.0F, 1.0F);
    if (std::fabs(cos_angle) > 1.0F - kEpsilon)
    {
        return normalize(lerp(from, to, t));
    }

    const auto angle     = std::acos(cos_angle);
    const auto sin_angle = std::sin(angle);
    const auto weight_a  = std::sin((1.0F - t) * angle) / sin_angle;
    const auto weight_b  = std::sin(t * angle) / sin_angle;
    return (from * weight_a) + (to * weight_b);
}

/**
 * @brief Snell refraction through a surface
 *
 * @param[in] incident unit incident direction
 * @param[in] normal unit surface normal facing against the incident ray
 * @param[in] eta ratio of refractive indices (n1 / n2)
 * @return refracted direction, or std::nullopt on total internal reflection
 */
[[nodiscard]] inline auto refract(const Vec3 &incident, const Vec3 &normal, float eta) noexcept
    -> std::optional<Vec3>
{
    const auto cos_i  = -dot(incident, normal);
    const auto sin_t2 = eta * eta * (1.0F - (cos_i * cos_i));
    if (sin_t2 > 1.0F)
    {
        return std::nullopt;
    }
    const auto cos_t = std::sqrt(1.0F - sin_t2);
    return (incident * eta) + (normal * ((eta * cos_i) - cos_t));
}

/**
 * @brief component of value along onto
 *
 * @warning a zero `onto` divides by zero and yields NaN per IEEE 754
 */
[[nodiscard]] constexpr auto project_onto(const Vec3 &value, const Vec3 &onto) noexcept -> Vec3
{
    return onto * (dot(value, onto) / length_squared(onto));
}

/// component of value perpendicular to from
[[nodiscard]] constexpr auto reject_from(const Vec3 &value, const Vec3 &from) noexcept -> Vec3
{
    return value - project_onto(value, from);
}

// ============================================================================
// componentwise helpers
// ============================================================================

[[nodiscard]] inline auto min(const Vec3 &lhs, const Vec3 &rhs) noexcept -> Vec3
{
    return Vec3{std::fmin(lhs.x, rhs.x), std::fmin(lhs.y, rhs.y), std::fmin(lhs.z, rhs.z)};
}

[[nodiscard]] inline auto max(const Vec3 &lhs, const Vec3 &rhs) noexcept -> Vec3
{
    return Vec3{std::fmax(lhs.x, rhs.x), std::fmax(lhs.y, rhs.y), std::fmax(lhs.z, rhs.z)};
}

[[nodiscard]] inline auto abs(const Vec3 &value) noexcept -> Vec3
{
    return Vec3{std::fabs(value.x), std::fabs(value.y), std::fabs(value.z)};
}

/// min(max(value, lo), hi), so hi wins when the bounds cross
[[nodiscard]] inline auto clamp(const Vec3 &value, const Vec3 &lo, const Vec3 &hi) noexcept -> Vec3
{
    return min(max(value, lo), hi);
}

[[nodiscard]] inline auto floor(const Vec3 &value) noexcept -> Vec3
{
    return Vec3{std::floor(value.x), std::floor(value.y), std::floor(value.z)};
}

[[nodiscard]] inline auto ceil(const Vec3 &value) noexcept -> Vec3
{
    return Vec3{std::ceil(value.x), std::ceil(value.y), std::ceil(value.z)};
}

/// halfway cases round away from zero (std::round)
[[nodiscard]] inline auto round(const Vec3 &value) noexcept -> Vec3
{
    return Vec3{std::round(value.x), std::round(value.y), std::round(value.z)};
}

/// largest absolute component
[[nodiscard]] constexpr auto max_component(const Vec3 &value) noexcept -> float
{
    return std::fmax(std::fmax(std::fabs(value.x), std::fabs(value.y)), std::fabs(value.z));
}

/// smallest absolute component
[[nodiscard]] inline auto min_component(const Vec3 &value) noexcept -> float
{
    return std::fmin(std::fmin(std::fabs(value.x), std::fabs(value.y)), std::fabs(value.z));
}

/**
 * @brief rearranges components, e.g. swizzle(v, 2, 1, 0) == {v.z, v.y, v.x}
 *
 * @throws std::out_of_range when any index is > 2
 */
[[nodiscard]] constexpr auto swizzle(const Vec3 &value, std::size_t x_index, std::size_t y_index,
                                     std::size_t z_index) -> Vec3
{
    return Vec3{value[x_index], value[y_index], value[z_index]};
}

// ============================================================================
// validity predicates
// ============================================================================

/// true iff no component is NaN or ±Infinity
[[nodiscard]] constexpr auto is_finite(const Vec3 &value) noexcept -> bool
{
    return std::isfinite(value.x) && std::isfinite(value.y) && std::isfinite(value.z);
}

/// true iff at least one component is NaN
[[nodiscard]] inline auto is_nan(const Vec3 &value) noexcept -> bool
{
    return std::isnan(value.x) || std::isnan(value.y) || std::isnan(value.z);
}

// ============================================================================
// Vec4 extension (homogeneous coordinates for matrix consumers)
// ============================================================================

/**
 * @brief four packed floats, mostly a carrier for w during transforms
 */
struct Vec4
{
    float x{0.0F};
    float y{0.0F};
    float z{0.0F};
    float w{0.0F};

    constexpr Vec4() noexcept = default;
    constexpr Vec4(float x_value, float y_value, float z_value, float w_value) noexcept
        : x{x_value}, y{y_value}, z{z_value}, w{w_value}
    {
    }

    [[nodiscard]] friend constexpr bool operator==(const Vec4 &, const Vec4 &) noexcept = default;
};

static_assert(sizeof(Vec4) == 4U * sizeof(float), "Vec4 must be four packed floats");
static_assert(std::is_standard_layout_v<Vec4>);

[[nodiscard]] constexpr auto extend(const Vec3 &value, float w) noexcept -> Vec4
{
    return Vec4{value.x, value.y, value.z, w};
}

/// w = 1, affected by translation
[[nodiscard]] constexpr auto to_point(const Vec3 &value) noexcept -> Vec4
{
    return extend(value, 1.0F);
}

/// w = 0, immune to translation
[[nodiscard]] constexpr auto to_direction(const Vec3 &value) noexcept -> Vec4
{
    return extend(value, 0.0F);
}

[[nodiscard]] constexpr auto truncate(const Vec4 &value) noexcept -> Vec3
{
    return Vec3{value.x, value.y, value.z};
}

/**
 * @brief perspective divide (x/w, y/w, z/w)
 *
 * @return Vec3::zero() when |w| < kEpsilon instead of blowing up to Infinity
 */
[[nodiscard]] inline auto truncate_with_perspective(const Vec4 &value) noexcept -> Vec3
{
    if (std::fabs(value.w) < kEpsilon)
    {
        return Vec3::zero();
    }
    return Vec3{value.x / value.w, value.y / value.w, value.z / value.w};
}

auto operator<<(std::ostream &stream, const Vec3 &value) -> std::ostream &;
auto operator<<(std::ostream &stream, const Vec4 &value) -> std::ostream &;

} // namespace hgui::common

/**
 * @brief std::format support, "(x, y, z)" with three decimals
 *
 * the tuple is rendered first, then fill/align/width from the format spec
 * apply to the whole text, so "{:>24}" right-aligns the tuple as a unit.
 */
template <>
struct std::formatter<hgui::common::Vec3> : std::formatter<std::string_view>
{
    auto format(const hgui::common::Vec3 &value, std::format_context &ctx) const
    {
        const auto text = std::format("({:.3f}, {:.3f}, {:.3f})", value.x, value.y, value.z);
        return std::formatter<std::string_view>::format(text, ctx);
    }
};

template <>
struct std::formatter<hgui::common::Vec4> : std::formatter<std::string_view>
{
    auto format(const hgui::common::Vec4 &value, std::format_context &ctx) const
    {
        const auto text = std::format("({:.3f}, {:.3f}, {:.3f}, {:.3f})", value.x, value.y, value.z, value.w);
        return std::formatter<std::string_view>::format(text, ctx);
    }
};
