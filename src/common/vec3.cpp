/**
 * @file vec3.cpp
 * @brief stream insertion for Vec3/Vec4 so gtest failures print readable vectors uwu
 *
 * all the math lives inline in vec3.hpp. this TU only hosts the ostream glue,
 * which routes through the std::formatter specializations so both paths print
 * the exact same "(x, y, z)" text.
 */
#include "hgui/common/vec3.hpp"

#include <format>
#include <ostream>

namespace hgui::common
{

auto operator<<(std::ostream &stream, const Vec3 &value) -> std::ostream &
{
    return stream << std::format("{}", value);
}

auto operator<<(std::ostream &stream, const Vec4 &value) -> std::ostream &
{
    return stream << std::format("{}", value);
}

} // namespace hgui::common
