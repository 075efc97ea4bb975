#pragma once

#include <glm/vec2.hpp>
#include <glm/common.hpp>

namespace stash::core {

// Integer vector types
using IVec2 = glm::ivec2;

// Inclusive range test: min <= value <= max
template<typename T>
constexpr bool is_in_range(T value, T min, T max) {
    return value >= min && value <= max;
}

// Component-wise product of an integer extent (width * height)
inline int area(const IVec2& extent) {
    return extent.x * extent.y;
}

inline int longest_side(const IVec2& extent) {
    return glm::max(extent.x, extent.y);
}

} // namespace stash::core
