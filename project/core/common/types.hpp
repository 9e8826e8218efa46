// core/common/types.hpp
#pragma once
#include <cstdint>

using u32 = std::uint32_t;
using u64 = std::uint64_t;
using i32 = std::int32_t;
using f32 = float;
using f64 = double;

struct Extent2D {
    u32 width{0};
    u32 height{0};

    bool is_zero() const { return width == 0 || height == 0; }

    bool operator==(const Extent2D& o) const { return width == o.width && height == o.height; }
    bool operator!=(const Extent2D& o) const { return !(*this == o); }
};
