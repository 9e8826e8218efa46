#pragma once
#include <cstddef>

#include "../core/common/types.hpp"

struct Vertex {
    f32 position[4];
    f32 color[4];
};

static_assert(sizeof(Vertex) == 8 * sizeof(f32), "Vertex must stay tightly packed");

constexpr u32 VERTEX_POSITION_OFFSET = offsetof(Vertex, position);
constexpr u32 VERTEX_COLOR_OFFSET    = offsetof(Vertex, color);

// red top, green bottom-left, blue bottom-right; clockwise
constexpr Vertex TRIANGLE_VERTICES[3] = {
    {{ 0.0f,  1.0f, 0.0f, 1.0f}, {1.0f, 0.0f, 0.0f, 1.0f}},
    {{-1.0f, -1.0f, 0.0f, 1.0f}, {0.0f, 1.0f, 0.0f, 1.0f}},
    {{ 1.0f, -1.0f, 0.0f, 1.0f}, {0.0f, 0.0f, 1.0f, 1.0f}},
};

constexpr u32 TRIANGLE_INDICES[3] = {0, 1, 2};
constexpr u32 TRIANGLE_INDEX_COUNT = 3;
