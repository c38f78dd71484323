#pragma once

#include <glm/glm.hpp>
#include <cstdint>
#include <vector>

namespace rivvon {

// Ordered 3D path samples (length >= 2 to be buildable)
using PointSequence = std::vector<glm::vec3>;

// Several paths rendered together as one series
using PathSet = std::vector<PointSequence>;

// Interleaved ribbon vertex as uploaded to the GPU (32 bytes)
struct RibbonVertex {
    float position[3];
    float normal[3];
    float uv[2];
};

static_assert(sizeof(RibbonVertex) == 32, "RibbonVertex must be tightly packed");

} // namespace rivvon
