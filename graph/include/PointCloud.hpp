#pragma once

#include <glm/glm.hpp>

#include <cstdint>
#include <limits>
#include <vector>

namespace graph
{

struct Ray
{
    glm::mat4 pose = glm::mat4(1.0F); ///< Ray travels along the local +Z axis of the pose.
    glm::vec2 range = glm::vec2(0.0F, std::numeric_limits<float>::infinity());
    int32_t ringId = 0;
    float timeOffset = 0.0F;
};

struct LidarPoint
{
    glm::vec3 position = glm::vec3(0.0F);
    glm::vec3 origin = glm::vec3(0.0F);
    float distance = 0.0F;
    float intensity = 0.0F;
    int32_t ringId = 0;
    float timeOffset = 0.0F;
    uint8_t returnIndex = 0;
    bool isHit = false;
};

using RayBatch = std::vector<Ray>;
using PointCloud = std::vector<LidarPoint>;

/// Data flowing through a graph: rays until a raytrace node ran, points afterwards.
struct FrameData
{
    RayBatch rays;
    PointCloud points;
    glm::mat4 raysTransform = glm::mat4(1.0F);
    bool raytraced = false;
};

} // namespace graph
