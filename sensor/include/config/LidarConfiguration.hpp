#pragma once

#include "NodeParameters.hpp"
#include "SceneBackend.hpp"

#include <glm/glm.hpp>

#include <cstdint>
#include <string>
#include <vector>

namespace lidarsim
{

struct LaserConfiguration
{
    float verticalAngle = 0.0F;
    float horizontalAngleOffset = 0.0F;
    float verticalOffset = 0.0F;
    float horizontalOffset = 0.0F;
    int32_t ringId = 0;
    float timeOffset = 0.0F;
    float minRange = 0.0F;
    float maxRange = 0.0F;

    bool operator==(const LaserConfiguration&) const = default;
};

struct NoiseParameters
{
    graph::AngularNoisePlacement angularNoiseType = graph::AngularNoisePlacement::RayBased;
    float angularNoiseMean = 0.0F;
    float angularNoiseStDev = 0.0F;
    float distanceNoiseMean = 0.0F;
    float distanceNoiseStDevBase = 0.0F;
    float distanceNoiseStDevRisePerMeter = 0.0F;

    bool operator==(const NoiseParameters&) const = default;
};

/// Declarative description of the point cloud produced by a lidar model.
/// The laser array is swept over [minHorizontalAngle, maxHorizontalAngle) in horizontalSteps
/// steps. A scan frequency of zero fires every ray at the same instant (flash lidar).
struct LidarConfiguration
{
    std::vector<LaserConfiguration> lasers;
    float minHorizontalAngle = 0.0F;
    float maxHorizontalAngle = 0.0F;
    int32_t horizontalSteps = 1;
    float scanFrequencyHz = 0.0F;
    NoiseParameters noiseParams;
    float horizontalBeamDivergence = 0.0F;
    float verticalBeamDivergence = 0.0F;
    graph::ReturnMode returnMode = graph::ReturnMode::SingleReturnFirst;
    glm::mat4 lidarOriginTransform = glm::mat4(1.0F); ///< Sensor mount to ray origin.

    std::vector<glm::mat4> rayPoses() const;
    std::vector<glm::vec2> rayRanges() const;
    std::vector<int32_t> rayRingIds() const;
    std::vector<float> rayTimeOffsets() const;

    std::size_t rayCount() const noexcept;
    int32_t ringCount() const noexcept;

    float fullRange() const noexcept;

    /// Names of the fields that differ from `other`; empty when both describe the same lidar.
    std::vector<std::string> differencesFrom(const LidarConfiguration& other) const;
};

} // namespace lidarsim
