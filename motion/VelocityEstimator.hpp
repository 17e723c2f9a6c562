#pragma once

#include <glm/glm.hpp>

namespace motion
{

struct SensorVelocity
{
    glm::vec3 linear = glm::vec3(0.0F);  ///< m/s in sensor-local axes.
    glm::vec3 angular = glm::vec3(0.0F); ///< rad/s per sensor-local axis (x, y, z).
};

inline constexpr float kMinElapsedSeconds = 1e-6F;

SensorVelocity estimateVelocity(const glm::mat4& previous, const glm::mat4& current, float elapsedSeconds);

/// Shortest signed angle (radians) that rotates `from` onto `to`, in [-pi, pi).
float deltaAngle(float from, float to);

glm::vec3 orientationAngles(const glm::mat4& transform);

} // namespace motion
