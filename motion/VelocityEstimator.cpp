#include "motion/VelocityEstimator.hpp"

#include <glm/gtc/constants.hpp>
#include <glm/gtc/quaternion.hpp>

#include <cmath>

namespace motion
{
namespace
{
glm::mat3 rotationPart(const glm::mat4& transform)
{
    // Strip scale so the quaternion conversion sees an orthonormal basis.
    return glm::mat3(glm::normalize(glm::vec3(transform[0])),
                     glm::normalize(glm::vec3(transform[1])),
                     glm::normalize(glm::vec3(transform[2])));
}
} // namespace

float deltaAngle(float from, float to)
{
    constexpr float twoPi = glm::two_pi<float>();
    float delta = std::fmod(to - from, twoPi);
    if (delta < -glm::pi<float>())
    {
        delta += twoPi;
    }
    else if (delta >= glm::pi<float>())
    {
        delta -= twoPi;
    }
    return delta;
}

glm::vec3 orientationAngles(const glm::mat4& transform)
{
    return glm::eulerAngles(glm::quat_cast(rotationPart(transform)));
}

SensorVelocity estimateVelocity(const glm::mat4& previous, const glm::mat4& current, float elapsedSeconds)
{
    SensorVelocity velocity;
    if (!(elapsedSeconds > kMinElapsedSeconds))
    {
        return velocity;
    }

    const glm::vec3 globalLinear = (glm::vec3(current[3]) - glm::vec3(previous[3])) / elapsedSeconds;
    velocity.linear = glm::transpose(rotationPart(current)) * globalLinear;

    const glm::vec3 previousAngles = orientationAngles(previous);
    const glm::vec3 currentAngles = orientationAngles(current);
    const glm::vec3 deltaRotation(deltaAngle(previousAngles.x, currentAngles.x),
                                  deltaAngle(previousAngles.y, currentAngles.y),
                                  deltaAngle(previousAngles.z, currentAngles.z));
    velocity.angular = deltaRotation / elapsedSeconds;
    return velocity;
}

} // namespace motion
