#include "config/LidarConfiguration.hpp"

#include <glm/gtc/matrix_transform.hpp>

#include <algorithm>
#include <limits>

namespace lidarsim
{
namespace
{
float horizontalStepAngle(const LidarConfiguration& configuration)
{
    if (configuration.horizontalSteps <= 0)
    {
        return 0.0F;
    }
    return (configuration.maxHorizontalAngle - configuration.minHorizontalAngle) /
        static_cast<float>(configuration.horizontalSteps);
}

std::size_t stepCount(const LidarConfiguration& configuration)
{
    return static_cast<std::size_t>(std::max(configuration.horizontalSteps, 0));
}
} // namespace

std::vector<glm::mat4> LidarConfiguration::rayPoses() const
{
    std::vector<glm::mat4> poses;
    poses.reserve(rayCount());

    const float stepAngle = horizontalStepAngle(*this);
    for (std::size_t step = 0; step < stepCount(*this); ++step)
    {
        const float azimuth = minHorizontalAngle + stepAngle * static_cast<float>(step);
        for (const auto& laser : lasers)
        {
            // Rays travel along local +Z: tilt +Z down to the laser elevation, then sweep about Z.
            glm::mat4 pose = glm::translate(glm::mat4(1.0F),
                                            glm::vec3(0.0F, laser.horizontalOffset, laser.verticalOffset));
            pose = glm::rotate(pose, glm::radians(azimuth + laser.horizontalAngleOffset), glm::vec3(0.0F, 0.0F, 1.0F));
            pose = glm::rotate(pose, glm::radians(90.0F - laser.verticalAngle), glm::vec3(0.0F, 1.0F, 0.0F));
            poses.push_back(pose);
        }
    }
    return poses;
}

std::vector<glm::vec2> LidarConfiguration::rayRanges() const
{
    std::vector<glm::vec2> ranges;
    ranges.reserve(rayCount());
    for (std::size_t step = 0; step < stepCount(*this); ++step)
    {
        for (const auto& laser : lasers)
        {
            ranges.emplace_back(laser.minRange, laser.maxRange);
        }
    }
    return ranges;
}

std::vector<int32_t> LidarConfiguration::rayRingIds() const
{
    std::vector<int32_t> ringIds;
    ringIds.reserve(lasers.size());
    for (const auto& laser : lasers)
    {
        ringIds.push_back(laser.ringId);
    }
    return ringIds;
}

std::vector<float> LidarConfiguration::rayTimeOffsets() const
{
    const float stepDuration = (scanFrequencyHz > 0.0F && horizontalSteps > 0)
        ? 1.0F / scanFrequencyHz / static_cast<float>(horizontalSteps)
        : 0.0F;

    std::vector<float> offsets;
    offsets.reserve(rayCount());
    for (std::size_t step = 0; step < stepCount(*this); ++step)
    {
        for (const auto& laser : lasers)
        {
            offsets.push_back(laser.timeOffset + stepDuration * static_cast<float>(step));
        }
    }
    return offsets;
}

std::size_t LidarConfiguration::rayCount() const noexcept
{
    return lasers.size() * stepCount(*this);
}

int32_t LidarConfiguration::ringCount() const noexcept
{
    return static_cast<int32_t>(lasers.size());
}

float LidarConfiguration::fullRange() const noexcept
{
    if (lasers.empty())
    {
        return std::numeric_limits<float>::infinity();
    }
    const auto farthest = std::max_element(lasers.begin(), lasers.end(), [](const auto& a, const auto& b) {
        return a.maxRange < b.maxRange;
    });
    return farthest->maxRange;
}

std::vector<std::string> LidarConfiguration::differencesFrom(const LidarConfiguration& other) const
{
    std::vector<std::string> fields;
    if (lasers != other.lasers)
    {
        fields.emplace_back("lasers");
    }
    if (minHorizontalAngle != other.minHorizontalAngle || maxHorizontalAngle != other.maxHorizontalAngle)
    {
        fields.emplace_back("horizontalFieldOfView");
    }
    if (horizontalSteps != other.horizontalSteps)
    {
        fields.emplace_back("horizontalSteps");
    }
    if (scanFrequencyHz != other.scanFrequencyHz)
    {
        fields.emplace_back("scanFrequencyHz");
    }
    if (!(noiseParams == other.noiseParams))
    {
        fields.emplace_back("noiseParams");
    }
    if (horizontalBeamDivergence != other.horizontalBeamDivergence ||
        verticalBeamDivergence != other.verticalBeamDivergence)
    {
        fields.emplace_back("beamDivergence");
    }
    if (returnMode != other.returnMode)
    {
        fields.emplace_back("returnMode");
    }
    if (lidarOriginTransform != other.lidarOriginTransform)
    {
        fields.emplace_back("lidarOriginTransform");
    }
    return fields;
}

} // namespace lidarsim
