#pragma once

#include "SceneBackend.hpp"
#include "config/SensorSettings.hpp"
#include "sensors/OutputRestriction.hpp"

#include <glm/glm.hpp>

#include <filesystem>
#include <istream>
#include <optional>
#include <vector>

namespace lidarsim
{

struct SensorDefinition
{
    SensorSettings settings;
    glm::mat4 worldPose = glm::mat4(1.0F);
    RestrictionPolicy restriction;
    std::optional<graph::ReturnMode> returnMode;
};

struct SimulationSettings
{
    double fixedTickHz = 50.0;
    double durationSeconds = 5.0;
    bool realtime = false;
    std::vector<SensorDefinition> sensors;
};

/// Parses an INI description of the simulation.
SimulationSettings parseSimulationSettings(std::istream& input);

SimulationSettings loadSimulationSettings(const std::filesystem::path& path);

/// Pose from a position in meters and roll/pitch/yaw in degrees (applied as Z * Y * X).
glm::mat4 poseFromPositionRotation(const glm::vec3& position, const glm::vec3& rotationDegrees);

} // namespace lidarsim
