#include "config/SettingsLoader.hpp"

#include "sensors/SensorErrors.hpp"

#include <glm/gtc/matrix_transform.hpp>

#include <algorithm>
#include <cctype>
#include <charconv>
#include <fstream>
#include <string>
#include <string_view>

namespace lidarsim
{
namespace
{
constexpr std::string_view kSensorSectionPrefix = "Sensor.";
constexpr std::string_view kSimulationSection = "Simulation";

struct SectionState
{
    std::string name;
    std::size_t sensorIndex = 0;
    bool isSensor = false;
    bool isSimulation = false;
};

std::string_view trim(std::string_view value)
{
    const auto first = value.find_first_not_of(" \t\r\n");
    if (first == std::string_view::npos)
    {
        return {};
    }
    const auto last = value.find_last_not_of(" \t\r\n");
    return value.substr(first, last - first + 1);
}

std::string_view stripInlineComment(std::string_view value)
{
    const auto semicolon = value.find(';');
    if (semicolon != std::string_view::npos)
    {
        value.remove_suffix(value.size() - semicolon);
    }
    return value;
}

std::string lowered(std::string_view text)
{
    std::string result(text);
    std::ranges::transform(result.begin(), result.end(), result.begin(), ::tolower);
    return result;
}

[[noreturn]] void malformed(int lineNumber, std::string_view key, std::string_view value)
{
    throw ConfigurationError("Settings line " + std::to_string(lineNumber) + ": invalid value '" + std::string(value) +
                             "' for key '" + std::string(key) + "'");
}

template <typename T>
T parseNumber(int lineNumber, std::string_view key, std::string_view text)
{
    T out{};
    const auto result = std::from_chars(text.data(), text.data() + text.size(), out);
    if (result.ec != std::errc() || result.ptr != text.data() + text.size())
    {
        malformed(lineNumber, key, text);
    }
    return out;
}

bool parseBool(int lineNumber, std::string_view key, std::string_view text)
{
    const std::string value = lowered(text);
    if (value == "true" || value == "1" || value == "yes" || value == "on")
    {
        return true;
    }
    if (value == "false" || value == "0" || value == "no" || value == "off")
    {
        return false;
    }
    malformed(lineNumber, key, text);
}

glm::vec3 parseVec3(int lineNumber, std::string_view key, std::string_view text)
{
    glm::vec3 result(0.0F);
    std::string_view rest = text;
    for (int axis = 0; axis < 3; ++axis)
    {
        const auto commaPos = rest.find(',');
        const bool last = axis == 2;
        if (last == (commaPos != std::string_view::npos))
        {
            malformed(lineNumber, key, text);
        }
        const std::string_view component = trim(last ? rest : rest.substr(0, commaPos));
        result[axis] = parseNumber<float>(lineNumber, key, component);
        if (!last)
        {
            rest = rest.substr(commaPos + 1);
        }
    }
    return result;
}

graph::ReturnMode parseReturnMode(int lineNumber, std::string_view key, std::string_view text)
{
    const std::string value = lowered(text);
    if (value == "first")
    {
        return graph::ReturnMode::SingleReturnFirst;
    }
    if (value == "last")
    {
        return graph::ReturnMode::SingleReturnLast;
    }
    if (value == "strongest")
    {
        return graph::ReturnMode::SingleReturnStrongest;
    }
    if (value == "dual" || value == "firstlast")
    {
        return graph::ReturnMode::DualReturnFirstLast;
    }
    malformed(lineNumber, key, text);
}

void applySimulationKey(SimulationSettings& settings, int lineNumber, std::string_view key, std::string_view value)
{
    if (key == "fixedTickHz")
    {
        settings.fixedTickHz = parseNumber<double>(lineNumber, key, value);
        if (settings.fixedTickHz <= 0.0)
        {
            malformed(lineNumber, key, value);
        }
    }
    else if (key == "durationSeconds")
    {
        settings.durationSeconds = parseNumber<double>(lineNumber, key, value);
        if (settings.durationSeconds < 0.0)
        {
            malformed(lineNumber, key, value);
        }
    }
    else if (key == "realtime")
    {
        settings.realtime = parseBool(lineNumber, key, value);
    }
}

void applySensorKey(SensorDefinition& sensor,
                    glm::vec3& position,
                    glm::vec3& rotation,
                    int lineNumber,
                    std::string_view key,
                    std::string_view value)
{
    SensorSettings& settings = sensor.settings;
    RestrictionPolicy& restriction = sensor.restriction;

    if (key == "model")
    {
        settings.modelPreset = std::string(value);
    }
    else if (key == "captureHz")
    {
        settings.automaticCaptureHz = parseNumber<int>(lineNumber, key, value);
        if (settings.automaticCaptureHz < 0)
        {
            malformed(lineNumber, key, value);
        }
    }
    else if (key == "position")
    {
        position = parseVec3(lineNumber, key, value);
    }
    else if (key == "rotation")
    {
        rotation = parseVec3(lineNumber, key, value);
    }
    else if (key == "returnMode")
    {
        sensor.returnMode = parseReturnMode(lineNumber, key, value);
    }
    else if (key == "distanceNoise")
    {
        settings.applyDistanceGaussianNoise = parseBool(lineNumber, key, value);
    }
    else if (key == "angularNoise")
    {
        settings.applyAngularGaussianNoise = parseBool(lineNumber, key, value);
    }
    else if (key == "velocityDistortion")
    {
        settings.applyVelocityDistortion = parseBool(lineNumber, key, value);
    }
    else if (key == "beamDivergence")
    {
        settings.simulateBeamDivergence = parseBool(lineNumber, key, value);
    }
    else if (key == "validateOnStartup")
    {
        settings.validateConfigurationOnStartup = parseBool(lineNumber, key, value);
    }
    else if (key == "restrictionEnabled")
    {
        restriction.applyRestriction = parseBool(lineNumber, key, value);
    }
    else if (key == "restrictionMaxRange")
    {
        restriction.maxRange = parseNumber<float>(lineNumber, key, value);
    }
    else if (key == "restrictionPeriodic")
    {
        restriction.enablePeriodicRestriction = parseBool(lineNumber, key, value);
    }
    else if (key == "restrictionOnDuration")
    {
        restriction.onDuration = parseNumber<float>(lineNumber, key, value);
    }
    else if (key == "restrictionOffDuration")
    {
        restriction.offDuration = parseNumber<float>(lineNumber, key, value);
    }
}
} // namespace

glm::mat4 poseFromPositionRotation(const glm::vec3& position, const glm::vec3& rotationDegrees)
{
    glm::mat4 pose = glm::translate(glm::mat4(1.0F), position);
    pose = glm::rotate(pose, glm::radians(rotationDegrees.z), glm::vec3(0.0F, 0.0F, 1.0F));
    pose = glm::rotate(pose, glm::radians(rotationDegrees.y), glm::vec3(0.0F, 1.0F, 0.0F));
    pose = glm::rotate(pose, glm::radians(rotationDegrees.x), glm::vec3(1.0F, 0.0F, 0.0F));
    return pose;
}

SimulationSettings parseSimulationSettings(std::istream& input)
{
    SimulationSettings settings;
    std::vector<glm::vec3> positions;
    std::vector<glm::vec3> rotations;

    SectionState section;
    std::string line;
    int lineNumber = 0;
    while (std::getline(input, line))
    {
        ++lineNumber;
        const std::string_view trimmedLine = trim(line);
        if (trimmedLine.empty())
        {
            continue;
        }

        const char firstChar = trimmedLine.front();
        if (firstChar == ';' || firstChar == '#')
        {
            continue;
        }

        if (firstChar == '[')
        {
            if (trimmedLine.back() != ']')
            {
                throw ConfigurationError("Settings line " + std::to_string(lineNumber) + ": unterminated section header");
            }
            section = SectionState{};
            section.name = std::string(trim(trimmedLine.substr(1, trimmedLine.size() - 2)));
            section.isSimulation = section.name == kSimulationSection;

            if (section.name.starts_with(kSensorSectionPrefix))
            {
                const std::string sensorName = section.name.substr(kSensorSectionPrefix.size());
                if (sensorName.empty())
                {
                    throw ConfigurationError("Settings line " + std::to_string(lineNumber) + ": sensor section without a name");
                }
                const bool duplicate = std::ranges::any_of(
                    settings.sensors, [&sensorName](const auto& sensor) { return sensor.settings.name == sensorName; });
                if (duplicate)
                {
                    throw ConfigurationError("Settings line " + std::to_string(lineNumber) + ": sensor '" + sensorName +
                                             "' declared twice");
                }

                SensorDefinition definition;
                definition.settings.name = sensorName;
                settings.sensors.push_back(std::move(definition));
                positions.emplace_back(0.0F);
                rotations.emplace_back(0.0F);
                section.isSensor = true;
                section.sensorIndex = settings.sensors.size() - 1;
            }
            continue;
        }

        const auto eqPos = trimmedLine.find('=');
        if (eqPos == std::string_view::npos)
        {
            continue;
        }

        const std::string_view key = trim(trimmedLine.substr(0, eqPos));
        const std::string_view value = trim(stripInlineComment(trimmedLine.substr(eqPos + 1)));
        if (value.empty())
        {
            continue;
        }

        if (section.isSimulation)
        {
            applySimulationKey(settings, lineNumber, key, value);
        }
        else if (section.isSensor)
        {
            applySensorKey(settings.sensors[section.sensorIndex],
                           positions[section.sensorIndex],
                           rotations[section.sensorIndex],
                           lineNumber,
                           key,
                           value);
        }
    }

    for (std::size_t index = 0; index < settings.sensors.size(); ++index)
    {
        settings.sensors[index].worldPose = poseFromPositionRotation(positions[index], rotations[index]);
    }
    return settings;
}

SimulationSettings loadSimulationSettings(const std::filesystem::path& path)
{
    std::ifstream file(path);
    if (!file)
    {
        throw ConfigurationError("Unable to open settings file " + path.string());
    }
    return parseSimulationSettings(file);
}

} // namespace lidarsim
