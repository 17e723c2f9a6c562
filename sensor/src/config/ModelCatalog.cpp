#include "config/ModelCatalog.hpp"

#include "sensors/SensorErrors.hpp"

#include <glm/gtc/matrix_transform.hpp>

#include <algorithm>
#include <array>
#include <cctype>
#include <ranges>

namespace lidarsim
{
namespace
{
constexpr std::array<float, 32> kHdl32VerticalAnglesRad = {
    -0.535293F, -0.162839F, -0.511905F, -0.139626F, -0.488692F, -0.116239F, -0.465305F, -0.093026F,
    -0.442092F, -0.069813F, -0.418879F, -0.046600F, -0.395666F, -0.023213F, -0.372279F, 0.0F,
    -0.349066F, 0.023213F, -0.325853F, 0.046600F, -0.302466F, 0.069813F, -0.279253F, 0.093026F,
    -0.256040F, 0.116413F, -0.232652F, 0.139626F, -0.209440F, 0.162839F, -0.186227F, 0.186227F};

constexpr std::array<float, 16> kVlp16VerticalAnglesRad = {
    -0.261799F, 0.0174533F, -0.226893F, 0.0523599F, -0.191986F, 0.0872665F, -0.15708F, 0.122173F,
    -0.122173F, 0.15708F, -0.0872665F, 0.191986F, -0.0523599F, 0.226893F, -0.0174533F, 0.261799F};

constexpr float kVlp16MicrosecondsPerFiring = 2.304F;
constexpr float kHdl32MicrosecondsPerFiring = 1.152F;

template <std::size_t N>
std::vector<LaserConfiguration> laserArray(const std::array<float, N>& verticalAnglesRad,
                                           float microsecondsPerFiring,
                                           float minRange,
                                           float maxRange)
{
    std::vector<LaserConfiguration> lasers;
    lasers.reserve(N);
    for (std::size_t beam = 0; beam < N; ++beam)
    {
        LaserConfiguration laser;
        laser.verticalAngle = glm::degrees(verticalAnglesRad[beam]);
        laser.ringId = static_cast<int32_t>(beam);
        laser.timeOffset = microsecondsPerFiring * static_cast<float>(beam) * 1e-6F;
        laser.minRange = minRange;
        laser.maxRange = maxRange;
        lasers.push_back(laser);
    }
    return lasers;
}
} // namespace

BuiltinModelCatalog::BuiltinModelCatalog()
{
    m_models.emplace(normalize("RangeMeter"), Entry{"RangeMeter", &BuiltinModelCatalog::rangeMeter});
    m_models.emplace(normalize("VelodyneVLP16"), Entry{"VelodyneVLP16", &BuiltinModelCatalog::velodyneVlp16});
    m_models.emplace(normalize("VelodyneHDL32E"), Entry{"VelodyneHDL32E", &BuiltinModelCatalog::velodyneHdl32e});
    m_models.emplace(normalize("SolidStateFlash"), Entry{"SolidStateFlash", &BuiltinModelCatalog::solidStateFlash});
}

LidarConfiguration BuiltinModelCatalog::lookup(const std::string& modelId) const
{
    const auto it = m_models.find(normalize(modelId));
    if (it == m_models.end())
    {
        throw ConfigurationError("Unknown lidar model '" + modelId + "'");
    }
    return it->second.factory();
}

bool BuiltinModelCatalog::contains(const std::string& modelId) const
{
    return m_models.find(normalize(modelId)) != m_models.end();
}

std::vector<std::string> BuiltinModelCatalog::modelIds() const
{
    std::vector<std::string> ids;
    ids.reserve(m_models.size());
    for (const auto& [key, entry] : m_models)
    {
        ids.push_back(entry.displayName);
    }
    return ids;
}

LidarConfiguration BuiltinModelCatalog::rangeMeter()
{
    LidarConfiguration configuration;
    LaserConfiguration laser;
    laser.minRange = 0.0F;
    laser.maxRange = 40.0F;
    configuration.lasers = {laser};
    configuration.minHorizontalAngle = 0.0F;
    configuration.maxHorizontalAngle = 0.0F;
    configuration.horizontalSteps = 1;
    configuration.noiseParams.distanceNoiseStDevBase = 0.02F;
    return configuration;
}

LidarConfiguration BuiltinModelCatalog::velodyneVlp16()
{
    LidarConfiguration configuration;
    configuration.lasers = laserArray(kVlp16VerticalAnglesRad, kVlp16MicrosecondsPerFiring, 0.9F, 100.0F);
    configuration.minHorizontalAngle = -180.0F;
    configuration.maxHorizontalAngle = 180.0F;
    configuration.horizontalSteps = 1800;
    configuration.scanFrequencyHz = 10.0F;
    configuration.noiseParams.angularNoiseStDev = 0.05F;
    configuration.noiseParams.distanceNoiseStDevBase = 0.02F;
    configuration.horizontalBeamDivergence = 0.17F;
    configuration.verticalBeamDivergence = 0.086F;
    configuration.lidarOriginTransform = glm::translate(glm::mat4(1.0F), glm::vec3(0.0F, 0.0F, 0.0377F));
    return configuration;
}

LidarConfiguration BuiltinModelCatalog::velodyneHdl32e()
{
    LidarConfiguration configuration;
    configuration.lasers = laserArray(kHdl32VerticalAnglesRad, kHdl32MicrosecondsPerFiring, 1.0F, 100.0F);
    configuration.minHorizontalAngle = -180.0F;
    configuration.maxHorizontalAngle = 180.0F;
    configuration.horizontalSteps = 2250;
    configuration.scanFrequencyHz = 10.0F;
    configuration.noiseParams.angularNoiseStDev = 0.05F;
    configuration.noiseParams.distanceNoiseStDevBase = 0.02F;
    configuration.horizontalBeamDivergence = 0.16F;
    configuration.verticalBeamDivergence = 0.16F;
    configuration.lidarOriginTransform = glm::translate(glm::mat4(1.0F), glm::vec3(0.0F, 0.0F, 0.0762F));
    return configuration;
}

LidarConfiguration BuiltinModelCatalog::solidStateFlash()
{
    constexpr int32_t kRows = 32;
    constexpr float kVerticalFovDeg = 30.0F;

    LidarConfiguration configuration;
    configuration.lasers.reserve(kRows);
    for (int32_t row = 0; row < kRows; ++row)
    {
        LaserConfiguration laser;
        laser.verticalAngle = -kVerticalFovDeg / 2.0F + kVerticalFovDeg * static_cast<float>(row) / (kRows - 1);
        laser.ringId = row;
        laser.minRange = 0.1F;
        laser.maxRange = 50.0F;
        configuration.lasers.push_back(laser);
    }
    configuration.minHorizontalAngle = -30.0F;
    configuration.maxHorizontalAngle = 30.0F;
    configuration.horizontalSteps = 60;
    configuration.noiseParams.angularNoiseType = graph::AngularNoisePlacement::HitpointBased;
    configuration.noiseParams.angularNoiseStDev = 0.1F;
    configuration.noiseParams.distanceNoiseStDevBase = 0.01F;
    configuration.noiseParams.distanceNoiseStDevRisePerMeter = 0.001F;
    return configuration;
}

std::string BuiltinModelCatalog::normalize(const std::string& modelId)
{
    std::string lowered = modelId;
    std::ranges::transform(lowered.begin(), lowered.end(), lowered.begin(), ::tolower);
    return lowered;
}

} // namespace lidarsim
