#pragma once

#include "PointCloud.hpp"
#include "SceneBackend.hpp"

#include <glm/glm.hpp>

#include <cstdint>
#include <functional>
#include <limits>
#include <map>
#include <random>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace graph
{

enum class NodeKind
{
    RaySource = 0,
    RangeFilter,
    RingIdAssigner,
    TimeOffsetAssigner,
    Transform,
    AngularNoise,
    DistanceNoise,
    Raytrace,
    WeatherEffect,
    Compaction
};

enum class AngularNoisePlacement
{
    RayBased = 0,
    HitpointBased
};

struct RaySourceParameters
{
    std::vector<glm::mat4> rayPoses;
};

/// A single entry applies to every ray, otherwise entries are applied cyclically.
struct RangeParameters
{
    std::vector<glm::vec2> ranges;
};

struct RingIdParameters
{
    std::vector<int32_t> ringIds;
};

struct TimeOffsetParameters
{
    std::vector<float> timeOffsets;
};

struct TransformParameters
{
    glm::mat4 transform = glm::mat4(1.0F);
};

struct AngularNoiseParameters
{
    float mean = 0.0F;
    float stDev = 0.0F;
    AngularNoisePlacement placement = AngularNoisePlacement::RayBased;
};

struct DistanceNoiseParameters
{
    float mean = 0.0F;
    float stDevBase = 0.0F;
    float stDevRisePerMeter = 0.0F;
};

struct RaytraceParameters
{
    float horizontalBeamDivergence = 0.0F;
    float verticalBeamDivergence = 0.0F;
    ReturnMode returnMode = ReturnMode::SingleReturnFirst;
    bool velocityDistortion = false;
    glm::vec3 linearVelocity = glm::vec3(0.0F);
    glm::vec3 angularVelocity = glm::vec3(0.0F);
    float rangeClamp = std::numeric_limits<float>::infinity();
};

struct WeatherEffectParameters;

using WeatherKernel = std::function<void(PointCloud&, const WeatherEffectParameters&, std::mt19937&)>;

struct WeatherEffectParameters
{
    std::string effect;
    float minRange = 0.0F;
    float maxRange = 0.0F;
    int32_t ringCount = 0;
    float beamDivergence = 0.0F;
    std::map<std::string, float> coefficients;
    WeatherKernel kernel;
};

enum class CompactField
{
    IsHit = 0
};

struct CompactionParameters
{
    CompactField field = CompactField::IsHit;
};

/// Alternative order follows NodeKind.
using NodeParameters = std::variant<RaySourceParameters,
                                    RangeParameters,
                                    RingIdParameters,
                                    TimeOffsetParameters,
                                    TransformParameters,
                                    AngularNoiseParameters,
                                    DistanceNoiseParameters,
                                    RaytraceParameters,
                                    WeatherEffectParameters,
                                    CompactionParameters>;

NodeKind kindOf(const NodeParameters& parameters) noexcept;
std::string_view toString(NodeKind kind) noexcept;

} // namespace graph
