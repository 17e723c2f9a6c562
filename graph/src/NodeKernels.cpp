#include "NodeKernels.hpp"

#include "GraphErrors.hpp"

#include <glm/gtc/matrix_transform.hpp>

#include <algorithm>
#include <cmath>

namespace graph
{
namespace
{
constexpr float kMinRotationMagnitude = 1e-9F;

float sampleNormal(std::mt19937& rng, float mean, float stDev)
{
    if (stDev <= 0.0F)
    {
        return mean;
    }
    std::normal_distribution<float> distribution(mean, stDev);
    return distribution(rng);
}

template <typename T, typename Setter>
void assignCyclic(RayBatch& rays, const std::vector<T>& values, Setter setter)
{
    if (values.empty())
    {
        return;
    }
    for (std::size_t i = 0; i < rays.size(); ++i)
    {
        setter(rays[i], values[i % values.size()]);
    }
}

glm::vec3 rayOrigin(const glm::mat4& pose)
{
    return glm::vec3(pose[3]);
}

glm::vec3 rayDirection(const glm::mat4& pose)
{
    return glm::normalize(glm::vec3(pose[2]));
}

/// Sensor-local motion accumulated over the time offset of a ray.
glm::mat4 motionOverTime(const RaytraceParameters& parameters, float timeOffset)
{
    glm::mat4 motion = glm::translate(glm::mat4(1.0F), parameters.linearVelocity * timeOffset);
    const float angularSpeed = glm::length(parameters.angularVelocity);
    if (angularSpeed > kMinRotationMagnitude)
    {
        motion = glm::rotate(motion, angularSpeed * timeOffset, parameters.angularVelocity / angularSpeed);
    }
    return motion;
}

LidarPoint makePoint(const Ray& ray, const glm::vec3& origin, const glm::vec3& direction, float distance)
{
    LidarPoint point;
    point.origin = origin;
    // Misses at unbounded range stay at the origin; the distance keeps the infinity.
    point.position = std::isfinite(distance) ? origin + direction * distance : origin;
    point.distance = distance;
    point.ringId = ray.ringId;
    point.timeOffset = ray.timeOffset;
    return point;
}

void appendReturns(PointCloud& points,
                   const Ray& ray,
                   const glm::vec3& origin,
                   const glm::vec3& direction,
                   float maxRange,
                   ReturnMode returnMode,
                   const std::vector<SceneHit>& hits)
{
    if (hits.empty())
    {
        points.push_back(makePoint(ray, origin, direction, maxRange));
        return;
    }

    auto pushHit = [&](const SceneHit& hit, uint8_t returnIndex) {
        LidarPoint point = makePoint(ray, origin, direction, hit.distance);
        point.intensity = hit.intensity;
        point.isHit = true;
        point.returnIndex = returnIndex;
        points.push_back(point);
    };

    switch (returnMode)
    {
        case ReturnMode::SingleReturnFirst:
            pushHit(hits.front(), 0U);
            break;
        case ReturnMode::SingleReturnLast:
            pushHit(hits.back(), 0U);
            break;
        case ReturnMode::SingleReturnStrongest:
            pushHit(*std::max_element(hits.begin(),
                                      hits.end(),
                                      [](const SceneHit& a, const SceneHit& b) { return a.intensity < b.intensity; }),
                    0U);
            break;
        case ReturnMode::DualReturnFirstLast:
            pushHit(hits.front(), 0U);
            if (hits.size() > 1U)
            {
                pushHit(hits.back(), 1U);
            }
            break;
    }
}

class NodeRunner
{
public:
    NodeRunner(const std::string& name, FrameData& frame, const IScene* scene, std::mt19937& rng)
        : m_name(name)
        , m_frame(frame)
        , m_scene(scene)
        , m_rng(rng)
    {
    }

    void operator()(const RaySourceParameters& parameters)
    {
        m_frame = FrameData{};
        m_frame.rays.reserve(parameters.rayPoses.size());
        for (const auto& pose : parameters.rayPoses)
        {
            Ray ray;
            ray.pose = pose;
            m_frame.rays.push_back(ray);
        }
    }

    void operator()(const RangeParameters& parameters)
    {
        assignCyclic(m_frame.rays, parameters.ranges, [](Ray& ray, const glm::vec2& range) { ray.range = range; });
    }

    void operator()(const RingIdParameters& parameters)
    {
        assignCyclic(m_frame.rays, parameters.ringIds, [](Ray& ray, int32_t ringId) { ray.ringId = ringId; });
    }

    void operator()(const TimeOffsetParameters& parameters)
    {
        assignCyclic(
            m_frame.rays, parameters.timeOffsets, [](Ray& ray, float timeOffset) { ray.timeOffset = timeOffset; });
    }

    void operator()(const TransformParameters& parameters)
    {
        if (!m_frame.raytraced)
        {
            for (auto& ray : m_frame.rays)
            {
                ray.pose = parameters.transform * ray.pose;
            }
            m_frame.raysTransform = parameters.transform * m_frame.raysTransform;
            return;
        }

        for (auto& point : m_frame.points)
        {
            point.position = glm::vec3(parameters.transform * glm::vec4(point.position, 1.0F));
            point.origin = glm::vec3(parameters.transform * glm::vec4(point.origin, 1.0F));
        }
    }

    void operator()(const AngularNoiseParameters& parameters)
    {
        if (parameters.placement == AngularNoisePlacement::RayBased)
        {
            if (m_frame.raytraced)
            {
                return;
            }
            for (auto& ray : m_frame.rays)
            {
                const float angle = sampleNormal(m_rng, parameters.mean, parameters.stDev);
                ray.pose = glm::rotate(ray.pose, angle, glm::vec3(0.0F, 1.0F, 0.0F));
            }
            return;
        }

        if (!m_frame.raytraced)
        {
            return;
        }
        for (auto& point : m_frame.points)
        {
            const float angle = sampleNormal(m_rng, parameters.mean, parameters.stDev);
            const glm::mat4 rotation = glm::rotate(glm::mat4(1.0F), angle, glm::vec3(0.0F, 0.0F, 1.0F));
            point.position = point.origin + glm::vec3(rotation * glm::vec4(point.position - point.origin, 0.0F));
        }
    }

    void operator()(const DistanceNoiseParameters& parameters)
    {
        if (!m_frame.raytraced)
        {
            return;
        }
        for (auto& point : m_frame.points)
        {
            if (!point.isHit || point.distance <= 0.0F)
            {
                continue;
            }
            const glm::vec3 direction = (point.position - point.origin) / point.distance;
            const float stDev = parameters.stDevBase + parameters.stDevRisePerMeter * point.distance;
            const float distance = std::max(0.0F, point.distance + sampleNormal(m_rng, parameters.mean, stDev));
            point.position = point.origin + direction * distance;
            point.distance = distance;
        }
    }

    void operator()(const RaytraceParameters& parameters)
    {
        if (m_scene == nullptr)
        {
            throw GraphStructureError("Raytrace node '" + m_name + "' has no scene bound");
        }

        PointCloud points;
        points.reserve(m_frame.rays.size());
        const glm::mat4 toSensor = glm::inverse(m_frame.raysTransform);

        for (const auto& ray : m_frame.rays)
        {
            glm::mat4 pose = ray.pose;
            if (parameters.velocityDistortion)
            {
                pose = m_frame.raysTransform * motionOverTime(parameters, ray.timeOffset) * toSensor * ray.pose;
            }

            RayQuery query;
            query.origin = rayOrigin(pose);
            query.direction = rayDirection(pose);
            query.minRange = ray.range.x;
            query.maxRange = std::min(ray.range.y, parameters.rangeClamp);
            query.horizontalBeamDivergence = parameters.horizontalBeamDivergence;
            query.verticalBeamDivergence = parameters.verticalBeamDivergence;

            std::vector<SceneHit> hits;
            if (query.maxRange >= query.minRange)
            {
                hits = m_scene->raytrace(query);
            }
            appendReturns(points, ray, query.origin, query.direction, query.maxRange, parameters.returnMode, hits);
        }

        m_frame.points = std::move(points);
        m_frame.raytraced = true;
    }

    void operator()(const WeatherEffectParameters& parameters)
    {
        if (!m_frame.raytraced || !parameters.kernel)
        {
            return;
        }
        parameters.kernel(m_frame.points, parameters, m_rng);
    }

    void operator()(const CompactionParameters&)
    {
        if (!m_frame.raytraced)
        {
            return;
        }
        auto& points = m_frame.points;
        points.erase(std::remove_if(points.begin(), points.end(), [](const LidarPoint& point) { return !point.isHit; }),
                     points.end());
    }

private:
    const std::string& m_name;
    FrameData& m_frame;
    const IScene* m_scene;
    std::mt19937& m_rng;
};
} // namespace

void runNode(const std::string& name,
             const NodeParameters& parameters,
             FrameData& frame,
             const IScene* scene,
             std::mt19937& rng)
{
    std::visit(NodeRunner(name, frame, scene, rng), parameters);
}

} // namespace graph
