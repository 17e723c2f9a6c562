#include "sensors/LidarSensor.hpp"

#include "motion/VelocityEstimator.hpp"

#include <glm/gtc/matrix_transform.hpp>

#include <algorithm>
#include <cmath>
#include <iostream>
#include <limits>
#include <stdexcept>

namespace lidarsim
{
namespace
{
// Absorbs floating-point jitter of the fixed tick when comparing against the capture interval.
constexpr double kTimerEpsilon = 0.00001;

std::string joinFields(const std::vector<std::string>& fields)
{
    std::string joined;
    for (const auto& field : fields)
    {
        if (!joined.empty())
        {
            joined += ", ";
        }
        joined += field;
    }
    return joined;
}
} // namespace

LidarSensor::LidarSensor(SensorSettings settings,
                         std::shared_ptr<const IModelCatalog> catalog,
                         std::shared_ptr<graph::IScene> scene,
                         std::vector<std::shared_ptr<IWeatherEffectProvider>> weatherProviders)
    : m_settings(std::move(settings))
    , m_catalog(std::move(catalog))
    , m_scene(std::move(scene))
    , m_weatherProviders(std::move(weatherProviders))
    , m_lidarGraph(m_settings.name + "/lidar")
    , m_compactGraph(m_settings.name + "/compact")
    , m_toLidarFrameGraph(m_settings.name + "/to_lidar_frame")
{
    if (!m_catalog)
    {
        throw MissingCollaboratorError("LidarSensor[" + m_settings.name + "]: no model catalog provided");
    }
    buildGraph();
}

LidarSensor::~LidarSensor()
{
    for (auto& [provider, connection] : m_weatherConnections)
    {
        provider->configChanged().disconnect(connection);
    }
    m_outputRestriction.cancel();
}

const std::string& LidarSensor::name() const noexcept
{
    return m_settings.name;
}

void LidarSensor::start()
{
    if (m_started)
    {
        return;
    }

    if (!m_scene)
    {
        throw MissingCollaboratorError("LidarSensor[" + name() + "]: scene backend is not present");
    }

    configuration();
    m_lidarGraph.setScene(m_scene);
    m_lastTransform = m_worldPose;
    m_currentTransform = m_worldPose;

    appendWeatherNodes();
    validate();

    if (m_settings.validateConfigurationOnStartup)
    {
        m_startupValidation = validateWithModel();
        if (m_startupValidation)
        {
            std::cerr << "LidarSensor[" << name() << "]: the configuration of the selected model preset ("
                      << m_settings.modelPreset << ") is modified (" << joinFields(m_startupValidation->fields)
                      << "). Ignore this warning if you have consciously changed them." << '\n';
        }
    }

    m_started = true;
    std::cout << "LidarSensor[" << name() << "]: started with model " << m_settings.modelPreset << " ("
              << m_configuration->rayCount() << " rays)" << '\n';
}

bool LidarSensor::started() const noexcept
{
    return m_started;
}

bool LidarSensor::tick(double deltaSeconds, uint64_t frameIndex)
{
    if (m_lastUpdateFrame != frameIndex)
    {
        m_fixedUpdatesInCurrentFrame = 0;
        m_lastUpdateFrame = frameIndex;
    }
    ++m_fixedUpdatesInCurrentFrame;

    m_outputRestriction.advance(static_cast<float>(deltaSeconds));

    if (m_settings.automaticCaptureHz <= 0)
    {
        return false;
    }

    m_timer += deltaSeconds;
    m_lastDeltaSeconds = deltaSeconds;
    updateTransforms();

    const double interval = 1.0 / static_cast<double>(m_settings.automaticCaptureHz);
    if (m_timer + kTimerEpsilon < interval)
    {
        return false;
    }

    // Keep the phase inside the interval; whole intervals of backlog are dropped, not replayed.
    m_timer = std::max(0.0, std::fmod(m_timer - interval, interval));
    return true;
}

void LidarSensor::notifyNewData()
{
    m_onNewData.emit();
}

void LidarSensor::validate()
{
    const bool presetChanged = m_validatedPreset != m_settings.modelPreset;
    const bool firstValidation = !m_validatedPreset.has_value();
    if (!firstValidation && presetChanged)
    {
        LidarConfiguration defaults = m_catalog->lookup(m_settings.modelPreset);
        apply(defaults);
        m_configuration = std::move(defaults);
    }
    else
    {
        apply(configuration());
    }

    m_validatedPreset = m_settings.modelPreset;
    m_onLidarModelChange.emit();
}

void LidarSensor::apply(const LidarConfiguration& configuration)
{
    const std::vector<glm::vec2> rayRanges = configuration.rayRanges();
    if (rayRanges.empty())
    {
        throw ConfigurationError("LidarSensor[" + name() + "]: configuration has no ray ranges");
    }
    m_outputRestriction.checkPolicy();

    const NoiseParameters& noise = configuration.noiseParams;
    m_lidarGraph.update(kLidarRaysNodeId, graph::RaySourceParameters{configuration.rayPoses()})
        .update(kLidarRangeNodeId, graph::RangeParameters{rayRanges})
        .update(kLidarRingsNodeId, graph::RingIdParameters{configuration.rayRingIds()})
        .update(kLidarTimeOffsetsNodeId, graph::TimeOffsetParameters{configuration.rayTimeOffsets()})
        .update(kNoiseLidarRayNodeId,
                graph::AngularNoiseParameters{glm::radians(noise.angularNoiseMean),
                                              glm::radians(noise.angularNoiseStDev),
                                              graph::AngularNoisePlacement::RayBased})
        .update(kNoiseHitpointNodeId,
                graph::AngularNoiseParameters{glm::radians(noise.angularNoiseMean),
                                              glm::radians(noise.angularNoiseStDev),
                                              graph::AngularNoisePlacement::HitpointBased})
        .update(kNoiseDistanceNodeId,
                graph::DistanceNoiseParameters{
                    noise.distanceNoiseMean, noise.distanceNoiseStDevBase, noise.distanceNoiseStDevRisePerMeter});

    graph::RaytraceParameters raytrace = m_lidarGraph.parametersAs<graph::RaytraceParameters>(kLidarRaytraceNodeId);
    if (m_settings.simulateBeamDivergence)
    {
        raytrace.horizontalBeamDivergence = glm::radians(configuration.horizontalBeamDivergence);
        raytrace.verticalBeamDivergence = glm::radians(configuration.verticalBeamDivergence);
    }
    else
    {
        raytrace.horizontalBeamDivergence = 0.0F;
        raytrace.verticalBeamDivergence = 0.0F;
    }
    raytrace.returnMode = configuration.returnMode;
    raytrace.velocityDistortion = m_settings.applyVelocityDistortion;
    m_lidarGraph.update(kLidarRaytraceNodeId, raytrace);

    const bool angularNoise = m_settings.applyAngularGaussianNoise;
    m_lidarGraph.setActive(kNoiseDistanceNodeId, m_settings.applyDistanceGaussianNoise)
        .setActive(kNoiseLidarRayNodeId,
                   angularNoise && noise.angularNoiseType == graph::AngularNoisePlacement::RayBased)
        .setActive(kNoiseHitpointNodeId,
                   angularNoise && noise.angularNoiseType == graph::AngularNoisePlacement::HitpointBased);

    applyWeather(configuration, rayRanges.front());

    m_outputRestriction.update(configuration);
    m_outputRestriction.apply(m_lidarGraph, kLidarRaytraceNodeId);
}

std::optional<ValidationMismatch> LidarSensor::validateWithModel() const
{
    const LidarConfiguration defaults = m_catalog->lookup(m_settings.modelPreset);
    if (!m_configuration)
    {
        return std::nullopt;
    }

    std::vector<std::string> fields = m_configuration->differencesFrom(defaults);
    if (fields.empty())
    {
        return std::nullopt;
    }
    return ValidationMismatch{m_settings.modelPreset, std::move(fields)};
}

void LidarSensor::capture(const glm::mat4& worldPose, int sceneTickCount)
{
    if (!m_started)
    {
        throw std::logic_error("LidarSensor[" + name() + "]: capture requested before start");
    }

    m_scene->refresh(sceneTickCount);
    issueRun(worldPose);
}

void LidarSensor::capture()
{
    capture(m_worldPose, m_fixedUpdatesInCurrentFrame);
}

void LidarSensor::issueCapture()
{
    if (!m_started)
    {
        throw std::logic_error("LidarSensor[" + name() + "]: capture requested before start");
    }
    issueRun(m_worldPose);
}

const std::shared_ptr<graph::IScene>& LidarSensor::scene() const noexcept
{
    return m_scene;
}

int LidarSensor::sceneTickCount() const noexcept
{
    return m_fixedUpdatesInCurrentFrame;
}

void LidarSensor::issueRun(const glm::mat4& worldPose)
{
    const glm::mat4 lidarPose = worldPose * configuration().lidarOriginTransform;
    m_lidarGraph.update(kLidarPoseNodeId, graph::TransformParameters{lidarPose});
    m_toLidarFrameGraph.update(kToLidarFrameNodeId, graph::TransformParameters{glm::inverse(lidarPose)});

    if (m_settings.applyVelocityDistortion)
    {
        setVelocityToRaytrace();
    }

    m_lidarGraph.execute();
}

SensorSettings& LidarSensor::settings() noexcept
{
    return m_settings;
}

const SensorSettings& LidarSensor::settings() const noexcept
{
    return m_settings;
}

LidarConfiguration& LidarSensor::configuration()
{
    if (!m_configuration)
    {
        m_configuration = m_catalog->lookup(m_settings.modelPreset);
    }
    return *m_configuration;
}

void LidarSensor::setConfiguration(LidarConfiguration configuration)
{
    m_configuration = std::move(configuration);
}

OutputRestriction& LidarSensor::outputRestriction() noexcept
{
    return m_outputRestriction;
}

void LidarSensor::setWorldPose(const glm::mat4& worldPose) noexcept
{
    m_worldPose = worldPose;
}

const glm::mat4& LidarSensor::worldPose() const noexcept
{
    return m_worldPose;
}

double LidarSensor::timer() const noexcept
{
    return m_timer;
}

void LidarSensor::synchronizeTimer(double timer) noexcept
{
    m_timer = timer;
}

const std::optional<ValidationMismatch>& LidarSensor::startupValidation() const noexcept
{
    return m_startupValidation;
}

graph::NodeGraph& LidarSensor::lidarGraph() noexcept
{
    return m_lidarGraph;
}

const graph::NodeGraph& LidarSensor::lidarGraph() const noexcept
{
    return m_lidarGraph;
}

void LidarSensor::connectToWorldFrame(graph::NodeGraph& consumer, bool compacted)
{
    graph::NodeGraph::connect(compacted ? m_compactGraph : m_lidarGraph, consumer);
}

void LidarSensor::connectToLidarFrame(graph::NodeGraph& consumer)
{
    graph::NodeGraph::connect(m_toLidarFrameGraph, consumer);
}

graph::PointCloud LidarSensor::worldFramePoints() const
{
    return m_compactGraph.output();
}

graph::PointCloud LidarSensor::lidarFramePoints() const
{
    return m_toLidarFrameGraph.output();
}

Signal<>& LidarSensor::onNewData() noexcept
{
    return m_onNewData;
}

Signal<>& LidarSensor::onLidarModelChange() noexcept
{
    return m_onLidarModelChange;
}

void LidarSensor::buildGraph()
{
    using graph::NodeKind;

    m_lidarGraph
        .append(kLidarRaysNodeId, NodeKind::RaySource, graph::RaySourceParameters{{glm::mat4(1.0F)}})
        .append(kLidarRangeNodeId,
                NodeKind::RangeFilter,
                graph::RangeParameters{{glm::vec2(0.0F, std::numeric_limits<float>::infinity())}})
        .append(kLidarRingsNodeId, NodeKind::RingIdAssigner, graph::RingIdParameters{{0}})
        .append(kLidarTimeOffsetsNodeId, NodeKind::TimeOffsetAssigner, graph::TimeOffsetParameters{{0.0F}})
        .append(kLidarPoseNodeId, NodeKind::Transform, graph::TransformParameters{})
        .append(kNoiseLidarRayNodeId,
                NodeKind::AngularNoise,
                graph::AngularNoiseParameters{0.0F, 0.0F, graph::AngularNoisePlacement::RayBased})
        .append(kLidarRaytraceNodeId, NodeKind::Raytrace, graph::RaytraceParameters{})
        .append(kNoiseHitpointNodeId,
                NodeKind::AngularNoise,
                graph::AngularNoiseParameters{0.0F, 0.0F, graph::AngularNoisePlacement::HitpointBased})
        .append(kNoiseDistanceNodeId, NodeKind::DistanceNoise, graph::DistanceNoiseParameters{});

    m_compactGraph.append(kPointsCompactNodeId, NodeKind::Compaction, graph::CompactionParameters{});
    m_toLidarFrameGraph.append(kToLidarFrameNodeId, NodeKind::Transform, graph::TransformParameters{});

    graph::NodeGraph::connect(m_lidarGraph, m_compactGraph);
    graph::NodeGraph::connect(m_compactGraph, m_toLidarFrameGraph);
}

void LidarSensor::appendWeatherNodes()
{
    for (const auto& provider : m_weatherProviders)
    {
        if (!provider || m_lidarGraph.hasNode(provider->nodeName()))
        {
            continue;
        }

        // Appended deactivated; validate() activates and fills it when the provider is enabled.
        m_lidarGraph.append(provider->nodeName(), graph::NodeKind::WeatherEffect, provider->initialParameters());
        m_lidarGraph.setActive(provider->nodeName(), false);

        const auto connection = provider->configChanged().connect([this] { validate(); });
        m_weatherConnections.emplace_back(provider, connection);
    }
}

void LidarSensor::applyWeather(const LidarConfiguration& configuration, const glm::vec2& firstRayRange)
{
    WeatherContext context;
    context.minRange = firstRayRange.x;
    context.maxRange = firstRayRange.y;
    context.ringCount = configuration.ringCount();
    context.horizontalBeamDivergence = glm::radians(configuration.horizontalBeamDivergence);

    for (const auto& provider : m_weatherProviders)
    {
        if (!provider || !m_lidarGraph.hasNode(provider->nodeName()))
        {
            continue;
        }

        const bool enabled = provider->isEnabled();
        if (enabled)
        {
            m_lidarGraph.update(provider->nodeName(), provider->parameters(context));
        }
        m_lidarGraph.setActive(provider->nodeName(), enabled);
    }
}

void LidarSensor::updateTransforms()
{
    m_lastTransform = m_currentTransform;
    m_currentTransform = m_worldPose;
}

void LidarSensor::setVelocityToRaytrace()
{
    const motion::SensorVelocity velocity = motion::estimateVelocity(
        m_lastTransform, m_currentTransform, static_cast<float>(m_lastDeltaSeconds));

    graph::RaytraceParameters raytrace = m_lidarGraph.parametersAs<graph::RaytraceParameters>(kLidarRaytraceNodeId);
    raytrace.linearVelocity = velocity.linear;
    raytrace.angularVelocity = velocity.angular;
    m_lidarGraph.update(kLidarRaytraceNodeId, raytrace);
}

} // namespace lidarsim
