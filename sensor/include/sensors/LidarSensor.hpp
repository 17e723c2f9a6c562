#pragma once

#include "NodeGraph.hpp"
#include "SceneBackend.hpp"
#include "config/LidarConfiguration.hpp"
#include "config/ModelCatalog.hpp"
#include "config/SensorSettings.hpp"
#include "sensors/OutputRestriction.hpp"
#include "sensors/SensorErrors.hpp"
#include "sensors/Signal.hpp"
#include "sensors/WeatherEffectProvider.hpp"

#include <glm/glm.hpp>

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace lidarsim
{

/// One simulated lidar: owns its processing graph and keeps it in sync with the configuration.
class LidarSensor
{
public:
    static constexpr const char* kLidarRaysNodeId = "LIDAR_RAYS";
    static constexpr const char* kLidarRangeNodeId = "LIDAR_RANGE";
    static constexpr const char* kLidarRingsNodeId = "LIDAR_RINGS";
    static constexpr const char* kLidarTimeOffsetsNodeId = "LIDAR_OFFSETS";
    static constexpr const char* kLidarPoseNodeId = "LIDAR_POSE";
    static constexpr const char* kNoiseLidarRayNodeId = "NOISE_LIDAR_RAY";
    static constexpr const char* kLidarRaytraceNodeId = "LIDAR_RAYTRACE";
    static constexpr const char* kNoiseHitpointNodeId = "NOISE_HITPOINT";
    static constexpr const char* kNoiseDistanceNodeId = "NOISE_DISTANCE";
    static constexpr const char* kPointsCompactNodeId = "POINTS_COMPACT";
    static constexpr const char* kToLidarFrameNodeId = "TO_LIDAR_FRAME";

    LidarSensor(SensorSettings settings,
                std::shared_ptr<const IModelCatalog> catalog,
                std::shared_ptr<graph::IScene> scene,
                std::vector<std::shared_ptr<IWeatherEffectProvider>> weatherProviders = {});
    ~LidarSensor();

    LidarSensor(const LidarSensor&) = delete;
    LidarSensor& operator=(const LidarSensor&) = delete;

    const std::string& name() const noexcept;

    void start();
    bool started() const noexcept;

    /// Local tick logic. Returns true when the sensor is due to capture on this tick;
    /// the caller refreshes the scene and then calls issueCapture().
    bool tick(double deltaSeconds, uint64_t frameIndex);
    void notifyNewData();

    /// Re-applies settings and configuration. Switching preset after the first validation
    /// replaces the configuration with the defaults of the new model.
    void validate();

    void apply(const LidarConfiguration& configuration);

    std::optional<ValidationMismatch> validateWithModel() const;

    void capture(const glm::mat4& worldPose, int sceneTickCount);
    void capture();
    void issueCapture();

    const std::shared_ptr<graph::IScene>& scene() const noexcept;
    int sceneTickCount() const noexcept;

    SensorSettings& settings() noexcept;
    const SensorSettings& settings() const noexcept;

    LidarConfiguration& configuration();
    void setConfiguration(LidarConfiguration configuration);

    OutputRestriction& outputRestriction() noexcept;

    void setWorldPose(const glm::mat4& worldPose) noexcept;
    const glm::mat4& worldPose() const noexcept;

    double timer() const noexcept;
    void synchronizeTimer(double timer) noexcept;

    const std::optional<ValidationMismatch>& startupValidation() const noexcept;

    graph::NodeGraph& lidarGraph() noexcept;
    const graph::NodeGraph& lidarGraph() const noexcept;

    void connectToWorldFrame(graph::NodeGraph& consumer, bool compacted = true);
    void connectToLidarFrame(graph::NodeGraph& consumer);

    graph::PointCloud worldFramePoints() const;
    graph::PointCloud lidarFramePoints() const;

    Signal<>& onNewData() noexcept;
    Signal<>& onLidarModelChange() noexcept;

private:
    friend struct LidarSensorTestHelper;

    void buildGraph();
    void appendWeatherNodes();
    void applyWeather(const LidarConfiguration& configuration, const glm::vec2& firstRayRange);
    void updateTransforms();
    void setVelocityToRaytrace();
    void issueRun(const glm::mat4& worldPose);

    SensorSettings m_settings;
    std::shared_ptr<const IModelCatalog> m_catalog;
    std::shared_ptr<graph::IScene> m_scene;
    std::vector<std::shared_ptr<IWeatherEffectProvider>> m_weatherProviders;
    std::vector<std::pair<std::shared_ptr<IWeatherEffectProvider>, Signal<>::ConnectionId>> m_weatherConnections;

    std::optional<LidarConfiguration> m_configuration;

    graph::NodeGraph m_lidarGraph;
    graph::NodeGraph m_compactGraph;
    graph::NodeGraph m_toLidarFrameGraph;
    OutputRestriction m_outputRestriction;

    std::optional<std::string> m_validatedPreset;
    std::optional<ValidationMismatch> m_startupValidation;
    bool m_started = false;

    double m_timer = 0.0;
    double m_lastDeltaSeconds = 0.0;
    glm::mat4 m_worldPose = glm::mat4(1.0F);
    glm::mat4 m_lastTransform = glm::mat4(1.0F);
    glm::mat4 m_currentTransform = glm::mat4(1.0F);

    int m_fixedUpdatesInCurrentFrame = 0;
    std::optional<uint64_t> m_lastUpdateFrame;

    Signal<> m_onNewData;
    Signal<> m_onLidarModelChange;
};

} // namespace lidarsim
