#include "engine/SensorScheduler.hpp"

#include <algorithm>
#include <iostream>
#include <stdexcept>
#include <thread>
#include <vector>

namespace lidarsim
{
namespace
{
constexpr double kAccumulatorEpsilon = 1e-9;
}

SensorScheduler::SensorScheduler(SensorRegistry& registry, double fixedTickHz)
    : m_registry(registry)
    , m_fixedDeltaTime(0.0)
{
    if (fixedTickHz <= 0.0)
    {
        throw std::invalid_argument("SensorScheduler: fixed tick rate must be positive");
    }
    m_fixedDeltaTime = 1.0 / fixedTickHz;
}

std::size_t SensorScheduler::fixedUpdate(const LidarSensor& caller)
{
    if (m_registry.leader() != &caller)
    {
        return 0U;
    }
    return tick();
}

std::size_t SensorScheduler::tick()
{
    const std::vector<LidarSensor*> sensors = m_registry.sensors();

    std::vector<LidarSensor*> triggered;
    triggered.reserve(sensors.size());
    for (LidarSensor* sensor : sensors)
    {
        if (sensor->tick(m_fixedDeltaTime, m_frameIndex))
        {
            triggered.push_back(sensor);
        }
    }

    // One scene refresh per tick, shared by every sensor that fires on it.
    std::vector<const graph::IScene*> refreshed;
    for (LidarSensor* sensor : triggered)
    {
        const std::shared_ptr<graph::IScene>& scene = sensor->scene();
        if (scene && std::find(refreshed.begin(), refreshed.end(), scene.get()) == refreshed.end())
        {
            scene->refresh(sensor->sceneTickCount());
            refreshed.push_back(scene.get());
        }
    }

    for (LidarSensor* sensor : triggered)
    {
        sensor->issueCapture();
    }

    for (LidarSensor* sensor : triggered)
    {
        sensor->notifyNewData();
    }

    ++m_tickCount;
    return triggered.size();
}

void SensorScheduler::beginFrame() noexcept
{
    ++m_frameIndex;
}

void SensorScheduler::run(std::chrono::duration<double> duration, bool realtime)
{
    const double frameSeconds = std::chrono::duration<double>(kTargetFrameDuration).count();
    double simulatedSeconds = 0.0;
    std::size_t captures = 0U;

    while (simulatedSeconds < duration.count())
    {
        const auto frameStart = std::chrono::steady_clock::now();

        beginFrame();
        m_accumulator += frameSeconds;
        while (m_accumulator + kAccumulatorEpsilon >= m_fixedDeltaTime)
        {
            m_accumulator -= m_fixedDeltaTime;
            if (m_registry.empty())
            {
                continue;
            }
            captures += fixedUpdate(*m_registry.leader());
        }
        simulatedSeconds += frameSeconds;

        if (realtime)
        {
            const auto frameDuration = std::chrono::steady_clock::now() - frameStart;
            if (frameDuration < kTargetFrameDuration)
            {
                std::this_thread::sleep_for(kTargetFrameDuration - frameDuration);
            }
        }
    }

    std::cout << "SensorScheduler: simulated " << simulatedSeconds << " s in " << m_frameIndex << " frames, "
              << m_tickCount << " ticks, " << captures << " captures" << '\n';
}

double SensorScheduler::fixedDeltaTime() const noexcept
{
    return m_fixedDeltaTime;
}

uint64_t SensorScheduler::frameIndex() const noexcept
{
    return m_frameIndex;
}

uint64_t SensorScheduler::tickCount() const noexcept
{
    return m_tickCount;
}

} // namespace lidarsim
