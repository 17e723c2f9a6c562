#pragma once

#include "engine/SensorRegistry.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>

namespace lidarsim
{

/// Fixed-tick control loop shared by every active sensor.
class SensorScheduler
{
public:
    explicit SensorScheduler(SensorRegistry& registry, double fixedTickHz = 50.0);

    std::size_t fixedUpdate(const LidarSensor& caller);

    std::size_t tick();

    void beginFrame() noexcept;

    void run(std::chrono::duration<double> duration, bool realtime = false);

    double fixedDeltaTime() const noexcept;
    uint64_t frameIndex() const noexcept;
    uint64_t tickCount() const noexcept;

    static constexpr std::chrono::milliseconds kTargetFrameDuration{33};

private:
    SensorRegistry& m_registry;
    double m_fixedDeltaTime;
    double m_accumulator = 0.0;
    uint64_t m_frameIndex = 0U;
    uint64_t m_tickCount = 0U;
};

} // namespace lidarsim
