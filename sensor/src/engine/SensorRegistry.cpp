#include "engine/SensorRegistry.hpp"

#include <algorithm>

namespace lidarsim
{

void SensorRegistry::activate(LidarSensor& sensor)
{
    if (contains(sensor))
    {
        return;
    }

    sensor.start();
    m_sensors.push_back(&sensor);

    // Joining sensors take the phase of the leader.
    sensor.synchronizeTimer(m_sensors.front()->timer());
}

void SensorRegistry::deactivate(LidarSensor& sensor)
{
    std::erase(m_sensors, &sensor);
}

bool SensorRegistry::contains(const LidarSensor& sensor) const noexcept
{
    return std::find(m_sensors.begin(), m_sensors.end(), &sensor) != m_sensors.end();
}

LidarSensor* SensorRegistry::leader() const noexcept
{
    return m_sensors.empty() ? nullptr : m_sensors.front();
}

const std::vector<LidarSensor*>& SensorRegistry::sensors() const noexcept
{
    return m_sensors;
}

std::size_t SensorRegistry::size() const noexcept
{
    return m_sensors.size();
}

bool SensorRegistry::empty() const noexcept
{
    return m_sensors.empty();
}

} // namespace lidarsim
