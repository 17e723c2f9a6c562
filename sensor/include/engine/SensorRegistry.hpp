#pragma once

#include "sensors/LidarSensor.hpp"

#include <cstddef>
#include <vector>

namespace lidarsim
{

/// Ordered collection of the active sensors. The first sensor leads the shared tick.
/// Sensors are owned by the caller and must be deactivated before they are destroyed.
class SensorRegistry
{
public:
    void activate(LidarSensor& sensor);
    void deactivate(LidarSensor& sensor);

    bool contains(const LidarSensor& sensor) const noexcept;
    LidarSensor* leader() const noexcept;
    const std::vector<LidarSensor*>& sensors() const noexcept;
    std::size_t size() const noexcept;
    bool empty() const noexcept;

private:
    std::vector<LidarSensor*> m_sensors;
};

} // namespace lidarsim
