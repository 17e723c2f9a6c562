#pragma once

#include "NodeParameters.hpp"
#include "sensors/Signal.hpp"

#include <cstdint>
#include <string>

namespace lidarsim
{

struct WeatherContext
{
    float minRange = 0.0F;
    float maxRange = 0.0F;
    int32_t ringCount = 0;
    float horizontalBeamDivergence = 0.0F;
};

/// Optional weather subsystem (snow, rain, fog) contributing one node to each lidar graph.
class IWeatherEffectProvider
{
public:
    virtual ~IWeatherEffectProvider() = default;

    virtual const std::string& nodeName() const noexcept = 0;
    virtual bool isEnabled() const = 0;

    virtual graph::WeatherEffectParameters initialParameters() const = 0;
    virtual graph::WeatherEffectParameters parameters(const WeatherContext& context) const = 0;

    /// Raised when the provider's own settings change; sensors re-validate on it.
    Signal<>& configChanged() noexcept
    {
        return m_configChanged;
    }

protected:
    Signal<> m_configChanged;
};

} // namespace lidarsim
