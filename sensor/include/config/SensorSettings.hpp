#pragma once

#include <string>

namespace lidarsim
{

struct SensorSettings
{
    std::string name = "lidar";
    int automaticCaptureHz = 10; ///< 0 disables automatic capture.
    std::string modelPreset = "RangeMeter";
    bool applyDistanceGaussianNoise = true;
    bool applyAngularGaussianNoise = true;
    bool applyVelocityDistortion = false;
    bool simulateBeamDivergence = false; ///< When false both beam divergences are forced to zero.
    bool validateConfigurationOnStartup = true;
};

} // namespace lidarsim
