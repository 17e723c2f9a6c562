#include "NodeParameters.hpp"

namespace graph
{

NodeKind kindOf(const NodeParameters& parameters) noexcept
{
    return static_cast<NodeKind>(parameters.index());
}

std::string_view toString(NodeKind kind) noexcept
{
    switch (kind)
    {
        case NodeKind::RaySource:
            return "RaySource";
        case NodeKind::RangeFilter:
            return "RangeFilter";
        case NodeKind::RingIdAssigner:
            return "RingIdAssigner";
        case NodeKind::TimeOffsetAssigner:
            return "TimeOffsetAssigner";
        case NodeKind::Transform:
            return "Transform";
        case NodeKind::AngularNoise:
            return "AngularNoise";
        case NodeKind::DistanceNoise:
            return "DistanceNoise";
        case NodeKind::Raytrace:
            return "Raytrace";
        case NodeKind::WeatherEffect:
            return "WeatherEffect";
        case NodeKind::Compaction:
            return "Compaction";
    }
    return "Unknown";
}

} // namespace graph
