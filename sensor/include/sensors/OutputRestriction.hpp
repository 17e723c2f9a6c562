#pragma once

#include "NodeGraph.hpp"
#include "config/LidarConfiguration.hpp"

#include <limits>
#include <memory>
#include <string>

namespace lidarsim
{

struct RestrictionPolicy
{
    bool applyRestriction = false;
    float maxRange = std::numeric_limits<float>::infinity();
    bool enablePeriodicRestriction = false;
    float onDuration = 1.0F;  ///< Seconds at full range per cycle.
    float offDuration = 1.0F; ///< Seconds at the restricted range per cycle.
};

/// Fault injection on the range of a raytrace node.
class OutputRestriction
{
public:
    enum class Mode
    {
        Static,
        Periodic
    };

    OutputRestriction() = default;
    explicit OutputRestriction(RestrictionPolicy policy);
    ~OutputRestriction();

    OutputRestriction(const OutputRestriction&) = delete;
    OutputRestriction& operator=(const OutputRestriction&) = delete;

    RestrictionPolicy& policy() noexcept;
    const RestrictionPolicy& policy() const noexcept;

    void update(const LidarConfiguration& configuration);

    void checkPolicy() const;

    void apply(graph::NodeGraph& graph, const std::string& raytraceNodeId);

    void advance(float deltaSeconds);
    void cancel() noexcept;

    Mode mode() const noexcept;
    float fullRange() const noexcept;
    float staticRange() const noexcept;

private:
    class PeriodicTask;

    RestrictionPolicy m_policy;
    float m_fullRange = std::numeric_limits<float>::infinity();
    std::unique_ptr<PeriodicTask> m_task;
};

void setRangeClamp(graph::NodeGraph& graph, const std::string& raytraceNodeId, float rangeClamp);

} // namespace lidarsim
