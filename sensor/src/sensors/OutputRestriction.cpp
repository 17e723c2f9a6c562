#include "sensors/OutputRestriction.hpp"

#include "sensors/SensorErrors.hpp"

namespace lidarsim
{

void setRangeClamp(graph::NodeGraph& graph, const std::string& raytraceNodeId, float rangeClamp)
{
    graph::RaytraceParameters parameters = graph.parametersAs<graph::RaytraceParameters>(raytraceNodeId);
    parameters.rangeClamp = rangeClamp;
    graph.update(raytraceNodeId, parameters);
}

class OutputRestriction::PeriodicTask
{
public:
    PeriodicTask(graph::NodeGraph& graph,
                 std::string raytraceNodeId,
                 float fullRange,
                 float restrictedRange,
                 float onDuration,
                 float offDuration)
        : m_graph(graph)
        , m_raytraceNodeId(std::move(raytraceNodeId))
        , m_fullRange(fullRange)
        , m_restrictedRange(restrictedRange)
        , m_onDuration(onDuration)
        , m_offDuration(offDuration)
    {
        setRangeClamp(m_graph, m_raytraceNodeId, m_fullRange);
    }

    void advance(float deltaSeconds)
    {
        m_elapsed += deltaSeconds;
        while (m_elapsed >= phaseDuration())
        {
            m_elapsed -= phaseDuration();
            m_restricted = !m_restricted;
            setRangeClamp(m_graph, m_raytraceNodeId, m_restricted ? m_restrictedRange : m_fullRange);
        }
    }

private:
    float phaseDuration() const noexcept
    {
        return m_restricted ? m_offDuration : m_onDuration;
    }

    graph::NodeGraph& m_graph;
    std::string m_raytraceNodeId;
    float m_fullRange;
    float m_restrictedRange;
    float m_onDuration;
    float m_offDuration;
    float m_elapsed = 0.0F;
    bool m_restricted = false;
};

OutputRestriction::OutputRestriction(RestrictionPolicy policy)
    : m_policy(policy)
{
}

OutputRestriction::~OutputRestriction() = default;

RestrictionPolicy& OutputRestriction::policy() noexcept
{
    return m_policy;
}

const RestrictionPolicy& OutputRestriction::policy() const noexcept
{
    return m_policy;
}

void OutputRestriction::update(const LidarConfiguration& configuration)
{
    m_fullRange = configuration.fullRange();
}

void OutputRestriction::checkPolicy() const
{
    if (m_policy.applyRestriction && m_policy.enablePeriodicRestriction &&
        (m_policy.onDuration <= 0.0F || m_policy.offDuration <= 0.0F))
    {
        throw ConfigurationError("Periodic output restriction needs positive on/off durations");
    }
}

void OutputRestriction::apply(graph::NodeGraph& graph, const std::string& raytraceNodeId)
{
    checkPolicy();
    if (m_policy.applyRestriction && m_policy.enablePeriodicRestriction)
    {
        cancel();
        m_task = std::make_unique<PeriodicTask>(
            graph, raytraceNodeId, m_fullRange, m_policy.maxRange, m_policy.onDuration, m_policy.offDuration);
        return;
    }

    cancel();
    setRangeClamp(graph, raytraceNodeId, staticRange());
}

void OutputRestriction::advance(float deltaSeconds)
{
    if (m_task)
    {
        m_task->advance(deltaSeconds);
    }
}

void OutputRestriction::cancel() noexcept
{
    m_task.reset();
}

OutputRestriction::Mode OutputRestriction::mode() const noexcept
{
    return m_task ? Mode::Periodic : Mode::Static;
}

float OutputRestriction::fullRange() const noexcept
{
    return m_fullRange;
}

float OutputRestriction::staticRange() const noexcept
{
    return m_policy.applyRestriction ? m_policy.maxRange : m_fullRange;
}

} // namespace lidarsim
