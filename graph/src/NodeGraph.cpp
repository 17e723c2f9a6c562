#include "NodeGraph.hpp"

#include "NodeKernels.hpp"

#include <algorithm>
#include <chrono>
#include <exception>

namespace graph
{

NodeGraph::NodeGraph(std::string label)
    : m_label(std::move(label))
    , m_seed(std::random_device{}())
{
}

NodeGraph::~NodeGraph()
{
    if (m_parent != nullptr)
    {
        auto& siblings = m_parent->m_children;
        siblings.erase(std::remove(siblings.begin(), siblings.end(), this), siblings.end());
    }
    for (NodeGraph* child : m_children)
    {
        child->m_parent = nullptr;
    }
}

NodeGraph& NodeGraph::append(const std::string& name, NodeKind kind, NodeParameters parameters)
{
    if (hasNode(name))
    {
        throw DuplicateNodeError(name);
    }
    if (kindOf(parameters) != kind)
    {
        throw GraphStructureError("Node '" + name + "' declared as " + std::string(toString(kind)) +
                                  " but given parameters of kind " + std::string(toString(kindOf(parameters))));
    }

    m_nodeIndex.emplace(name, m_nodes.size());
    m_nodes.push_back(Node{name, kind, std::move(parameters), true});
    return *this;
}

NodeGraph& NodeGraph::update(const std::string& name, NodeParameters parameters)
{
    Node& node = findNode(name);
    if (kindOf(parameters) != node.kind)
    {
        throw GraphStructureError("Node '" + name + "' is of kind " + std::string(toString(node.kind)) +
                                  ", cannot update it with parameters of kind " +
                                  std::string(toString(kindOf(parameters))));
    }
    node.parameters = std::move(parameters);
    return *this;
}

NodeGraph& NodeGraph::setActive(const std::string& name, bool active)
{
    findNode(name).active = active;
    return *this;
}

bool NodeGraph::hasNode(const std::string& name) const noexcept
{
    return m_nodeIndex.find(name) != m_nodeIndex.end();
}

bool NodeGraph::isActive(const std::string& name) const
{
    return findNode(name).active;
}

NodeKind NodeGraph::kind(const std::string& name) const
{
    return findNode(name).kind;
}

const NodeParameters& NodeGraph::parameters(const std::string& name) const
{
    return findNode(name).parameters;
}

std::vector<std::string> NodeGraph::nodeNames() const
{
    std::vector<std::string> names;
    names.reserve(m_nodes.size());
    for (const auto& node : m_nodes)
    {
        names.push_back(node.name);
    }
    return names;
}

std::size_t NodeGraph::size() const noexcept
{
    return m_nodes.size();
}

const std::string& NodeGraph::label() const noexcept
{
    return m_label;
}

void NodeGraph::connect(NodeGraph& parent, NodeGraph& child)
{
    if (&parent == &child)
    {
        throw GraphStructureError("Graph '" + parent.m_label + "' cannot be connected to itself");
    }
    if (child.m_parent != nullptr)
    {
        throw GraphStructureError("Graph '" + child.m_label + "' is already connected to '" +
                                  child.m_parent->m_label + "'");
    }
    if (child.isAncestorOf(parent))
    {
        throw GraphStructureError("Connecting '" + parent.m_label + "' to '" + child.m_label +
                                  "' would introduce a cycle");
    }

    child.m_parent = &parent;
    parent.m_children.push_back(&child);
}

void NodeGraph::disconnect(NodeGraph& parent, NodeGraph& child)
{
    if (child.m_parent != &parent)
    {
        throw GraphStructureError("Graph '" + child.m_label + "' is not connected to '" + parent.m_label + "'");
    }

    auto& siblings = parent.m_children;
    siblings.erase(std::remove(siblings.begin(), siblings.end(), &child), siblings.end());
    child.m_parent = nullptr;
}

NodeGraph* NodeGraph::parent() const noexcept
{
    return m_parent;
}

const std::vector<NodeGraph*>& NodeGraph::children() const noexcept
{
    return m_children;
}

void NodeGraph::setScene(std::shared_ptr<const IScene> scene)
{
    m_scene = std::move(scene);
}

void NodeGraph::setSeed(uint32_t seed) noexcept
{
    m_seed = seed;
}

void NodeGraph::execute()
{
    NodeGraph& rootGraph = root();
    if (!rootGraph.m_executor)
    {
        rootGraph.m_executor = std::make_unique<GraphExecutor>();
    }

    const uint64_t runIndex = rootGraph.m_runCount++;
    std::seed_seq seedSequence{rootGraph.m_seed,
                               static_cast<uint32_t>(runIndex & 0xFFFFFFFFU),
                               static_cast<uint32_t>(runIndex >> 32U)};
    std::mt19937 rng(seedSequence);

    std::shared_ptr<Stage> stage = rootGraph.snapshot();
    std::shared_ptr<const IScene> scene = rootGraph.m_scene;

    rootGraph.m_executor->enqueue(
        [stage, scene, rng]() mutable { runStage(*stage, FrameData{}, scene.get(), rng); });
}

FrameData NodeGraph::result() const
{
    if (!m_result.valid())
    {
        return {};
    }
    return m_result.get();
}

PointCloud NodeGraph::output() const
{
    return result().points;
}

bool NodeGraph::outputReady() const
{
    return m_result.valid() && m_result.wait_for(std::chrono::seconds(0)) == std::future_status::ready;
}

uint64_t NodeGraph::runCount() const noexcept
{
    return m_runCount;
}

NodeGraph::Node& NodeGraph::findNode(const std::string& name)
{
    const auto it = m_nodeIndex.find(name);
    if (it == m_nodeIndex.end())
    {
        throw UnknownNodeError(name);
    }
    return m_nodes[it->second];
}

const NodeGraph::Node& NodeGraph::findNode(const std::string& name) const
{
    const auto it = m_nodeIndex.find(name);
    if (it == m_nodeIndex.end())
    {
        throw UnknownNodeError(name);
    }
    return m_nodes[it->second];
}

NodeGraph& NodeGraph::root() noexcept
{
    NodeGraph* current = this;
    while (current->m_parent != nullptr)
    {
        current = current->m_parent;
    }
    return *current;
}

bool NodeGraph::isAncestorOf(const NodeGraph& other) const noexcept
{
    for (const NodeGraph* current = other.m_parent; current != nullptr; current = current->m_parent)
    {
        if (current == this)
        {
            return true;
        }
    }
    return false;
}

std::unique_ptr<NodeGraph::Stage> NodeGraph::snapshot()
{
    auto stage = std::make_unique<Stage>();
    stage->label = m_label;
    for (const auto& node : m_nodes)
    {
        if (node.active)
        {
            stage->nodes.push_back(node);
        }
    }

    m_result = stage->promise.get_future().share();

    for (NodeGraph* child : m_children)
    {
        stage->children.push_back(child->snapshot());
    }
    return stage;
}

void NodeGraph::runStage(Stage& stage, FrameData frame, const IScene* scene, std::mt19937& rng)
{
    try
    {
        for (const auto& node : stage.nodes)
        {
            runNode(node.name, node.parameters, frame, scene, rng);
        }
    }
    catch (...)
    {
        failStage(stage, std::current_exception());
        return;
    }

    stage.promise.set_value(frame);
    for (auto& child : stage.children)
    {
        runStage(*child, frame, scene, rng);
    }
}

void NodeGraph::failStage(Stage& stage, const std::exception_ptr& error)
{
    stage.promise.set_exception(error);
    for (auto& child : stage.children)
    {
        failStage(*child, error);
    }
}

} // namespace graph
