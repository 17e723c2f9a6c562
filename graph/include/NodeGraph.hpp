#pragma once

#include "GraphErrors.hpp"
#include "GraphExecutor.hpp"
#include "NodeParameters.hpp"
#include "PointCloud.hpp"
#include "SceneBackend.hpp"

#include <cstddef>
#include <cstdint>
#include <future>
#include <memory>
#include <random>
#include <string>
#include <unordered_map>
#include <variant>
#include <vector>

namespace graph
{

/// Ordered, named and mutable sequence of processing nodes.
class NodeGraph
{
public:
    explicit NodeGraph(std::string label = "graph");
    ~NodeGraph();

    NodeGraph(const NodeGraph&) = delete;
    NodeGraph& operator=(const NodeGraph&) = delete;

    NodeGraph& append(const std::string& name, NodeKind kind, NodeParameters parameters);

    NodeGraph& update(const std::string& name, NodeParameters parameters);

    NodeGraph& setActive(const std::string& name, bool active);

    bool hasNode(const std::string& name) const noexcept;
    bool isActive(const std::string& name) const;
    NodeKind kind(const std::string& name) const;
    const NodeParameters& parameters(const std::string& name) const;

    template <typename T>
    const T& parametersAs(const std::string& name) const
    {
        const T* typed = std::get_if<T>(&parameters(name));
        if (typed == nullptr)
        {
            throw GraphStructureError("Node '" + name + "' holds parameters of kind " +
                                      std::string(toString(kind(name))));
        }
        return *typed;
    }

    std::vector<std::string> nodeNames() const;
    std::size_t size() const noexcept;
    const std::string& label() const noexcept;

    /// Wires child to consume the terminal output of parent. A parent may feed many children,
    /// a child has exactly one parent, and cycles are rejected with GraphStructureError.
    static void connect(NodeGraph& parent, NodeGraph& child);
    static void disconnect(NodeGraph& parent, NodeGraph& child);

    NodeGraph* parent() const noexcept;
    const std::vector<NodeGraph*>& children() const noexcept;

    void setScene(std::shared_ptr<const IScene> scene);
    void setSeed(uint32_t seed) noexcept;

    /// Returns without waiting; results are pulled with output() or result().
    void execute();

    FrameData result() const;
    PointCloud output() const;
    bool outputReady() const;

    uint64_t runCount() const noexcept;

private:
    struct Node
    {
        std::string name;
        NodeKind kind;
        NodeParameters parameters;
        bool active = true;
    };

    struct Stage
    {
        std::string label;
        std::vector<Node> nodes;
        std::promise<FrameData> promise;
        std::vector<std::unique_ptr<Stage>> children;
    };

    Node& findNode(const std::string& name);
    const Node& findNode(const std::string& name) const;
    NodeGraph& root() noexcept;
    bool isAncestorOf(const NodeGraph& other) const noexcept;

    std::unique_ptr<Stage> snapshot();
    static void runStage(Stage& stage, FrameData frame, const IScene* scene, std::mt19937& rng);
    static void failStage(Stage& stage, const std::exception_ptr& error);

    std::string m_label;
    std::vector<Node> m_nodes;
    std::unordered_map<std::string, std::size_t> m_nodeIndex;

    NodeGraph* m_parent = nullptr;
    std::vector<NodeGraph*> m_children;

    std::shared_ptr<const IScene> m_scene;
    uint32_t m_seed;
    uint64_t m_runCount = 0U;
    std::shared_future<FrameData> m_result;
    std::unique_ptr<GraphExecutor> m_executor;
};

} // namespace graph
