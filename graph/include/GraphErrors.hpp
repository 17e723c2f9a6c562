#pragma once

#include <stdexcept>
#include <string>

namespace graph
{

/// Misuse of the graph structure. Raised at the point of mutation, never deferred to execution.
class GraphStructureError : public std::runtime_error
{
public:
    explicit GraphStructureError(const std::string& message)
        : std::runtime_error(message)
    {
    }
};

class DuplicateNodeError : public GraphStructureError
{
public:
    explicit DuplicateNodeError(const std::string& nodeName)
        : GraphStructureError("Node '" + nodeName + "' already exists in the graph")
    {
    }
};

class UnknownNodeError : public GraphStructureError
{
public:
    explicit UnknownNodeError(const std::string& nodeName)
        : GraphStructureError("Node '" + nodeName + "' does not exist in the graph")
    {
    }
};

} // namespace graph
