#pragma once

#include <stdexcept>
#include <string>
#include <vector>

namespace lidarsim
{

class ConfigurationError : public std::runtime_error
{
public:
    explicit ConfigurationError(const std::string& message)
        : std::runtime_error(message)
    {
    }
};

class MissingCollaboratorError : public std::runtime_error
{
public:
    explicit MissingCollaboratorError(const std::string& message)
        : std::runtime_error(message)
    {
    }
};

/// Live configuration differs from the defaults of its model. Reported, never thrown.
struct ValidationMismatch
{
    std::string model;
    std::vector<std::string> fields;
};

} // namespace lidarsim
