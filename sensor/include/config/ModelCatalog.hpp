#pragma once

#include "config/LidarConfiguration.hpp"

#include <functional>
#include <map>
#include <string>
#include <vector>

namespace lidarsim
{

class IModelCatalog
{
public:
    virtual ~IModelCatalog() = default;

    /// Throws ConfigurationError for an unknown model id.
    virtual LidarConfiguration lookup(const std::string& modelId) const = 0;
    virtual bool contains(const std::string& modelId) const = 0;
};

/// Catalog of the models shipped with the simulator. Model ids are case-insensitive.
class BuiltinModelCatalog : public IModelCatalog
{
public:
    BuiltinModelCatalog();

    LidarConfiguration lookup(const std::string& modelId) const override;
    bool contains(const std::string& modelId) const override;

    std::vector<std::string> modelIds() const;

    static LidarConfiguration rangeMeter();
    static LidarConfiguration velodyneVlp16();
    static LidarConfiguration velodyneHdl32e();
    static LidarConfiguration solidStateFlash();

private:
    struct Entry
    {
        std::string displayName;
        std::function<LidarConfiguration()> factory;
    };

    static std::string normalize(const std::string& modelId);

    std::map<std::string, Entry> m_models;
};

} // namespace lidarsim
