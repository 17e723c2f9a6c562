#pragma once

#include <glm/glm.hpp>

#include <cstdint>
#include <vector>

namespace graph
{

enum class ReturnMode
{
    SingleReturnFirst = 0,
    SingleReturnLast,
    SingleReturnStrongest,
    DualReturnFirstLast
};

struct RayQuery
{
    glm::vec3 origin = glm::vec3(0.0F);
    glm::vec3 direction = glm::vec3(0.0F, 0.0F, 1.0F);
    float minRange = 0.0F;
    float maxRange = 0.0F;
    float horizontalBeamDivergence = 0.0F;
    float verticalBeamDivergence = 0.0F;
};

struct SceneHit
{
    float distance = 0.0F;
    float intensity = 0.0F;
};

/// Geometry backend queried by raytrace nodes.
/// raytrace() is called from graph worker threads and must not mutate shared state.
class IScene
{
public:
    virtual ~IScene() = default;

    /// Called once per fixed tick, before the rays of that tick; tickCount counts ticks inside the frame.
    virtual void refresh(int tickCount) = 0;

    virtual std::vector<SceneHit> raytrace(const RayQuery& query) const = 0;
};

} // namespace graph
