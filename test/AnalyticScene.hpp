#pragma once

#include "SceneBackend.hpp"

#include <glm/glm.hpp>

#include <atomic>
#include <vector>

namespace demo
{

struct Box
{
    glm::vec3 min;
    glm::vec3 max;
    float reflectivity = 0.8F;
};

/// Ground plane at z = groundHeight plus a set of axis-aligned boxes.
class AnalyticScene : public graph::IScene
{
public:
    explicit AnalyticScene(float groundHeight = 0.0F, float groundReflectivity = 0.3F);

    void addBox(const Box& box);

    void refresh(int tickCount) override;
    std::vector<graph::SceneHit> raytrace(const graph::RayQuery& query) const override;

    int refreshCount() const noexcept;

private:
    float m_groundHeight;
    float m_groundReflectivity;
    std::vector<Box> m_boxes;
    std::atomic<int> m_refreshCount{0};
};

} // namespace demo
