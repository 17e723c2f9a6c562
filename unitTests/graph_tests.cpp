#include <cmath>
#include <limits>
#include <memory>
#include <string>
#include <vector>

#include <gtest/gtest.h>

#include <glm/gtc/matrix_transform.hpp>

#include "NodeGraph.hpp"

namespace
{
class FakeScene : public graph::IScene
{
public:
    explicit FakeScene(std::vector<graph::SceneHit> hits)
        : m_hits(std::move(hits))
    {
    }

    void refresh(int) override
    {
    }

    std::vector<graph::SceneHit> raytrace(const graph::RayQuery& query) const override
    {
        std::vector<graph::SceneHit> result;
        for (const auto& hit : m_hits)
        {
            if (hit.distance >= query.minRange && hit.distance <= query.maxRange)
            {
                result.push_back(hit);
            }
        }
        return result;
    }

private:
    std::vector<graph::SceneHit> m_hits;
};

// Ray pointing along +X: +Z of the pose rotated about Y.
glm::mat4 forwardRay()
{
    return glm::rotate(glm::mat4(1.0F), glm::radians(90.0F), glm::vec3(0.0F, 1.0F, 0.0F));
}

void buildTraceGraph(graph::NodeGraph& graph, std::vector<glm::mat4> poses, glm::vec2 range)
{
    graph.append("rays", graph::NodeKind::RaySource, graph::RaySourceParameters{std::move(poses)})
        .append("range", graph::NodeKind::RangeFilter, graph::RangeParameters{{range}})
        .append("trace", graph::NodeKind::Raytrace, graph::RaytraceParameters{});
}
} // namespace

TEST(NodeGraphTest, AppendedNodeIsQueryable)
{
    graph::NodeGraph graph;
    EXPECT_FALSE(graph.hasNode("rays"));

    graph.append("rays", graph::NodeKind::RaySource, graph::RaySourceParameters{});

    EXPECT_TRUE(graph.hasNode("rays"));
    EXPECT_TRUE(graph.isActive("rays"));
    EXPECT_EQ(graph.kind("rays"), graph::NodeKind::RaySource);
    EXPECT_EQ(graph.size(), 1U);
}

TEST(NodeGraphTest, AppendRejectsDuplicateName)
{
    graph::NodeGraph graph;
    graph.append("noise", graph::NodeKind::DistanceNoise, graph::DistanceNoiseParameters{});

    EXPECT_THROW(graph.append("noise", graph::NodeKind::DistanceNoise, graph::DistanceNoiseParameters{}),
                 graph::DuplicateNodeError);
    EXPECT_EQ(graph.size(), 1U);
}

TEST(NodeGraphTest, AppendRejectsParametersOfAnotherKind)
{
    graph::NodeGraph graph;
    EXPECT_THROW(graph.append("noise", graph::NodeKind::DistanceNoise, graph::TransformParameters{}),
                 graph::GraphStructureError);
    EXPECT_FALSE(graph.hasNode("noise"));
}

TEST(NodeGraphTest, UpdateUnknownNodeThrows)
{
    graph::NodeGraph graph;
    EXPECT_THROW(graph.update("missing", graph::DistanceNoiseParameters{}), graph::UnknownNodeError);
    EXPECT_THROW(graph.setActive("missing", false), graph::UnknownNodeError);
}

TEST(NodeGraphTest, UpdateReplacesParameters)
{
    graph::NodeGraph graph;
    graph.append("noise", graph::NodeKind::DistanceNoise, graph::DistanceNoiseParameters{});

    graph.update("noise", graph::DistanceNoiseParameters{0.5F, 0.02F, 0.001F});

    const auto& parameters = graph.parametersAs<graph::DistanceNoiseParameters>("noise");
    EXPECT_FLOAT_EQ(parameters.mean, 0.5F);
    EXPECT_FLOAT_EQ(parameters.stDevBase, 0.02F);
    EXPECT_FLOAT_EQ(parameters.stDevRisePerMeter, 0.001F);
}

TEST(NodeGraphTest, UpdateRejectsKindChange)
{
    graph::NodeGraph graph;
    graph.append("noise", graph::NodeKind::DistanceNoise, graph::DistanceNoiseParameters{0.5F, 0.0F, 0.0F});

    EXPECT_THROW(graph.update("noise", graph::TransformParameters{}), graph::GraphStructureError);
    EXPECT_FLOAT_EQ(graph.parametersAs<graph::DistanceNoiseParameters>("noise").mean, 0.5F);
    EXPECT_THROW(graph.parametersAs<graph::TransformParameters>("noise"), graph::GraphStructureError);
}

TEST(NodeGraphTest, SetActiveKeepsParameters)
{
    graph::NodeGraph graph;
    graph.append("noise", graph::NodeKind::DistanceNoise, graph::DistanceNoiseParameters{0.25F, 0.1F, 0.0F});

    graph.setActive("noise", false);
    EXPECT_FALSE(graph.isActive("noise"));
    EXPECT_FLOAT_EQ(graph.parametersAs<graph::DistanceNoiseParameters>("noise").mean, 0.25F);

    graph.setActive("noise", true);
    EXPECT_TRUE(graph.isActive("noise"));
    EXPECT_FLOAT_EQ(graph.parametersAs<graph::DistanceNoiseParameters>("noise").stDevBase, 0.1F);
}

TEST(NodeGraphTest, NodeNamesFollowAppendOrder)
{
    graph::NodeGraph graph;
    buildTraceGraph(graph, {forwardRay()}, glm::vec2(0.0F, 10.0F));

    const std::vector<std::string> expected = {"rays", "range", "trace"};
    EXPECT_EQ(graph.nodeNames(), expected);
}

TEST(NodeGraphTest, ConnectRejectsSelfCycleAndSecondParent)
{
    graph::NodeGraph a("a");
    graph::NodeGraph b("b");
    graph::NodeGraph c("c");

    EXPECT_THROW(graph::NodeGraph::connect(a, a), graph::GraphStructureError);

    graph::NodeGraph::connect(a, b);
    graph::NodeGraph::connect(b, c);
    EXPECT_THROW(graph::NodeGraph::connect(c, a), graph::GraphStructureError);
    EXPECT_THROW(graph::NodeGraph::connect(a, c), graph::GraphStructureError);

    EXPECT_EQ(c.parent(), &b);
    ASSERT_EQ(a.children().size(), 1U);
    EXPECT_EQ(a.children().front(), &b);
}

TEST(NodeGraphTest, DisconnectDetachesChild)
{
    graph::NodeGraph a("a");
    graph::NodeGraph b("b");
    graph::NodeGraph::connect(a, b);

    graph::NodeGraph::disconnect(a, b);

    EXPECT_EQ(b.parent(), nullptr);
    EXPECT_TRUE(a.children().empty());
    EXPECT_THROW(graph::NodeGraph::disconnect(a, b), graph::GraphStructureError);
}

TEST(NodeGraphTest, DestroyedChildLeavesParent)
{
    graph::NodeGraph parent("parent");
    {
        graph::NodeGraph child("child");
        graph::NodeGraph::connect(parent, child);
        EXPECT_EQ(parent.children().size(), 1U);
    }
    EXPECT_TRUE(parent.children().empty());
}

TEST(NodeGraphTest, RaytraceProducesFirstHitAlongRay)
{
    graph::NodeGraph graph;
    buildTraceGraph(graph, {forwardRay()}, glm::vec2(0.0F, 50.0F));
    graph.setScene(std::make_shared<FakeScene>(std::vector<graph::SceneHit>{{5.0F, 0.4F}, {9.0F, 0.9F}}));

    graph.execute();
    const graph::PointCloud points = graph.output();

    ASSERT_EQ(points.size(), 1U);
    EXPECT_TRUE(points[0].isHit);
    EXPECT_NEAR(points[0].distance, 5.0F, 1e-5F);
    EXPECT_NEAR(points[0].position.x, 5.0F, 1e-4F);
    EXPECT_NEAR(points[0].position.y, 0.0F, 1e-4F);
    EXPECT_NEAR(points[0].position.z, 0.0F, 1e-4F);
    EXPECT_EQ(graph.runCount(), 1U);
}

TEST(NodeGraphTest, ReturnModesSelectHits)
{
    graph::NodeGraph graph;
    buildTraceGraph(graph, {forwardRay()}, glm::vec2(0.0F, 50.0F));
    graph.setScene(std::make_shared<FakeScene>(
        std::vector<graph::SceneHit>{{5.0F, 0.4F}, {9.0F, 0.9F}, {20.0F, 0.1F}}));

    graph::RaytraceParameters parameters;
    parameters.returnMode = graph::ReturnMode::SingleReturnStrongest;
    graph.update("trace", parameters);
    graph.execute();
    ASSERT_EQ(graph.output().size(), 1U);
    EXPECT_NEAR(graph.output()[0].distance, 9.0F, 1e-5F);

    parameters.returnMode = graph::ReturnMode::DualReturnFirstLast;
    graph.update("trace", parameters);
    graph.execute();
    const graph::PointCloud dual = graph.output();
    ASSERT_EQ(dual.size(), 2U);
    EXPECT_NEAR(dual[0].distance, 5.0F, 1e-5F);
    EXPECT_EQ(dual[0].returnIndex, 0U);
    EXPECT_NEAR(dual[1].distance, 20.0F, 1e-5F);
    EXPECT_EQ(dual[1].returnIndex, 1U);
}

TEST(NodeGraphTest, RangeClampTurnsFarHitsIntoMisses)
{
    graph::NodeGraph graph;
    buildTraceGraph(graph, {forwardRay()}, glm::vec2(0.0F, 50.0F));
    graph.setScene(std::make_shared<FakeScene>(std::vector<graph::SceneHit>{{30.0F, 0.5F}}));

    graph::RaytraceParameters parameters;
    parameters.rangeClamp = 10.0F;
    graph.update("trace", parameters);
    graph.execute();

    const graph::PointCloud points = graph.output();
    ASSERT_EQ(points.size(), 1U);
    EXPECT_FALSE(points[0].isHit);
    EXPECT_NEAR(points[0].distance, 10.0F, 1e-5F);
}

TEST(NodeGraphTest, InactiveNodeIsSkipped)
{
    graph::NodeGraph graph;
    buildTraceGraph(graph, {forwardRay()}, glm::vec2(0.0F, 50.0F));
    graph.append("shift", graph::NodeKind::Transform,
                 graph::TransformParameters{glm::translate(glm::mat4(1.0F), glm::vec3(0.0F, 0.0F, 100.0F))});
    graph.setScene(std::make_shared<FakeScene>(std::vector<graph::SceneHit>{{5.0F, 0.5F}}));

    graph.execute();
    EXPECT_NEAR(graph.output()[0].position.z, 100.0F, 1e-3F);

    graph.setActive("shift", false);
    graph.execute();
    EXPECT_NEAR(graph.output()[0].position.z, 0.0F, 1e-3F);
}

TEST(NodeGraphTest, ChildrenConsumeParentOutput)
{
    graph::NodeGraph lidar("lidar");
    buildTraceGraph(lidar, {forwardRay(), glm::mat4(1.0F)}, glm::vec2(0.0F, 8.0F));
    lidar.setScene(std::make_shared<FakeScene>(std::vector<graph::SceneHit>{{5.0F, 0.5F}}));

    // Only the forward ray hits: the +Z ray is filtered by a narrower second range below.
    lidar.update("range", graph::RangeParameters{{glm::vec2(0.0F, 8.0F), glm::vec2(6.0F, 8.0F)}});

    graph::NodeGraph compact("compact");
    compact.append("compact", graph::NodeKind::Compaction, graph::CompactionParameters{});
    graph::NodeGraph shifted("shifted");
    shifted.append("shift", graph::NodeKind::Transform,
                   graph::TransformParameters{glm::translate(glm::mat4(1.0F), glm::vec3(1.0F, 0.0F, 0.0F))});

    graph::NodeGraph::connect(lidar, compact);
    graph::NodeGraph::connect(lidar, shifted);

    compact.execute();

    EXPECT_EQ(lidar.output().size(), 2U);
    const graph::PointCloud compacted = compact.output();
    ASSERT_EQ(compacted.size(), 1U);
    EXPECT_TRUE(compacted[0].isHit);

    const graph::PointCloud moved = shifted.output();
    ASSERT_EQ(moved.size(), 2U);
    EXPECT_NEAR(moved[0].position.x, 6.0F, 1e-4F);
}

TEST(NodeGraphTest, RaytraceWithoutSceneFailsRunAndDescendants)
{
    graph::NodeGraph lidar("lidar");
    buildTraceGraph(lidar, {forwardRay()}, glm::vec2(0.0F, 8.0F));
    graph::NodeGraph compact("compact");
    compact.append("compact", graph::NodeKind::Compaction, graph::CompactionParameters{});
    graph::NodeGraph::connect(lidar, compact);

    lidar.execute();

    EXPECT_THROW(lidar.output(), graph::GraphStructureError);
    EXPECT_THROW(compact.output(), graph::GraphStructureError);
}

TEST(NodeGraphTest, SeededRunsAreReproducible)
{
    auto runOnce = [](uint32_t seed) {
        graph::NodeGraph graph;
        buildTraceGraph(graph, {forwardRay()}, glm::vec2(0.0F, 50.0F));
        graph.append("noise", graph::NodeKind::DistanceNoise, graph::DistanceNoiseParameters{0.0F, 0.5F, 0.0F});
        graph.setScene(std::make_shared<FakeScene>(std::vector<graph::SceneHit>{{10.0F, 0.5F}}));
        graph.setSeed(seed);
        graph.execute();
        return graph.output().front().distance;
    };

    EXPECT_FLOAT_EQ(runOnce(7U), runOnce(7U));
}

TEST(NodeGraphTest, DistanceNoiseLeavesMissesUntouched)
{
    graph::NodeGraph graph;
    buildTraceGraph(graph, {forwardRay()}, glm::vec2(0.0F, 12.0F));
    graph.append("noise", graph::NodeKind::DistanceNoise, graph::DistanceNoiseParameters{1.0F, 0.5F, 0.0F});
    graph.setScene(std::make_shared<FakeScene>(std::vector<graph::SceneHit>{}));

    graph.execute();
    const graph::PointCloud points = graph.output();
    ASSERT_EQ(points.size(), 1U);
    EXPECT_FALSE(points[0].isHit);
    EXPECT_FLOAT_EQ(points[0].distance, 12.0F);
}

TEST(NodeGraphTest, WeatherKernelRunsOnPoints)
{
    graph::NodeGraph graph;
    buildTraceGraph(graph, {forwardRay()}, glm::vec2(0.0F, 50.0F));
    graph::WeatherEffectParameters weather;
    weather.effect = "fog";
    weather.coefficients["attenuation"] = 0.5F;
    weather.kernel = [](graph::PointCloud& points, const graph::WeatherEffectParameters& parameters, std::mt19937&) {
        for (auto& point : points)
        {
            point.intensity *= parameters.coefficients.at("attenuation");
        }
    };
    graph.append("weather", graph::NodeKind::WeatherEffect, weather);
    graph.setScene(std::make_shared<FakeScene>(std::vector<graph::SceneHit>{{5.0F, 0.8F}}));

    graph.execute();
    EXPECT_NEAR(graph.output().front().intensity, 0.4F, 1e-6F);
}

TEST(NodeGraphTest, WeatherKernelFailureOfAnyTypeFailsRun)
{
    graph::NodeGraph lidar("lidar");
    buildTraceGraph(lidar, {forwardRay()}, glm::vec2(0.0F, 50.0F));
    graph::WeatherEffectParameters weather;
    weather.effect = "rain";
    weather.kernel = [](graph::PointCloud&, const graph::WeatherEffectParameters&, std::mt19937&) { throw 42; };
    lidar.append("weather", graph::NodeKind::WeatherEffect, weather);
    lidar.setScene(std::make_shared<FakeScene>(std::vector<graph::SceneHit>{{5.0F, 0.8F}}));
    graph::NodeGraph compact("compact");
    compact.append("compact", graph::NodeKind::Compaction, graph::CompactionParameters{});
    graph::NodeGraph::connect(lidar, compact);

    lidar.execute();

    EXPECT_THROW(lidar.output(), int);
    EXPECT_THROW(compact.output(), int);
}

TEST(NodeGraphTest, UnboundedMissStaysAtOrigin)
{
    graph::NodeGraph graph;
    buildTraceGraph(graph, {forwardRay()}, glm::vec2(0.0F, std::numeric_limits<float>::infinity()));
    graph.setScene(std::make_shared<FakeScene>(std::vector<graph::SceneHit>{}));

    graph.execute();
    const graph::PointCloud points = graph.output();

    ASSERT_EQ(points.size(), 1U);
    EXPECT_FALSE(points[0].isHit);
    EXPECT_TRUE(std::isinf(points[0].distance));
    EXPECT_TRUE(std::isfinite(points[0].position.x));
    EXPECT_TRUE(std::isfinite(points[0].position.y));
    EXPECT_TRUE(std::isfinite(points[0].position.z));
    EXPECT_FLOAT_EQ(points[0].position.x, points[0].origin.x);
    EXPECT_FLOAT_EQ(points[0].position.y, points[0].origin.y);
    EXPECT_FLOAT_EQ(points[0].position.z, points[0].origin.z);
}

TEST(NodeGraphTest, VelocityDistortionShiftsOriginsByTimeOffset)
{
    graph::NodeGraph graph;
    const glm::mat4 mount = glm::rotate(glm::translate(glm::mat4(1.0F), glm::vec3(10.0F, 0.0F, 0.0F)),
                                        glm::radians(90.0F),
                                        glm::vec3(0.0F, 0.0F, 1.0F));
    graph::RaytraceParameters trace;
    trace.velocityDistortion = true;
    trace.linearVelocity = glm::vec3(4.0F, 0.0F, 0.0F);
    graph.append("rays", graph::NodeKind::RaySource, graph::RaySourceParameters{{forwardRay(), forwardRay()}})
        .append("range", graph::NodeKind::RangeFilter, graph::RangeParameters{{glm::vec2(0.0F, 50.0F)}})
        .append("offsets", graph::NodeKind::TimeOffsetAssigner, graph::TimeOffsetParameters{{0.0F, 0.5F}})
        .append("pose", graph::NodeKind::Transform, graph::TransformParameters{mount})
        .append("trace", graph::NodeKind::Raytrace, trace);
    graph.setScene(std::make_shared<FakeScene>(std::vector<graph::SceneHit>{{5.0F, 0.5F}}));

    graph.execute();
    const graph::PointCloud points = graph.output();

    // Sensor-local +X motion appears as world +Y under the mount rotation.
    ASSERT_EQ(points.size(), 2U);
    EXPECT_NEAR(points[0].origin.x, 10.0F, 1e-4F);
    EXPECT_NEAR(points[0].origin.y, 0.0F, 1e-4F);
    EXPECT_NEAR(points[1].origin.x, 10.0F, 1e-4F);
    EXPECT_NEAR(points[1].origin.y, 2.0F, 1e-4F);
    EXPECT_NEAR(points[1].origin.z, 0.0F, 1e-4F);
    EXPECT_NEAR(points[1].position.y, 7.0F, 1e-4F);
    EXPECT_FLOAT_EQ(points[1].timeOffset, 0.5F);
}

TEST(NodeGraphTest, RayBasedAngularNoiseTurnsRaysAboutLocalY)
{
    auto runWith = [](graph::AngularNoiseParameters noise) {
        graph::NodeGraph graph;
        noise.placement = graph::AngularNoisePlacement::RayBased;
        graph.append("rays", graph::NodeKind::RaySource, graph::RaySourceParameters{{forwardRay(), forwardRay()}})
            .append("range", graph::NodeKind::RangeFilter, graph::RangeParameters{{glm::vec2(0.0F, 50.0F)}})
            .append("noise", graph::NodeKind::AngularNoise, noise)
            .append("trace", graph::NodeKind::Raytrace, graph::RaytraceParameters{});
        graph.setScene(std::make_shared<FakeScene>(std::vector<graph::SceneHit>{{5.0F, 0.5F}}));
        graph.setSeed(11U);
        graph.execute();
        return graph.output();
    };

    const graph::PointCloud biased = runWith(graph::AngularNoiseParameters{0.1F, 0.0F});
    ASSERT_EQ(biased.size(), 2U);
    EXPECT_NEAR(biased[0].position.x, 5.0F * std::cos(0.1F), 1e-4F);
    EXPECT_NEAR(biased[0].position.y, 0.0F, 1e-4F);
    EXPECT_NEAR(biased[0].position.z, -5.0F * std::sin(0.1F), 1e-4F);

    const graph::PointCloud noisy = runWith(graph::AngularNoiseParameters{0.0F, 0.1F});
    ASSERT_EQ(noisy.size(), 2U);
    for (const auto& point : noisy)
    {
        EXPECT_NEAR(point.position.y, 0.0F, 1e-4F);
        EXPECT_NEAR(glm::length(point.position), 5.0F, 1e-4F);
    }
    EXPECT_NE(noisy[0].position.z, noisy[1].position.z);
}

TEST(NodeGraphTest, HitpointAngularNoiseTurnsPointsAboutZ)
{
    auto runWith = [](graph::AngularNoiseParameters noise) {
        graph::NodeGraph graph;
        noise.placement = graph::AngularNoisePlacement::HitpointBased;
        buildTraceGraph(graph, {forwardRay(), forwardRay()}, glm::vec2(0.0F, 50.0F));
        graph.append("noise", graph::NodeKind::AngularNoise, noise);
        graph.setScene(std::make_shared<FakeScene>(std::vector<graph::SceneHit>{{5.0F, 0.5F}}));
        graph.setSeed(11U);
        graph.execute();
        return graph.output();
    };

    const graph::PointCloud biased = runWith(graph::AngularNoiseParameters{0.1F, 0.0F});
    ASSERT_EQ(biased.size(), 2U);
    EXPECT_NEAR(biased[0].position.x, 5.0F * std::cos(0.1F), 1e-4F);
    EXPECT_NEAR(biased[0].position.y, 5.0F * std::sin(0.1F), 1e-4F);
    EXPECT_NEAR(biased[0].position.z, 0.0F, 1e-4F);
    EXPECT_FLOAT_EQ(biased[0].distance, 5.0F);

    const graph::PointCloud noisy = runWith(graph::AngularNoiseParameters{0.0F, 0.1F});
    ASSERT_EQ(noisy.size(), 2U);
    for (const auto& point : noisy)
    {
        EXPECT_NEAR(point.position.z, 0.0F, 1e-4F);
        EXPECT_NEAR(glm::length(point.position), 5.0F, 1e-4F);
    }
    EXPECT_NE(noisy[0].position.y, noisy[1].position.y);
}

TEST(NodeParametersTest, KindFollowsVariantAlternative)
{
    EXPECT_EQ(graph::kindOf(graph::RaytraceParameters{}), graph::NodeKind::Raytrace);
    EXPECT_EQ(graph::kindOf(graph::CompactionParameters{}), graph::NodeKind::Compaction);
    EXPECT_EQ(graph::toString(graph::NodeKind::AngularNoise), "AngularNoise");
}
