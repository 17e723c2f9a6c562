#pragma once

#include "NodeParameters.hpp"
#include "PointCloud.hpp"
#include "SceneBackend.hpp"

#include <random>
#include <string>

namespace graph
{

/// Applies one node to the frame flowing through a graph run.
void runNode(const std::string& name,
             const NodeParameters& parameters,
             FrameData& frame,
             const IScene* scene,
             std::mt19937& rng);

} // namespace graph
