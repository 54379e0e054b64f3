#pragma once

// Render graph umbrella header.
// Separate from <vkgraph/vkgraph.hpp> -- include this only when using the
// render graph.

#include <vkgraph/graph/compiled_graph.hpp>
#include <vkgraph/graph/declaration.hpp>
#include <vkgraph/graph/frame_executor.hpp>
#include <vkgraph/graph/pass_recorder.hpp>
#include <vkgraph/graph/plan.hpp>
#include <vkgraph/graph/render_graph.hpp>
#include <vkgraph/graph/resize_coordinator.hpp>
#include <vkgraph/result.hpp>
