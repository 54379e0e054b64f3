#pragma once

#include <vkgraph/graph/render_graph.hpp>

#include <cassert>
#include <string>
#include <utility>
#include <vector>

namespace vkgraph::test {

// "offscreen" renders 4x multisampled color + depth and resolves into
// "color_resolve"; "fullscreen" samples that into the backbuffer.
inline graph::RenderGraph forwardGraph(VkExtent2D offscreenExtent = {800, 600}) {
    using namespace vkgraph::graph;

    ImageDesc color;
    color.name = "color";
    color.extent = offscreenExtent;
    color.format = VK_FORMAT_R8G8B8A8_UNORM;
    color.samples = VK_SAMPLE_COUNT_4_BIT;
    color.clearValue.color = {{0.1f, 0.1f, 0.1f, 1.0f}};

    ImageDesc depth;
    depth.name = "depth_stencil";
    depth.extent = offscreenExtent;
    depth.format = VK_FORMAT_D16_UNORM;
    depth.samples = VK_SAMPLE_COUNT_4_BIT;
    depth.clearValue.depthStencil = {1.0f, 0};

    ImageDesc resolve;
    resolve.name = "color_resolve";
    resolve.extent = offscreenExtent;
    resolve.format = VK_FORMAT_R8G8B8A8_UNORM;
    resolve.resolve = true;

    ImageDesc backbuffer;
    backbuffer.name = "backbuffer#2";

    std::vector<std::string> passes = {"offscreen", "fullscreen"};
    std::vector<ImageDesc> images = {color, depth, resolve, backbuffer};
    std::vector<Edge> edges = {{"offscreen", "color"},
                               {"offscreen", "depth_stencil"},
                               {"offscreen", "color_resolve"},
                               {"color_resolve", "fullscreen"},
                               {"fullscreen", "backbuffer#2"}};

    auto graph = RenderGraph::create(passes, images, edges);
    assert(graph.ok());
    return std::move(graph).value();
}

} // namespace vkgraph::test
