#pragma once

#include <vkgraph/context.hpp>
#include <vkgraph/frames.hpp>
#include <vkgraph/graph/render_graph.hpp>
#include <vkgraph/presenter.hpp>
#include <vkgraph/result.hpp>

#include <vulkan/vulkan.h>

#include <cstdint>

namespace vkgraph::graph {

enum class ResizeOutcome : std::uint8_t {
    Skipped,   // zero extent (minimized window); nothing was touched
    Unchanged, // same extent as the current build
    Rebuilt,   // presenter recreated, graph rebuilt and rebound
};

[[nodiscard]] const char* resizeOutcomeName(ResizeOutcome outcome);

// Tears a graph down and rebuilds it for a new surface extent, in the only
// safe order: wait every in-flight frame, wait device idle, release the old
// build, recreate the presenter, rebuild the same declaration against the
// presenter's surface and bind its images.
//
// Holds references only; every collaborator must outlive the coordinator.
//
// Thread safety: thread-confined (render loop thread).
class ResizeCoordinator {
public:
    ResizeCoordinator(const RenderContext& ctx, RenderGraph& graph, FrameSync& frames,
                      Presenter& presenter);

    // Idempotent: a second call with the same extent is Unchanged.
    [[nodiscard]] Result<ResizeOutcome> resize(VkExtent2D extent);

    // Same as resize() but rebuilds even when the extent did not change.
    // Used after the presenter reported the surface out of date.
    [[nodiscard]] Result<ResizeOutcome> recover(VkExtent2D extent);

    [[nodiscard]] std::uint32_t rebuildCount() const { return rebuildCount_; }

private:
    [[nodiscard]] Result<ResizeOutcome> run(VkExtent2D extent, bool force);

    const RenderContext& ctx_;
    RenderGraph& graph_;
    FrameSync& frames_;
    Presenter& presenter_;

    VkExtent2D lastExtent_{0, 0};
    std::uint32_t rebuildCount_ = 0;
};

} // namespace vkgraph::graph
