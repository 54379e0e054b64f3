#pragma once

#include <vkgraph/context.hpp>
#include <vkgraph/frames.hpp>
#include <vkgraph/graph/render_graph.hpp>
#include <vkgraph/graph/resize_coordinator.hpp>
#include <vkgraph/presenter.hpp>
#include <vkgraph/result.hpp>

#include <vulkan/vulkan.h>

#include <cstdint>

namespace vkgraph::graph {

enum class FrameStatus : std::uint8_t {
    Presented, // recorded, submitted and queued for presentation
    Skipped,   // zero extent; nothing was recorded
    Recreated, // surface was out of date; graph rebuilt, frame dropped
};

[[nodiscard]] const char* frameStatusName(FrameStatus status);

// Drives one frame per call: keep the graph in step with the drawable
// extent, wait the slot, acquire, record every pass, submit, present.
// Surface out-of-date is recovered here and reported as Recreated; every
// other error is returned. A recorder error abandons the slot and rebuilds
// before it is returned, so the next call starts clean.
//
// Holds references only; every collaborator must outlive the executor.
//
// Thread safety: thread-confined (render loop thread).
class FrameExecutor {
public:
    FrameExecutor(const RenderContext& ctx, RenderGraph& graph, FrameSync& frames,
                  Presenter& presenter, ResizeCoordinator& coordinator);

    [[nodiscard]] Result<FrameStatus> renderFrame(VkExtent2D drawableExtent);

    // Frames that reached the presenter.
    [[nodiscard]] std::uint64_t presentedCount() const { return presented_; }

private:
    [[nodiscard]] Result<FrameStatus> recoverFrom(VkExtent2D drawableExtent);

    const RenderContext& ctx_;
    RenderGraph& graph_;
    FrameSync& frames_;
    Presenter& presenter_;
    ResizeCoordinator& coordinator_;

    std::uint64_t presented_ = 0;
};

} // namespace vkgraph::graph
