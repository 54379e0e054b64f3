#include <vkgraph/graph/resize_coordinator.hpp>

#include <cstdio>

namespace vkgraph::graph {

const char* resizeOutcomeName(ResizeOutcome outcome) {
    switch (outcome) {
    case ResizeOutcome::Skipped:
        return "Skipped";
    case ResizeOutcome::Unchanged:
        return "Unchanged";
    case ResizeOutcome::Rebuilt:
        return "Rebuilt";
    }
    return "Unknown";
}

ResizeCoordinator::ResizeCoordinator(const RenderContext& ctx, RenderGraph& graph,
                                     FrameSync& frames, Presenter& presenter)
    : ctx_(ctx), graph_(graph), frames_(frames), presenter_(presenter) {}

Result<ResizeOutcome> ResizeCoordinator::resize(VkExtent2D extent) {
    return run(extent, false);
}

Result<ResizeOutcome> ResizeCoordinator::recover(VkExtent2D extent) {
    return run(extent, true);
}

Result<ResizeOutcome> ResizeCoordinator::run(VkExtent2D extent, bool force) {
    if (isZeroExtent(extent)) return ResizeOutcome::Skipped;

    // A graph built before the coordinator saw any request counts as built
    // for its own surface extent.
    VkExtent2D current = lastExtent_;
    if (isZeroExtent(current) && graph_.isBuilt()) current = graph_.surface().extent;

    if (!force && graph_.isBuilt() && sameExtent(extent, current)) {
        return ResizeOutcome::Unchanged;
    }

    // Nothing the old build recorded may still be executing when it goes.
    auto waited = frames_.waitAll();
    if (!waited.ok()) return waited.error();

    auto idle = ctx_.waitIdle();
    if (!idle.ok()) return idle.error();

    graph_.release();

    auto recreated = presenter_.recreate(extent);
    if (!recreated.ok()) return recreated.error();

    SurfaceInfo surface = presenter_.surface();
    if (isZeroExtent(surface.extent)) {
        // The surface went away between the request and the recreate.
        // Stay released; the next non-zero request builds again.
        return ResizeOutcome::Skipped;
    }

    auto images = presenter_.images();
    auto rebuilt = graph_.rebuild(ctx_, surface, images);
    if (!rebuilt.ok()) return rebuilt.error();

    lastExtent_ = extent;
    rebuildCount_++;

#ifndef NDEBUG
    std::fprintf(stderr, "[vkgraph::graph] rebuilt for %ux%u (%zu backbuffer images)\n",
                 surface.extent.width, surface.extent.height, images.size());
#endif

    return ResizeOutcome::Rebuilt;
}

} // namespace vkgraph::graph
