#include <vkgraph/graph/frame_executor.hpp>

namespace vkgraph::graph {

const char* frameStatusName(FrameStatus status) {
    switch (status) {
    case FrameStatus::Presented:
        return "Presented";
    case FrameStatus::Skipped:
        return "Skipped";
    case FrameStatus::Recreated:
        return "Recreated";
    }
    return "Unknown";
}

FrameExecutor::FrameExecutor(const RenderContext& ctx, RenderGraph& graph, FrameSync& frames,
                             Presenter& presenter, ResizeCoordinator& coordinator)
    : ctx_(ctx), graph_(graph), frames_(frames), presenter_(presenter),
      coordinator_(coordinator) {}

Result<FrameStatus> FrameExecutor::recoverFrom(VkExtent2D drawableExtent) {
    auto recovered = coordinator_.recover(drawableExtent);
    if (!recovered.ok()) return recovered.error();
    return recovered.value() == ResizeOutcome::Skipped ? FrameStatus::Skipped
                                                       : FrameStatus::Recreated;
}

Result<FrameStatus> FrameExecutor::renderFrame(VkExtent2D drawableExtent) {
    if (isZeroExtent(drawableExtent)) return FrameStatus::Skipped;

    auto resized = coordinator_.resize(drawableExtent);
    if (!resized.ok()) return resized.error();
    if (resized.value() == ResizeOutcome::Skipped) return FrameStatus::Skipped;

    auto slot = frames_.waitCurrent();
    if (!slot.ok()) return slot.error();
    const FrameState frame = slot.value();

    auto acquired = presenter_.acquireImage(frame.imageAvailable);
    if (!acquired.ok()) {
        // Nothing was submitted; the fence is still signaled.
        auto skipped = frames_.skipCurrent();
        if (!skipped.ok()) return skipped.error();

        if (acquired.failedWith(ErrorCode::SurfaceOutOfDate)) return recoverFrom(drawableExtent);
        return acquired.error();
    }
    std::uint32_t imageIndex = acquired.value();

    auto cmd = frames_.beginRecording();
    if (!cmd.ok()) return cmd.error();

    auto recorded = graph_.executeAtIndex(cmd.value(), imageIndex);
    if (!recorded.ok()) {
        auto abandoned = frames_.abandonRecording(ctx_.graphicsQueue());
        if (!abandoned.ok()) return abandoned.error();

        // The acquired image is never presented; recreating the presenter
        // gives it back.
        auto recovered = coordinator_.recover(drawableExtent);
        if (!recovered.ok()) return recovered.error();
        return recorded.error();
    }

    auto submitted = frames_.submit(ctx_.graphicsQueue());
    if (!submitted.ok()) return submitted.error();

    auto presenting = frames_.beginPresent();
    if (!presenting.ok()) return presenting.error();

    auto presented = presenter_.presentImage(imageIndex, frame.renderFinished);

    // The submission is in flight either way; the slot's fence covers it.
    auto finished = frames_.finishFrame();
    if (!finished.ok()) return finished.error();

    if (!presented.ok()) {
        if (presented.failedWith(ErrorCode::SurfaceOutOfDate)) return recoverFrom(drawableExtent);
        return presented.error();
    }

    presented_++;
    return FrameStatus::Presented;
}

} // namespace vkgraph::graph
