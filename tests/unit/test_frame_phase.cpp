#include <vkgraph/frames.hpp>
#include <vkgraph/graph/frame_executor.hpp>
#include <vkgraph/graph/resize_coordinator.hpp>

#include <cassert>
#include <cstdio>
#include <cstring>

using vkgraph::FramePhase;

int main() {
    std::printf("frame phase test\n");

    // Forward cycle
    {
        assert(vkgraph::canTransition(FramePhase::Idle, FramePhase::WaitingOnFence));
        assert(vkgraph::canTransition(FramePhase::WaitingOnFence, FramePhase::Recording));
        assert(vkgraph::canTransition(FramePhase::Recording, FramePhase::Submitted));
        assert(vkgraph::canTransition(FramePhase::Submitted, FramePhase::Presenting));
        assert(vkgraph::canTransition(FramePhase::Presenting, FramePhase::Idle));
        std::printf("  forward cycle: ok\n");
    }

    // Skipping a frame after the wait
    {
        assert(vkgraph::canTransition(FramePhase::WaitingOnFence, FramePhase::Idle));
        std::printf("  skip after wait: ok\n");
    }

    // Abandoning a recording
    {
        assert(vkgraph::canTransition(FramePhase::Recording, FramePhase::Idle));
        std::printf("  abandon recording: ok\n");
    }

    // Everything else is rejected
    {
        assert(!vkgraph::canTransition(FramePhase::Idle, FramePhase::Recording));
        assert(!vkgraph::canTransition(FramePhase::Idle, FramePhase::Idle));
        assert(!vkgraph::canTransition(FramePhase::Recording, FramePhase::Presenting));
        assert(!vkgraph::canTransition(FramePhase::Submitted, FramePhase::Idle));
        assert(!vkgraph::canTransition(FramePhase::Submitted, FramePhase::Recording));
        assert(!vkgraph::canTransition(FramePhase::Presenting, FramePhase::WaitingOnFence));

        int allowed = 0;
        for (int from = 0; from <= static_cast<int>(FramePhase::Presenting); ++from) {
            for (int to = 0; to <= static_cast<int>(FramePhase::Presenting); ++to) {
                if (vkgraph::canTransition(static_cast<FramePhase>(from),
                                           static_cast<FramePhase>(to)))
                    allowed++;
            }
        }
        assert(allowed == 7);
        std::printf("  invalid transitions: ok\n");
    }

    // Names
    {
        assert(std::strcmp(vkgraph::framePhaseName(FramePhase::Idle), "Idle") == 0);
        assert(std::strcmp(vkgraph::framePhaseName(FramePhase::WaitingOnFence),
                           "WaitingOnFence") == 0);
        assert(std::strcmp(vkgraph::framePhaseName(FramePhase::Presenting), "Presenting") == 0);

        using vkgraph::graph::FrameStatus;
        using vkgraph::graph::ResizeOutcome;
        assert(std::strcmp(vkgraph::graph::frameStatusName(FrameStatus::Recreated),
                           "Recreated") == 0);
        assert(std::strcmp(vkgraph::graph::resizeOutcomeName(ResizeOutcome::Unchanged),
                           "Unchanged") == 0);
        std::printf("  names: ok\n");
    }

    // Extent helpers
    {
        assert(vkgraph::isZeroExtent({0, 600}));
        assert(vkgraph::isZeroExtent({800, 0}));
        assert(!vkgraph::isZeroExtent({1, 1}));
        assert(vkgraph::sameExtent({800, 600}, {800, 600}));
        assert(!vkgraph::sameExtent({800, 600}, {600, 800}));
        std::printf("  extent helpers: ok\n");
    }

    std::printf("frame phase test passed\n");
    return 0;
}
