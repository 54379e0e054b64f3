#include <vkgraph/frames.hpp>

#include "support/headless_device.hpp"

#include <cassert>
#include <cstdio>

// Stands in for the presenter: signal imageAvailable, consume renderFinished.
static void signalSemaphore(VkQueue queue, VkSemaphore semaphore) {
    VkSubmitInfo si{};
    si.sType = VK_STRUCTURE_TYPE_SUBMIT_INFO;
    si.signalSemaphoreCount = 1;
    si.pSignalSemaphores = &semaphore;
    VkResult vr = vkQueueSubmit(queue, 1, &si, VK_NULL_HANDLE);
    assert(vr == VK_SUCCESS);
    (void)vr;
}

static void waitSemaphore(VkQueue queue, VkSemaphore semaphore) {
    VkPipelineStageFlags stage = VK_PIPELINE_STAGE_ALL_COMMANDS_BIT;
    VkSubmitInfo si{};
    si.sType = VK_STRUCTURE_TYPE_SUBMIT_INFO;
    si.waitSemaphoreCount = 1;
    si.pWaitSemaphores = &semaphore;
    si.pWaitDstStageMask = &stage;
    VkResult vr = vkQueueSubmit(queue, 1, &si, VK_NULL_HANDLE);
    assert(vr == VK_SUCCESS);
    (void)vr;
}

int main() {
    vkgraph::test::HeadlessDevice dev("test_framesync");
    using vkgraph::ErrorCode;
    using vkgraph::FramePhase;

    std::printf("framesync test\n");

    assert(vkgraph::FrameSync::create(dev.ctx(), 0).failedWith(ErrorCode::InvalidDescriptor));

    auto created = vkgraph::FrameSync::create(dev.ctx(), 2);
    assert(created.ok());
    auto& frames = created.value();
    assert(frames.count() == 2);
    assert(frames.current() == 0);
    assert(frames.phase(0) == FramePhase::Idle);
    assert(frames.phase(1) == FramePhase::Idle);
    std::printf("  framesync created: %u frames in flight\n", frames.count());

    // Distinct handles per slot
    {
        const auto& s0 = frames.state(0);
        const auto& s1 = frames.state(1);
        assert(s0.cmd != VK_NULL_HANDLE && s1.cmd != VK_NULL_HANDLE);
        assert(s0.cmd != s1.cmd);
        assert(s0.imageAvailable != s1.imageAvailable);
        assert(s0.renderFinished != s1.renderFinished);
        assert(s0.inFlight != s1.inFlight);
        assert(s0.index == 0 && s1.index == 1);
        // Fences start signaled.
        assert(vkGetFenceStatus(dev.device(), s0.inFlight) == VK_SUCCESS);
        std::printf("  slot handles: ok\n");
    }

    // Out-of-order calls are rejected and leave the phase alone
    {
        assert(frames.beginRecording().failedWith(ErrorCode::InvalidState));
        assert(frames.submit(dev.queue()).failedWith(ErrorCode::InvalidState));
        assert(frames.beginPresent().failedWith(ErrorCode::InvalidState));
        assert(frames.finishFrame().failedWith(ErrorCode::InvalidState));
        assert(frames.skipCurrent().failedWith(ErrorCode::InvalidState));
        assert(frames.phase(0) == FramePhase::Idle);
        std::printf("  out-of-order calls: ok\n");
    }

    // Full cycle on slot 0
    {
        auto f0 = frames.waitCurrent();
        assert(f0.ok());
        assert(f0.value().index == 0);
        assert(frames.phase(0) == FramePhase::WaitingOnFence);
        assert(frames.waitCurrent().failedWith(ErrorCode::InvalidState));

        signalSemaphore(dev.queue(), f0.value().imageAvailable);

        auto cmd = frames.beginRecording();
        assert(cmd.ok());
        assert(cmd.value() == f0.value().cmd);
        assert(frames.phase(0) == FramePhase::Recording);

        assert(frames.submit(dev.queue()).ok());
        assert(frames.phase(0) == FramePhase::Submitted);

        assert(frames.beginPresent().ok());
        assert(frames.phase(0) == FramePhase::Presenting);
        waitSemaphore(dev.queue(), f0.value().renderFinished);

        assert(frames.finishFrame().ok());
        assert(frames.phase(0) == FramePhase::Idle);
        assert(frames.current() == 1);
        std::printf("  frame 0 cycle: ok\n");
    }

    // Skip slot 1 after the wait: fence stays signaled, slot advances nowhere
    {
        auto f1 = frames.waitCurrent();
        assert(f1.ok());
        assert(f1.value().index == 1);
        assert(frames.skipCurrent().ok());
        assert(frames.phase(1) == FramePhase::Idle);
        assert(frames.current() == 1);
        assert(vkGetFenceStatus(dev.device(), f1.value().inFlight) == VK_SUCCESS);

        // The same slot can be waited on again right away.
        auto again = frames.waitCurrent();
        assert(again.ok());
        assert(frames.skipCurrent().ok());
        std::printf("  skip after wait: ok\n");
    }

    // waitAll blocks on slot 0's submission
    {
        assert(frames.waitAll().ok());
        assert(vkGetFenceStatus(dev.device(), frames.state(0).inFlight) == VK_SUCCESS);
        std::printf("  wait all: ok\n");
    }

    // waitAll skips a slot caught mid-recording (its fence is reset, nothing pending)
    {
        auto f1 = frames.waitCurrent();
        assert(f1.ok());
        auto cmd = frames.beginRecording();
        assert(cmd.ok());
        assert(frames.waitAll().ok());

        signalSemaphore(dev.queue(), f1.value().imageAvailable);
        assert(frames.submit(dev.queue()).ok());
        assert(frames.beginPresent().ok());
        waitSemaphore(dev.queue(), f1.value().renderFinished);
        assert(frames.finishFrame().ok());
        assert(frames.current() == 0);
        std::printf("  wait all mid-recording: ok\n");
    }

    // Abandoning a recording hands the slot back with its fence signaled
    {
        auto slot = frames.current();
        assert(frames.abandonRecording(dev.queue()).failedWith(ErrorCode::InvalidState));

        auto f = frames.waitCurrent();
        assert(f.ok());
        auto cmd = frames.beginRecording();
        assert(cmd.ok());
        assert(vkGetFenceStatus(dev.device(), f.value().inFlight) == VK_NOT_READY);

        signalSemaphore(dev.queue(), f.value().imageAvailable);
        assert(frames.abandonRecording(dev.queue()).ok());
        assert(frames.phase(slot) == FramePhase::Idle);
        assert(frames.current() == slot);
        assert(frames.waitAll().ok());
        assert(vkGetFenceStatus(dev.device(), f.value().inFlight) == VK_SUCCESS);

        // The same slot records and submits again.
        auto again = frames.waitCurrent();
        assert(again.ok());
        assert(frames.beginRecording().ok());
        signalSemaphore(dev.queue(), again.value().imageAvailable);
        assert(frames.submit(dev.queue()).ok());
        assert(frames.beginPresent().ok());
        waitSemaphore(dev.queue(), again.value().renderFinished);
        assert(frames.finishFrame().ok());
        assert(frames.current() != slot);
        std::printf("  abandon recording: ok\n");
    }

    // One-shot helpers
    {
        auto f = frames.waitCurrent();
        assert(f.ok());
        assert(frames.skipCurrent().ok());

        VkCommandPoolCreateInfo poolCI{};
        poolCI.sType = VK_STRUCTURE_TYPE_COMMAND_POOL_CREATE_INFO;
        poolCI.queueFamilyIndex = dev.family();
        VkCommandPool pool = VK_NULL_HANDLE;
        VkResult vr = vkCreateCommandPool(dev.device(), &poolCI, nullptr, &pool);
        assert(vr == VK_SUCCESS);

        VkCommandBufferAllocateInfo allocCI{};
        allocCI.sType = VK_STRUCTURE_TYPE_COMMAND_BUFFER_ALLOCATE_INFO;
        allocCI.commandPool = pool;
        allocCI.level = VK_COMMAND_BUFFER_LEVEL_PRIMARY;
        allocCI.commandBufferCount = 1;
        VkCommandBuffer cmd = VK_NULL_HANDLE;
        vr = vkAllocateCommandBuffers(dev.device(), &allocCI, &cmd);
        assert(vr == VK_SUCCESS);
        (void)vr;

        assert(vkgraph::beginOneTimeCommands(cmd).ok());
        assert(vkgraph::endSubmitOneShotBlocking(dev.queue(), cmd).ok());
        vkDestroyCommandPool(dev.device(), pool, nullptr);
        std::printf("  one-shot helpers: ok\n");
    }

    assert(frames.waitAll().ok());
    dev.waitIdle();

    std::printf("framesync test passed\n");
    return 0;
}
