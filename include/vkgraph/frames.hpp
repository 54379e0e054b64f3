#pragma once

#include <vkgraph/context.hpp>
#include <vkgraph/error.hpp>
#include <vkgraph/result.hpp>

#include <vulkan/vulkan.h>

#include <cstdint>
#include <vector>

namespace vkgraph {

// Lifecycle of one frame-in-flight slot:
//   Idle -> WaitingOnFence -> Recording -> Submitted -> Presenting -> Idle
// plus WaitingOnFence -> Idle when the frame is skipped before recording
// (the fence is still signaled, nothing was submitted), and Recording -> Idle
// when the recording is abandoned.
enum class FramePhase : std::uint8_t {
    Idle,
    WaitingOnFence,
    Recording,
    Submitted,
    Presenting,
};

[[nodiscard]] bool canTransition(FramePhase from, FramePhase to);
[[nodiscard]] const char* framePhaseName(FramePhase phase);

// Per-slot synchronization handles. Plain data -- does not own anything.
// FrameSync manages lifetime.
struct FrameState {
    VkCommandBuffer cmd = VK_NULL_HANDLE;
    VkSemaphore imageAvailable = VK_NULL_HANDLE; // signaled by the presenter's acquire
    VkSemaphore renderFinished = VK_NULL_HANDLE; // signaled by the frame's submit
    VkFence inFlight = VK_NULL_HANDLE;           // signaled when the GPU finished the slot
    std::uint32_t index = 0;                     // slot (0..N-1)
};

// Owns a command pool, N command buffers and N sets of sync objects
// (two semaphores + a fence) for frames-in-flight, used round-robin.
// Pre-allocates everything at creation -- zero per-frame allocations.
// Fences are created signaled so the first wait on every slot returns at once.
//
// Each call below moves the current slot one phase forward and fails with
// ErrorCode::InvalidState when called out of order.
//
// Thread safety: thread-confined (render loop thread).
class FrameSync {
public:
    [[nodiscard]] static Result<FrameSync> create(const RenderContext& ctx,
                                                  std::uint32_t count = 2);

    ~FrameSync();
    FrameSync(FrameSync&&) noexcept;
    FrameSync& operator=(FrameSync&&) noexcept;
    FrameSync(const FrameSync&) = delete;
    FrameSync& operator=(const FrameSync&) = delete;

    // Idle -> WaitingOnFence. Blocks until the slot's previous submission has
    // finished. Does not reset the fence.
    [[nodiscard]] Result<FrameState> waitCurrent();

    // WaitingOnFence -> Idle. Gives the slot back untouched.
    [[nodiscard]] Result<void> skipCurrent();

    // WaitingOnFence -> Recording. Resets the fence and the command buffer,
    // then begins it with ONE_TIME_SUBMIT.
    [[nodiscard]] Result<VkCommandBuffer> beginRecording();

    // Recording -> Submitted. Ends the command buffer and submits it, waiting
    // on imageAvailable at waitStage and signaling renderFinished + inFlight.
    [[nodiscard]] Result<void> submit(VkQueue queue,
                                      VkPipelineStageFlags waitStage =
                                          VK_PIPELINE_STAGE_COLOR_ATTACHMENT_OUTPUT_BIT);

    // Recording -> Idle. Drops the recorded commands and makes an empty
    // submission that waits on imageAvailable and signals inFlight. The
    // current slot does not advance.
    [[nodiscard]] Result<void> abandonRecording(VkQueue queue);

    // Submitted -> Presenting.
    [[nodiscard]] Result<void> beginPresent();

    // Presenting -> Idle, and advance to the next slot.
    [[nodiscard]] Result<void> finishFrame();

    // Blocks until every slot with a pending submission has finished.
    // Slots caught mid-recording have nothing pending and are skipped.
    [[nodiscard]] Result<void> waitAll();

    [[nodiscard]] std::uint32_t count() const { return count_; }
    [[nodiscard]] std::uint32_t current() const { return current_; }
    [[nodiscard]] FramePhase phase(std::uint32_t slot) const { return phases_[slot]; }
    [[nodiscard]] const FrameState& state(std::uint32_t slot) const { return slots_[slot]; }

private:
    FrameSync() = default;
    void destroy();
    [[nodiscard]] Result<void> advance(FramePhase to, const char* operation);

    VkDevice device_ = VK_NULL_HANDLE;
    VkCommandPool pool_ = VK_NULL_HANDLE;
    std::uint32_t count_ = 0;
    std::uint32_t current_ = 0;
    std::vector<FrameState> slots_;
    std::vector<FramePhase> phases_;
};

// Begin a command buffer with ONE_TIME_SUBMIT flag.
[[nodiscard]] Result<void> beginOneTimeCommands(VkCommandBuffer cmd);

// End, submit, and wait for a one-shot command buffer (blocks on queue idle).
[[nodiscard]] Result<void> endSubmitOneShotBlocking(VkQueue queue, VkCommandBuffer cmd,
                                                    VkFence fence = VK_NULL_HANDLE);

} // namespace vkgraph
