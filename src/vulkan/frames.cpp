#include <vkgraph/debug.hpp>
#include <vkgraph/frames.hpp>

#include <cstdint>
#include <string>
#include <utility>

namespace vkgraph {

bool canTransition(FramePhase from, FramePhase to) {
    switch (from) {
    case FramePhase::Idle:
        return to == FramePhase::WaitingOnFence;
    case FramePhase::WaitingOnFence:
        return to == FramePhase::Recording || to == FramePhase::Idle;
    case FramePhase::Recording:
        return to == FramePhase::Submitted || to == FramePhase::Idle;
    case FramePhase::Submitted:
        return to == FramePhase::Presenting;
    case FramePhase::Presenting:
        return to == FramePhase::Idle;
    }
    return false;
}

const char* framePhaseName(FramePhase phase) {
    switch (phase) {
    case FramePhase::Idle:
        return "Idle";
    case FramePhase::WaitingOnFence:
        return "WaitingOnFence";
    case FramePhase::Recording:
        return "Recording";
    case FramePhase::Submitted:
        return "Submitted";
    case FramePhase::Presenting:
        return "Presenting";
    }
    return "Unknown";
}

void FrameSync::destroy() {
    if (device_ == VK_NULL_HANDLE) return;

    for (auto& s : slots_) {
        if (s.imageAvailable != VK_NULL_HANDLE) vkDestroySemaphore(device_, s.imageAvailable, nullptr);
        if (s.renderFinished != VK_NULL_HANDLE) vkDestroySemaphore(device_, s.renderFinished, nullptr);
        if (s.inFlight != VK_NULL_HANDLE)       vkDestroyFence(device_, s.inFlight, nullptr);
    }
    slots_.clear();
    phases_.clear();

    // Frees the command buffers with it.
    if (pool_ != VK_NULL_HANDLE) {
        vkDestroyCommandPool(device_, pool_, nullptr);
        pool_ = VK_NULL_HANDLE;
    }

    device_ = VK_NULL_HANDLE;
}

FrameSync::~FrameSync() { destroy(); }

FrameSync::FrameSync(FrameSync&& o) noexcept
    : device_(o.device_), pool_(o.pool_), count_(o.count_), current_(o.current_),
      slots_(std::move(o.slots_)), phases_(std::move(o.phases_)) {
    o.device_ = VK_NULL_HANDLE;
    o.pool_   = VK_NULL_HANDLE;
    o.count_  = 0;
}

FrameSync& FrameSync::operator=(FrameSync&& o) noexcept {
    if (this != &o) {
        destroy();
        device_   = o.device_;
        pool_     = o.pool_;
        count_    = o.count_;
        current_  = o.current_;
        slots_    = std::move(o.slots_);
        phases_   = std::move(o.phases_);
        o.device_ = VK_NULL_HANDLE;
        o.pool_   = VK_NULL_HANDLE;
        o.count_  = 0;
    }
    return *this;
}

Result<FrameSync> FrameSync::create(const RenderContext& ctx, std::uint32_t count) {
    if (!ctx.alive()) {
        return Error{"create frame sync", 0, "context was destroyed", ErrorCode::InvalidState};
    }
    if (count == 0) {
        return Error{"create frame sync", 0, "at least one frame in flight is required",
                     ErrorCode::InvalidDescriptor};
    }

    FrameSync fs;
    fs.device_ = ctx.vkDevice();
    fs.count_  = count;

    VkCommandPoolCreateInfo poolCI{};
    poolCI.sType            = VK_STRUCTURE_TYPE_COMMAND_POOL_CREATE_INFO;
    poolCI.flags            = VK_COMMAND_POOL_CREATE_RESET_COMMAND_BUFFER_BIT;
    poolCI.queueFamilyIndex = ctx.graphicsQueueFamily();

    VkResult vr = vkCreateCommandPool(fs.device_, &poolCI, nullptr, &fs.pool_);
    if (vr != VK_SUCCESS) {
        return vulkanError("create command pool", vr, "vkCreateCommandPool failed");
    }

    std::vector<VkCommandBuffer> cmds(count);
    VkCommandBufferAllocateInfo allocInfo{};
    allocInfo.sType              = VK_STRUCTURE_TYPE_COMMAND_BUFFER_ALLOCATE_INFO;
    allocInfo.commandPool        = fs.pool_;
    allocInfo.level              = VK_COMMAND_BUFFER_LEVEL_PRIMARY;
    allocInfo.commandBufferCount = count;

    vr = vkAllocateCommandBuffers(fs.device_, &allocInfo, cmds.data());
    if (vr != VK_SUCCESS) {
        return vulkanError("allocate command buffers", vr, "vkAllocateCommandBuffers failed");
    }

    VkSemaphoreCreateInfo semCI{};
    semCI.sType = VK_STRUCTURE_TYPE_SEMAPHORE_CREATE_INFO;

    VkFenceCreateInfo fenceCI{};
    fenceCI.sType = VK_STRUCTURE_TYPE_FENCE_CREATE_INFO;
    fenceCI.flags = VK_FENCE_CREATE_SIGNALED_BIT;

    fs.slots_.resize(count);
    fs.phases_.assign(count, FramePhase::Idle);

    for (std::uint32_t i = 0; i < count; ++i) {
        auto& s = fs.slots_[i];
        s.cmd   = cmds[i];
        s.index = i;

        vr = vkCreateSemaphore(fs.device_, &semCI, nullptr, &s.imageAvailable);
        if (vr != VK_SUCCESS) {
            return vulkanError("create semaphore", vr,
                               "failed for imageAvailable[" + std::to_string(i) + "]");
        }

        vr = vkCreateSemaphore(fs.device_, &semCI, nullptr, &s.renderFinished);
        if (vr != VK_SUCCESS) {
            return vulkanError("create semaphore", vr,
                               "failed for renderFinished[" + std::to_string(i) + "]");
        }

        vr = vkCreateFence(fs.device_, &fenceCI, nullptr, &s.inFlight);
        if (vr != VK_SUCCESS) {
            return vulkanError("create fence", vr, "failed for inFlight[" + std::to_string(i) + "]");
        }

        std::string suffix = "[" + std::to_string(i) + "]";
        debugName(fs.device_, s.cmd, "frame cmd" + suffix);
        debugName(fs.device_, s.imageAvailable, "frame imageAvailable" + suffix);
        debugName(fs.device_, s.renderFinished, "frame renderFinished" + suffix);
        debugName(fs.device_, s.inFlight, "frame inFlight" + suffix);
    }

    return fs;
}

Result<void> FrameSync::advance(FramePhase to, const char* operation) {
    FramePhase from = phases_[current_];
    if (!canTransition(from, to)) {
        return Error{operation, 0,
                     "frame slot " + std::to_string(current_) + " is " + framePhaseName(from) +
                         ", cannot move to " + framePhaseName(to),
                     ErrorCode::InvalidState};
    }
    phases_[current_] = to;
    return {};
}

Result<FrameState> FrameSync::waitCurrent() {
    if (device_ == VK_NULL_HANDLE) {
        return Error{"wait for frame", 0, "frame sync was destroyed", ErrorCode::InvalidState};
    }

    auto moved = advance(FramePhase::WaitingOnFence, "wait for frame");
    if (!moved.ok()) return moved.error();

    const auto& s = slots_[current_];

    // Blocks until this slot's previous frame is done on the GPU.
    VkResult vr = vkWaitForFences(device_, 1, &s.inFlight, VK_TRUE, UINT64_MAX);
    if (vr != VK_SUCCESS) {
        phases_[current_] = FramePhase::Idle;
        return vulkanError("wait for fence", vr,
                           "vkWaitForFences failed for frame " + std::to_string(current_));
    }

    return s;
}

Result<void> FrameSync::skipCurrent() {
    return advance(FramePhase::Idle, "skip frame");
}

Result<VkCommandBuffer> FrameSync::beginRecording() {
    auto moved = advance(FramePhase::Recording, "begin frame recording");
    if (!moved.ok()) return moved.error();

    const auto& s = slots_[current_];

    // Reset only here: a frame skipped after the wait keeps its fence signaled.
    VkResult vr = vkResetFences(device_, 1, &s.inFlight);
    if (vr != VK_SUCCESS) {
        return vulkanError("reset fence", vr, "vkResetFences failed");
    }

    vr = vkResetCommandBuffer(s.cmd, 0);
    if (vr != VK_SUCCESS) {
        return vulkanError("reset command buffer", vr, "vkResetCommandBuffer failed");
    }

    auto begun = beginOneTimeCommands(s.cmd);
    if (!begun.ok()) return begun.error();

    return s.cmd;
}

Result<void> FrameSync::submit(VkQueue queue, VkPipelineStageFlags waitStage) {
    auto moved = advance(FramePhase::Submitted, "submit frame");
    if (!moved.ok()) return moved;

    const auto& s = slots_[current_];

    VkResult vr = vkEndCommandBuffer(s.cmd);
    if (vr != VK_SUCCESS) {
        return vulkanError("end frame command buffer", vr, "vkEndCommandBuffer failed");
    }

    VkSubmitInfo submitInfo{};
    submitInfo.sType                = VK_STRUCTURE_TYPE_SUBMIT_INFO;
    submitInfo.waitSemaphoreCount   = 1;
    submitInfo.pWaitSemaphores      = &s.imageAvailable;
    submitInfo.pWaitDstStageMask    = &waitStage;
    submitInfo.commandBufferCount   = 1;
    submitInfo.pCommandBuffers      = &s.cmd;
    submitInfo.signalSemaphoreCount = 1;
    submitInfo.pSignalSemaphores    = &s.renderFinished;

    vr = vkQueueSubmit(queue, 1, &submitInfo, s.inFlight);
    if (vr != VK_SUCCESS) {
        return vulkanError("submit frame", vr, "vkQueueSubmit failed");
    }

    return {};
}

Result<void> FrameSync::abandonRecording(VkQueue queue) {
    FramePhase from = phases_[current_];
    if (from != FramePhase::Recording) {
        return Error{"abandon frame recording", 0,
                     "frame slot " + std::to_string(current_) + " is " + framePhaseName(from) +
                         ", not Recording",
                     ErrorCode::InvalidState};
    }

    const auto& s = slots_[current_];

    VkResult vr = vkResetCommandBuffer(s.cmd, 0);
    if (vr != VK_SUCCESS) {
        return vulkanError("abandon frame recording", vr, "vkResetCommandBuffer failed");
    }

    // Consume the acquire's signal and re-signal the fence, so the slot looks
    // like it was never used.
    VkPipelineStageFlags waitStage = VK_PIPELINE_STAGE_ALL_COMMANDS_BIT;
    VkSubmitInfo submitInfo{};
    submitInfo.sType              = VK_STRUCTURE_TYPE_SUBMIT_INFO;
    submitInfo.waitSemaphoreCount = 1;
    submitInfo.pWaitSemaphores    = &s.imageAvailable;
    submitInfo.pWaitDstStageMask  = &waitStage;

    vr = vkQueueSubmit(queue, 1, &submitInfo, s.inFlight);
    if (vr != VK_SUCCESS) {
        return vulkanError("abandon frame recording", vr, "vkQueueSubmit failed");
    }

    phases_[current_] = FramePhase::Idle;
    return {};
}

Result<void> FrameSync::beginPresent() {
    return advance(FramePhase::Presenting, "present frame");
}

Result<void> FrameSync::finishFrame() {
    auto moved = advance(FramePhase::Idle, "finish frame");
    if (!moved.ok()) return moved;

    current_ = (current_ + 1) % count_;
    return {};
}

Result<void> FrameSync::waitAll() {
    if (device_ == VK_NULL_HANDLE) return {};

    std::vector<VkFence> pending;
    pending.reserve(count_);
    for (std::uint32_t i = 0; i < count_; ++i) {
        if (phases_[i] != FramePhase::Recording) {
            pending.push_back(slots_[i].inFlight);
        }
    }
    if (pending.empty()) return {};

    VkResult vr = vkWaitForFences(device_, static_cast<std::uint32_t>(pending.size()),
                                  pending.data(), VK_TRUE, UINT64_MAX);
    if (vr != VK_SUCCESS) {
        return vulkanError("wait for all frames", vr, "vkWaitForFences failed");
    }
    return {};
}

Result<void> beginOneTimeCommands(VkCommandBuffer cmd) {
    VkCommandBufferBeginInfo beginInfo{};
    beginInfo.sType = VK_STRUCTURE_TYPE_COMMAND_BUFFER_BEGIN_INFO;
    beginInfo.flags = VK_COMMAND_BUFFER_USAGE_ONE_TIME_SUBMIT_BIT;

    VkResult vr = vkBeginCommandBuffer(cmd, &beginInfo);
    if (vr != VK_SUCCESS) {
        return vulkanError("begin command buffer", vr, "vkBeginCommandBuffer failed");
    }
    return {};
}

Result<void> endSubmitOneShotBlocking(VkQueue queue, VkCommandBuffer cmd, VkFence fence) {
    VkResult vr = vkEndCommandBuffer(cmd);
    if (vr != VK_SUCCESS) {
        return vulkanError("end one-shot command buffer", vr, "vkEndCommandBuffer failed");
    }

    VkSubmitInfo submitInfo{};
    submitInfo.sType = VK_STRUCTURE_TYPE_SUBMIT_INFO;
    submitInfo.commandBufferCount = 1;
    submitInfo.pCommandBuffers = &cmd;

    vr = vkQueueSubmit(queue, 1, &submitInfo, fence);
    if (vr != VK_SUCCESS) {
        return vulkanError("submit one-shot command buffer", vr, "vkQueueSubmit failed");
    }

    vr = vkQueueWaitIdle(queue);
    if (vr != VK_SUCCESS) {
        return vulkanError("wait one-shot queue idle", vr, "vkQueueWaitIdle failed");
    }

    return {};
}

} // namespace vkgraph
