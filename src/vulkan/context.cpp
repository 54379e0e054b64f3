#include <vkgraph/context.hpp>

#include <cstdio>
#include <utility>

namespace vkgraph {

RenderContext::~RenderContext() {
    if (device_ == VK_NULL_HANDLE) return;

    auto r = destroy();
    if (!r.ok()) {
        std::fprintf(stderr, "[vkgraph] %s\n", r.error().format().c_str());
    }
}

RenderContext::RenderContext(RenderContext&& o) noexcept
    : physicalDevice_(o.physicalDevice_), device_(o.device_), allocator_(o.allocator_),
      graphicsQueue_(o.graphicsQueue_), graphicsQueueFamily_(o.graphicsQueueFamily_),
      cachePath_(std::move(o.cachePath_)), cache_(std::move(o.cache_)) {
    o.device_ = VK_NULL_HANDLE;
    o.allocator_ = nullptr;
}

RenderContext& RenderContext::operator=(RenderContext&& o) noexcept {
    if (this != &o) {
        if (device_ != VK_NULL_HANDLE) {
            auto r = destroy();
            if (!r.ok()) {
                std::fprintf(stderr, "[vkgraph] %s\n", r.error().format().c_str());
            }
        }
        physicalDevice_ = o.physicalDevice_;
        device_ = o.device_;
        allocator_ = o.allocator_;
        graphicsQueue_ = o.graphicsQueue_;
        graphicsQueueFamily_ = o.graphicsQueueFamily_;
        cachePath_ = std::move(o.cachePath_);
        cache_ = std::move(o.cache_);
        o.device_ = VK_NULL_HANDLE;
        o.allocator_ = nullptr;
    }
    return *this;
}

Result<RenderContext> RenderContext::create(const ContextDesc& desc) {
    if (desc.device == VK_NULL_HANDLE || desc.physicalDevice == VK_NULL_HANDLE) {
        return Error{"create render context", 0, "device and physicalDevice are required",
                     ErrorCode::InvalidDescriptor};
    }
    if (desc.allocator == nullptr) {
        return Error{"create render context", 0, "a VMA allocator is required",
                     ErrorCode::InvalidDescriptor};
    }
    if (desc.graphicsQueue == VK_NULL_HANDLE || desc.graphicsQueueFamily == UINT32_MAX) {
        return Error{"create render context", 0, "a graphics queue and its family are required",
                     ErrorCode::InvalidDescriptor};
    }

    auto cache = desc.pipelineCachePath.empty()
                     ? PipelineCache::create(desc.device)
                     : PipelineCache::load(desc.device, desc.pipelineCachePath);
    if (!cache.ok()) return cache.error();

    RenderContext ctx;
    ctx.physicalDevice_ = desc.physicalDevice;
    ctx.device_ = desc.device;
    ctx.allocator_ = desc.allocator;
    ctx.graphicsQueue_ = desc.graphicsQueue;
    ctx.graphicsQueueFamily_ = desc.graphicsQueueFamily;
    ctx.cachePath_ = desc.pipelineCachePath;
    ctx.cache_ = std::make_unique<PipelineCache>(std::move(cache).value());
    return ctx;
}

VkPipelineCache RenderContext::vkPipelineCache() const {
    return cache_ ? cache_->vkPipelineCache() : VK_NULL_HANDLE;
}

Result<void> RenderContext::waitIdle() const {
    if (device_ == VK_NULL_HANDLE) {
        return Error{"wait device idle", 0, "context was destroyed", ErrorCode::InvalidState};
    }

    VkResult vr = vkDeviceWaitIdle(device_);
    if (vr != VK_SUCCESS) {
        return vulkanError("wait device idle", vr, "vkDeviceWaitIdle failed");
    }
    return {};
}

Result<void> RenderContext::destroy() {
    Result<void> saved;
    if (cache_) {
        if (!cachePath_.empty()) {
            saved = cache_->save(cachePath_);
        }
        cache_.reset();
    }

    device_ = VK_NULL_HANDLE;
    allocator_ = nullptr;
    graphicsQueue_ = VK_NULL_HANDLE;
    return saved;
}

} // namespace vkgraph
