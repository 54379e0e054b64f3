#pragma once

#include <vkgraph/allocator.hpp>
#include <vkgraph/error.hpp>
#include <vkgraph/pipeline_cache.hpp>
#include <vkgraph/result.hpp>

#include <vulkan/vulkan.h>

#include <cstdint>
#include <filesystem>
#include <memory>

namespace vkgraph {

// Handles supplied by the device layer. None of them are owned by the context.
struct ContextDesc {
    VkPhysicalDevice physicalDevice = VK_NULL_HANDLE; // required
    VkDevice device = VK_NULL_HANDLE;                 // required
    VmaAllocator allocator = nullptr;                 // required
    VkQueue graphicsQueue = VK_NULL_HANDLE;           // required
    std::uint32_t graphicsQueueFamily = UINT32_MAX;   // required

    // When non-empty, the pipeline cache is seeded from this file at create()
    // and written back at destroy().
    std::filesystem::path pipelineCachePath;
};

// Long-lived state shared by every build of a render graph: the device
// handles it compiles against and the pipeline cache pass collaborators build
// their pipelines with. Created once, reused across rebuilds, torn down
// explicitly after the last graph is gone.
//
// Thread safety: thread-confined (render loop thread).
class RenderContext {
public:
    [[nodiscard]] static Result<RenderContext> create(const ContextDesc& desc);

    ~RenderContext();
    RenderContext(RenderContext&&) noexcept;
    RenderContext& operator=(RenderContext&&) noexcept;
    RenderContext(const RenderContext&) = delete;
    RenderContext& operator=(const RenderContext&) = delete;

    [[nodiscard]] VkPhysicalDevice vkPhysicalDevice() const { return physicalDevice_; }
    [[nodiscard]] VkDevice vkDevice() const { return device_; }
    [[nodiscard]] VmaAllocator vmaAllocator() const { return allocator_; }
    [[nodiscard]] VkQueue graphicsQueue() const { return graphicsQueue_; }
    [[nodiscard]] std::uint32_t graphicsQueueFamily() const { return graphicsQueueFamily_; }

    [[nodiscard]] VkPipelineCache vkPipelineCache() const;

    [[nodiscard]] bool alive() const { return device_ != VK_NULL_HANDLE; }

    // Blocks until the device has finished all submitted work.
    [[nodiscard]] Result<void> waitIdle() const;

    // Saves the pipeline cache (when a path was given) and releases it.
    // The context is unusable afterwards. Safe to call twice.
    [[nodiscard]] Result<void> destroy();

private:
    RenderContext() = default;

    VkPhysicalDevice physicalDevice_ = VK_NULL_HANDLE;
    VkDevice device_ = VK_NULL_HANDLE;
    VmaAllocator allocator_ = nullptr;
    VkQueue graphicsQueue_ = VK_NULL_HANDLE;
    std::uint32_t graphicsQueueFamily_ = UINT32_MAX;
    std::filesystem::path cachePath_;
    std::unique_ptr<PipelineCache> cache_;
};

} // namespace vkgraph
