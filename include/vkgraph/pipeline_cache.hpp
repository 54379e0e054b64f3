#pragma once

#include <vkgraph/error.hpp>
#include <vkgraph/result.hpp>

#include <vulkan/vulkan.h>

#include <filesystem>

namespace vkgraph {

// RAII wrapper for VkPipelineCache with disk persistence.
// Move-only. Owned by RenderContext so it outlives every graph rebuild.
class PipelineCache {
public:
    ~PipelineCache();
    PipelineCache(PipelineCache&&) noexcept;
    PipelineCache& operator=(PipelineCache&&) noexcept;
    PipelineCache(const PipelineCache&) = delete;
    PipelineCache& operator=(const PipelineCache&) = delete;

    [[nodiscard]] static Result<PipelineCache> create(VkDevice device);

    // Falls back to an empty cache if the file does not exist or is unreadable.
    [[nodiscard]] static Result<PipelineCache> load(VkDevice device,
                                                     const std::filesystem::path& path);

    [[nodiscard]] Result<void> save(const std::filesystem::path& path) const;
    [[nodiscard]] VkPipelineCache vkPipelineCache() const { return cache_; }

    void destroy();

private:
    PipelineCache() = default;

    VkDevice         device_ = VK_NULL_HANDLE;
    VkPipelineCache  cache_  = VK_NULL_HANDLE;
};

} // namespace vkgraph
