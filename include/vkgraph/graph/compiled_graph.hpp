#pragma once

#include <vkgraph/context.hpp>
#include <vkgraph/error.hpp>
#include <vkgraph/graph/declaration.hpp>
#include <vkgraph/graph/plan.hpp>
#include <vkgraph/result.hpp>
#include <vkgraph/sampler.hpp>

#include <vulkan/vulkan.h>

#include <cstdint>
#include <span>
#include <string>
#include <vector>

namespace vkgraph::graph {

// VMA-backed image created for one non-backbuffer resource.
struct GraphImage {
    VkImage image = VK_NULL_HANDLE;
    VkImageView view = VK_NULL_HANDLE;
    void* allocation = nullptr; // VmaAllocation stored as void*
};

// Aggregate compile statistics.
struct GraphStats {
    std::uint32_t passCount = 0;
    std::uint32_t imageCount = 0; // allocated images, backbuffer excluded
    std::uint32_t transientCount = 0;
    std::uint32_t dependencyCount = 0;
    double compileTimeUs = 0.0;

    // Timing breakdown (microseconds).
    double planUs = 0.0;
    double allocUs = 0.0;
    double samplerUs = 0.0;
    double renderPassUs = 0.0;
    double framebufferUs = 0.0;
};

// The native objects one build of a graph produces: images and views,
// samplers, one VkRenderPass per pass and its framebuffers. Immutable until
// destroyed; a rebuild replaces it wholesale.
//
// Framebuffers of passes that never touch the backbuffer are created here and
// shared by every backbuffer index. Passes that do touch it get one
// framebuffer per backbuffer image, created by bindBackbuffer().
//
// Destroy only after the device has finished every submission that uses it.
//
// Thread safety: thread-confined (render loop thread).
class CompiledGraph {
public:
    // Fails with DeviceResourceExhausted when an image cannot be allocated, or
    // a Vulkan error for the other objects. Nothing leaks on failure.
    [[nodiscard]] static Result<CompiledGraph> create(const RenderContext& ctx,
                                                      const GraphDesc& desc, GraphPlan plan);

    ~CompiledGraph();
    CompiledGraph(CompiledGraph&&) noexcept;
    CompiledGraph& operator=(CompiledGraph&&) noexcept;
    CompiledGraph(const CompiledGraph&) = delete;
    CompiledGraph& operator=(const CompiledGraph&) = delete;

    // Creates one view per image (surface format) and one framebuffer per
    // image for every pass writing the backbuffer. Replaces an earlier
    // binding. A graph without a backbuffer ignores the call.
    // Fails with BackbufferMismatch on an empty list.
    [[nodiscard]] Result<void> bindBackbuffer(std::span<const VkImage> images);

    [[nodiscard]] bool hasBackbuffer() const { return backbufferResource_ != kExternal; }
    [[nodiscard]] bool backbufferBound() const { return !backbufferImages_.empty(); }
    [[nodiscard]] std::uint32_t backbufferCount() const {
        return static_cast<std::uint32_t>(backbufferImages_.size());
    }

    [[nodiscard]] const GraphPlan& plan() const { return plan_; }
    [[nodiscard]] const GraphStats& stats() const { return stats_; }
    [[nodiscard]] GraphStats& stats() { return stats_; }

    // By resource index. VK_NULL_HANDLE for the backbuffer resource.
    [[nodiscard]] VkImage image(std::uint32_t resource) const { return images_[resource].image; }
    [[nodiscard]] VkImageView imageView(std::uint32_t resource) const {
        return images_[resource].view;
    }

    [[nodiscard]] VkImage backbufferImage(std::uint32_t index) const {
        return backbufferImages_[index];
    }
    [[nodiscard]] VkImageView backbufferView(std::uint32_t index) const {
        return backbufferViews_[index];
    }

    // By pass index (declaration order).
    [[nodiscard]] VkRenderPass renderPass(std::uint32_t pass) const { return renderPasses_[pass]; }

    // The framebuffer used when recording into backbuffer image `index`.
    // VK_NULL_HANDLE for a backbuffer pass before binding or an out-of-range
    // index.
    [[nodiscard]] VkFramebuffer framebuffer(std::uint32_t pass, std::uint32_t index) const;

    // By sampler index; 0 is "default".
    [[nodiscard]] VkSampler sampler(std::uint32_t index) const {
        return samplers_[index].vkSampler();
    }

    void destroy();

private:
    CompiledGraph() = default;

    [[nodiscard]] Result<void> allocateImages(const GraphDesc& desc);
    [[nodiscard]] Result<void> createSamplers(const GraphDesc& desc);
    [[nodiscard]] Result<void> createRenderPasses();
    [[nodiscard]] Result<VkFramebuffer> createFramebuffer(const PassPlan& pp,
                                                          VkImageView backbufferView,
                                                          const std::string& name);
    void releaseBackbuffer();

    VkDevice device_ = VK_NULL_HANDLE;
    VmaAllocator allocator_ = nullptr;

    GraphPlan plan_;
    GraphStats stats_;
    std::vector<std::string> passNames_;
    std::uint32_t backbufferResource_ = kExternal;

    std::vector<GraphImage> images_; // per resource
    std::vector<Sampler> samplers_;
    std::vector<VkRenderPass> renderPasses_;                     // per pass
    std::vector<VkFramebuffer> sharedFramebuffers_;              // per pass
    std::vector<std::vector<VkFramebuffer>> indexedFramebuffers_; // per pass, per image

    std::vector<VkImage> backbufferImages_; // not owned
    std::vector<VkImageView> backbufferViews_;
};

} // namespace vkgraph::graph
