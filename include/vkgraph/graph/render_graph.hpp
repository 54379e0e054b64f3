#pragma once

#include <vkgraph/context.hpp>
#include <vkgraph/error.hpp>
#include <vkgraph/graph/compiled_graph.hpp>
#include <vkgraph/graph/declaration.hpp>
#include <vkgraph/graph/pass_recorder.hpp>
#include <vkgraph/graph/plan.hpp>
#include <vkgraph/presenter.hpp>
#include <vkgraph/result.hpp>

#include <vulkan/vulkan.h>

#include <cstdint>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace vkgraph::graph {

// Render graph: declare passes, image resources and the edges between them
// once, build against a surface, bind the presenter's images, execute every
// frame, rebuild on resize.
//
// Usage:
//   auto graph = RenderGraph::create(passes, images, edges).orThrow();
//   graph.registerPass("fullscreen", std::make_unique<MyRecorder>(...)).orThrow();
//   graph.build(ctx, presenter.surface()).orThrow();
//   graph.insertBackbufferImages(presenter.images()).orThrow();
//   graph.executeAtIndex(cmd, imageIndex).orThrow();
//
// The declaration never changes after create(). build() compiles it into a
// CompiledGraph; release() drops that, rebuild() replaces it. Recorders are
// kept across rebuilds.
//
// Thread safety: thread-confined. All methods must be called from the render
// loop thread.
class RenderGraph {
public:
    explicit RenderGraph(GraphDesc desc);

    // Declares every pass, then every image, then every edge, and returns the
    // first declaration error.
    [[nodiscard]] static Result<RenderGraph> create(const std::vector<std::string>& passNames,
                                                    const std::vector<ImageDesc>& images,
                                                    const std::vector<Edge>& edges);

    ~RenderGraph();
    RenderGraph(RenderGraph&&) noexcept;
    RenderGraph& operator=(RenderGraph&&) noexcept;
    RenderGraph(const RenderGraph&) = delete;
    RenderGraph& operator=(const RenderGraph&) = delete;

    // Compiles the declaration against the surface: sort, usage, ops,
    // dependencies, images, samplers, render passes, shared framebuffers.
    // Fails with Cycle, MissingProducer, InvalidAttachment or
    // DeviceResourceExhausted, and with InvalidState when already built.
    // Nothing is allocated when planning fails.
    [[nodiscard]] Result<void> build(const RenderContext& ctx, const SurfaceInfo& surface);

    // Binds the presenter's images to the backbuffer family. Must follow
    // build(). The first binding fixes the image count; every later binding,
    // on this build or a rebuild, must supply the same count.
    // Fails with BackbufferMismatch. Ignored when the graph has no backbuffer.
    [[nodiscard]] Result<void> insertBackbufferImages(std::span<const VkImage> images);

    // release() + build() + insertBackbufferImages(). The caller guarantees
    // the device no longer uses the current build.
    [[nodiscard]] Result<void> rebuild(const RenderContext& ctx, const SurfaceInfo& surface,
                                       std::span<const VkImage> images);

    // Destroys the current build. The caller guarantees the device no longer
    // uses it. Safe to call when nothing is built.
    void release();

    // Replaces the recorder of a pass. Fails with UnknownNode.
    [[nodiscard]] Result<void> registerPass(std::string_view pass,
                                            std::unique_ptr<PassRecorder> recorder);

    // Accessors. All fail with InvalidState before build() and with
    // UnknownNode for a name the declaration does not know. Backbuffer names
    // ("backbuffer#i") address bound image i and fail with BackbufferNotBound
    // before binding.
    [[nodiscard]] Result<VkRenderPass> passHandle(std::string_view pass) const;
    [[nodiscard]] Result<VkImage> image(std::string_view name) const;
    [[nodiscard]] Result<VkImageView> imageView(std::string_view name) const;
    [[nodiscard]] Result<VkSampler> sampler(std::string_view name) const;
    [[nodiscard]] Result<VkFramebuffer> framebuffer(std::string_view pass,
                                                    std::uint32_t backbufferIndex) const;
    [[nodiscard]] Result<VkImageUsageFlags> imageUsage(std::string_view name) const;
    [[nodiscard]] Result<VkExtent2D> passExtent(std::string_view pass) const;

    // Records every pass in topological order: begin render pass, recorder,
    // end render pass. A recorder error ends the open render pass and is
    // returned. Fails with BackbufferNotBound before any command is recorded
    // when a backbuffer pass has nothing bound.
    [[nodiscard]] Result<void> executeAtIndex(VkCommandBuffer cmd, std::uint32_t backbufferIndex);

    // Records a single pass with a caller-supplied recorder, for one-shot
    // offscreen work outside the frame loop.
    [[nodiscard]] Result<void> executePass(VkCommandBuffer cmd, std::string_view pass,
                                           std::uint32_t backbufferIndex,
                                           PassRecorder& recorder);

    [[nodiscard]] bool isBuilt() const { return compiled_.has_value(); }
    [[nodiscard]] bool hasBackbuffer() const { return desc_.backbuffer().has_value(); }

    // Image count fixed by the first binding; 0 before it.
    [[nodiscard]] std::uint32_t backbufferCount() const { return backbufferCount_; }

    [[nodiscard]] const GraphDesc& desc() const { return desc_; }
    [[nodiscard]] const SurfaceInfo& surface() const { return surface_; }

    // Only valid while built.
    [[nodiscard]] const GraphPlan& plan() const { return compiled_->plan(); }
    [[nodiscard]] const GraphStats& stats() const { return compiled_->stats(); }

    // Debug: print the compiled passes, attachments, dependencies and
    // allocations to stderr.
    void dumpLog() const;

private:
    [[nodiscard]] Result<void> requireBuilt(const char* operation) const;
    [[nodiscard]] Result<std::uint32_t> lookupPass(const char* operation,
                                                   std::string_view pass) const;
    [[nodiscard]] Result<std::uint32_t> lookupImage(const char* operation,
                                                    std::string_view name) const;
    [[nodiscard]] Result<std::uint32_t> lookupBackbufferIndex(const char* operation,
                                                              std::string_view name) const;
    [[nodiscard]] Result<VkFramebuffer> selectFramebuffer(const char* operation,
                                                          std::uint32_t pass,
                                                          std::uint32_t backbufferIndex) const;
    [[nodiscard]] Result<void> recordPass(VkCommandBuffer cmd, const PassPlan& pp,
                                          VkFramebuffer framebuffer, PassRecorder* recorder);

    GraphDesc desc_;
    std::optional<CompiledGraph> compiled_;
    SurfaceInfo surface_;
    std::uint32_t backbufferCount_ = 0;

    std::vector<std::unique_ptr<PassRecorder>> recorders_; // per pass index
    std::vector<bool> warnedNoRecorder_;
};

} // namespace vkgraph::graph
