#include <vkgraph/debug.hpp>
#include <vkgraph/graph/compiled_graph.hpp>

#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wmissing-field-initializers"
#pragma GCC diagnostic ignored "-Wunused-parameter"
#pragma GCC diagnostic ignored "-Wunused-variable"
#include <vk_mem_alloc.h>
#pragma GCC diagnostic pop

#include <chrono>
#include <utility>

namespace vkgraph::graph {

// Cast void* back to VmaAllocation for internal use.
static VmaAllocation toVma(void* p) {
    return static_cast<VmaAllocation>(p);
}

CompiledGraph::~CompiledGraph() {
    destroy();
}

CompiledGraph::CompiledGraph(CompiledGraph&& o) noexcept
    : device_(o.device_), allocator_(o.allocator_), plan_(std::move(o.plan_)),
      stats_(o.stats_), passNames_(std::move(o.passNames_)),
      backbufferResource_(o.backbufferResource_),
      images_(std::move(o.images_)), samplers_(std::move(o.samplers_)),
      renderPasses_(std::move(o.renderPasses_)),
      sharedFramebuffers_(std::move(o.sharedFramebuffers_)),
      indexedFramebuffers_(std::move(o.indexedFramebuffers_)),
      backbufferImages_(std::move(o.backbufferImages_)),
      backbufferViews_(std::move(o.backbufferViews_)) {
    o.device_ = VK_NULL_HANDLE;
    o.allocator_ = nullptr;
}

CompiledGraph& CompiledGraph::operator=(CompiledGraph&& o) noexcept {
    if (this != &o) {
        destroy();
        device_ = o.device_;
        allocator_ = o.allocator_;
        plan_ = std::move(o.plan_);
        stats_ = o.stats_;
        passNames_ = std::move(o.passNames_);
        backbufferResource_ = o.backbufferResource_;
        images_ = std::move(o.images_);
        samplers_ = std::move(o.samplers_);
        renderPasses_ = std::move(o.renderPasses_);
        sharedFramebuffers_ = std::move(o.sharedFramebuffers_);
        indexedFramebuffers_ = std::move(o.indexedFramebuffers_);
        backbufferImages_ = std::move(o.backbufferImages_);
        backbufferViews_ = std::move(o.backbufferViews_);
        o.device_ = VK_NULL_HANDLE;
        o.allocator_ = nullptr;
    }
    return *this;
}

void CompiledGraph::releaseBackbuffer() {
    for (auto& perIndex : indexedFramebuffers_) {
        for (auto fb : perIndex) {
            if (fb != VK_NULL_HANDLE) vkDestroyFramebuffer(device_, fb, nullptr);
        }
        perIndex.clear();
    }
    for (auto view : backbufferViews_) {
        if (view != VK_NULL_HANDLE) vkDestroyImageView(device_, view, nullptr);
    }
    backbufferViews_.clear();
    backbufferImages_.clear();
}

void CompiledGraph::destroy() {
    if (device_ == VK_NULL_HANDLE) return;

    releaseBackbuffer();

    for (auto fb : sharedFramebuffers_) {
        if (fb != VK_NULL_HANDLE) vkDestroyFramebuffer(device_, fb, nullptr);
    }
    sharedFramebuffers_.clear();

    for (auto rp : renderPasses_) {
        if (rp != VK_NULL_HANDLE) vkDestroyRenderPass(device_, rp, nullptr);
    }
    renderPasses_.clear();

    for (auto& img : images_) {
        if (img.view != VK_NULL_HANDLE) vkDestroyImageView(device_, img.view, nullptr);
        if (img.image != VK_NULL_HANDLE) {
            vmaDestroyImage(allocator_, img.image, toVma(img.allocation));
        }
    }
    images_.clear();

    samplers_.clear();
    indexedFramebuffers_.clear();

    device_ = VK_NULL_HANDLE;
    allocator_ = nullptr;
}

Result<CompiledGraph> CompiledGraph::create(const RenderContext& ctx, const GraphDesc& desc,
                                            GraphPlan plan) {
    using Clock = std::chrono::steady_clock;
    auto us = [](Clock::time_point a, Clock::time_point b) {
        return std::chrono::duration<double, std::micro>(b - a).count();
    };

    CompiledGraph g;
    g.device_ = ctx.vkDevice();
    g.allocator_ = ctx.vmaAllocator();
    g.plan_ = std::move(plan);
    g.passNames_ = desc.passes();
    if (auto bb = desc.backbuffer()) g.backbufferResource_ = *bb;

    auto passCount = static_cast<std::uint32_t>(g.passNames_.size());
    g.renderPasses_.assign(passCount, VK_NULL_HANDLE);
    g.sharedFramebuffers_.assign(passCount, VK_NULL_HANDLE);
    g.indexedFramebuffers_.resize(passCount);

    auto tStart = Clock::now();

    auto images = g.allocateImages(desc);
    if (!images.ok()) return images.error();
    auto tAlloc = Clock::now();

    auto samplers = g.createSamplers(desc);
    if (!samplers.ok()) return samplers.error();
    auto tSamplers = Clock::now();

    auto passes = g.createRenderPasses();
    if (!passes.ok()) return passes.error();
    auto tPasses = Clock::now();

    for (const auto& pp : g.plan_.passes) {
        if (pp.touchesBackbuffer()) continue;

        auto fb = g.createFramebuffer(pp, VK_NULL_HANDLE,
                                      "graph framebuffer '" + g.passNames_[pp.pass] + "'");
        if (!fb.ok()) return fb.error();
        g.sharedFramebuffers_[pp.pass] = fb.value();
    }
    auto tFramebuffers = Clock::now();

    g.stats_.passCount = passCount;
    g.stats_.dependencyCount = static_cast<std::uint32_t>(g.plan_.dependencies.size());
    for (std::uint32_t ri = 0; ri < static_cast<std::uint32_t>(g.images_.size()); ++ri) {
        if (g.images_[ri].image == VK_NULL_HANDLE) continue;
        g.stats_.imageCount++;
        if (g.plan_.resources[ri].transient) g.stats_.transientCount++;
    }
    g.stats_.allocUs = us(tStart, tAlloc);
    g.stats_.samplerUs = us(tAlloc, tSamplers);
    g.stats_.renderPassUs = us(tSamplers, tPasses);
    g.stats_.framebufferUs = us(tPasses, tFramebuffers);

    return g;
}

Result<void> CompiledGraph::allocateImages(const GraphDesc& desc) {
    const auto& resources = plan_.resources;
    images_.assign(resources.size(), GraphImage{});

    for (std::uint32_t ri = 0; ri < static_cast<std::uint32_t>(resources.size()); ++ri) {
        const auto& rp = resources[ri];
        if (rp.backbuffer) continue;

        const auto& name = desc.images()[ri].name();

        VkImageCreateInfo ci{};
        ci.sType = VK_STRUCTURE_TYPE_IMAGE_CREATE_INFO;
        ci.imageType = VK_IMAGE_TYPE_2D;
        ci.format = rp.format;
        ci.extent = {rp.extent.width, rp.extent.height, 1};
        ci.mipLevels = 1;
        ci.arrayLayers = 1;
        ci.samples = rp.samples;
        ci.tiling = VK_IMAGE_TILING_OPTIMAL;
        ci.usage = rp.usage;
        ci.sharingMode = VK_SHARING_MODE_EXCLUSIVE;
        ci.initialLayout = VK_IMAGE_LAYOUT_UNDEFINED;

        VmaAllocationCreateInfo allocCI{};
        allocCI.usage = VMA_MEMORY_USAGE_GPU_ONLY;
        if (rp.transient) {
            // Tile memory on GPUs that have it; VMA falls back to device-local.
            allocCI.preferredFlags = VK_MEMORY_PROPERTY_LAZILY_ALLOCATED_BIT;
        }

        VkImage image = VK_NULL_HANDLE;
        VmaAllocation allocation = nullptr;
        VkResult vr = vmaCreateImage(allocator_, &ci, &allocCI, &image, &allocation, nullptr);
        if (vr != VK_SUCCESS) {
            return Error{"allocate graph image", static_cast<std::int32_t>(vr),
                         "VMA failed to allocate '" + name + "' (" +
                             std::to_string(rp.extent.width) + "x" +
                             std::to_string(rp.extent.height) + ")",
                         ErrorCode::DeviceResourceExhausted};
        }

        VkImageViewCreateInfo viewCI{};
        viewCI.sType = VK_STRUCTURE_TYPE_IMAGE_VIEW_CREATE_INFO;
        viewCI.image = image;
        viewCI.viewType = VK_IMAGE_VIEW_TYPE_2D;
        viewCI.format = rp.format;
        viewCI.subresourceRange = {rp.aspect, 0, 1, 0, 1};

        VkImageView view = VK_NULL_HANDLE;
        vr = vkCreateImageView(device_, &viewCI, nullptr, &view);
        if (vr != VK_SUCCESS) {
            vmaDestroyImage(allocator_, image, allocation);
            return vulkanError("create graph image view", vr,
                               "failed to create image view for '" + name + "'");
        }

        images_[ri] = {image, view, allocation};

        debugName(device_, image, "graph image '" + name + "'");
        debugName(device_, view, "graph view '" + name + "'");
    }

    return {};
}

Result<void> CompiledGraph::createSamplers(const GraphDesc& desc) {
    samplers_.reserve(desc.samplers().size());
    for (const auto& decl : desc.samplers()) {
        auto s = Sampler::create(device_, decl.desc);
        if (!s.ok()) return s.error();
        debugName(device_, s.value().vkSampler(), "graph sampler '" + decl.name + "'");
        samplers_.push_back(std::move(s).value());
    }
    return {};
}

Result<void> CompiledGraph::createRenderPasses() {
    for (const auto& pp : plan_.passes) {
        std::vector<VkAttachmentDescription> attachments;
        attachments.reserve(pp.attachments.size());
        for (const auto& ap : pp.attachments) {
            VkAttachmentDescription ad{};
            ad.format = ap.format;
            ad.samples = ap.samples;
            ad.loadOp = ap.loadOp;
            ad.storeOp = ap.storeOp;
            ad.stencilLoadOp = ap.stencilLoadOp;
            ad.stencilStoreOp = ap.stencilStoreOp;
            ad.initialLayout = ap.initialLayout;
            ad.finalLayout = ap.finalLayout;
            attachments.push_back(ad);
        }

        std::vector<VkAttachmentReference> colorRefs;
        for (auto ref : pp.colorRefs) colorRefs.push_back({ref, pp.attachments[ref].layout});

        std::vector<VkAttachmentReference> resolveRefs;
        for (auto ref : pp.resolveRefs) {
            if (ref == VK_ATTACHMENT_UNUSED) {
                resolveRefs.push_back({VK_ATTACHMENT_UNUSED, VK_IMAGE_LAYOUT_UNDEFINED});
            } else {
                resolveRefs.push_back({ref, pp.attachments[ref].layout});
            }
        }

        VkAttachmentReference depthRef{};
        if (pp.depthRef != VK_ATTACHMENT_UNUSED) {
            depthRef = {pp.depthRef, pp.attachments[pp.depthRef].layout};
        }

        VkSubpassDescription subpass{};
        subpass.pipelineBindPoint = VK_PIPELINE_BIND_POINT_GRAPHICS;
        subpass.colorAttachmentCount = static_cast<std::uint32_t>(colorRefs.size());
        subpass.pColorAttachments = colorRefs.empty() ? nullptr : colorRefs.data();
        subpass.pResolveAttachments = resolveRefs.empty() ? nullptr : resolveRefs.data();
        subpass.pDepthStencilAttachment =
            pp.depthRef != VK_ATTACHMENT_UNUSED ? &depthRef : nullptr;

        auto dependencies = subpassDependencies(plan_, pp.pass);

        VkRenderPassCreateInfo ci{};
        ci.sType = VK_STRUCTURE_TYPE_RENDER_PASS_CREATE_INFO;
        ci.attachmentCount = static_cast<std::uint32_t>(attachments.size());
        ci.pAttachments = attachments.empty() ? nullptr : attachments.data();
        ci.subpassCount = 1;
        ci.pSubpasses = &subpass;
        ci.dependencyCount = static_cast<std::uint32_t>(dependencies.size());
        ci.pDependencies = dependencies.empty() ? nullptr : dependencies.data();

        VkRenderPass renderPass = VK_NULL_HANDLE;
        VkResult vr = vkCreateRenderPass(device_, &ci, nullptr, &renderPass);
        if (vr != VK_SUCCESS) {
            return vulkanError("create render pass", vr,
                               "vkCreateRenderPass failed for pass '" + passNames_[pp.pass] +
                                   "'");
        }
        renderPasses_[pp.pass] = renderPass;
        debugName(device_, renderPass, "graph pass '" + passNames_[pp.pass] + "'");
    }
    return {};
}

Result<VkFramebuffer> CompiledGraph::createFramebuffer(const PassPlan& pp,
                                                       VkImageView backbufferView,
                                                       const std::string& name) {
    std::vector<VkImageView> views;
    views.reserve(pp.attachments.size());
    for (const auto& ap : pp.attachments) {
        views.push_back(plan_.resources[ap.resource].backbuffer ? backbufferView
                                                                : images_[ap.resource].view);
    }

    VkFramebufferCreateInfo ci{};
    ci.sType = VK_STRUCTURE_TYPE_FRAMEBUFFER_CREATE_INFO;
    ci.renderPass = renderPasses_[pp.pass];
    ci.attachmentCount = static_cast<std::uint32_t>(views.size());
    ci.pAttachments = views.empty() ? nullptr : views.data();
    ci.width = pp.extent.width;
    ci.height = pp.extent.height;
    ci.layers = 1;

    VkFramebuffer fb = VK_NULL_HANDLE;
    VkResult vr = vkCreateFramebuffer(device_, &ci, nullptr, &fb);
    if (vr != VK_SUCCESS) {
        return vulkanError("create framebuffer", vr,
                           "vkCreateFramebuffer failed for pass '" + passNames_[pp.pass] + "'");
    }
    debugName(device_, fb, name);
    return fb;
}

Result<void> CompiledGraph::bindBackbuffer(std::span<const VkImage> images) {
    if (!hasBackbuffer()) return {};
    if (images.empty()) {
        return Error{"bind backbuffer", 0, "no backbuffer images supplied",
                     ErrorCode::BackbufferMismatch};
    }

    releaseBackbuffer();

    const auto& rp = plan_.resources[backbufferResource_];
    for (std::uint32_t i = 0; i < static_cast<std::uint32_t>(images.size()); ++i) {
        VkImageViewCreateInfo viewCI{};
        viewCI.sType = VK_STRUCTURE_TYPE_IMAGE_VIEW_CREATE_INFO;
        viewCI.image = images[i];
        viewCI.viewType = VK_IMAGE_VIEW_TYPE_2D;
        viewCI.format = rp.format;
        viewCI.subresourceRange = {VK_IMAGE_ASPECT_COLOR_BIT, 0, 1, 0, 1};

        VkImageView view = VK_NULL_HANDLE;
        VkResult vr = vkCreateImageView(device_, &viewCI, nullptr, &view);
        if (vr != VK_SUCCESS) {
            releaseBackbuffer();
            return vulkanError("bind backbuffer", vr,
                               "failed to create view for backbuffer image " +
                                   std::to_string(i));
        }
        backbufferImages_.push_back(images[i]);
        backbufferViews_.push_back(view);
        debugName(device_, view, "graph view '" + backbufferName(i) + "'");
    }

    for (const auto& pp : plan_.passes) {
        if (!pp.touchesBackbuffer()) continue;

        auto& perIndex = indexedFramebuffers_[pp.pass];
        for (std::uint32_t i = 0; i < backbufferCount(); ++i) {
            auto fb = createFramebuffer(pp, backbufferViews_[i],
                                        "graph framebuffer '" + passNames_[pp.pass] + "' #" +
                                            std::to_string(i));
            if (!fb.ok()) {
                releaseBackbuffer();
                return fb.error();
            }
            perIndex.push_back(fb.value());
        }
    }

    return {};
}

VkFramebuffer CompiledGraph::framebuffer(std::uint32_t pass, std::uint32_t index) const {
    if (pass >= sharedFramebuffers_.size()) return VK_NULL_HANDLE;
    if (sharedFramebuffers_[pass] != VK_NULL_HANDLE) return sharedFramebuffers_[pass];

    const auto& perIndex = indexedFramebuffers_[pass];
    return index < perIndex.size() ? perIndex[index] : VK_NULL_HANDLE;
}

} // namespace vkgraph::graph
