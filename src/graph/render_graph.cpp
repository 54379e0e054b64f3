#include <vkgraph/graph/render_graph.hpp>

#include <chrono>
#include <cinttypes>
#include <cstdio>
#include <cstring>
#include <utility>

namespace vkgraph::graph {

RenderGraph::RenderGraph(GraphDesc desc)
    : desc_(std::move(desc)), recorders_(desc_.passes().size()),
      warnedNoRecorder_(desc_.passes().size(), false) {}

RenderGraph::~RenderGraph() {
    release();
}

RenderGraph::RenderGraph(RenderGraph&& o) noexcept
    : desc_(std::move(o.desc_)), compiled_(std::move(o.compiled_)), surface_(o.surface_),
      backbufferCount_(o.backbufferCount_), recorders_(std::move(o.recorders_)),
      warnedNoRecorder_(std::move(o.warnedNoRecorder_)) {
    o.compiled_.reset();
    o.backbufferCount_ = 0;
}

RenderGraph& RenderGraph::operator=(RenderGraph&& o) noexcept {
    if (this != &o) {
        release();
        desc_ = std::move(o.desc_);
        compiled_ = std::move(o.compiled_);
        surface_ = o.surface_;
        backbufferCount_ = o.backbufferCount_;
        recorders_ = std::move(o.recorders_);
        warnedNoRecorder_ = std::move(o.warnedNoRecorder_);
        o.compiled_.reset();
        o.backbufferCount_ = 0;
    }
    return *this;
}

Result<RenderGraph> RenderGraph::create(const std::vector<std::string>& passNames,
                                        const std::vector<ImageDesc>& images,
                                        const std::vector<Edge>& edges) {
    GraphDesc desc;
    for (const auto& name : passNames) {
        auto r = desc.declarePass(name);
        if (!r.ok()) return r.error();
    }
    for (const auto& image : images) {
        auto r = desc.declareImage(image);
        if (!r.ok()) return r.error();
    }
    for (const auto& edge : edges) {
        auto r = desc.declareEdge(edge.producer, edge.consumer);
        if (!r.ok()) return r.error();
    }
    return RenderGraph(std::move(desc));
}

Result<void> RenderGraph::build(const RenderContext& ctx, const SurfaceInfo& surface) {
    if (compiled_) {
        return Error{"build render graph", 0, "already built -- call release() or rebuild()",
                     ErrorCode::InvalidState};
    }
    if (!ctx.alive()) {
        return Error{"build render graph", 0, "render context has been destroyed",
                     ErrorCode::InvalidState};
    }

    using Clock = std::chrono::steady_clock;
    auto tStart = Clock::now();

    auto plan = planGraph(desc_, surface);
    if (!plan.ok()) return plan.error();
    auto tPlan = Clock::now();

#ifndef NDEBUG
    for (const auto& w : plan.value().warnings) {
        std::fprintf(stderr, "[vkgraph::graph] warning: %s\n", w.c_str());
    }
#endif

    auto compiled = CompiledGraph::create(ctx, desc_, std::move(plan).value());
    if (!compiled.ok()) return compiled.error();
    auto tEnd = Clock::now();

    compiled_.emplace(std::move(compiled).value());
    surface_ = surface;

    auto& stats = compiled_->stats();
    stats.planUs = std::chrono::duration<double, std::micro>(tPlan - tStart).count();
    stats.compileTimeUs = std::chrono::duration<double, std::micro>(tEnd - tStart).count();
    return {};
}

Result<void> RenderGraph::insertBackbufferImages(std::span<const VkImage> images) {
    auto built = requireBuilt("bind backbuffer");
    if (!built.ok()) return built;
    if (!hasBackbuffer()) return {};

    if (images.empty()) {
        return Error{"bind backbuffer", 0, "no backbuffer images supplied",
                     ErrorCode::BackbufferMismatch};
    }
    auto count = static_cast<std::uint32_t>(images.size());
    if (backbufferCount_ != 0 && count != backbufferCount_) {
        return Error{"bind backbuffer", 0,
                     "expected " + std::to_string(backbufferCount_) +
                         " backbuffer images, got " + std::to_string(count),
                     ErrorCode::BackbufferMismatch};
    }

    auto bound = compiled_->bindBackbuffer(images);
    if (!bound.ok()) return bound;

    backbufferCount_ = count;
    return {};
}

Result<void> RenderGraph::rebuild(const RenderContext& ctx, const SurfaceInfo& surface,
                                  std::span<const VkImage> images) {
    release();

    auto built = build(ctx, surface);
    if (!built.ok()) return built;

    return insertBackbufferImages(images);
}

void RenderGraph::release() {
    compiled_.reset();
}

Result<void> RenderGraph::registerPass(std::string_view pass,
                                       std::unique_ptr<PassRecorder> recorder) {
    auto index = desc_.findPass(pass);
    if (!index) {
        return Error{"register pass", 0, "unknown pass '" + std::string(pass) + "'",
                     ErrorCode::UnknownNode};
    }
    recorders_[*index] = std::move(recorder);
    warnedNoRecorder_[*index] = false;
    return {};
}

Result<void> RenderGraph::requireBuilt(const char* operation) const {
    if (!compiled_) {
        return Error{operation, 0, "render graph is not built -- call build() first",
                     ErrorCode::InvalidState};
    }
    return {};
}

Result<std::uint32_t> RenderGraph::lookupPass(const char* operation,
                                              std::string_view pass) const {
    auto built = requireBuilt(operation);
    if (!built.ok()) return built.error();

    auto index = desc_.findPass(pass);
    if (!index) {
        return Error{operation, 0, "unknown pass '" + std::string(pass) + "'",
                     ErrorCode::UnknownNode};
    }
    return *index;
}

Result<std::uint32_t> RenderGraph::lookupImage(const char* operation,
                                               std::string_view name) const {
    auto built = requireBuilt(operation);
    if (!built.ok()) return built.error();

    auto index = desc_.findImage(name);
    if (!index) {
        return Error{operation, 0, "unknown image '" + std::string(name) + "'",
                     ErrorCode::UnknownNode};
    }
    return *index;
}

Result<std::uint32_t> RenderGraph::lookupBackbufferIndex(const char* operation,
                                                         std::string_view name) const {
    if (!compiled_->backbufferBound()) {
        return Error{operation, 0,
                     "'" + std::string(name) + "': no images bound -- call "
                     "insertBackbufferImages() first",
                     ErrorCode::BackbufferNotBound};
    }
    auto index = backbufferIndex(name).value_or(0);
    if (index >= compiled_->backbufferCount()) {
        return Error{operation, 0,
                     "'" + std::string(name) + "': only " +
                         std::to_string(compiled_->backbufferCount()) + " images are bound",
                     ErrorCode::BackbufferMismatch};
    }
    return index;
}

Result<VkRenderPass> RenderGraph::passHandle(std::string_view pass) const {
    auto index = lookupPass("pass handle", pass);
    if (!index.ok()) return index.error();
    return compiled_->renderPass(index.value());
}

Result<VkImage> RenderGraph::image(std::string_view name) const {
    auto index = lookupImage("image", name);
    if (!index.ok()) return index.error();

    if (compiled_->plan().resources[index.value()].backbuffer) {
        auto bb = lookupBackbufferIndex("image", name);
        if (!bb.ok()) return bb.error();
        return compiled_->backbufferImage(bb.value());
    }
    return compiled_->image(index.value());
}

Result<VkImageView> RenderGraph::imageView(std::string_view name) const {
    auto index = lookupImage("image view", name);
    if (!index.ok()) return index.error();

    if (compiled_->plan().resources[index.value()].backbuffer) {
        auto bb = lookupBackbufferIndex("image view", name);
        if (!bb.ok()) return bb.error();
        return compiled_->backbufferView(bb.value());
    }
    return compiled_->imageView(index.value());
}

Result<VkSampler> RenderGraph::sampler(std::string_view name) const {
    auto built = requireBuilt("sampler");
    if (!built.ok()) return built.error();

    auto index = desc_.findSampler(name);
    if (!index) {
        return Error{"sampler", 0, "unknown sampler '" + std::string(name) + "'",
                     ErrorCode::UnknownNode};
    }
    return compiled_->sampler(*index);
}

Result<VkFramebuffer> RenderGraph::selectFramebuffer(const char* operation, std::uint32_t pass,
                                                     std::uint32_t backbufferIndex) const {
    if (!compiled_->plan().passPlan(pass).touchesBackbuffer()) {
        return compiled_->framebuffer(pass, backbufferIndex);
    }

    if (!compiled_->backbufferBound()) {
        return Error{operation, 0,
                     "pass '" + desc_.passes()[pass] +
                         "' renders to the backbuffer but no images are bound",
                     ErrorCode::BackbufferNotBound};
    }
    if (backbufferIndex >= compiled_->backbufferCount()) {
        return Error{operation, 0,
                     "backbuffer index " + std::to_string(backbufferIndex) + " out of range (" +
                         std::to_string(compiled_->backbufferCount()) + " images bound)",
                     ErrorCode::BackbufferMismatch};
    }
    return compiled_->framebuffer(pass, backbufferIndex);
}

Result<VkFramebuffer> RenderGraph::framebuffer(std::string_view pass,
                                               std::uint32_t backbufferIndex) const {
    auto index = lookupPass("framebuffer", pass);
    if (!index.ok()) return index.error();
    return selectFramebuffer("framebuffer", index.value(), backbufferIndex);
}

Result<VkImageUsageFlags> RenderGraph::imageUsage(std::string_view name) const {
    auto index = lookupImage("image usage", name);
    if (!index.ok()) return index.error();
    return compiled_->plan().resources[index.value()].usage;
}

Result<VkExtent2D> RenderGraph::passExtent(std::string_view pass) const {
    auto index = lookupPass("pass extent", pass);
    if (!index.ok()) return index.error();
    return compiled_->plan().passPlan(index.value()).extent;
}

Result<void> RenderGraph::recordPass(VkCommandBuffer cmd, const PassPlan& pp,
                                     VkFramebuffer framebuffer, PassRecorder* recorder) {
    std::vector<VkClearValue> clearValues;
    clearValues.reserve(pp.attachments.size());
    for (const auto& ap : pp.attachments) {
        clearValues.push_back(desc_.images()[ap.resource].desc().clearValue);
    }

    VkRenderPassBeginInfo begin{};
    begin.sType = VK_STRUCTURE_TYPE_RENDER_PASS_BEGIN_INFO;
    begin.renderPass = compiled_->renderPass(pp.pass);
    begin.framebuffer = framebuffer;
    begin.renderArea = {{0, 0}, pp.extent};
    begin.clearValueCount = static_cast<std::uint32_t>(clearValues.size());
    begin.pClearValues = clearValues.empty() ? nullptr : clearValues.data();

    vkCmdBeginRenderPass(cmd, &begin, VK_SUBPASS_CONTENTS_INLINE);

    if (recorder) {
        auto recorded = recorder->record(cmd);
        if (!recorded.ok()) {
            vkCmdEndRenderPass(cmd);
            return recorded;
        }
    } else {
#ifndef NDEBUG
        if (!warnedNoRecorder_[pp.pass]) {
            std::fprintf(stderr,
                         "[vkgraph::graph] warning: pass '%s' has no recorder; "
                         "it only clears and stores\n",
                         desc_.passes()[pp.pass].c_str());
            warnedNoRecorder_[pp.pass] = true;
        }
#endif
    }

    vkCmdEndRenderPass(cmd);
    return {};
}

Result<void> RenderGraph::executeAtIndex(VkCommandBuffer cmd, std::uint32_t backbufferIndex) {
    auto built = requireBuilt("execute render graph");
    if (!built.ok()) return built;

    // Resolve every framebuffer first so a binding error leaves cmd untouched.
    const auto& passes = compiled_->plan().passes;
    std::vector<VkFramebuffer> framebuffers;
    framebuffers.reserve(passes.size());
    for (const auto& pp : passes) {
        auto fb = selectFramebuffer("execute render graph", pp.pass, backbufferIndex);
        if (!fb.ok()) return fb.error();
        framebuffers.push_back(fb.value());
    }

    for (std::size_t i = 0; i < passes.size(); ++i) {
        const auto& pp = passes[i];
        auto recorded = recordPass(cmd, pp, framebuffers[i], recorders_[pp.pass].get());
        if (!recorded.ok()) return recorded;
    }
    return {};
}

Result<void> RenderGraph::executePass(VkCommandBuffer cmd, std::string_view pass,
                                      std::uint32_t backbufferIndex, PassRecorder& recorder) {
    auto index = lookupPass("execute pass", pass);
    if (!index.ok()) return index.error();

    auto fb = selectFramebuffer("execute pass", index.value(), backbufferIndex);
    if (!fb.ok()) return fb.error();

    return recordPass(cmd, compiled_->plan().passPlan(index.value()), fb.value(), &recorder);
}

static const char* layoutName(VkImageLayout layout) {
    switch (layout) {
    case VK_IMAGE_LAYOUT_UNDEFINED:
        return "UNDEFINED";
    case VK_IMAGE_LAYOUT_GENERAL:
        return "GENERAL";
    case VK_IMAGE_LAYOUT_COLOR_ATTACHMENT_OPTIMAL:
        return "COLOR_ATTACHMENT_OPTIMAL";
    case VK_IMAGE_LAYOUT_DEPTH_STENCIL_ATTACHMENT_OPTIMAL:
        return "DEPTH_STENCIL_ATTACHMENT_OPTIMAL";
    case VK_IMAGE_LAYOUT_DEPTH_STENCIL_READ_ONLY_OPTIMAL:
        return "DEPTH_STENCIL_READ_ONLY_OPTIMAL";
    case VK_IMAGE_LAYOUT_SHADER_READ_ONLY_OPTIMAL:
        return "SHADER_READ_ONLY_OPTIMAL";
    case VK_IMAGE_LAYOUT_PRESENT_SRC_KHR:
        return "PRESENT_SRC_KHR";
    default:
        return "(other)";
    }
}

static const char* loadOpName(VkAttachmentLoadOp op) {
    switch (op) {
    case VK_ATTACHMENT_LOAD_OP_LOAD:
        return "LOAD";
    case VK_ATTACHMENT_LOAD_OP_CLEAR:
        return "CLEAR";
    case VK_ATTACHMENT_LOAD_OP_DONT_CARE:
        return "DONT_CARE";
    default:
        return "(other)";
    }
}

static const char* storeOpName(VkAttachmentStoreOp op) {
    switch (op) {
    case VK_ATTACHMENT_STORE_OP_STORE:
        return "STORE";
    case VK_ATTACHMENT_STORE_OP_DONT_CARE:
        return "DONT_CARE";
    default:
        return "(other)";
    }
}

static void appendStageBits(std::string& out, VkPipelineStageFlags flags) {
    if (flags == 0) {
        out += "(none)";
        return;
    }

    bool first = true;
    auto add = [&](VkPipelineStageFlags bit, const char* name) {
        if (flags & bit) {
            if (!first)
                out += "|";
            out += name;
            first = false;
        }
    };

    add(VK_PIPELINE_STAGE_TOP_OF_PIPE_BIT, "TOP_OF_PIPE");
    add(VK_PIPELINE_STAGE_VERTEX_SHADER_BIT, "VERTEX_SHADER");
    add(VK_PIPELINE_STAGE_FRAGMENT_SHADER_BIT, "FRAGMENT_SHADER");
    add(VK_PIPELINE_STAGE_EARLY_FRAGMENT_TESTS_BIT, "EARLY_FRAG");
    add(VK_PIPELINE_STAGE_LATE_FRAGMENT_TESTS_BIT, "LATE_FRAG");
    add(VK_PIPELINE_STAGE_COLOR_ATTACHMENT_OUTPUT_BIT, "COLOR_ATTACHMENT_OUTPUT");
    add(VK_PIPELINE_STAGE_BOTTOM_OF_PIPE_BIT, "BOTTOM_OF_PIPE");
    add(VK_PIPELINE_STAGE_ALL_GRAPHICS_BIT, "ALL_GRAPHICS");

    if (first) {
        // Unrecognized bits.
        char buf[32];
        std::snprintf(buf, sizeof(buf), "0x%" PRIx32, static_cast<std::uint32_t>(flags));
        out += buf;
    }
}

static void appendAccessBits(std::string& out, VkAccessFlags flags) {
    if (flags == 0) {
        out += "(none)";
        return;
    }

    bool first = true;
    auto add = [&](VkAccessFlags bit, const char* name) {
        if (flags & bit) {
            if (!first)
                out += "|";
            out += name;
            first = false;
        }
    };

    add(VK_ACCESS_SHADER_READ_BIT, "SHADER_READ");
    add(VK_ACCESS_COLOR_ATTACHMENT_READ_BIT, "COLOR_ATTACHMENT_READ");
    add(VK_ACCESS_COLOR_ATTACHMENT_WRITE_BIT, "COLOR_ATTACHMENT_WRITE");
    add(VK_ACCESS_DEPTH_STENCIL_ATTACHMENT_READ_BIT, "DEPTH_STENCIL_READ");
    add(VK_ACCESS_DEPTH_STENCIL_ATTACHMENT_WRITE_BIT, "DEPTH_STENCIL_WRITE");
    add(VK_ACCESS_MEMORY_READ_BIT, "MEMORY_READ");
    add(VK_ACCESS_MEMORY_WRITE_BIT, "MEMORY_WRITE");

    if (first) {
        char buf[32];
        std::snprintf(buf, sizeof(buf), "0x%" PRIx32, static_cast<std::uint32_t>(flags));
        out += buf;
    }
}

static const char* formatName(VkFormat format) {
    switch (format) {
    case VK_FORMAT_R8G8B8A8_UNORM:
        return "R8G8B8A8_UNORM";
    case VK_FORMAT_R8G8B8A8_SRGB:
        return "R8G8B8A8_SRGB";
    case VK_FORMAT_B8G8R8A8_UNORM:
        return "B8G8R8A8_UNORM";
    case VK_FORMAT_B8G8R8A8_SRGB:
        return "B8G8R8A8_SRGB";
    case VK_FORMAT_R16G16B16A16_SFLOAT:
        return "R16G16B16A16_SFLOAT";
    case VK_FORMAT_R32G32B32A32_SFLOAT:
        return "R32G32B32A32_SFLOAT";
    case VK_FORMAT_D32_SFLOAT:
        return "D32_SFLOAT";
    case VK_FORMAT_D24_UNORM_S8_UINT:
        return "D24_UNORM_S8_UINT";
    case VK_FORMAT_D32_SFLOAT_S8_UINT:
        return "D32_SFLOAT_S8_UINT";
    case VK_FORMAT_D16_UNORM:
        return "D16_UNORM";
    default:
        return "(other format)";
    }
}

static std::string passLabel(const GraphDesc& desc, std::uint32_t pass) {
    return pass == kExternal ? std::string("(external)") : "'" + desc.passes()[pass] + "'";
}

void RenderGraph::dumpLog() const {
    if (!compiled_) {
        std::fprintf(stderr, "[vkgraph::graph] Not built yet.\n");
        return;
    }

    const auto& plan = compiled_->plan();
    const auto& stats = compiled_->stats();

    std::fprintf(stderr, "[vkgraph::graph] Compiled %u passes (surface %ux%u %s):\n",
                 stats.passCount, surface_.extent.width, surface_.extent.height,
                 formatName(surface_.format));
    for (std::uint32_t i = 0; i < static_cast<std::uint32_t>(plan.order.size()); ++i) {
        const auto& pp = plan.passes[i];
        std::fprintf(stderr, "  [%u] %-20s %ux%u%s\n", i, desc_.passes()[pp.pass].c_str(),
                     pp.extent.width, pp.extent.height,
                     pp.touchesBackbuffer() ? "  (backbuffer)" : "");
    }

    for (const auto& pp : plan.passes) {
        std::fprintf(stderr, "[vkgraph::graph] pass '%s':\n", desc_.passes()[pp.pass].c_str());

        for (std::uint32_t a = 0; a < static_cast<std::uint32_t>(pp.attachments.size()); ++a) {
            const auto& ap = pp.attachments[a];
            std::fprintf(stderr,
                         "  ATT %u: %-18s %-13s %-20s x%u  %s/%s\n"
                         "         %s -> %s -> %s\n",
                         a, desc_.images()[ap.resource].name().c_str(), roleName(ap.role),
                         formatName(ap.format), static_cast<unsigned>(ap.samples),
                         loadOpName(ap.loadOp), storeOpName(ap.storeOp),
                         layoutName(ap.initialLayout), layoutName(ap.layout),
                         layoutName(ap.finalLayout));
        }
        for (const auto& in : pp.sampled) {
            std::fprintf(stderr, "  SAMPLES: %-18s in %s\n",
                         desc_.images()[in.resource].name().c_str(), layoutName(in.layout));
        }

        for (const auto& dep : subpassDependencies(plan, pp.pass)) {
            std::string srcStage, srcAccess, dstStage, dstAccess;
            appendStageBits(srcStage, dep.srcStageMask);
            appendStageBits(dstStage, dep.dstStageMask);
            appendAccessBits(srcAccess, dep.srcAccessMask);
            appendAccessBits(dstAccess, dep.dstAccessMask);

            std::fprintf(stderr,
                         "  DEP %s\n"
                         "         src: %s / %s\n"
                         "         dst: %s / %s\n",
                         dep.srcSubpass == VK_SUBPASS_EXTERNAL ? "EXTERNAL -> 0"
                                                               : "0 -> EXTERNAL",
                         srcStage.c_str(), srcAccess.c_str(), dstStage.c_str(),
                         dstAccess.c_str());
        }
    }

    std::fprintf(stderr, "[vkgraph::graph] Dependencies:\n");
    for (const auto& dep : plan.dependencies) {
        const char* resource = dep.resource == kExternal
                                   ? "(ordering)"
                                   : desc_.images()[dep.resource].name().c_str();
        std::fprintf(stderr, "  %-18s %s -> %s\n", resource,
                     passLabel(desc_, dep.srcPass).c_str(),
                     passLabel(desc_, dep.dstPass).c_str());
    }

    if (stats.imageCount > 0) {
        std::fprintf(stderr, "[vkgraph::graph] Allocations:\n");
        for (std::uint32_t ri = 0; ri < static_cast<std::uint32_t>(plan.resources.size()); ++ri) {
            const auto& rp = plan.resources[ri];
            if (rp.backbuffer) continue;

            VkImage image = compiled_->image(ri);
            std::uint64_t handle{};
            std::memcpy(&handle, &image, sizeof(handle));
            std::fprintf(stderr, "  %-18s %ux%u  %-24s%s (VkImage 0x%" PRIx64 ")\n",
                         desc_.images()[ri].name().c_str(), rp.extent.width, rp.extent.height,
                         formatName(rp.format), rp.transient ? " transient" : "", handle);
        }
    }

    std::fprintf(stderr,
                 "[vkgraph::graph] build %.0fus: plan %.0fus, alloc %.0fus, samplers %.0fus, "
                 "renderPasses %.0fus, framebuffers %.0fus\n",
                 stats.compileTimeUs, stats.planUs, stats.allocUs, stats.samplerUs,
                 stats.renderPassUs, stats.framebufferUs);

    std::fprintf(stderr,
                 "[vkgraph::graph] %u passes, %u images (%u transient), %u dependencies, "
                 "%u backbuffer images bound\n",
                 stats.passCount, stats.imageCount, stats.transientCount, stats.dependencyCount,
                 compiled_->backbufferCount());
}

} // namespace vkgraph::graph
