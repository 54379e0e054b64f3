#include <vkgraph/graph/plan.hpp>

#include <algorithm>
#include <cmath>
#include <functional>
#include <queue>
#include <string>

namespace vkgraph::graph {

const char* roleName(AttachmentRole role) {
    switch (role) {
    case AttachmentRole::Color:
        return "color";
    case AttachmentRole::DepthStencil:
        return "depth-stencil";
    case AttachmentRole::Resolve:
        return "resolve";
    }
    return "unknown";
}

namespace {

VkImageLayout attachmentLayout(AttachmentRole role) {
    return role == AttachmentRole::DepthStencil ? VK_IMAGE_LAYOUT_DEPTH_STENCIL_ATTACHMENT_OPTIMAL
                                                : VK_IMAGE_LAYOUT_COLOR_ATTACHMENT_OPTIMAL;
}

VkImageLayout readLayout(AttachmentRole role) {
    return role == AttachmentRole::DepthStencil ? VK_IMAGE_LAYOUT_DEPTH_STENCIL_READ_ONLY_OPTIMAL
                                                : VK_IMAGE_LAYOUT_SHADER_READ_ONLY_OPTIMAL;
}

VkPipelineStageFlags writeStage(AttachmentRole role) {
    return role == AttachmentRole::DepthStencil
               ? (VK_PIPELINE_STAGE_EARLY_FRAGMENT_TESTS_BIT |
                  VK_PIPELINE_STAGE_LATE_FRAGMENT_TESTS_BIT)
               : VK_PIPELINE_STAGE_COLOR_ATTACHMENT_OUTPUT_BIT;
}

VkAccessFlags writeAccess(AttachmentRole role) {
    return role == AttachmentRole::DepthStencil ? VK_ACCESS_DEPTH_STENCIL_ATTACHMENT_WRITE_BIT
                                                : VK_ACCESS_COLOR_ATTACHMENT_WRITE_BIT;
}

// Access of a pass that loads (or clears) and then writes the attachment.
VkAccessFlags attachmentAccess(AttachmentRole role) {
    return role == AttachmentRole::DepthStencil
               ? (VK_ACCESS_DEPTH_STENCIL_ATTACHMENT_READ_BIT |
                  VK_ACCESS_DEPTH_STENCIL_ATTACHMENT_WRITE_BIT)
               : (VK_ACCESS_COLOR_ATTACHMENT_READ_BIT | VK_ACCESS_COLOR_ATTACHMENT_WRITE_BIT);
}

bool contains(const std::vector<std::uint32_t>& sorted, std::uint32_t v) {
    return std::binary_search(sorted.begin(), sorted.end(), v);
}

void sortUnique(std::vector<std::uint32_t>& v) {
    std::sort(v.begin(), v.end());
    v.erase(std::unique(v.begin(), v.end()), v.end());
}

Error attachmentError(const std::string& message) {
    return Error{"compile render graph", 0, message, ErrorCode::InvalidAttachment};
}

// Per-resource writers/readers by pass index (declaration order).
struct ResAccess {
    std::vector<std::uint32_t> writers;
    std::vector<std::uint32_t> readers;
};

} // namespace

Result<GraphPlan> planGraph(const GraphDesc& desc, const SurfaceInfo& surface) {
    const auto passCount = static_cast<std::uint32_t>(desc.passes().size());
    const auto resCount = static_cast<std::uint32_t>(desc.images().size());
    const auto& images = desc.images();

    GraphPlan plan;
    plan.surface = surface;

    // Flat bool matrix for deduplication.
    std::vector<bool> adjMatrix(static_cast<std::size_t>(passCount) * passCount, false);
    std::vector<ResAccess> perResource(resCount);

    for (const auto& e : desc.edges()) {
        if (e.producer.kind == NodeKind::Pass && e.consumer.kind == NodeKind::Image) {
            perResource[e.consumer.index].writers.push_back(e.producer.index);
        } else if (e.producer.kind == NodeKind::Image && e.consumer.kind == NodeKind::Pass) {
            perResource[e.producer.index].readers.push_back(e.consumer.index);
        } else if (e.producer.kind == NodeKind::Pass && e.consumer.kind == NodeKind::Pass) {
            adjMatrix[e.producer.index * passCount + e.consumer.index] = true;
        }
    }

    // Consecutive writers are ordered by declaration (WAW); every reader
    // samples the final contents, so it follows every writer.
    for (std::uint32_t ri = 0; ri < resCount; ++ri) {
        auto& ra = perResource[ri];
        sortUnique(ra.writers);
        sortUnique(ra.readers);

        if (!ra.readers.empty() && ra.writers.empty()) {
            return Error{"compile render graph", 0,
                         "'" + images[ri].name() + "' is sampled by '" +
                             desc.passes()[ra.readers.front()] + "' but no pass writes it",
                         ErrorCode::MissingProducer};
        }

        for (std::size_t wi = 1; wi < ra.writers.size(); ++wi)
            adjMatrix[ra.writers[wi - 1] * passCount + ra.writers[wi]] = true;

        for (auto w : ra.writers)
            for (auto r : ra.readers)
                adjMatrix[w * passCount + r] = true;
    }

    // Kahn's algorithm. Ready passes leave the queue lowest declaration index
    // first, which keeps independent passes in the order they were declared.
    std::vector<std::uint32_t> inDegree(passCount, 0);
    for (std::uint32_t i = 0; i < passCount; ++i)
        for (std::uint32_t j = 0; j < passCount; ++j)
            if (adjMatrix[i * passCount + j]) inDegree[j]++;

    std::priority_queue<std::uint32_t, std::vector<std::uint32_t>, std::greater<>> ready;
    for (std::uint32_t i = 0; i < passCount; ++i) {
        if (inDegree[i] == 0) ready.push(i);
    }

    plan.order.reserve(passCount);
    while (!ready.empty()) {
        auto u = ready.top();
        ready.pop();
        plan.order.push_back(u);
        for (std::uint32_t v = 0; v < passCount; ++v) {
            if (adjMatrix[u * passCount + v] && --inDegree[v] == 0) ready.push(v);
        }
    }

    if (plan.order.size() != passCount) {
        std::string stuck;
        for (std::uint32_t i = 0; i < passCount; ++i) {
            if (inDegree[i] == 0) continue;
            if (!stuck.empty()) stuck += ", ";
            stuck += "'" + desc.passes()[i] + "'";
        }
        return Error{"compile render graph", 0, "cycle detected among passes " + stuck,
                     ErrorCode::Cycle};
    }

    plan.position.assign(passCount, 0);
    for (std::uint32_t pos = 0; pos < passCount; ++pos)
        plan.position[plan.order[pos]] = pos;

    // Resources: role, format, extent, usage.
    plan.resources.resize(resCount);
    for (std::uint32_t ri = 0; ri < resCount; ++ri) {
        const auto& img = images[ri];
        const auto& d = img.desc();
        auto& rp = plan.resources[ri];

        rp.backbuffer = img.isBackbuffer();
        rp.samples = d.samples;

        if (rp.backbuffer) {
            if (surface.format == VK_FORMAT_UNDEFINED || isZeroExtent(surface.extent)) {
                return attachmentError("'" + img.name() +
                                       "' needs a surface with a format and a non-zero extent");
            }
            if (d.format != VK_FORMAT_UNDEFINED && d.format != surface.format) {
                return attachmentError("'" + img.name() +
                                       "' declares a format different from the surface format");
            }
            rp.format = surface.format;
            rp.extent = surface.extent;
        } else {
            rp.format = d.format;
            if (d.sizeMode == SizeMode::Fixed) {
                rp.extent = d.extent;
            } else {
                if (isZeroExtent(surface.extent)) {
                    return attachmentError("'" + img.name() +
                                           "' is surface-relative but the surface has no extent");
                }
                rp.extent.width = std::max(
                    1u, static_cast<std::uint32_t>(std::floor(surface.extent.width * d.scale)));
                rp.extent.height = std::max(
                    1u, static_cast<std::uint32_t>(std::floor(surface.extent.height * d.scale)));
            }
        }

        bool depth = isDepthFormat(rp.format);
        rp.role = d.resolve ? AttachmentRole::Resolve
                            : (depth ? AttachmentRole::DepthStencil : AttachmentRole::Color);
        rp.aspect = depth ? VK_IMAGE_ASPECT_DEPTH_BIT : VK_IMAGE_ASPECT_COLOR_BIT;
        if (hasStencilComponent(rp.format)) rp.aspect |= VK_IMAGE_ASPECT_STENCIL_BIT;

        const auto& ra = perResource[ri];
        for (auto w : ra.writers) rp.writers.push_back(plan.position[w]);
        for (auto r : ra.readers) rp.readers.push_back(plan.position[r]);
        std::sort(rp.writers.begin(), rp.writers.end());
        std::sort(rp.readers.begin(), rp.readers.end());

        bool sampled = d.forceShaderRead || !rp.readers.empty();
        bool crossPass = rp.writers.size() > 1 || !rp.readers.empty();
        rp.transient = !rp.backbuffer && !d.forceStore && !sampled && !crossPass;

        rp.usage = depth ? VK_IMAGE_USAGE_DEPTH_STENCIL_ATTACHMENT_BIT
                         : VK_IMAGE_USAGE_COLOR_ATTACHMENT_BIT;
        if (sampled) rp.usage |= VK_IMAGE_USAGE_SAMPLED_BIT;
        if (d.forceStore) rp.usage |= VK_IMAGE_USAGE_TRANSFER_SRC_BIT;
        if (rp.transient) rp.usage |= VK_IMAGE_USAGE_TRANSIENT_ATTACHMENT_BIT;

        if (rp.writers.empty()) {
            plan.warnings.push_back("'" + img.name() + "' is never written by any pass");
        }
    }

    // Passes, in execution order.
    plan.passes.resize(passCount);
    for (std::uint32_t pos = 0; pos < passCount; ++pos) {
        auto& pp = plan.passes[pos];
        pp.pass = plan.order[pos];
        const auto& passName = desc.passes()[pp.pass];

        std::vector<std::uint32_t> resolveTargets;

        for (std::uint32_t ri = 0; ri < resCount; ++ri) {
            const auto& rp = plan.resources[ri];
            const auto& d = images[ri].desc();

            if (contains(rp.readers, pos)) {
                pp.sampled.push_back({ri, readLayout(rp.role)});
                continue;
            }
            if (!contains(rp.writers, pos)) continue;

            bool firstWrite = rp.writers.front() == pos;
            bool lastWrite = rp.writers.back() == pos;
            bool laterUse = !lastWrite || !rp.readers.empty();
            bool sampled = d.forceShaderRead || !rp.readers.empty();

            AttachmentPlan ap;
            ap.resource = ri;
            ap.role = rp.role;
            ap.format = rp.format;
            ap.samples = rp.samples;
            // A resolve target is overwritten in full by the resolve, so its
            // first write needs no clear.
            if (firstWrite) {
                ap.loadOp = rp.role == AttachmentRole::Resolve ? VK_ATTACHMENT_LOAD_OP_DONT_CARE
                                                               : VK_ATTACHMENT_LOAD_OP_CLEAR;
            } else {
                ap.loadOp = VK_ATTACHMENT_LOAD_OP_LOAD;
            }
            ap.storeOp = (laterUse || d.forceStore || rp.backbuffer)
                             ? VK_ATTACHMENT_STORE_OP_STORE
                             : VK_ATTACHMENT_STORE_OP_DONT_CARE;
            if (hasStencilComponent(rp.format)) {
                ap.stencilLoadOp = ap.loadOp;
                ap.stencilStoreOp = ap.storeOp;
            }
            ap.layout = attachmentLayout(rp.role);
            ap.initialLayout = firstWrite ? VK_IMAGE_LAYOUT_UNDEFINED : ap.layout;
            if (!lastWrite) {
                ap.finalLayout = ap.layout;
            } else if (rp.backbuffer) {
                ap.finalLayout = VK_IMAGE_LAYOUT_PRESENT_SRC_KHR;
            } else if (sampled) {
                ap.finalLayout = readLayout(rp.role);
            } else {
                ap.finalLayout = ap.layout;
            }

            auto index = static_cast<std::uint32_t>(pp.attachments.size());
            pp.attachments.push_back(ap);

            switch (rp.role) {
            case AttachmentRole::Color:
                pp.colorRefs.push_back(index);
                break;
            case AttachmentRole::DepthStencil:
                if (pp.depthRef != VK_ATTACHMENT_UNUSED) {
                    return attachmentError("pass '" + passName +
                                           "' writes more than one depth-stencil attachment");
                }
                pp.depthRef = index;
                break;
            case AttachmentRole::Resolve:
                resolveTargets.push_back(index);
                break;
            }
            if (rp.backbuffer) pp.backbufferAttachment = index;
        }

        // Color and depth attachments of one subpass share a sample count.
        VkSampleCountFlagBits passSamples = VK_SAMPLE_COUNT_1_BIT;
        bool haveSamples = false;
        auto checkSamples = [&](std::uint32_t ref) {
            auto s = pp.attachments[ref].samples;
            if (haveSamples && s != passSamples) return false;
            passSamples = s;
            haveSamples = true;
            return true;
        };
        for (auto ref : pp.colorRefs) {
            if (!checkSamples(ref)) {
                return attachmentError("pass '" + passName + "' mixes sample counts");
            }
        }
        if (pp.depthRef != VK_ATTACHMENT_UNUSED && !checkSamples(pp.depthRef)) {
            return attachmentError("pass '" + passName + "' mixes sample counts");
        }

        // Resolve targets pair with multisampled colors in declaration order.
        if (!resolveTargets.empty()) {
            if (passSamples == VK_SAMPLE_COUNT_1_BIT ||
                resolveTargets.size() > pp.colorRefs.size()) {
                return attachmentError("pass '" + passName +
                                       "' has more resolve targets than multisampled colors");
            }
            pp.resolveRefs.assign(pp.colorRefs.size(), VK_ATTACHMENT_UNUSED);
            for (std::size_t k = 0; k < resolveTargets.size(); ++k)
                pp.resolveRefs[k] = resolveTargets[k];
        }

        // Render area: smallest attachment, or the surface for attachment-less passes.
        if (pp.attachments.empty()) {
            pp.extent = isZeroExtent(surface.extent) ? VkExtent2D{1, 1} : surface.extent;
        } else {
            pp.extent = plan.resources[pp.attachments.front().resource].extent;
            for (const auto& ap : pp.attachments) {
                const auto& e = plan.resources[ap.resource].extent;
                pp.extent.width = std::min(pp.extent.width, e.width);
                pp.extent.height = std::min(pp.extent.height, e.height);
            }
        }
    }

    // Unconsumed: color written but never read, stored, resolved or presented.
    // Depth is consumed by the depth test of the pass that writes it.
    for (std::uint32_t ri = 0; ri < resCount; ++ri) {
        const auto& rp = plan.resources[ri];
        const auto& d = images[ri].desc();
        if (rp.writers.empty() || !rp.readers.empty() || rp.backbuffer || d.forceStore ||
            d.forceShaderRead || rp.role == AttachmentRole::DepthStencil) {
            continue;
        }

        bool resolved = false;
        for (auto w : rp.writers) {
            const auto& pp = plan.passes[w];
            for (std::size_t k = 0; k < pp.resolveRefs.size(); ++k) {
                if (pp.resolveRefs[k] != VK_ATTACHMENT_UNUSED &&
                    pp.attachments[pp.colorRefs[k]].resource == ri) {
                    resolved = true;
                }
            }
        }
        if (!resolved) {
            plan.warnings.push_back("'" + images[ri].name() +
                                    "' is written but never consumed; its contents are discarded");
        }
    }

    // Dependencies, resource by resource, then explicit ordering edges.
    for (std::uint32_t ri = 0; ri < resCount; ++ri) {
        const auto& rp = plan.resources[ri];
        if (rp.writers.empty()) continue;

        bool sampled = images[ri].desc().forceShaderRead || !rp.readers.empty();

        for (std::size_t k = 0; k < rp.writers.size(); ++k) {
            PassDependency dep;
            dep.resource = ri;
            dep.dstPass = plan.order[rp.writers[k]];
            dep.dstStageMask = writeStage(rp.role);
            dep.dstAccessMask = attachmentAccess(rp.role);

            if (k == 0) {
                // Frame start: the previous frame's last use of this image
                // (attachment write, sampling, or presentation) must finish.
                dep.srcPass = kExternal;
                dep.srcStageMask = writeStage(rp.role);
                if (sampled) dep.srcStageMask |= VK_PIPELINE_STAGE_FRAGMENT_SHADER_BIT;
                dep.srcAccessMask = rp.backbuffer ? 0 : writeAccess(rp.role);
            } else {
                dep.srcPass = plan.order[rp.writers[k - 1]];
                dep.srcStageMask = writeStage(rp.role);
                dep.srcAccessMask = writeAccess(rp.role);
            }
            plan.dependencies.push_back(dep);
        }

        std::uint32_t lastWriter = plan.order[rp.writers.back()];
        for (auto r : rp.readers) {
            PassDependency dep;
            dep.resource = ri;
            dep.srcPass = lastWriter;
            dep.dstPass = plan.order[r];
            dep.srcStageMask = writeStage(rp.role);
            dep.srcAccessMask = writeAccess(rp.role);
            dep.dstStageMask = VK_PIPELINE_STAGE_FRAGMENT_SHADER_BIT;
            dep.dstAccessMask = VK_ACCESS_SHADER_READ_BIT;
            plan.dependencies.push_back(dep);
        }

        // Sampled outside the graph: hand the last write over to the
        // external reader.
        if (images[ri].desc().forceShaderRead && rp.readers.empty() && !rp.backbuffer) {
            PassDependency dep;
            dep.resource = ri;
            dep.srcPass = lastWriter;
            dep.dstPass = kExternal;
            dep.srcStageMask = writeStage(rp.role);
            dep.srcAccessMask = writeAccess(rp.role);
            dep.dstStageMask = VK_PIPELINE_STAGE_FRAGMENT_SHADER_BIT;
            dep.dstAccessMask = VK_ACCESS_SHADER_READ_BIT;
            plan.dependencies.push_back(dep);
        }

        if (rp.backbuffer) {
            PassDependency dep;
            dep.resource = ri;
            dep.srcPass = lastWriter;
            dep.dstPass = kExternal;
            dep.srcStageMask = VK_PIPELINE_STAGE_COLOR_ATTACHMENT_OUTPUT_BIT;
            dep.srcAccessMask = VK_ACCESS_COLOR_ATTACHMENT_WRITE_BIT;
            dep.dstStageMask = VK_PIPELINE_STAGE_BOTTOM_OF_PIPE_BIT;
            dep.dstAccessMask = 0;
            plan.dependencies.push_back(dep);
        }
    }

    for (const auto& e : desc.edges()) {
        if (e.producer.kind != NodeKind::Pass || e.consumer.kind != NodeKind::Pass) continue;

        PassDependency dep;
        dep.srcPass = e.producer.index;
        dep.dstPass = e.consumer.index;
        dep.srcStageMask = VK_PIPELINE_STAGE_ALL_GRAPHICS_BIT;
        dep.srcAccessMask = VK_ACCESS_MEMORY_WRITE_BIT;
        dep.dstStageMask = VK_PIPELINE_STAGE_ALL_GRAPHICS_BIT;
        dep.dstAccessMask = VK_ACCESS_MEMORY_READ_BIT | VK_ACCESS_MEMORY_WRITE_BIT;
        plan.dependencies.push_back(dep);
    }

    return plan;
}

std::vector<VkSubpassDependency> subpassDependencies(const GraphPlan& plan,
                                                     std::uint32_t passIndex) {
    VkSubpassDependency in{};
    in.srcSubpass = VK_SUBPASS_EXTERNAL;
    in.dstSubpass = 0;
    bool haveIn = false;

    VkSubpassDependency out{};
    out.srcSubpass = 0;
    out.dstSubpass = VK_SUBPASS_EXTERNAL;
    bool haveOut = false;

    for (const auto& dep : plan.dependencies) {
        if (dep.dstPass == passIndex) {
            in.srcStageMask |= dep.srcStageMask;
            in.srcAccessMask |= dep.srcAccessMask;
            in.dstStageMask |= dep.dstStageMask;
            in.dstAccessMask |= dep.dstAccessMask;
            haveIn = true;
        }
        if (dep.srcPass == passIndex) {
            out.srcStageMask |= dep.srcStageMask;
            out.srcAccessMask |= dep.srcAccessMask;
            out.dstStageMask |= dep.dstStageMask;
            out.dstAccessMask |= dep.dstAccessMask;
            haveOut = true;
        }
    }

    std::vector<VkSubpassDependency> deps;
    if (haveIn) deps.push_back(in);
    if (haveOut) deps.push_back(out);
    return deps;
}

bool shapeEquivalent(const GraphPlan& a, const GraphPlan& b) {
    if (a.surface.format != b.surface.format || a.order != b.order ||
        a.passes.size() != b.passes.size() || a.resources.size() != b.resources.size() ||
        a.dependencies != b.dependencies) {
        return false;
    }

    for (std::size_t i = 0; i < a.passes.size(); ++i) {
        const auto& pa = a.passes[i];
        const auto& pb = b.passes[i];
        if (pa.pass != pb.pass || pa.attachments != pb.attachments ||
            pa.colorRefs != pb.colorRefs || pa.resolveRefs != pb.resolveRefs ||
            pa.depthRef != pb.depthRef || pa.sampled != pb.sampled ||
            pa.backbufferAttachment != pb.backbufferAttachment) {
            return false;
        }
    }

    for (std::size_t i = 0; i < a.resources.size(); ++i) {
        const auto& ra = a.resources[i];
        const auto& rb = b.resources[i];
        if (ra.role != rb.role || ra.format != rb.format || ra.samples != rb.samples ||
            ra.usage != rb.usage || ra.aspect != rb.aspect || ra.transient != rb.transient ||
            ra.backbuffer != rb.backbuffer || ra.writers != rb.writers ||
            ra.readers != rb.readers) {
            return false;
        }
    }

    return true;
}

} // namespace vkgraph::graph
