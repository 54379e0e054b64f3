#pragma once

#include <vkgraph/error.hpp>
#include <vkgraph/graph/declaration.hpp>
#include <vkgraph/presenter.hpp>
#include <vkgraph/result.hpp>

#include <vulkan/vulkan.h>

#include <cstdint>
#include <string>
#include <vector>

namespace vkgraph::graph {

// Dependency endpoint outside the graph: previous frames on the way in,
// presentation on the way out.
inline constexpr std::uint32_t kExternal = UINT32_MAX;

enum class AttachmentRole : std::uint8_t {
    Color,
    DepthStencil,
    Resolve,
};

[[nodiscard]] const char* roleName(AttachmentRole role);

// One attachment of a pass's render pass, in framebuffer order.
struct AttachmentPlan {
    std::uint32_t resource = 0; // index into GraphDesc::images()
    AttachmentRole role = AttachmentRole::Color;
    VkFormat format = VK_FORMAT_UNDEFINED;
    VkSampleCountFlagBits samples = VK_SAMPLE_COUNT_1_BIT;
    VkAttachmentLoadOp loadOp = VK_ATTACHMENT_LOAD_OP_DONT_CARE;
    VkAttachmentStoreOp storeOp = VK_ATTACHMENT_STORE_OP_DONT_CARE;
    VkAttachmentLoadOp stencilLoadOp = VK_ATTACHMENT_LOAD_OP_DONT_CARE;
    VkAttachmentStoreOp stencilStoreOp = VK_ATTACHMENT_STORE_OP_DONT_CARE;
    VkImageLayout initialLayout = VK_IMAGE_LAYOUT_UNDEFINED;
    VkImageLayout layout = VK_IMAGE_LAYOUT_UNDEFINED; // inside the subpass
    VkImageLayout finalLayout = VK_IMAGE_LAYOUT_UNDEFINED;

    bool operator==(const AttachmentPlan&) const = default;
};

// A resource the pass samples. Its producer left it in `layout`.
struct SampledInput {
    std::uint32_t resource = 0;
    VkImageLayout layout = VK_IMAGE_LAYOUT_SHADER_READ_ONLY_OPTIMAL;

    bool operator==(const SampledInput&) const = default;
};

// Execution + memory dependency between two passes (declaration indices), or
// between a pass and kExternal.
struct PassDependency {
    std::uint32_t srcPass = kExternal;
    std::uint32_t dstPass = kExternal;
    std::uint32_t resource = kExternal; // kExternal for pass -> pass ordering edges
    VkPipelineStageFlags srcStageMask = 0;
    VkPipelineStageFlags dstStageMask = 0;
    VkAccessFlags srcAccessMask = 0;
    VkAccessFlags dstAccessMask = 0;

    bool operator==(const PassDependency&) const = default;
};

struct PassPlan {
    std::uint32_t pass = 0; // index into GraphDesc::passes()
    std::vector<AttachmentPlan> attachments;

    // Subpass references, as indices into attachments. resolveRefs is empty
    // or parallel to colorRefs (VK_ATTACHMENT_UNUSED where a color has no
    // resolve target).
    std::vector<std::uint32_t> colorRefs;
    std::vector<std::uint32_t> resolveRefs;
    std::uint32_t depthRef = VK_ATTACHMENT_UNUSED;

    std::vector<SampledInput> sampled;

    std::uint32_t backbufferAttachment = VK_ATTACHMENT_UNUSED;
    VkExtent2D extent{0, 0}; // render area: smallest attachment extent

    [[nodiscard]] bool touchesBackbuffer() const {
        return backbufferAttachment != VK_ATTACHMENT_UNUSED;
    }
};

struct ResourcePlan {
    AttachmentRole role = AttachmentRole::Color;
    VkFormat format = VK_FORMAT_UNDEFINED;
    VkSampleCountFlagBits samples = VK_SAMPLE_COUNT_1_BIT;
    VkImageUsageFlags usage = 0;
    VkImageAspectFlags aspect = 0;
    VkExtent2D extent{0, 0};
    bool transient = false;  // contents never outlive the pass that writes them
    bool backbuffer = false; // bound from the presenter, never allocated

    // Positions in GraphPlan::order, ascending.
    std::vector<std::uint32_t> writers;
    std::vector<std::uint32_t> readers;
};

// Everything the compiler derives from a declaration before touching the GPU.
struct GraphPlan {
    SurfaceInfo surface;

    std::vector<std::uint32_t> order;    // pass indices in execution order
    std::vector<std::uint32_t> position; // pass index -> position in order
    std::vector<PassPlan> passes;        // execution order
    std::vector<ResourcePlan> resources; // GraphDesc::images() order
    std::vector<PassDependency> dependencies;
    std::vector<std::string> warnings;

    [[nodiscard]] const PassPlan& passPlan(std::uint32_t passIndex) const {
        return passes[position[passIndex]];
    }
};

// Validates and compiles a declaration against a surface.
// Fails with Cycle, MissingProducer or InvalidAttachment. Deterministic: the
// same declaration and surface always give the same plan.
[[nodiscard]] Result<GraphPlan> planGraph(const GraphDesc& desc, const SurfaceInfo& surface);

// The dependencies touching one pass, merged into at most two subpass
// dependencies for its render pass: EXTERNAL -> 0 and 0 -> EXTERNAL.
[[nodiscard]] std::vector<VkSubpassDependency> subpassDependencies(const GraphPlan& plan,
                                                                   std::uint32_t passIndex);

// Same passes, attachments, ops, layouts, usages and dependencies.
// Extents are ignored, so plans for different surface sizes can match.
[[nodiscard]] bool shapeEquivalent(const GraphPlan& a, const GraphPlan& b);

} // namespace vkgraph::graph
