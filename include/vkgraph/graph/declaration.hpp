#pragma once

#include <vkgraph/error.hpp>
#include <vkgraph/presenter.hpp>
#include <vkgraph/result.hpp>
#include <vkgraph/sampler.hpp>

#include <vulkan/vulkan.h>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace vkgraph::graph {

// Prefix of the reserved backbuffer family. "backbuffer#0", "backbuffer#2",
// ... all name the graph's single backbuffer resource; once images are bound,
// "backbuffer#i" addresses image i.
inline constexpr std::string_view kBackbufferPrefix = "backbuffer#";

[[nodiscard]] bool isBackbufferName(std::string_view name);
[[nodiscard]] std::string backbufferName(std::uint32_t index);

// Index parsed from a backbuffer family name, nullopt for any other name.
[[nodiscard]] std::optional<std::uint32_t> backbufferIndex(std::string_view name);

[[nodiscard]] bool isDepthFormat(VkFormat format);
[[nodiscard]] bool hasStencilComponent(VkFormat format);

enum class SizeMode : std::uint8_t {
    Fixed,           // extent is used as declared
    SurfaceRelative, // surface extent * scale, recomputed on every build
};

// Image resource configuration. Only name and format are required (the
// backbuffer takes its format from the surface, so for it only the name is).
struct ImageDesc {
    std::string name;
    VkExtent2D extent{0, 0}; // required for SizeMode::Fixed
    VkFormat format = VK_FORMAT_UNDEFINED;
    // Zero by default; depth buffers usually want depthStencil = {1.0f, 0}.
    VkClearValue clearValue{};
    VkSampleCountFlagBits samples = VK_SAMPLE_COUNT_1_BIT;

    // Keep contents after the last writing pass even with no later reader.
    // Also makes the image usable as a transfer source.
    bool forceStore = false;
    // Leave the image in a shader-readable layout after its last write and
    // give it SAMPLED usage, even when no pass in the graph samples it.
    bool forceShaderRead = false;

    // Single-sample target that a multisampled color attachment written by the
    // same pass resolves into.
    bool resolve = false;

    SizeMode sizeMode = SizeMode::Fixed;
    float scale = 1.0f; // only read for SizeMode::SurfaceRelative
};

// A validated ImageDesc. The only way to get one is create(), so every
// resource the graph holds has passed validation.
class ImageResource {
public:
    // Fails with InvalidDescriptor.
    [[nodiscard]] static Result<ImageResource> create(ImageDesc desc);

    [[nodiscard]] const ImageDesc& desc() const { return desc_; }
    [[nodiscard]] const std::string& name() const { return desc_.name; }
    [[nodiscard]] bool isBackbuffer() const { return backbuffer_; }

private:
    ImageResource() = default;

    ImageDesc desc_;
    bool backbuffer_ = false;
};

// Edge by name, as handed to RenderGraph::create.
struct Edge {
    std::string producer;
    std::string consumer;
};

enum class NodeKind : std::uint8_t { Pass, Image };

struct NodeRef {
    NodeKind kind = NodeKind::Pass;
    std::uint32_t index = 0;

    bool operator==(const NodeRef&) const = default;
};

// Edge after name resolution. Pass -> image is a write, image -> pass a
// sampled read, pass -> pass an ordering constraint.
struct EdgeDecl {
    NodeRef producer;
    NodeRef consumer;

    bool operator==(const EdgeDecl&) const = default;
};

struct SamplerDecl {
    std::string name;
    SamplerDesc desc;
};

// Immutable-once-built description of a graph: named passes, named image
// resources and the edges between them. Shared unchanged by every build and
// rebuild of a RenderGraph.
//
// Thread safety: not thread-safe.
class GraphDesc {
public:
    GraphDesc();

    // Fails with DuplicateName or InvalidDescriptor.
    [[nodiscard]] Result<std::uint32_t> declarePass(std::string_view name);
    [[nodiscard]] Result<std::uint32_t> declareImage(ImageDesc desc);
    [[nodiscard]] Result<std::uint32_t> declareSampler(std::string_view name,
                                                       const SamplerDesc& desc);

    // Both ends must be declared, or name the backbuffer family (declared
    // implicitly on first use). Fails with UnknownNode or InvalidEdge.
    [[nodiscard]] Result<void> declareEdge(std::string_view producer, std::string_view consumer);

    [[nodiscard]] std::optional<std::uint32_t> findPass(std::string_view name) const;
    // Any backbuffer family name resolves to the backbuffer resource.
    [[nodiscard]] std::optional<std::uint32_t> findImage(std::string_view name) const;
    [[nodiscard]] std::optional<std::uint32_t> findSampler(std::string_view name) const;
    [[nodiscard]] std::optional<NodeRef> find(std::string_view name) const;

    [[nodiscard]] const std::vector<std::string>& passes() const { return passes_; }
    [[nodiscard]] const std::vector<ImageResource>& images() const { return images_; }
    [[nodiscard]] const std::vector<EdgeDecl>& edges() const { return edges_; }
    [[nodiscard]] const std::vector<SamplerDecl>& samplers() const { return samplers_; }

    [[nodiscard]] std::optional<std::uint32_t> backbuffer() const { return backbuffer_; }

private:
    [[nodiscard]] bool nameTaken(std::string_view name) const;
    [[nodiscard]] Result<NodeRef> resolve(std::string_view name, const char* side);

    std::vector<std::string> passes_;
    std::vector<ImageResource> images_;
    std::vector<EdgeDecl> edges_;
    std::vector<SamplerDecl> samplers_; // [0] is always "default"
    std::optional<std::uint32_t> backbuffer_;
};

} // namespace vkgraph::graph
