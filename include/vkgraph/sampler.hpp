#pragma once

#include <vkgraph/error.hpp>
#include <vkgraph/result.hpp>

#include <vulkan/vulkan.h>

namespace vkgraph {

// Sampler configuration. Defaults match the graph's "default" sampler:
// linear filtering, clamp-to-edge on every axis, LOD range [0, 1].
struct SamplerDesc {
    VkFilter             magFilter    = VK_FILTER_LINEAR;
    VkFilter             minFilter    = VK_FILTER_LINEAR;
    VkSamplerMipmapMode  mipmapMode   = VK_SAMPLER_MIPMAP_MODE_LINEAR;
    VkSamplerAddressMode addressModeU = VK_SAMPLER_ADDRESS_MODE_CLAMP_TO_EDGE;
    VkSamplerAddressMode addressModeV = VK_SAMPLER_ADDRESS_MODE_CLAMP_TO_EDGE;
    VkSamplerAddressMode addressModeW = VK_SAMPLER_ADDRESS_MODE_CLAMP_TO_EDGE;
    VkBorderColor        borderColor  = VK_BORDER_COLOR_FLOAT_OPAQUE_BLACK;
    float                minLod       = 0.0f;
    float                maxLod       = 1.0f; // VK_LOD_CLAMP_NONE for the full chain
    bool                 anisotropy   = false;
    float                maxAnisotropy = 1.0f; // only read when anisotropy is set
    bool                 compare      = false;
    VkCompareOp          compareOp    = VK_COMPARE_OP_LESS_OR_EQUAL;

    bool operator==(const SamplerDesc&) const = default;
};

// Checks the fields Vulkan would reject. Fails with InvalidDescriptor.
[[nodiscard]] Result<void> validateSamplerDesc(const SamplerDesc& desc);

// Thread safety: immutable after construction.
class Sampler {
public:
    [[nodiscard]] static Result<Sampler> create(VkDevice device, const SamplerDesc& desc);

    ~Sampler();
    Sampler(Sampler&&) noexcept;
    Sampler& operator=(Sampler&&) noexcept;
    Sampler(const Sampler&) = delete;
    Sampler& operator=(const Sampler&) = delete;

    [[nodiscard]] VkSampler native()    const { return sampler_; }
    [[nodiscard]] VkSampler vkSampler() const { return native(); }

private:
    Sampler() = default;

    VkDevice  device_  = VK_NULL_HANDLE;
    VkSampler sampler_ = VK_NULL_HANDLE;
};

} // namespace vkgraph
