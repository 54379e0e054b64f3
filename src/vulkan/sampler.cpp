#include <vkgraph/sampler.hpp>

namespace vkgraph {

Sampler::~Sampler() {
    if (sampler_ != VK_NULL_HANDLE) {
        vkDestroySampler(device_, sampler_, nullptr);
    }
}

Sampler::Sampler(Sampler&& o) noexcept
    : device_(o.device_), sampler_(o.sampler_) {
    o.device_  = VK_NULL_HANDLE;
    o.sampler_ = VK_NULL_HANDLE;
}

Sampler& Sampler::operator=(Sampler&& o) noexcept {
    if (this != &o) {
        if (sampler_ != VK_NULL_HANDLE) {
            vkDestroySampler(device_, sampler_, nullptr);
        }
        device_  = o.device_;
        sampler_ = o.sampler_;
        o.device_  = VK_NULL_HANDLE;
        o.sampler_ = VK_NULL_HANDLE;
    }
    return *this;
}

Result<void> validateSamplerDesc(const SamplerDesc& desc) {
    if (desc.minLod < 0.0f) {
        return Error{"validate sampler", 0, "minLod must not be negative",
                     ErrorCode::InvalidDescriptor};
    }
    if (desc.maxLod < desc.minLod) {
        return Error{"validate sampler", 0, "maxLod must not be below minLod",
                     ErrorCode::InvalidDescriptor};
    }
    if (desc.anisotropy && desc.maxAnisotropy < 1.0f) {
        return Error{"validate sampler", 0, "maxAnisotropy must be at least 1",
                     ErrorCode::InvalidDescriptor};
    }
    return {};
}

Result<Sampler> Sampler::create(VkDevice device, const SamplerDesc& desc) {
    auto valid = validateSamplerDesc(desc);
    if (!valid.ok()) return valid.error();

    VkSamplerCreateInfo ci{};
    ci.sType         = VK_STRUCTURE_TYPE_SAMPLER_CREATE_INFO;
    ci.magFilter     = desc.magFilter;
    ci.minFilter     = desc.minFilter;
    ci.mipmapMode    = desc.mipmapMode;
    ci.addressModeU  = desc.addressModeU;
    ci.addressModeV  = desc.addressModeV;
    ci.addressModeW  = desc.addressModeW;
    ci.borderColor   = desc.borderColor;
    ci.minLod        = desc.minLod;
    ci.maxLod        = desc.maxLod;
    ci.maxAnisotropy = 1.0f;

    if (desc.anisotropy) {
        ci.anisotropyEnable = VK_TRUE;
        ci.maxAnisotropy    = desc.maxAnisotropy;
    }
    if (desc.compare) {
        ci.compareEnable = VK_TRUE;
        ci.compareOp     = desc.compareOp;
    }

    Sampler s;
    s.device_ = device;

    VkResult vr = vkCreateSampler(device, &ci, nullptr, &s.sampler_);
    if (vr != VK_SUCCESS) {
        return vulkanError("create sampler", vr, "vkCreateSampler failed");
    }

    return s;
}

} // namespace vkgraph
