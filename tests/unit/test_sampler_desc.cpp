#include <vkgraph/sampler.hpp>

#include <cassert>
#include <cstdio>

int main() {
    std::printf("sampler desc test\n");

    // Defaults: linear, clamp-to-edge, LOD [0, 1]
    {
        vkgraph::SamplerDesc d;
        assert(d.magFilter == VK_FILTER_LINEAR);
        assert(d.minFilter == VK_FILTER_LINEAR);
        assert(d.mipmapMode == VK_SAMPLER_MIPMAP_MODE_LINEAR);
        assert(d.addressModeU == VK_SAMPLER_ADDRESS_MODE_CLAMP_TO_EDGE);
        assert(d.addressModeV == VK_SAMPLER_ADDRESS_MODE_CLAMP_TO_EDGE);
        assert(d.addressModeW == VK_SAMPLER_ADDRESS_MODE_CLAMP_TO_EDGE);
        assert(d.minLod == 0.0f);
        assert(d.maxLod == 1.0f);
        assert(!d.anisotropy);
        assert(!d.compare);
        assert(vkgraph::validateSamplerDesc(d).ok());
        std::printf("  defaults: ok\n");
    }

    // LOD range
    {
        vkgraph::SamplerDesc d;
        d.minLod = -1.0f;
        assert(vkgraph::validateSamplerDesc(d).failedWith(vkgraph::ErrorCode::InvalidDescriptor));

        d.minLod = 2.0f;
        d.maxLod = 1.0f;
        assert(vkgraph::validateSamplerDesc(d).failedWith(vkgraph::ErrorCode::InvalidDescriptor));

        d.maxLod = VK_LOD_CLAMP_NONE;
        assert(vkgraph::validateSamplerDesc(d).ok());
        std::printf("  lod range: ok\n");
    }

    // Anisotropy is only checked when enabled
    {
        vkgraph::SamplerDesc d;
        d.maxAnisotropy = 0.0f;
        assert(vkgraph::validateSamplerDesc(d).ok());
        d.anisotropy = true;
        assert(vkgraph::validateSamplerDesc(d).failedWith(vkgraph::ErrorCode::InvalidDescriptor));
        d.maxAnisotropy = 16.0f;
        assert(vkgraph::validateSamplerDesc(d).ok());
        std::printf("  anisotropy: ok\n");
    }

    // Equality
    {
        vkgraph::SamplerDesc a;
        vkgraph::SamplerDesc b;
        assert(a == b);
        b.compare = true;
        assert(!(a == b));
    }

    std::printf("sampler desc test passed\n");
    return 0;
}
