#include <vkgraph/pipeline_cache.hpp>

#include <vulkan/vulkan.h>

#include <cstddef>
#include <cstdint>
#include <fstream>
#include <vector>

namespace vkgraph {

PipelineCache::~PipelineCache() { destroy(); }

PipelineCache::PipelineCache(PipelineCache&& o) noexcept : device_(o.device_), cache_(o.cache_) {
    o.device_ = VK_NULL_HANDLE;
    o.cache_ = VK_NULL_HANDLE;
}

PipelineCache& PipelineCache::operator=(PipelineCache&& o) noexcept {
    if (this != &o) {
        destroy();
        device_ = o.device_;
        cache_ = o.cache_;
        o.device_ = VK_NULL_HANDLE;
        o.cache_ = VK_NULL_HANDLE;
    }
    return *this;
}

void PipelineCache::destroy() {
    if (cache_ != VK_NULL_HANDLE) {
        vkDestroyPipelineCache(device_, cache_, nullptr);
        cache_ = VK_NULL_HANDLE;
    }
}

Result<PipelineCache> PipelineCache::create(VkDevice device) {
    VkPipelineCacheCreateInfo ci{};
    ci.sType = VK_STRUCTURE_TYPE_PIPELINE_CACHE_CREATE_INFO;

    PipelineCache pc;
    pc.device_ = device;

    VkResult vr = vkCreatePipelineCache(device, &ci, nullptr, &pc.cache_);
    if (vr != VK_SUCCESS) {
        return vulkanError("create pipeline cache", vr, "vkCreatePipelineCache failed");
    }

    return pc;
}

// The driver validates the header of the blob and ignores data written by an
// incompatible driver, so a stale file still yields a usable (empty) cache.
Result<PipelineCache> PipelineCache::load(VkDevice device, const std::filesystem::path& path) {
    std::vector<std::uint8_t> blob;

    std::ifstream file(path, std::ios::binary | std::ios::ate);
    if (file.is_open()) {
        auto size = static_cast<std::size_t>(file.tellg());
        if (size > 0) {
            blob.resize(size);
            file.seekg(0);
            file.read(reinterpret_cast<char*>(blob.data()), static_cast<std::streamsize>(size));
            if (!file.good()) blob.clear();
        }
    }

    VkPipelineCacheCreateInfo ci{};
    ci.sType = VK_STRUCTURE_TYPE_PIPELINE_CACHE_CREATE_INFO;
    ci.initialDataSize = blob.size();
    ci.pInitialData = blob.empty() ? nullptr : blob.data();

    PipelineCache pc;
    pc.device_ = device;

    VkResult vr = vkCreatePipelineCache(device, &ci, nullptr, &pc.cache_);
    if (vr != VK_SUCCESS) {
        return vulkanError("load pipeline cache", vr,
                           "vkCreatePipelineCache failed with cached data from: " +
                               path.string());
    }

    return pc;
}

Result<void> PipelineCache::save(const std::filesystem::path& path) const {
    if (cache_ == VK_NULL_HANDLE) {
        return Error{"save pipeline cache", 0, "cache was destroyed", ErrorCode::InvalidState};
    }

    std::size_t size = 0;
    VkResult vr = vkGetPipelineCacheData(device_, cache_, &size, nullptr);
    if (vr != VK_SUCCESS) {
        return vulkanError("save pipeline cache", vr, "vkGetPipelineCacheData (query size) failed");
    }

    std::vector<std::uint8_t> blob(size);
    vr = vkGetPipelineCacheData(device_, cache_, &size, blob.data());
    if (vr != VK_SUCCESS) {
        return vulkanError("save pipeline cache", vr,
                           "vkGetPipelineCacheData (retrieve data) failed");
    }

    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    if (!file.is_open()) {
        return Error{"save pipeline cache", 0, "could not open file for writing: " + path.string()};
    }

    file.write(reinterpret_cast<const char*>(blob.data()), static_cast<std::streamsize>(size));
    if (!file.good()) {
        return Error{"save pipeline cache", 0, "write failed: " + path.string()};
    }

    return {};
}

} // namespace vkgraph
