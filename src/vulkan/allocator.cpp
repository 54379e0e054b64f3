#include <vkgraph/allocator.hpp>

#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wmissing-field-initializers"
#pragma GCC diagnostic ignored "-Wunused-parameter"
#pragma GCC diagnostic ignored "-Wunused-variable"
#define VMA_IMPLEMENTATION
#include <vk_mem_alloc.h>
#pragma GCC diagnostic pop

#include <cstdint>

namespace vkgraph {

Allocator::~Allocator() {
    if (allocator_ != nullptr) {
        vmaDestroyAllocator(allocator_);
    }
}

Allocator::Allocator(Allocator&& o) noexcept : allocator_(o.allocator_) {
    o.allocator_ = nullptr;
}

Allocator& Allocator::operator=(Allocator&& o) noexcept {
    if (this != &o) {
        if (allocator_ != nullptr) {
            vmaDestroyAllocator(allocator_);
        }
        allocator_   = o.allocator_;
        o.allocator_ = nullptr;
    }
    return *this;
}

Result<Allocator> Allocator::create(const AllocatorDesc& desc) {
    if (desc.instance == VK_NULL_HANDLE || desc.physicalDevice == VK_NULL_HANDLE ||
        desc.device == VK_NULL_HANDLE) {
        return Error{"create allocator", 0,
                     "instance, physicalDevice and device are required",
                     ErrorCode::InvalidDescriptor};
    }

    VmaAllocatorCreateInfo ci{};
    ci.instance         = desc.instance;
    ci.physicalDevice   = desc.physicalDevice;
    ci.device           = desc.device;
    ci.vulkanApiVersion = desc.vulkanApiVersion;

    Allocator a;
    VkResult vr = vmaCreateAllocator(&ci, &a.allocator_);
    if (vr != VK_SUCCESS) {
        return vulkanError("create allocator", vr, "vmaCreateAllocator failed");
    }

    return a;
}

std::uint32_t Allocator::allocationCount() const {
    if (allocator_ == nullptr) return 0;

    VmaTotalStatistics stats{};
    vmaCalculateStatistics(allocator_, &stats);
    return stats.total.statistics.allocationCount;
}

std::uint64_t Allocator::allocationBytes() const {
    if (allocator_ == nullptr) return 0;

    VmaTotalStatistics stats{};
    vmaCalculateStatistics(allocator_, &stats);
    return stats.total.statistics.allocationBytes;
}

} // namespace vkgraph
