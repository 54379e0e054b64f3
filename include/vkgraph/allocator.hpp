#pragma once

#include <vkgraph/error.hpp>
#include <vkgraph/result.hpp>

#include <vulkan/vulkan.h>

#include <cstdint>

// Forward-declare VMA handle to avoid pulling vk_mem_alloc.h into user code.
struct VmaAllocator_T;
using VmaAllocator = VmaAllocator_T*;

namespace vkgraph {

struct AllocatorDesc {
    VkInstance instance = VK_NULL_HANDLE;             // required
    VkPhysicalDevice physicalDevice = VK_NULL_HANDLE; // required
    VkDevice device = VK_NULL_HANDLE;                 // required
    std::uint32_t vulkanApiVersion = VK_API_VERSION_1_1;
};

// RAII wrapper for a VmaAllocator. The device layer usually owns one already;
// this is for hosts (tools, tests) that bring up a device themselves.
// Destroy only after every graph allocated from it is gone.
class Allocator {
public:
    [[nodiscard]] static Result<Allocator> create(const AllocatorDesc& desc);

    ~Allocator();
    Allocator(Allocator&&) noexcept;
    Allocator& operator=(Allocator&&) noexcept;
    Allocator(const Allocator&) = delete;
    Allocator& operator=(const Allocator&) = delete;

    [[nodiscard]] VmaAllocator vmaAllocator() const { return allocator_; }

    // Live VMA allocations across all heaps.
    [[nodiscard]] std::uint32_t allocationCount() const;

    // Bytes held by live allocations across all heaps.
    [[nodiscard]] std::uint64_t allocationBytes() const;

private:
    Allocator() = default;

    VmaAllocator allocator_ = nullptr;
};

} // namespace vkgraph
