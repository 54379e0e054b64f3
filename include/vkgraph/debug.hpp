#pragma once

#include <vulkan/vulkan.h>

#include <cstdint>
#include <string_view>

namespace vkgraph {

// Tag Vulkan objects with debug names visible in validation layers and
// GPU debuggers (RenderDoc, Nsight). No-op when VK_EXT_debug_utils is
// not enabled on the device.
void debugName(VkDevice device, VkObjectType type, std::uint64_t handle, std::string_view name);

void debugName(VkDevice device, VkImage image, std::string_view name);
void debugName(VkDevice device, VkImageView view, std::string_view name);
void debugName(VkDevice device, VkSampler sampler, std::string_view name);
void debugName(VkDevice device, VkRenderPass renderPass, std::string_view name);
void debugName(VkDevice device, VkFramebuffer framebuffer, std::string_view name);
void debugName(VkDevice device, VkCommandBuffer cmd, std::string_view name);
void debugName(VkDevice device, VkSemaphore semaphore, std::string_view name);
void debugName(VkDevice device, VkFence fence, std::string_view name);

} // namespace vkgraph
