#include <vkgraph/debug.hpp>

#include <string>

namespace vkgraph {

namespace {

// 64-bit builds only: every handle type is a pointer there.
template <typename Handle>
std::uint64_t handleBits(Handle h) {
    return static_cast<std::uint64_t>(reinterpret_cast<std::uintptr_t>(h));
}

} // namespace

void debugName(VkDevice device, VkObjectType type, std::uint64_t handle,
               std::string_view name) {
    if (device == VK_NULL_HANDLE || handle == 0) return;

    auto pfn = reinterpret_cast<PFN_vkSetDebugUtilsObjectNameEXT>(
        vkGetDeviceProcAddr(device, "vkSetDebugUtilsObjectNameEXT"));
    if (!pfn) return;

    std::string nameStr(name);

    VkDebugUtilsObjectNameInfoEXT info{};
    info.sType        = VK_STRUCTURE_TYPE_DEBUG_UTILS_OBJECT_NAME_INFO_EXT;
    info.objectType   = type;
    info.objectHandle = handle;
    info.pObjectName  = nameStr.c_str();

    pfn(device, &info);
}

void debugName(VkDevice device, VkImage image, std::string_view name) {
    debugName(device, VK_OBJECT_TYPE_IMAGE, handleBits(image), name);
}

void debugName(VkDevice device, VkImageView view, std::string_view name) {
    debugName(device, VK_OBJECT_TYPE_IMAGE_VIEW, handleBits(view), name);
}

void debugName(VkDevice device, VkSampler sampler, std::string_view name) {
    debugName(device, VK_OBJECT_TYPE_SAMPLER, handleBits(sampler), name);
}

void debugName(VkDevice device, VkRenderPass renderPass, std::string_view name) {
    debugName(device, VK_OBJECT_TYPE_RENDER_PASS, handleBits(renderPass), name);
}

void debugName(VkDevice device, VkFramebuffer framebuffer, std::string_view name) {
    debugName(device, VK_OBJECT_TYPE_FRAMEBUFFER, handleBits(framebuffer), name);
}

void debugName(VkDevice device, VkCommandBuffer cmd, std::string_view name) {
    debugName(device, VK_OBJECT_TYPE_COMMAND_BUFFER, handleBits(cmd), name);
}

void debugName(VkDevice device, VkSemaphore semaphore, std::string_view name) {
    debugName(device, VK_OBJECT_TYPE_SEMAPHORE, handleBits(semaphore), name);
}

void debugName(VkDevice device, VkFence fence, std::string_view name) {
    debugName(device, VK_OBJECT_TYPE_FENCE, handleBits(fence), name);
}

} // namespace vkgraph
