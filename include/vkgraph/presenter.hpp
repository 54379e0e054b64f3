#pragma once

#include <vkgraph/error.hpp>
#include <vkgraph/result.hpp>

#include <vulkan/vulkan.h>

#include <cstdint>
#include <vector>

namespace vkgraph {

// What a render graph needs to know about the output surface: the format of
// the backbuffer images and the extent surface-relative resources follow.
struct SurfaceInfo {
    VkFormat format = VK_FORMAT_UNDEFINED;
    VkExtent2D extent{0, 0};
};

[[nodiscard]] inline bool sameExtent(VkExtent2D a, VkExtent2D b) {
    return a.width == b.width && a.height == b.height;
}

[[nodiscard]] inline bool isZeroExtent(VkExtent2D e) {
    return e.width == 0 || e.height == 0;
}

// The presentation layer. It owns the backbuffer images and their count;
// the graph only binds them. Implementations report a surface that no longer
// matches (out-of-date, or suboptimal at present time) as
// ErrorCode::SurfaceOutOfDate so the frame executor can rebuild.
//
// Thread safety: thread-confined (render loop thread).
class Presenter {
public:
    virtual ~Presenter() = default;

    // Acquire the next backbuffer image. imageAvailable is signaled when the
    // image is ready to be rendered to.
    [[nodiscard]] virtual Result<std::uint32_t> acquireImage(VkSemaphore imageAvailable) = 0;

    // Queue the image for presentation once renderFinished is signaled.
    [[nodiscard]] virtual Result<void> presentImage(std::uint32_t imageIndex,
                                                    VkSemaphore renderFinished) = 0;

    // Recreate the backbuffer images for a new drawable extent. The caller
    // guarantees the device is idle. The resulting extent may be clamped.
    [[nodiscard]] virtual Result<void> recreate(VkExtent2D extent) = 0;

    [[nodiscard]] virtual SurfaceInfo surface() const = 0;
    [[nodiscard]] virtual std::vector<VkImage> images() const = 0;
};

} // namespace vkgraph
