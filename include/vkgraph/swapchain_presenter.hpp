#pragma once

#include <vkgraph/error.hpp>
#include <vkgraph/presenter.hpp>
#include <vkgraph/result.hpp>

#include <vulkan/vulkan.h>

#include <cstdint>
#include <vector>

namespace vkgraph {

enum class PresentMode {
    Fifo,          // vsync, always available
    Mailbox,       // triple-buffered vsync, preferred if available
    Immediate,     // no vsync
    MailboxOrFifo, // try mailbox, fall back to fifo (default)
};

// Swapchain configuration. The surface and the queues come from the device
// layer and are not owned.
struct SwapchainDesc {
    VkPhysicalDevice physicalDevice = VK_NULL_HANDLE; // required
    VkDevice device = VK_NULL_HANDLE;                 // required
    VkSurfaceKHR surface = VK_NULL_HANDLE;            // required
    VkQueue presentQueue = VK_NULL_HANDLE;            // required
    std::uint32_t graphicsFamily = 0;
    std::uint32_t presentFamily = 0;

    VkExtent2D extent{0, 0}; // drawable size; ignored when the surface dictates one
    bool preferSrgb = true;
    PresentMode presentMode = PresentMode::MailboxOrFifo;
    std::uint32_t imageCount = 0; // 0 = min + 1
};

// Presenter over a VkSwapchainKHR. Owns the swapchain; the graph creates its
// own views of the images.
//
// Thread safety: thread-confined (render loop thread).
class SwapchainPresenter final : public Presenter {
public:
    [[nodiscard]] static Result<SwapchainPresenter> create(const SwapchainDesc& desc);

    ~SwapchainPresenter() override;
    SwapchainPresenter(SwapchainPresenter&&) noexcept;
    SwapchainPresenter& operator=(SwapchainPresenter&&) noexcept;
    SwapchainPresenter(const SwapchainPresenter&) = delete;
    SwapchainPresenter& operator=(const SwapchainPresenter&) = delete;

    // Suboptimal counts as success; out-of-date is SurfaceOutOfDate.
    [[nodiscard]] Result<std::uint32_t> acquireImage(VkSemaphore imageAvailable) override;

    // Suboptimal and out-of-date are both SurfaceOutOfDate.
    [[nodiscard]] Result<void> presentImage(std::uint32_t imageIndex,
                                            VkSemaphore renderFinished) override;

    // Call after the device is idle. A zero extent (or one the surface clamps
    // to zero) leaves the swapchain as is.
    [[nodiscard]] Result<void> recreate(VkExtent2D extent) override;

    [[nodiscard]] SurfaceInfo surface() const override { return {format_, extent_}; }
    [[nodiscard]] std::vector<VkImage> images() const override { return images_; }

    [[nodiscard]] VkSwapchainKHR native() const { return swapchain_; }
    [[nodiscard]] VkSwapchainKHR vkSwapchain() const { return native(); }
    [[nodiscard]] std::uint32_t imageCount() const {
        return static_cast<std::uint32_t>(images_.size());
    }

private:
    SwapchainPresenter() = default;

    void destroy();
    [[nodiscard]] Result<void> createSwapchain(VkExtent2D extent);

    VkDevice device_ = VK_NULL_HANDLE;
    VkPhysicalDevice gpu_ = VK_NULL_HANDLE;
    VkSurfaceKHR surface_ = VK_NULL_HANDLE;
    VkQueue presentQueue_ = VK_NULL_HANDLE;
    VkSwapchainKHR swapchain_ = VK_NULL_HANDLE;
    VkFormat format_ = VK_FORMAT_UNDEFINED;
    VkColorSpaceKHR colorSpace_ = VK_COLOR_SPACE_SRGB_NONLINEAR_KHR;
    VkExtent2D extent_ = {0, 0};
    VkPresentModeKHR presentMode_ = VK_PRESENT_MODE_FIFO_KHR;
    std::uint32_t imageCountRequested_ = 0;
    std::uint32_t graphicsFamily_ = 0;
    std::uint32_t presentFamily_ = 0;
    std::vector<VkImage> images_;
};

} // namespace vkgraph
