#include <vkgraph/swapchain_presenter.hpp>

#include <algorithm>
#include <cstdint>
#include <string>
#include <vector>

namespace vkgraph {

SwapchainPresenter::~SwapchainPresenter() {
    destroy();
}

SwapchainPresenter::SwapchainPresenter(SwapchainPresenter&& o) noexcept
    : device_(o.device_), gpu_(o.gpu_), surface_(o.surface_), presentQueue_(o.presentQueue_),
      swapchain_(o.swapchain_), format_(o.format_), colorSpace_(o.colorSpace_),
      extent_(o.extent_), presentMode_(o.presentMode_),
      imageCountRequested_(o.imageCountRequested_), graphicsFamily_(o.graphicsFamily_),
      presentFamily_(o.presentFamily_), images_(std::move(o.images_)) {
    o.swapchain_ = VK_NULL_HANDLE;
    o.device_ = VK_NULL_HANDLE;
}

SwapchainPresenter& SwapchainPresenter::operator=(SwapchainPresenter&& o) noexcept {
    if (this != &o) {
        destroy();
        device_ = o.device_;
        gpu_ = o.gpu_;
        surface_ = o.surface_;
        presentQueue_ = o.presentQueue_;
        swapchain_ = o.swapchain_;
        format_ = o.format_;
        colorSpace_ = o.colorSpace_;
        extent_ = o.extent_;
        presentMode_ = o.presentMode_;
        imageCountRequested_ = o.imageCountRequested_;
        graphicsFamily_ = o.graphicsFamily_;
        presentFamily_ = o.presentFamily_;
        images_ = std::move(o.images_);
        o.swapchain_ = VK_NULL_HANDLE;
        o.device_ = VK_NULL_HANDLE;
    }
    return *this;
}

void SwapchainPresenter::destroy() {
    if (swapchain_ != VK_NULL_HANDLE) {
        vkDestroySwapchainKHR(device_, swapchain_, nullptr);
        swapchain_ = VK_NULL_HANDLE;
    }
    images_.clear();
}

Result<SwapchainPresenter> SwapchainPresenter::create(const SwapchainDesc& desc) {
    if (desc.physicalDevice == VK_NULL_HANDLE || desc.device == VK_NULL_HANDLE ||
        desc.surface == VK_NULL_HANDLE || desc.presentQueue == VK_NULL_HANDLE) {
        return Error{"create swapchain", 0,
                     "physicalDevice, device, surface and presentQueue are required",
                     ErrorCode::InvalidDescriptor};
    }

    VkSurfaceCapabilitiesKHR caps;
    VkResult vr = vkGetPhysicalDeviceSurfaceCapabilitiesKHR(desc.physicalDevice, desc.surface,
                                                            &caps);
    if (vr != VK_SUCCESS) {
        return vulkanError("create swapchain", vr,
                           "vkGetPhysicalDeviceSurfaceCapabilitiesKHR failed");
    }

    std::uint32_t formatCount = 0;
    vkGetPhysicalDeviceSurfaceFormatsKHR(desc.physicalDevice, desc.surface, &formatCount,
                                         nullptr);
    if (formatCount == 0) {
        return Error{"create swapchain", 0, "No surface formats available",
                     ErrorCode::InvalidState};
    }
    std::vector<VkSurfaceFormatKHR> formats(formatCount);
    vkGetPhysicalDeviceSurfaceFormatsKHR(desc.physicalDevice, desc.surface, &formatCount,
                                         formats.data());

    VkSurfaceFormatKHR chosen = formats[0];
    if (desc.preferSrgb) {
        for (auto& f : formats) {
            if (f.format == VK_FORMAT_B8G8R8A8_SRGB &&
                f.colorSpace == VK_COLOR_SPACE_SRGB_NONLINEAR_KHR) {
                chosen = f;
                break;
            }
        }
    }

    std::uint32_t modeCount = 0;
    vkGetPhysicalDeviceSurfacePresentModesKHR(desc.physicalDevice, desc.surface, &modeCount,
                                              nullptr);
    std::vector<VkPresentModeKHR> modes(modeCount);
    vkGetPhysicalDeviceSurfacePresentModesKHR(desc.physicalDevice, desc.surface, &modeCount,
                                              modes.data());

    VkPresentModeKHR vkMode = VK_PRESENT_MODE_FIFO_KHR; // always available
    auto hasMode = [&](VkPresentModeKHR m) {
        return std::find(modes.begin(), modes.end(), m) != modes.end();
    };

    switch (desc.presentMode) {
    case PresentMode::Fifo:
        vkMode = VK_PRESENT_MODE_FIFO_KHR;
        break;
    case PresentMode::Mailbox:
    case PresentMode::MailboxOrFifo:
        if (hasMode(VK_PRESENT_MODE_MAILBOX_KHR))
            vkMode = VK_PRESENT_MODE_MAILBOX_KHR;
        break;
    case PresentMode::Immediate:
        if (hasMode(VK_PRESENT_MODE_IMMEDIATE_KHR))
            vkMode = VK_PRESENT_MODE_IMMEDIATE_KHR;
        break;
    }

    std::uint32_t imgCount = desc.imageCount;
    if (imgCount == 0) {
        imgCount = caps.minImageCount + 1;
    }
    if (caps.maxImageCount > 0 && imgCount > caps.maxImageCount) {
        imgCount = caps.maxImageCount;
    }

    SwapchainPresenter sc;
    sc.device_ = desc.device;
    sc.gpu_ = desc.physicalDevice;
    sc.surface_ = desc.surface;
    sc.presentQueue_ = desc.presentQueue;
    sc.format_ = chosen.format;
    sc.colorSpace_ = chosen.colorSpace;
    sc.presentMode_ = vkMode;
    sc.imageCountRequested_ = imgCount;
    sc.graphicsFamily_ = desc.graphicsFamily;
    sc.presentFamily_ = desc.presentFamily;

    auto created = sc.createSwapchain(desc.extent);
    if (!created.ok()) return created.error();
    if (sc.swapchain_ == VK_NULL_HANDLE) {
        return Error{"create swapchain", 0, "surface has no drawable area",
                     ErrorCode::InvalidDescriptor};
    }

    return sc;
}

Result<void> SwapchainPresenter::createSwapchain(VkExtent2D requested) {
    VkSurfaceCapabilitiesKHR caps;
    VkResult vr = vkGetPhysicalDeviceSurfaceCapabilitiesKHR(gpu_, surface_, &caps);
    if (vr != VK_SUCCESS) {
        return vulkanError("create swapchain", vr,
                           "vkGetPhysicalDeviceSurfaceCapabilitiesKHR failed");
    }

    VkExtent2D extent;
    if (caps.currentExtent.width != UINT32_MAX) {
        extent = caps.currentExtent;
    } else {
        extent.width = std::clamp(requested.width, caps.minImageExtent.width,
                                  caps.maxImageExtent.width);
        extent.height = std::clamp(requested.height, caps.minImageExtent.height,
                                   caps.maxImageExtent.height);
    }

    if (isZeroExtent(extent)) {
        // Minimized. Keep the swapchain but report no drawable area.
        extent_ = {0, 0};
        return {};
    }

    VkSwapchainKHR oldSwapchain = swapchain_;

    VkSwapchainCreateInfoKHR ci{};
    ci.sType = VK_STRUCTURE_TYPE_SWAPCHAIN_CREATE_INFO_KHR;
    ci.surface = surface_;
    ci.minImageCount = imageCountRequested_;
    ci.imageFormat = format_;
    ci.imageColorSpace = colorSpace_;
    ci.imageExtent = extent;
    ci.imageArrayLayers = 1;
    ci.imageUsage = VK_IMAGE_USAGE_COLOR_ATTACHMENT_BIT | VK_IMAGE_USAGE_TRANSFER_DST_BIT;
    ci.preTransform = caps.currentTransform;
    ci.compositeAlpha = VK_COMPOSITE_ALPHA_OPAQUE_BIT_KHR;
    ci.presentMode = presentMode_;
    ci.clipped = VK_TRUE;
    ci.oldSwapchain = oldSwapchain;

    std::uint32_t familyIndices[] = {graphicsFamily_, presentFamily_};
    if (graphicsFamily_ == presentFamily_) {
        ci.imageSharingMode = VK_SHARING_MODE_EXCLUSIVE;
    } else {
        ci.imageSharingMode = VK_SHARING_MODE_CONCURRENT;
        ci.queueFamilyIndexCount = 2;
        ci.pQueueFamilyIndices = familyIndices;
    }

    VkSwapchainKHR newSwapchain = VK_NULL_HANDLE;
    vr = vkCreateSwapchainKHR(device_, &ci, nullptr, &newSwapchain);
    if (vr != VK_SUCCESS) {
        // The old swapchain stays usable.
        return vulkanError("create swapchain", vr, "vkCreateSwapchainKHR failed");
    }

    swapchain_ = newSwapchain;
    extent_ = extent;
    if (oldSwapchain != VK_NULL_HANDLE) {
        vkDestroySwapchainKHR(device_, oldSwapchain, nullptr);
    }

    std::uint32_t count = 0;
    vr = vkGetSwapchainImagesKHR(device_, swapchain_, &count, nullptr);
    if (vr != VK_SUCCESS) {
        return vulkanError("create swapchain", vr, "vkGetSwapchainImagesKHR failed");
    }
    images_.resize(count);
    vr = vkGetSwapchainImagesKHR(device_, swapchain_, &count, images_.data());
    if (vr != VK_SUCCESS) {
        return vulkanError("create swapchain", vr, "vkGetSwapchainImagesKHR failed");
    }

    return {};
}

Result<std::uint32_t> SwapchainPresenter::acquireImage(VkSemaphore imageAvailable) {
    std::uint32_t index = 0;
    VkResult vr = vkAcquireNextImageKHR(device_, swapchain_, UINT64_MAX, imageAvailable,
                                        VK_NULL_HANDLE, &index);

    if (vr == VK_ERROR_OUT_OF_DATE_KHR) {
        return vulkanError("acquire image", vr, "swapchain out of date -- call recreate()");
    }
    if (vr != VK_SUCCESS && vr != VK_SUBOPTIMAL_KHR) {
        return vulkanError("acquire image", vr, "vkAcquireNextImageKHR failed");
    }

    return index;
}

Result<void> SwapchainPresenter::presentImage(std::uint32_t imageIndex,
                                              VkSemaphore renderFinished) {
    VkPresentInfoKHR pi{};
    pi.sType = VK_STRUCTURE_TYPE_PRESENT_INFO_KHR;
    pi.waitSemaphoreCount = 1;
    pi.pWaitSemaphores = &renderFinished;
    pi.swapchainCount = 1;
    pi.pSwapchains = &swapchain_;
    pi.pImageIndices = &imageIndex;

    VkResult vr = vkQueuePresentKHR(presentQueue_, &pi);
    if (vr == VK_ERROR_OUT_OF_DATE_KHR || vr == VK_SUBOPTIMAL_KHR) {
        return vulkanError("present image", vr, "swapchain no longer matches the surface");
    }
    if (vr != VK_SUCCESS) {
        return vulkanError("present image", vr, "vkQueuePresentKHR failed");
    }
    return {};
}

Result<void> SwapchainPresenter::recreate(VkExtent2D extent) {
    if (isZeroExtent(extent)) {
        return {}; // minimized/no drawable area
    }
    return createSwapchain(extent);
}

} // namespace vkgraph
