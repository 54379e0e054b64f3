#include <vkgraph/graph.hpp>
#include <vkgraph/vkgraph.hpp>

#include <SDL3/SDL.h>
#include <SDL3/SDL_vulkan.h>
#include <vulkan/vulkan.h>

#include <cmath>
#include <cstdint>
#include <cstdio>
#include <memory>
#include <vector>

// Two passes, no pipelines: "scene" clears an HDR target and stamps a moving
// band into it, "present" samples it (in a real renderer) and clears the
// backbuffer. Resize the window to watch the graph rebuild.

namespace {

struct Device {
    VkInstance instance = VK_NULL_HANDLE;
    VkSurfaceKHR surface = VK_NULL_HANDLE;
    VkPhysicalDevice gpu = VK_NULL_HANDLE;
    VkDevice device = VK_NULL_HANDLE;
    VkQueue queue = VK_NULL_HANDLE;
    std::uint32_t family = 0;
};

bool createDevice(SDL_Window* window, Device& out) {
    Uint32 extCount = 0;
    const char* const* exts = SDL_Vulkan_GetInstanceExtensions(&extCount);

    VkApplicationInfo app{};
    app.sType = VK_STRUCTURE_TYPE_APPLICATION_INFO;
    app.pApplicationName = "vkgraph_graph_clear";
    app.apiVersion = VK_API_VERSION_1_1;

    VkInstanceCreateInfo ici{};
    ici.sType = VK_STRUCTURE_TYPE_INSTANCE_CREATE_INFO;
    ici.pApplicationInfo = &app;
    ici.enabledExtensionCount = extCount;
    ici.ppEnabledExtensionNames = exts;
    if (vkCreateInstance(&ici, nullptr, &out.instance) != VK_SUCCESS) return false;

    if (!SDL_Vulkan_CreateSurface(window, out.instance, nullptr, &out.surface)) {
        std::fprintf(stderr, "SDL_Vulkan_CreateSurface failed: %s\n", SDL_GetError());
        return false;
    }

    std::uint32_t gpuCount = 0;
    vkEnumeratePhysicalDevices(out.instance, &gpuCount, nullptr);
    std::vector<VkPhysicalDevice> gpus(gpuCount);
    vkEnumeratePhysicalDevices(out.instance, &gpuCount, gpus.data());

    for (auto gpu : gpus) {
        std::uint32_t familyCount = 0;
        vkGetPhysicalDeviceQueueFamilyProperties(gpu, &familyCount, nullptr);
        std::vector<VkQueueFamilyProperties> families(familyCount);
        vkGetPhysicalDeviceQueueFamilyProperties(gpu, &familyCount, families.data());

        for (std::uint32_t f = 0; f < familyCount; ++f) {
            VkBool32 present = VK_FALSE;
            vkGetPhysicalDeviceSurfaceSupportKHR(gpu, f, out.surface, &present);
            if ((families[f].queueFlags & VK_QUEUE_GRAPHICS_BIT) && present) {
                out.gpu = gpu;
                out.family = f;
                break;
            }
        }
        if (out.gpu != VK_NULL_HANDLE) break;
    }
    if (out.gpu == VK_NULL_HANDLE) return false;

    float priority = 1.0f;
    VkDeviceQueueCreateInfo qci{};
    qci.sType = VK_STRUCTURE_TYPE_DEVICE_QUEUE_CREATE_INFO;
    qci.queueFamilyIndex = out.family;
    qci.queueCount = 1;
    qci.pQueuePriorities = &priority;

    const char* swapchainExt = VK_KHR_SWAPCHAIN_EXTENSION_NAME;
    VkDeviceCreateInfo dci{};
    dci.sType = VK_STRUCTURE_TYPE_DEVICE_CREATE_INFO;
    dci.queueCreateInfoCount = 1;
    dci.pQueueCreateInfos = &qci;
    dci.enabledExtensionCount = 1;
    dci.ppEnabledExtensionNames = &swapchainExt;
    if (vkCreateDevice(out.gpu, &dci, nullptr, &out.device) != VK_SUCCESS) return false;

    vkGetDeviceQueue(out.device, out.family, 0, &out.queue);
    return true;
}

VkExtent2D pixelSize(SDL_Window* window) {
    int w = 0;
    int h = 0;
    SDL_GetWindowSizeInPixels(window, &w, &h);
    return {static_cast<std::uint32_t>(w), static_cast<std::uint32_t>(h)};
}

// Clears a horizontal band of color attachment 0.
class BandRecorder final : public vkgraph::graph::PassRecorder {
public:
    explicit BandRecorder(const vkgraph::graph::RenderGraph& graph) : graph_(graph) {}

    vkgraph::Result<void> record(VkCommandBuffer cmd) override {
        auto extent = graph_.passExtent("scene");
        if (!extent.ok()) return extent.error();

        t_ += 0.01f;
        auto height = extent.value().height / 8;
        auto y = static_cast<std::int32_t>((0.5f + 0.5f * std::sin(t_)) *
                                           static_cast<float>(extent.value().height - height));

        VkClearAttachment clear{};
        clear.aspectMask = VK_IMAGE_ASPECT_COLOR_BIT;
        clear.colorAttachment = 0;
        clear.clearValue.color = {{1.0f, 0.5f, 0.1f, 1.0f}};

        VkClearRect rect{};
        rect.rect = {{0, y}, {extent.value().width, height == 0 ? 1 : height}};
        rect.layerCount = 1;
        vkCmdClearAttachments(cmd, 1, &clear, 1, &rect);
        return {};
    }

private:
    const vkgraph::graph::RenderGraph& graph_;
    float t_ = 0.0f;
};

} // namespace

int main() {
    if (!SDL_Init(SDL_INIT_VIDEO)) {
        std::fprintf(stderr, "SDL_Init failed: %s\n", SDL_GetError());
        return 1;
    }

    SDL_Window* window = SDL_CreateWindow("vkgraph - graph clear", 1280, 720,
                                          SDL_WINDOW_VULKAN | SDL_WINDOW_RESIZABLE);
    if (!window) {
        std::fprintf(stderr, "SDL_CreateWindow failed: %s\n", SDL_GetError());
        return 1;
    }

    Device dev;
    if (!createDevice(window, dev)) {
        std::fprintf(stderr, "no Vulkan device can present to this window\n");
        return 1;
    }

    {
        auto allocator = vkgraph::Allocator::create({dev.instance, dev.gpu, dev.device}).value();

        vkgraph::ContextDesc cd;
        cd.physicalDevice = dev.gpu;
        cd.device = dev.device;
        cd.allocator = allocator.vmaAllocator();
        cd.graphicsQueue = dev.queue;
        cd.graphicsQueueFamily = dev.family;
        cd.pipelineCachePath = "graph_clear.cache";
        auto ctx = vkgraph::RenderContext::create(cd).value();

        vkgraph::SwapchainDesc sd;
        sd.physicalDevice = dev.gpu;
        sd.device = dev.device;
        sd.surface = dev.surface;
        sd.presentQueue = dev.queue;
        sd.graphicsFamily = dev.family;
        sd.presentFamily = dev.family;
        sd.extent = pixelSize(window);
        auto presenter = vkgraph::SwapchainPresenter::create(sd).value();

        auto frames = vkgraph::FrameSync::create(ctx, 2).value();

        vkgraph::graph::ImageDesc hdr;
        hdr.name = "hdr";
        hdr.format = VK_FORMAT_R16G16B16A16_SFLOAT;
        hdr.sizeMode = vkgraph::graph::SizeMode::SurfaceRelative;
        hdr.clearValue.color = {{0.05f, 0.05f, 0.08f, 1.0f}};

        vkgraph::graph::ImageDesc backbuffer;
        backbuffer.name = "backbuffer#0";
        backbuffer.clearValue.color = {{0.0f, 0.0f, 0.0f, 1.0f}};

        auto graph = vkgraph::graph::RenderGraph::create(
                         {"scene", "present"}, {hdr, backbuffer},
                         {{"scene", "hdr"}, {"hdr", "present"}, {"present", "backbuffer#0"}})
                         .value();
        graph.registerPass("scene", std::make_unique<BandRecorder>(graph)).orThrow();

        vkgraph::graph::ResizeCoordinator coordinator(ctx, graph, frames, presenter);
        vkgraph::graph::FrameExecutor executor(ctx, graph, frames, presenter, coordinator);

        bool running = true;
        bool dumped = false;
        while (running) {
            SDL_Event event;
            while (SDL_PollEvent(&event)) {
                if (event.type == SDL_EVENT_QUIT ||
                    event.type == SDL_EVENT_WINDOW_CLOSE_REQUESTED) {
                    running = false;
                }
            }

            auto status = executor.renderFrame(pixelSize(window));
            if (!status.ok()) {
                std::fprintf(stderr, "%s\n", status.error().format().c_str());
                break;
            }
            if (status.value() == vkgraph::graph::FrameStatus::Skipped) {
                SDL_Delay(16);
            }
            if (!dumped && graph.isBuilt()) {
                graph.dumpLog();
                dumped = true;
            }
        }

        frames.waitAll().orThrow();
        ctx.waitIdle().orThrow();
        graph.release();
        ctx.destroy().orThrow();
    }

    vkDestroyDevice(dev.device, nullptr);
    vkDestroySurfaceKHR(dev.instance, dev.surface, nullptr);
    vkDestroyInstance(dev.instance, nullptr);
    SDL_DestroyWindow(window);
    SDL_Quit();
    return 0;
}
