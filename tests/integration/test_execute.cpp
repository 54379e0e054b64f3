#include <vkgraph/graph.hpp>

#include "support/fake_presenter.hpp"
#include "support/forward_graph.hpp"
#include "support/headless_device.hpp"

#include <cassert>
#include <cstdint>
#include <cstdio>
#include <cstring>
#include <memory>
#include <string>
#include <vector>

using namespace vkgraph;
using namespace vkgraph::graph;

namespace {

// Host-visible buffer the test copies an image into.
struct Readback {
    VmaAllocator allocator = nullptr;
    VkBuffer buffer = VK_NULL_HANDLE;
    VmaAllocation allocation = nullptr;
    void* mapped = nullptr;

    Readback(VmaAllocator a, VkDeviceSize size) : allocator(a) {
        VkBufferCreateInfo ci{};
        ci.sType = VK_STRUCTURE_TYPE_BUFFER_CREATE_INFO;
        ci.size = size;
        ci.usage = VK_BUFFER_USAGE_TRANSFER_DST_BIT;

        VmaAllocationCreateInfo aci{};
        aci.usage = VMA_MEMORY_USAGE_GPU_TO_CPU;
        aci.flags = VMA_ALLOCATION_CREATE_MAPPED_BIT;

        VmaAllocationInfo info{};
        VkResult vr = vmaCreateBuffer(allocator, &ci, &aci, &buffer, &allocation, &info);
        assert(vr == VK_SUCCESS);
        (void)vr;
        mapped = info.pMappedData;
        assert(mapped != nullptr);
    }

    ~Readback() { vmaDestroyBuffer(allocator, buffer, allocation); }

    Readback(const Readback&) = delete;
    Readback& operator=(const Readback&) = delete;

    const std::uint8_t* pixel(std::uint32_t x, std::uint32_t y, std::uint32_t width) {
        vmaInvalidateAllocation(allocator, allocation, 0, VK_WHOLE_SIZE);
        return static_cast<const std::uint8_t*>(mapped) + (y * width + x) * 4;
    }
};

// Color attachment -> transfer source, then copy the whole image out.
void copyToBuffer(VkCommandBuffer cmd, VkImage image, VkExtent2D extent, VkBuffer buffer) {
    VkImageMemoryBarrier barrier{};
    barrier.sType = VK_STRUCTURE_TYPE_IMAGE_MEMORY_BARRIER;
    barrier.srcAccessMask = VK_ACCESS_COLOR_ATTACHMENT_WRITE_BIT;
    barrier.dstAccessMask = VK_ACCESS_TRANSFER_READ_BIT;
    barrier.oldLayout = VK_IMAGE_LAYOUT_COLOR_ATTACHMENT_OPTIMAL;
    barrier.newLayout = VK_IMAGE_LAYOUT_TRANSFER_SRC_OPTIMAL;
    barrier.srcQueueFamilyIndex = VK_QUEUE_FAMILY_IGNORED;
    barrier.dstQueueFamilyIndex = VK_QUEUE_FAMILY_IGNORED;
    barrier.image = image;
    barrier.subresourceRange = {VK_IMAGE_ASPECT_COLOR_BIT, 0, 1, 0, 1};
    vkCmdPipelineBarrier(cmd, VK_PIPELINE_STAGE_COLOR_ATTACHMENT_OUTPUT_BIT,
                         VK_PIPELINE_STAGE_TRANSFER_BIT, 0, 0, nullptr, 0, nullptr, 1, &barrier);

    VkBufferImageCopy region{};
    region.imageSubresource = {VK_IMAGE_ASPECT_COLOR_BIT, 0, 0, 1};
    region.imageExtent = {extent.width, extent.height, 1};
    vkCmdCopyImageToBuffer(cmd, image, VK_IMAGE_LAYOUT_TRANSFER_SRC_OPTIMAL, buffer, 1, &region);
}

// Clears the left half of color attachment 0.
class LeftHalfClear final : public PassRecorder {
public:
    LeftHalfClear(VkExtent2D extent, VkClearColorValue color) : extent_(extent), color_(color) {}

    Result<void> record(VkCommandBuffer cmd) override {
        VkClearAttachment clear{};
        clear.aspectMask = VK_IMAGE_ASPECT_COLOR_BIT;
        clear.colorAttachment = 0;
        clear.clearValue.color = color_;

        VkClearRect rect{};
        rect.rect = {{0, 0}, {extent_.width / 2, extent_.height}};
        rect.layerCount = 1;
        vkCmdClearAttachments(cmd, 1, &clear, 1, &rect);
        calls++;
        return {};
    }

    int calls = 0;

private:
    VkExtent2D extent_;
    VkClearColorValue color_;
};

} // namespace

int main() {
    test::HeadlessDevice dev("test_execute");
    auto& ctx = dev.ctx();

    test::FakePresenter presenter(dev.allocator().vmaAllocator(), dev.queue(),
                                  VK_FORMAT_B8G8R8A8_UNORM, {800, 600}, 2);

    std::printf("execute test\n");

    // Passes record in topological order, once per execute
    {
        auto graph = test::forwardGraph();
        std::vector<std::string> order;

        auto recorder = [&](const char* name) {
            return std::make_unique<FunctionRecorder>([&order, name](VkCommandBuffer cmd) {
                assert(cmd != VK_NULL_HANDLE);
                order.emplace_back(name);
                return Result<void>{};
            });
        };
        // Registered before build; survives it.
        assert(graph.registerPass("fullscreen", recorder("fullscreen")).ok());
        assert(graph.registerPass("offscreen", recorder("offscreen")).ok());

        assert(graph.build(ctx, presenter.surface()).ok());
        assert(graph.insertBackbufferImages(presenter.images()).ok());

        for (std::uint32_t index = 0; index < 2; ++index) {
            auto shot = test::OneShotCmd::begin(dev.device(), dev.family());
            assert(graph.executeAtIndex(shot.cmd, index).ok());
            shot.submitAndWait(dev.queue());
        }

        assert(order.size() == 4);
        assert(order[0] == "offscreen" && order[1] == "fullscreen");
        assert(order[2] == "offscreen" && order[3] == "fullscreen");

        // Index out of range fails before recording anything.
        auto shot = test::OneShotCmd::begin(dev.device(), dev.family());
        assert(graph.executeAtIndex(shot.cmd, 2).failedWith(ErrorCode::BackbufferMismatch));
        assert(order.size() == 4);
        shot.discard();
        std::printf("  topological recording: ok\n");
    }

    // Passes without a recorder clear and store
    {
        auto graph = test::forwardGraph();
        assert(graph.build(ctx, presenter.surface()).ok());
        assert(graph.insertBackbufferImages(presenter.images()).ok());

        auto shot = test::OneShotCmd::begin(dev.device(), dev.family());
        assert(graph.executeAtIndex(shot.cmd, 1).ok());
        shot.submitAndWait(dev.queue());
        std::printf("  no recorder: ok\n");
    }

    // A recorder error ends the open render pass and propagates
    {
        auto graph = test::forwardGraph();
        bool fullscreenRan = false;
        assert(graph.registerPass("offscreen",
                                  std::make_unique<FunctionRecorder>([](VkCommandBuffer) {
                                      return Result<void>{Error{"record offscreen", 0,
                                                                "pipeline missing",
                                                                ErrorCode::InvalidState}};
                                  }))
                   .ok());
        assert(graph.registerPass("fullscreen",
                                  std::make_unique<FunctionRecorder>([&](VkCommandBuffer) {
                                      fullscreenRan = true;
                                      return Result<void>{};
                                  }))
                   .ok());
        assert(graph.build(ctx, presenter.surface()).ok());
        assert(graph.insertBackbufferImages(presenter.images()).ok());

        auto shot = test::OneShotCmd::begin(dev.device(), dev.family());
        auto r = graph.executeAtIndex(shot.cmd, 0);
        assert(!r.ok());
        assert(r.error().operation == "record offscreen");
        assert(r.failedWith(ErrorCode::InvalidState));
        assert(!fullscreenRan);
        // The command buffer is still valid: the render pass was closed.
        shot.submitAndWait(dev.queue());
        std::printf("  recorder error: ok\n");
    }

    // Clear values, LOAD between writers, and executePass
    {
        constexpr VkExtent2D kExtent{4, 4};

        ImageDesc target;
        target.name = "target";
        target.extent = kExtent;
        target.format = VK_FORMAT_R8G8B8A8_UNORM;
        target.clearValue.color = {{1.0f, 0.0f, 0.0f, 1.0f}};
        target.forceStore = true;

        auto created = RenderGraph::create({"base", "overlay"}, {target},
                                           {{"base", "target"}, {"overlay", "target"}});
        assert(created.ok());
        auto& graph = created.value();

        auto overlay = std::make_unique<LeftHalfClear>(
            kExtent, VkClearColorValue{{0.0f, 1.0f, 0.0f, 1.0f}});
        LeftHalfClear* overlayPtr = overlay.get();
        assert(graph.registerPass("overlay", std::move(overlay)).ok());

        assert(graph.build(ctx, presenter.surface()).ok());
        assert(graph.plan().passPlan(1).attachments[0].loadOp == VK_ATTACHMENT_LOAD_OP_LOAD);
        assert(graph.imageUsage("target").value() & VK_IMAGE_USAGE_TRANSFER_SRC_BIT);

        Readback readback(dev.allocator().vmaAllocator(), kExtent.width * kExtent.height * 4);

        auto shot = test::OneShotCmd::begin(dev.device(), dev.family());
        assert(graph.executeAtIndex(shot.cmd, 0).ok());
        copyToBuffer(shot.cmd, graph.image("target").value(), kExtent, readback.buffer);
        shot.submitAndWait(dev.queue());
        assert(overlayPtr->calls == 1);

        const std::uint8_t* left = readback.pixel(0, 0, kExtent.width);
        assert(left[0] == 0 && left[1] == 255 && left[2] == 0 && left[3] == 255);
        const std::uint8_t* right = readback.pixel(3, 3, kExtent.width);
        assert(right[0] == 255 && right[1] == 0 && right[2] == 0 && right[3] == 255);
        std::printf("  clear + load: ok\n");

        // Only "base": the whole image is the clear color again.
        int baseCalls = 0;
        FunctionRecorder counting([&](VkCommandBuffer) {
            baseCalls++;
            return Result<void>{};
        });
        shot = test::OneShotCmd::begin(dev.device(), dev.family());
        assert(graph.executePass(shot.cmd, "base", 0, counting).ok());
        copyToBuffer(shot.cmd, graph.image("target").value(), kExtent, readback.buffer);
        shot.submitAndWait(dev.queue());
        assert(baseCalls == 1);
        assert(overlayPtr->calls == 1);

        left = readback.pixel(0, 0, kExtent.width);
        assert(left[0] == 255 && left[1] == 0);

        auto missing = test::OneShotCmd::begin(dev.device(), dev.family());
        assert(graph.executePass(missing.cmd, "nope", 0, counting).failedWith(
            ErrorCode::UnknownNode));
        missing.discard();
        std::printf("  execute single pass: ok\n");
    }

    dev.waitIdle();

    std::printf("execute test passed\n");
    return 0;
}
