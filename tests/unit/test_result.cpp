#include <vkgraph/result.hpp>

#include <vulkan/vulkan.h>

#include <cassert>
#include <cstdint>
#include <cstdio>
#include <memory>
#ifndef VKGRAPH_ENABLE_EXCEPTIONS
#define VKGRAPH_ENABLE_EXCEPTIONS 1
#endif
#if VKGRAPH_ENABLE_EXCEPTIONS
#include <stdexcept>
#endif
#include <string>
#include <vector>

using namespace vkgraph;

// A stand-in for the declare -> plan -> build chain: each stage forwards the
// first error untouched.
static Result<std::uint32_t> declare(const std::string& name) {
    if (name.empty()) {
        return Error{"declare pass", 0, "empty name", ErrorCode::InvalidDescriptor};
    }
    return static_cast<std::uint32_t>(name.size());
}

static Result<std::vector<std::uint32_t>> plan(const std::vector<std::string>& passes) {
    std::vector<std::uint32_t> order;
    for (const auto& p : passes) {
        auto index = declare(p);
        if (!index.ok()) return index.error();
        order.push_back(index.value());
    }
    if (order.size() > 3) {
        return Error{"compile render graph", 0, "passes 'a' and 'b' depend on each other",
                     ErrorCode::Cycle};
    }
    return order;
}

static Result<void> build(const std::vector<std::string>& passes) {
    auto planned = plan(passes);
    if (!planned.ok()) return planned.error();
    return {};
}

static void testPropagation() {
    assert(build({"offscreen", "fullscreen"}).ok());

    auto empty = build({"offscreen", ""});
    assert(empty.failedWith(ErrorCode::InvalidDescriptor));
    assert(empty.error().operation == "declare pass");

    auto cyclic = build({"a", "b", "c", "d"});
    assert(cyclic.failedWith(ErrorCode::Cycle));
    assert(!cyclic.failedWith(ErrorCode::InvalidDescriptor));
    assert(errorCategory(cyclic.error().code) == ErrorCategory::Compile);

    std::printf("  propagation keeps the first error: ok\n");
}

static void testCodes() {
    // Errors built from a VkResult carry the mapped code.
    Result<int> lost = vulkanError("wait for fence", VK_ERROR_DEVICE_LOST, "vkWaitForFences failed");
    assert(lost.failedWith(ErrorCode::DeviceLost));
    assert(lost.error().vkResult == VK_ERROR_DEVICE_LOST);

    Result<int> outOfDate = vulkanError("acquire image", VK_ERROR_OUT_OF_DATE_KHR, "");
    assert(outOfDate.failedWith(ErrorCode::SurfaceOutOfDate));

    // Unspecified code means a raw Vulkan failure.
    Result<int> raw = Error{"create sampler", -2, "nope"};
    assert(raw.failedWith(ErrorCode::Vulkan));

    // Success never matches a code.
    Result<void> fine;
    assert(!fine.failedWith(ErrorCode::Vulkan));

    std::printf("  error codes: ok\n");
}

static void testMoveOnlyValue() {
    auto make = [](bool succeed) -> Result<std::unique_ptr<int>> {
        if (!succeed) {
            return Error{"register pass", 0, "unknown pass 'x'", ErrorCode::UnknownNode};
        }
        return std::make_unique<int>(5);
    };

    auto owned = make(true).value();
    assert(owned && *owned == 5);

    Error taken = make(false).error();
    assert(taken.code == ErrorCode::UnknownNode);
    assert(taken.message == "unknown pass 'x'");

    std::printf("  move-only values: ok\n");
}

static void testOrThrow() {
    auto built = plan({"shadow", "lighting"}).orThrow();
    assert(built.size() == 2);

    Result<void> ok;
    std::move(ok).orThrow();

#if VKGRAPH_ENABLE_EXCEPTIONS
    bool caught = false;
    try {
        build({"a", "b", "c", "d"}).orThrow();
    } catch (const std::runtime_error& e) {
        caught = true;
        std::string msg = e.what();
        assert(msg.find("compile render graph") != std::string::npos);
        assert(msg.find("Cycle") != std::string::npos);
    }
    assert(caught);
#endif

    std::printf("  orThrow: ok\n");
}

int main() {
    std::printf("result test\n");

    testPropagation();
    testCodes();
    testMoveOnlyValue();
    testOrThrow();

    std::printf("result test passed\n");
    return 0;
}
