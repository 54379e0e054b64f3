#pragma once

#include <vkgraph/result.hpp>

#include <vulkan/vulkan.h>

#include <functional>
#include <utility>

namespace vkgraph::graph {

// Records the commands of one pass. Called between vkCmdBeginRenderPass and
// vkCmdEndRenderPass on the pass's render pass; the recorder must not end the
// render pass, end the command buffer or submit it.
//
// Recorders belong to the RenderGraph, not to a build, so they survive every
// rebuild. Pipelines they create against a render pass must be recreated
// when the graph rebuilds (RenderGraph::passHandle() changes).
class PassRecorder {
public:
    virtual ~PassRecorder() = default;

    [[nodiscard]] virtual Result<void> record(VkCommandBuffer cmd) = 0;
};

// Adapts a callable.
class FunctionRecorder final : public PassRecorder {
public:
    using Fn = std::function<Result<void>(VkCommandBuffer)>;

    explicit FunctionRecorder(Fn fn) : fn_(std::move(fn)) {}

    [[nodiscard]] Result<void> record(VkCommandBuffer cmd) override {
        if (!fn_) return {};
        return fn_(cmd);
    }

private:
    Fn fn_;
};

} // namespace vkgraph::graph
