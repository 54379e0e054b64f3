#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace vkgraph {

// What went wrong, coarse enough for a caller to branch on.
// Declaration errors are caller bugs and never retried. Compile errors abort
// startup. Runtime errors come from frame execution; SurfaceOutOfDate is
// recovered internally by the frame executor.
enum class ErrorCode : std::uint8_t {
    // declaration
    UnknownNode,
    DuplicateName,
    InvalidEdge,
    InvalidDescriptor,
    // compile
    Cycle,
    MissingProducer,
    InvalidAttachment,
    DeviceResourceExhausted,
    // runtime
    SurfaceOutOfDate,
    DeviceLost,
    BackbufferNotBound,
    BackbufferMismatch,
    InvalidState,
    Vulkan,
};

enum class ErrorCategory : std::uint8_t {
    Declaration,
    Compile,
    Runtime,
};

[[nodiscard]] ErrorCategory errorCategory(ErrorCode code);
[[nodiscard]] const char* errorCodeName(ErrorCode code);

// Classify a VkResult (stored as int32_t, see Error) into an ErrorCode.
[[nodiscard]] ErrorCode errorCodeFromVkResult(std::int32_t vkResult);

// Thin error type that carries what we tried, what Vulkan said, and a human message.
// VkResult is stored as int32_t to avoid pulling <vulkan/vulkan.h> into every header.
struct Error {
    std::string operation; // e.g. "declare edge"
    std::int32_t vkResult; // 0 (VK_SUCCESS) when not a Vulkan error
    std::string message;   // human-readable explanation
    ErrorCode code = ErrorCode::Vulkan;

    [[nodiscard]] ErrorCategory category() const { return errorCategory(code); }

    // Format as a single readable string.
    [[nodiscard]] std::string format() const;
};

// Error for a failed Vulkan call; the code is derived from the VkResult.
[[nodiscard]] Error vulkanError(std::string operation, std::int32_t vkResult,
                                std::string message);

// Error unwrap hook used by Result<T>::orThrow().
// When VKGRAPH_ENABLE_EXCEPTIONS=1, throws std::runtime_error.
// When VKGRAPH_ENABLE_EXCEPTIONS=0, prints and aborts.
[[noreturn]] void throwError(const Error& e);

} // namespace vkgraph
