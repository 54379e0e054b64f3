#include <vkgraph/error.hpp>

#include <vulkan/vulkan.h>

#include <cstdio>
#include <cstdlib>
#include <stdexcept>
#include <string>
#include <utility>

namespace vkgraph {

#ifndef VKGRAPH_ENABLE_EXCEPTIONS
#define VKGRAPH_ENABLE_EXCEPTIONS 1
#endif

ErrorCategory errorCategory(ErrorCode code) {
    switch (code) {
    case ErrorCode::UnknownNode:
    case ErrorCode::DuplicateName:
    case ErrorCode::InvalidEdge:
    case ErrorCode::InvalidDescriptor:
        return ErrorCategory::Declaration;
    case ErrorCode::Cycle:
    case ErrorCode::MissingProducer:
    case ErrorCode::InvalidAttachment:
    case ErrorCode::DeviceResourceExhausted:
        return ErrorCategory::Compile;
    default:
        return ErrorCategory::Runtime;
    }
}

const char* errorCodeName(ErrorCode code) {
    switch (code) {
    case ErrorCode::UnknownNode:
        return "UnknownNode";
    case ErrorCode::DuplicateName:
        return "DuplicateName";
    case ErrorCode::InvalidEdge:
        return "InvalidEdge";
    case ErrorCode::InvalidDescriptor:
        return "InvalidDescriptor";
    case ErrorCode::Cycle:
        return "Cycle";
    case ErrorCode::MissingProducer:
        return "MissingProducer";
    case ErrorCode::InvalidAttachment:
        return "InvalidAttachment";
    case ErrorCode::DeviceResourceExhausted:
        return "DeviceResourceExhausted";
    case ErrorCode::SurfaceOutOfDate:
        return "SurfaceOutOfDate";
    case ErrorCode::DeviceLost:
        return "DeviceLost";
    case ErrorCode::BackbufferNotBound:
        return "BackbufferNotBound";
    case ErrorCode::BackbufferMismatch:
        return "BackbufferMismatch";
    case ErrorCode::InvalidState:
        return "InvalidState";
    case ErrorCode::Vulkan:
        return "Vulkan";
    }
    return "Unknown";
}

ErrorCode errorCodeFromVkResult(std::int32_t vkResult) {
    switch (static_cast<VkResult>(vkResult)) {
    case VK_ERROR_OUT_OF_HOST_MEMORY:
    case VK_ERROR_OUT_OF_DEVICE_MEMORY:
    case VK_ERROR_OUT_OF_POOL_MEMORY:
    case VK_ERROR_TOO_MANY_OBJECTS:
    case VK_ERROR_FRAGMENTED_POOL:
        return ErrorCode::DeviceResourceExhausted;
    case VK_ERROR_DEVICE_LOST:
        return ErrorCode::DeviceLost;
    case VK_ERROR_OUT_OF_DATE_KHR:
    case VK_SUBOPTIMAL_KHR:
        return ErrorCode::SurfaceOutOfDate;
    default:
        return ErrorCode::Vulkan;
    }
}

Error vulkanError(std::string operation, std::int32_t vkResult, std::string message) {
    return Error{std::move(operation), vkResult, std::move(message),
                 errorCodeFromVkResult(vkResult)};
}

std::string Error::format() const {
    std::string out = "vkgraph: " + operation + " failed";

    if (vkResult != 0) {
        out += " (VkResult " + std::to_string(vkResult) + ")";
    } else if (code != ErrorCode::Vulkan) {
        out += " (";
        out += errorCodeName(code);
        out += ")";
    }

    if (!message.empty()) {
        out += ": " + message;
    }

    return out;
}

void throwError(const Error& e) {
#if VKGRAPH_ENABLE_EXCEPTIONS
    throw std::runtime_error(e.format());
#else
    std::fprintf(stderr, "%s\n", e.format().c_str());
    std::abort();
#endif
}

} // namespace vkgraph
