#include <vkgraph/graph/declaration.hpp>

#include <algorithm>
#include <charconv>
#include <string>
#include <utility>

namespace vkgraph::graph {

bool isBackbufferName(std::string_view name) {
    return backbufferIndex(name).has_value();
}

std::string backbufferName(std::uint32_t index) {
    return std::string(kBackbufferPrefix) + std::to_string(index);
}

std::optional<std::uint32_t> backbufferIndex(std::string_view name) {
    if (name.size() <= kBackbufferPrefix.size() || !name.starts_with(kBackbufferPrefix))
        return std::nullopt;

    auto digits = name.substr(kBackbufferPrefix.size());
    std::uint32_t value = 0;
    auto [end, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), value);
    if (ec != std::errc{} || end != digits.data() + digits.size())
        return std::nullopt;
    return value;
}

bool isDepthFormat(VkFormat format) {
    switch (format) {
    case VK_FORMAT_D16_UNORM:
    case VK_FORMAT_X8_D24_UNORM_PACK32:
    case VK_FORMAT_D32_SFLOAT:
    case VK_FORMAT_D16_UNORM_S8_UINT:
    case VK_FORMAT_D24_UNORM_S8_UINT:
    case VK_FORMAT_D32_SFLOAT_S8_UINT:
        return true;
    default:
        return false;
    }
}

bool hasStencilComponent(VkFormat format) {
    switch (format) {
    case VK_FORMAT_D16_UNORM_S8_UINT:
    case VK_FORMAT_D24_UNORM_S8_UINT:
    case VK_FORMAT_D32_SFLOAT_S8_UINT:
        return true;
    default:
        return false;
    }
}

namespace {

Error invalidDescriptor(const std::string& name, const std::string& what) {
    return Error{"declare image", 0, "'" + name + "': " + what, ErrorCode::InvalidDescriptor};
}

bool validSampleCount(VkSampleCountFlagBits samples) {
    auto s = static_cast<std::uint32_t>(samples);
    return s != 0 && (s & (s - 1)) == 0 && s <= 64u;
}

} // namespace

Result<ImageResource> ImageResource::create(ImageDesc desc) {
    if (desc.name.empty()) {
        return Error{"declare image", 0, "image name must not be empty",
                     ErrorCode::InvalidDescriptor};
    }
    if (!validSampleCount(desc.samples)) {
        return invalidDescriptor(desc.name, "sample count must be a power of two up to 64");
    }

    ImageResource r;
    r.backbuffer_ = isBackbufferName(desc.name);

    if (r.backbuffer_) {
        // Extent and format come from the presenter.
        if (desc.samples != VK_SAMPLE_COUNT_1_BIT) {
            return invalidDescriptor(desc.name, "backbuffer images are single-sample");
        }
        if (desc.resolve || desc.forceShaderRead) {
            return invalidDescriptor(desc.name,
                                     "backbuffer cannot be a resolve target or shader-readable");
        }
        r.desc_ = std::move(desc);
        return r;
    }

    if (desc.format == VK_FORMAT_UNDEFINED) {
        return invalidDescriptor(desc.name, "format is required");
    }
    if (desc.sizeMode == SizeMode::Fixed && (desc.extent.width == 0 || desc.extent.height == 0)) {
        return invalidDescriptor(desc.name, "fixed-size images need a non-zero extent");
    }
    if (desc.sizeMode == SizeMode::SurfaceRelative && !(desc.scale > 0.0f)) {
        return invalidDescriptor(desc.name, "surface-relative scale must be positive");
    }
    if (desc.resolve) {
        if (desc.samples != VK_SAMPLE_COUNT_1_BIT) {
            return invalidDescriptor(desc.name, "resolve targets must be single-sample");
        }
        if (isDepthFormat(desc.format)) {
            return invalidDescriptor(desc.name, "only color images can be resolve targets");
        }
    }

    r.desc_ = std::move(desc);
    return r;
}

GraphDesc::GraphDesc() {
    samplers_.push_back({"default", SamplerDesc{}});
}

bool GraphDesc::nameTaken(std::string_view name) const {
    return findPass(name).has_value() ||
           std::any_of(images_.begin(), images_.end(),
                       [&](const ImageResource& r) { return r.name() == name; });
}

Result<std::uint32_t> GraphDesc::declarePass(std::string_view name) {
    if (name.empty()) {
        return Error{"declare pass", 0, "pass name must not be empty",
                     ErrorCode::InvalidDescriptor};
    }
    if (isBackbufferName(name)) {
        return Error{"declare pass", 0,
                     "'" + std::string(name) + "' is reserved for the backbuffer family",
                     ErrorCode::InvalidDescriptor};
    }
    if (nameTaken(name)) {
        return Error{"declare pass", 0, "'" + std::string(name) + "' is already declared",
                     ErrorCode::DuplicateName};
    }

    passes_.emplace_back(name);
    return static_cast<std::uint32_t>(passes_.size() - 1);
}

Result<std::uint32_t> GraphDesc::declareImage(ImageDesc desc) {
    auto resource = ImageResource::create(std::move(desc));
    if (!resource.ok()) return resource.error();

    const auto& name = resource.value().name();
    if (resource.value().isBackbuffer() && backbuffer_) {
        return Error{"declare image", 0,
                     "'" + name + "': the graph already has a backbuffer family ('" +
                         images_[*backbuffer_].name() + "')",
                     ErrorCode::DuplicateName};
    }
    if (nameTaken(name)) {
        return Error{"declare image", 0, "'" + name + "' is already declared",
                     ErrorCode::DuplicateName};
    }

    auto index = static_cast<std::uint32_t>(images_.size());
    if (resource.value().isBackbuffer()) backbuffer_ = index;
    images_.push_back(std::move(resource).value());
    return index;
}

Result<std::uint32_t> GraphDesc::declareSampler(std::string_view name, const SamplerDesc& desc) {
    if (name.empty()) {
        return Error{"declare sampler", 0, "sampler name must not be empty",
                     ErrorCode::InvalidDescriptor};
    }
    if (findSampler(name)) {
        return Error{"declare sampler", 0, "'" + std::string(name) + "' is already declared",
                     ErrorCode::DuplicateName};
    }

    auto valid = validateSamplerDesc(desc);
    if (!valid.ok()) return valid.error();

    samplers_.push_back({std::string(name), desc});
    return static_cast<std::uint32_t>(samplers_.size() - 1);
}

std::optional<std::uint32_t> GraphDesc::findPass(std::string_view name) const {
    for (std::uint32_t i = 0; i < static_cast<std::uint32_t>(passes_.size()); ++i) {
        if (passes_[i] == name) return i;
    }
    return std::nullopt;
}

std::optional<std::uint32_t> GraphDesc::findImage(std::string_view name) const {
    if (isBackbufferName(name)) return backbuffer_;

    for (std::uint32_t i = 0; i < static_cast<std::uint32_t>(images_.size()); ++i) {
        if (images_[i].name() == name) return i;
    }
    return std::nullopt;
}

std::optional<std::uint32_t> GraphDesc::findSampler(std::string_view name) const {
    for (std::uint32_t i = 0; i < static_cast<std::uint32_t>(samplers_.size()); ++i) {
        if (samplers_[i].name == name) return i;
    }
    return std::nullopt;
}

std::optional<NodeRef> GraphDesc::find(std::string_view name) const {
    if (auto p = findPass(name)) return NodeRef{NodeKind::Pass, *p};
    if (auto i = findImage(name)) return NodeRef{NodeKind::Image, *i};
    return std::nullopt;
}

Result<NodeRef> GraphDesc::resolve(std::string_view name, const char* side) {
    if (auto node = find(name)) return *node;

    if (isBackbufferName(name)) {
        ImageDesc desc;
        desc.name = std::string(name);
        auto index = declareImage(std::move(desc));
        if (!index.ok()) return index.error();
        return NodeRef{NodeKind::Image, index.value()};
    }

    return Error{"declare edge", 0, std::string("unknown ") + side + " '" + std::string(name) + "'",
                 ErrorCode::UnknownNode};
}

Result<void> GraphDesc::declareEdge(std::string_view producer, std::string_view consumer) {
    // Check both names before declaring an implicit backbuffer, so a failed
    // edge leaves the description untouched.
    if (!find(producer) && !isBackbufferName(producer)) {
        return Error{"declare edge", 0, "unknown producer '" + std::string(producer) + "'",
                     ErrorCode::UnknownNode};
    }
    if (!find(consumer) && !isBackbufferName(consumer)) {
        return Error{"declare edge", 0, "unknown consumer '" + std::string(consumer) + "'",
                     ErrorCode::UnknownNode};
    }

    bool producerIsImage = !findPass(producer).has_value();
    bool consumerIsImage = !findPass(consumer).has_value();
    std::string label = "'" + std::string(producer) + "' -> '" + std::string(consumer) + "'";

    if (producerIsImage && consumerIsImage) {
        return Error{"declare edge", 0, label + ": an edge needs a pass on at least one side",
                     ErrorCode::InvalidEdge};
    }
    if (producerIsImage && isBackbufferName(producer)) {
        return Error{"declare edge", 0, label + ": the backbuffer cannot be sampled",
                     ErrorCode::InvalidEdge};
    }

    auto p = resolve(producer, "producer");
    if (!p.ok()) return p.error();
    auto c = resolve(consumer, "consumer");
    if (!c.ok()) return c.error();

    EdgeDecl edge{p.value(), c.value()};
    if (std::find(edges_.begin(), edges_.end(), edge) != edges_.end()) {
        return Error{"declare edge", 0, label + " is declared twice", ErrorCode::InvalidEdge};
    }

    edges_.push_back(edge);
    return {};
}

} // namespace vkgraph::graph
