#include <vkgraph/graph/declaration.hpp>
#include <vkgraph/graph/render_graph.hpp>

#include <cassert>
#include <cstdio>
#include <string>
#include <vector>

using namespace vkgraph;
using namespace vkgraph::graph;

static ImageDesc colorImage(const char* name) {
    ImageDesc d;
    d.name = name;
    d.extent = {800, 600};
    d.format = VK_FORMAT_R8G8B8A8_UNORM;
    return d;
}

static void testBackbufferNames() {
    assert(isBackbufferName("backbuffer#0"));
    assert(isBackbufferName("backbuffer#2"));
    assert(isBackbufferName("backbuffer#12"));
    assert(!isBackbufferName("backbuffer#"));
    assert(!isBackbufferName("backbuffer#x"));
    assert(!isBackbufferName("backbuffer#1a"));
    assert(!isBackbufferName("backbuffer"));
    assert(!isBackbufferName("Backbuffer#0"));

    assert(backbufferIndex("backbuffer#7").value() == 7);
    assert(!backbufferIndex("color").has_value());
    assert(backbufferName(3) == "backbuffer#3");

    std::printf("  backbuffer names: ok\n");
}

static void testFormats() {
    assert(isDepthFormat(VK_FORMAT_D16_UNORM));
    assert(isDepthFormat(VK_FORMAT_D32_SFLOAT_S8_UINT));
    assert(!isDepthFormat(VK_FORMAT_R8G8B8A8_UNORM));
    assert(hasStencilComponent(VK_FORMAT_D24_UNORM_S8_UINT));
    assert(!hasStencilComponent(VK_FORMAT_D16_UNORM));
    std::printf("  depth formats: ok\n");
}

static void testImageValidation() {
    // Name required
    {
        ImageDesc d = colorImage("");
        auto r = ImageResource::create(d);
        assert(r.failedWith(ErrorCode::InvalidDescriptor));
    }
    // Format required
    {
        ImageDesc d = colorImage("color");
        d.format = VK_FORMAT_UNDEFINED;
        assert(ImageResource::create(d).failedWith(ErrorCode::InvalidDescriptor));
    }
    // Fixed size needs an extent
    {
        ImageDesc d = colorImage("color");
        d.extent = {0, 600};
        assert(ImageResource::create(d).failedWith(ErrorCode::InvalidDescriptor));
    }
    // Surface-relative ignores the extent but needs a positive scale
    {
        ImageDesc d = colorImage("color");
        d.extent = {0, 0};
        d.sizeMode = SizeMode::SurfaceRelative;
        d.scale = 0.5f;
        assert(ImageResource::create(d).ok());
        d.scale = 0.0f;
        assert(ImageResource::create(d).failedWith(ErrorCode::InvalidDescriptor));
    }
    // Sample count
    {
        ImageDesc d = colorImage("color");
        d.samples = static_cast<VkSampleCountFlagBits>(3);
        assert(ImageResource::create(d).failedWith(ErrorCode::InvalidDescriptor));
        d.samples = VK_SAMPLE_COUNT_4_BIT;
        assert(ImageResource::create(d).ok());
    }
    // Resolve targets are single-sample color
    {
        ImageDesc d = colorImage("color_resolve");
        d.resolve = true;
        d.samples = VK_SAMPLE_COUNT_4_BIT;
        assert(ImageResource::create(d).failedWith(ErrorCode::InvalidDescriptor));
        d.samples = VK_SAMPLE_COUNT_1_BIT;
        d.format = VK_FORMAT_D16_UNORM;
        assert(ImageResource::create(d).failedWith(ErrorCode::InvalidDescriptor));
    }
    // Backbuffer needs only a name
    {
        ImageDesc d;
        d.name = "backbuffer#0";
        auto r = ImageResource::create(d);
        assert(r.ok());
        assert(r.value().isBackbuffer());
        d.samples = VK_SAMPLE_COUNT_4_BIT;
        assert(ImageResource::create(d).failedWith(ErrorCode::InvalidDescriptor));
    }

    std::printf("  image validation: ok\n");
}

static void testNames() {
    GraphDesc desc;
    assert(desc.declarePass("offscreen").value() == 0);
    assert(desc.declarePass("fullscreen").value() == 1);
    assert(desc.declarePass("offscreen").failedWith(ErrorCode::DuplicateName));
    assert(desc.declarePass("").failedWith(ErrorCode::InvalidDescriptor));
    assert(desc.declarePass("backbuffer#0").failedWith(ErrorCode::InvalidDescriptor));

    assert(desc.declareImage(colorImage("color")).value() == 0);
    assert(desc.declareImage(colorImage("color")).failedWith(ErrorCode::DuplicateName));

    // Passes and images share one namespace.
    assert(desc.declareImage(colorImage("offscreen")).failedWith(ErrorCode::DuplicateName));
    assert(desc.declarePass("color").failedWith(ErrorCode::DuplicateName));

    assert(desc.findPass("fullscreen").value() == 1);
    assert(!desc.findPass("color").has_value());
    assert(desc.findImage("color").value() == 0);
    assert(desc.find("offscreen").value() == (NodeRef{NodeKind::Pass, 0}));
    assert(desc.find("color").value() == (NodeRef{NodeKind::Image, 0}));
    assert(!desc.find("missing").has_value());

    std::printf("  names: ok\n");
}

static void testEdges() {
    GraphDesc desc;
    (void)desc.declarePass("offscreen");
    (void)desc.declarePass("fullscreen");
    (void)desc.declareImage(colorImage("color"));
    (void)desc.declareImage(colorImage("other"));

    assert(desc.declareEdge("offscreen", "color").ok());
    assert(desc.declareEdge("color", "fullscreen").ok());
    assert(desc.declareEdge("offscreen", "fullscreen").ok());
    assert(desc.edges().size() == 3);
    assert(desc.edges()[0].producer == (NodeRef{NodeKind::Pass, 0}));
    assert(desc.edges()[0].consumer == (NodeRef{NodeKind::Image, 0}));

    // Duplicate
    assert(desc.declareEdge("offscreen", "color").failedWith(ErrorCode::InvalidEdge));
    // Image -> image
    assert(desc.declareEdge("color", "other").failedWith(ErrorCode::InvalidEdge));
    // Unknown names
    assert(desc.declareEdge("nope", "color").failedWith(ErrorCode::UnknownNode));
    assert(desc.declareEdge("offscreen", "nope").failedWith(ErrorCode::UnknownNode));
    assert(desc.edges().size() == 3);

    // A failed edge does not declare the backbuffer implicitly.
    assert(desc.declareEdge("nope", "backbuffer#0").failedWith(ErrorCode::UnknownNode));
    assert(!desc.backbuffer().has_value());

    // First use declares it.
    assert(desc.declareEdge("fullscreen", "backbuffer#2").ok());
    assert(desc.backbuffer().has_value());
    auto bb = *desc.backbuffer();
    assert(desc.images()[bb].isBackbuffer());
    assert(desc.images()[bb].name() == "backbuffer#2");

    // Every family name aliases the one backbuffer.
    assert(desc.findImage("backbuffer#0").value() == bb);
    assert(desc.declareEdge("fullscreen", "backbuffer#0").failedWith(ErrorCode::InvalidEdge));

    ImageDesc second;
    second.name = "backbuffer#5";
    assert(desc.declareImage(second).failedWith(ErrorCode::DuplicateName));

    // The backbuffer is never sampled.
    assert(desc.declareEdge("backbuffer#2", "offscreen").failedWith(ErrorCode::InvalidEdge));

    std::printf("  edges: ok\n");
}

static void testSamplers() {
    GraphDesc desc;
    assert(desc.samplers().size() == 1);
    assert(desc.samplers()[0].name == "default");
    assert(desc.findSampler("default").value() == 0);
    assert(desc.samplers()[0].desc == SamplerDesc{});

    SamplerDesc nearest;
    nearest.magFilter = VK_FILTER_NEAREST;
    nearest.minFilter = VK_FILTER_NEAREST;
    assert(desc.declareSampler("nearest", nearest).value() == 1);
    assert(desc.declareSampler("nearest", nearest).failedWith(ErrorCode::DuplicateName));
    assert(desc.declareSampler("default", nearest).failedWith(ErrorCode::DuplicateName));
    assert(desc.declareSampler("", nearest).failedWith(ErrorCode::InvalidDescriptor));

    SamplerDesc bad;
    bad.minLod = 2.0f;
    bad.maxLod = 1.0f;
    assert(desc.declareSampler("bad", bad).failedWith(ErrorCode::InvalidDescriptor));
    assert(desc.samplers().size() == 2);

    std::printf("  samplers: ok\n");
}

static void testCreate() {
    std::vector<std::string> passes = {"offscreen", "fullscreen"};

    ImageDesc color = colorImage("color");
    color.samples = VK_SAMPLE_COUNT_4_BIT;
    ImageDesc depth;
    depth.name = "depth_stencil";
    depth.extent = {800, 600};
    depth.format = VK_FORMAT_D16_UNORM;
    depth.samples = VK_SAMPLE_COUNT_4_BIT;
    ImageDesc resolve = colorImage("color_resolve");
    resolve.resolve = true;
    ImageDesc backbuffer;
    backbuffer.name = "backbuffer#2";

    std::vector<ImageDesc> images = {color, depth, resolve, backbuffer};
    std::vector<Edge> edges = {{"offscreen", "color"},
                               {"offscreen", "depth_stencil"},
                               {"offscreen", "color_resolve"},
                               {"color_resolve", "fullscreen"},
                               {"fullscreen", "backbuffer#2"}};

    auto graph = RenderGraph::create(passes, images, edges);
    assert(graph.ok());
    assert(!graph.value().isBuilt());
    assert(graph.value().hasBackbuffer());
    assert(graph.value().backbufferCount() == 0);
    assert(graph.value().desc().passes().size() == 2);
    assert(graph.value().desc().images().size() == 4);
    assert(graph.value().desc().edges().size() == 5);

    // Accessors need a build.
    assert(graph.value().imageView("color").failedWith(ErrorCode::InvalidState));
    assert(graph.value().passHandle("offscreen").failedWith(ErrorCode::InvalidState));

    // Registering a recorder works before build, but only for passes.
    assert(graph.value().registerPass("offscreen", nullptr).ok());
    assert(graph.value().registerPass("color", nullptr).failedWith(ErrorCode::UnknownNode));

    // First declaration error wins.
    std::vector<Edge> badEdges = {{"offscreen", "missing"}, {"color", "color_resolve"}};
    auto bad = RenderGraph::create(passes, images, badEdges);
    assert(bad.failedWith(ErrorCode::UnknownNode));

    std::vector<std::string> dupPasses = {"a", "a"};
    assert(RenderGraph::create(dupPasses, {}, {}).failedWith(ErrorCode::DuplicateName));

    std::printf("  create: ok\n");
}

int main() {
    std::printf("declaration test\n");

    testBackbufferNames();
    testFormats();
    testImageValidation();
    testNames();
    testEdges();
    testSamplers();
    testCreate();

    std::printf("declaration test passed\n");
    return 0;
}
