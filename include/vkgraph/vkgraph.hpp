#pragma once

// Core umbrella header: errors, context, frames, samplers, presenters.
// The render graph lives in <vkgraph/graph.hpp>.

#include <vkgraph/allocator.hpp>
#include <vkgraph/context.hpp>
#include <vkgraph/debug.hpp>
#include <vkgraph/error.hpp>
#include <vkgraph/frames.hpp>
#include <vkgraph/pipeline_cache.hpp>
#include <vkgraph/presenter.hpp>
#include <vkgraph/result.hpp>
#include <vkgraph/sampler.hpp>
#include <vkgraph/swapchain_presenter.hpp>
