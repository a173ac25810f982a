#pragma once

#include <vulkan/vulkan_raii.hpp>

#include "FrameBackend.hpp"
#include "FrameContext.hpp"
#include "Framebuffers.hpp"
#include "Pipeline.hpp"
#include "RenderContext.hpp"
#include "RenderPass.hpp"
#include "RendererConfig.hpp"
#include "ResourceGraph.hpp"

// Vulkan implementation of the frame operations. Owns everything that
// depends on the render context, torn down in reverse declaration order.
class Renderer : public FrameBackend
{
  public:
    Renderer(
        RenderContext        &context,
        const RendererConfig &config,
        ResourceGraph        &graph);

    auto slotCount() const -> uint32_t override;

    auto waitForFence(uint32_t slot) -> void override;
    auto resetFence(uint32_t slot) -> void override;

    auto acquireImage(uint32_t slot) -> AcquireResult override;

    auto resetCommands(uint32_t slot) -> void override;
    auto recordCommands(
        uint32_t slot,
        uint32_t imageIndex) -> void override;

    auto submit(uint32_t slot, uint32_t imageIndex) -> void override;

    auto present(
        uint32_t slot,
        uint32_t imageIndex) -> TargetStatus override;

    auto recreateTargets() -> bool override;
    auto waitIdle() -> void override;

  private:
    RenderContext &context;
    uint64_t       fenceTimeout;
    uint64_t       acquireTimeout;

    RenderPass   renderPass;
    Pipeline     pipeline;
    Framebuffers framebuffers;
    FrameContext frames;
};
