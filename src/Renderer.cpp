#include "Renderer.hpp"

#include "Shader.hpp"

#include <spdlog/spdlog.h>

#include <array>
#include <stdexcept>

Renderer::Renderer(
    RenderContext        &context,
    const RendererConfig &config,
    ResourceGraph        &graph)
    : context{context},
      fenceTimeout{config.fenceTimeout},
      acquireTimeout{config.acquireTimeout},
      renderPass{
          context.device,
          context.colorFormat(),
          graph},
      pipeline{
          context.device,
          renderPass,
          loadShader(
              config.vertexShaderPath,
              vk::ShaderStageFlagBits::eVertex),
          loadShader(
              config.fragmentShaderPath,
              vk::ShaderStageFlagBits::eFragment),
          context.extent(),
          graph},
      framebuffers{
          context.device,
          context.swapchain,
          renderPass,
          graph},
      frames{
          context.device,
          config.framesInFlight,
          graph}
{
}

auto Renderer::slotCount() const -> uint32_t
{
    return frames.maxFrames();
}

auto Renderer::waitForFence(uint32_t slot) -> void
{
    const auto result = context.device.handle.waitForFences(
        *frames.sync(slot).inFlight,
        vk::True,
        fenceTimeout);

    if (result == vk::Result::eTimeout) {
        throw std::runtime_error{
            fmt::format("Timed out waiting for the fence of frame slot {}", slot)};
    }
}

auto Renderer::resetFence(uint32_t slot) -> void
{
    context.device.handle.resetFences(*frames.sync(slot).inFlight);
}

auto Renderer::acquireImage(uint32_t slot) -> AcquireResult
{
    return context.swapchain.acquireNextImage(
        *frames.sync(slot).imageAvailable,
        acquireTimeout);
}

auto Renderer::resetCommands(uint32_t slot) -> void
{
    frames.cmd(slot).reset();
}

auto Renderer::recordCommands(
    uint32_t slot,
    uint32_t imageIndex) -> void
{
    auto &cmd = frames.cmd(slot);

    cmd.begin(vk::CommandBufferBeginInfo{});

    // opaque black
    const auto clearValue = vk::ClearValue{
        vk::ClearColorValue{std::array<float, 4>{0.0f, 0.0f, 0.0f, 1.0f}}};

    cmd.beginRenderPass(
        vk::RenderPassBeginInfo{
            *renderPass.handle,
            *framebuffers[imageIndex],
            vk::Rect2D{{0, 0}, context.extent()},
            clearValue},
        vk::SubpassContents::eInline);

    cmd.bindPipeline(vk::PipelineBindPoint::eGraphics, *pipeline.handle);
    cmd.draw(3, 1, 0, 0);

    cmd.endRenderPass();
    cmd.end();
}

auto Renderer::submit(
    uint32_t slot,
    uint32_t imageIndex) -> void
{
    const auto &sync = frames.sync(slot);

    const auto waitSemaphore   = *sync.imageAvailable;
    const auto signalSemaphore = context.swapchain.renderFinishedSemaphore(imageIndex);
    const auto commandBuffer   = *frames.cmd(slot);

    // the image is first written by the render pass' color attachment output
    const vk::PipelineStageFlags waitStage =
        vk::PipelineStageFlagBits::eColorAttachmentOutput;

    context.device.graphicsQueue.submit(
        vk::SubmitInfo{waitSemaphore, waitStage, commandBuffer, signalSemaphore},
        *sync.inFlight);
}

auto Renderer::present(
    uint32_t /*slot*/,
    uint32_t imageIndex) -> TargetStatus
{
    return context.swapchain.present(
        context.device.presentQueue,
        context.swapchain.renderFinishedSemaphore(imageIndex),
        imageIndex);
}

auto Renderer::recreateTargets() -> bool
{
    if (!context.swapchain.waitForDrawableExtent()) {
        spdlog::debug("Window closed while minimized, presentation targets not rebuilt");
        return false;
    }

    // Ensure no work is using old swapchain-dependent resources
    context.device.waitIdle();

    framebuffers.clear();
    context.swapchain.recreate();

    if (context.colorFormat() != renderPass.colorFormat) {
        throw std::runtime_error{
            "Presentation format changed while recreating the swapchain"};
    }

    pipeline.rebuild(context.extent());
    framebuffers.create();

    return true;
}

auto Renderer::waitIdle() -> void
{
    spdlog::debug("Waiting for device idle");
    context.device.waitIdle();
}
