#include "RenderPass.hpp"

#include <spdlog/spdlog.h>
#include <vulkan/vulkan_to_string.hpp>

RenderPass::RenderPass(
    const Device  &device,
    vk::Format     colorFormat,
    ResourceGraph &graph)
    : token{graph, ResourceKind::RenderPass, {device.token.handle()}},
      colorFormat{colorFormat},
      handle{createRenderPass(
          device,
          colorFormat)}
{
    spdlog::debug("Render pass created for {}", vk::to_string(colorFormat));
}

auto RenderPass::createRenderPass(
    const Device &device,
    vk::Format    colorFormat) -> vk::raii::RenderPass
{
    const auto colorAttachment = vk::AttachmentDescription{
        {},
        colorFormat,
        vk::SampleCountFlagBits::e1,
        vk::AttachmentLoadOp::eClear,
        vk::AttachmentStoreOp::eStore,
        vk::AttachmentLoadOp::eDontCare,
        vk::AttachmentStoreOp::eDontCare,
        vk::ImageLayout::eUndefined,
        vk::ImageLayout::ePresentSrcKHR};

    const auto colorAttachmentReference =
        vk::AttachmentReference{0, vk::ImageLayout::eColorAttachmentOptimal};

    const auto subpass = vk::SubpassDescription{
        {},
        vk::PipelineBindPoint::eGraphics,
        {},
        colorAttachmentReference};

    // the layout transition waits for the acquire semaphore, which is waited
    // on at color attachment output
    const auto dependency = vk::SubpassDependency{
        vk::SubpassExternal,
        0,
        vk::PipelineStageFlagBits::eColorAttachmentOutput,
        vk::PipelineStageFlagBits::eColorAttachmentOutput,
        {},
        vk::AccessFlagBits::eColorAttachmentWrite};

    return {
        device.handle,
        vk::RenderPassCreateInfo{{}, colorAttachment, subpass, dependency}};
}
