#include "Pipeline.hpp"

#include "PipelineLayout.hpp"
#include "Shader.hpp"

#include <spdlog/spdlog.h>

#include <array>

Pipeline::Pipeline(
    const Device          &device,
    const RenderPass      &renderPass,
    std::vector<uint32_t>  vertexCode,
    std::vector<uint32_t>  fragmentCode,
    vk::Extent2D           extent,
    ResourceGraph         &graph)
    : token{graph, ResourceKind::Pipeline, {device.token.handle(), renderPass.token.handle()}},
      device{device},
      renderPass{renderPass},
      vertexCode{std::move(vertexCode)},
      fragmentCode{std::move(fragmentCode)},
      extent{extent},
      layout{createPipelineLayout(device.handle)},
      handle{createPipeline(
          device,
          renderPass,
          layout,
          this->vertexCode,
          this->fragmentCode,
          extent)}
{
    spdlog::debug("Graphics pipeline created for {}x{}", extent.width, extent.height);
}

auto Pipeline::createPipeline(
    const Device                   &device,
    const RenderPass               &renderPass,
    const vk::raii::PipelineLayout &pipelineLayout,
    std::span<const uint32_t>       vertexCode,
    std::span<const uint32_t>       fragmentCode,
    vk::Extent2D                    extent) -> vk::raii::Pipeline
{
    // only needed until the pipeline is compiled
    auto vertexModule   = createShaderModule(device.handle, vertexCode);
    auto fragmentModule = createShaderModule(device.handle, fragmentCode);

    // The stages used by this pipeline
    const auto shaderStages = std::array{
        vk::PipelineShaderStageCreateInfo{
            {},
            vk::ShaderStageFlagBits::eVertex,
            *vertexModule,
            "main",
            {}},
        vk::PipelineShaderStageCreateInfo{
            {},
            vk::ShaderStageFlagBits::eFragment,
            *fragmentModule,
            "main",
            {}},
    };

    // positions come from gl_VertexIndex
    const auto vertexInputStateCreateInfo = vk::PipelineVertexInputStateCreateInfo{};

    const auto inputAssemblyCreateInfo = vk::PipelineInputAssemblyStateCreateInfo{
        {},
        vk::PrimitiveTopology::eTriangleList,
        false};

    const auto viewport = vk::Viewport{
        0.0f,
        0.0f,
        static_cast<float>(extent.width),
        static_cast<float>(extent.height),
        0.0f,
        1.0f};

    const auto scissor = vk::Rect2D{{0, 0}, extent};

    const auto pipelineViewportStateCreateInfo =
        vk::PipelineViewportStateCreateInfo{{}, viewport, scissor};

    const auto pipelineRasterizationStateCreateInfo =
        vk::PipelineRasterizationStateCreateInfo{
            {},
            {},
            {},
            vk::PolygonMode::eFill,
            vk::CullModeFlags::BitsType::eBack,
            vk::FrontFace::eClockwise,
            {},
            {},
            {},
            {},
            1.0f};

    const auto pipelineMultisampleStateCreateInfo =
        vk::PipelineMultisampleStateCreateInfo{};

    const auto colorBlendAttachmentState = vk::PipelineColorBlendAttachmentState{
        {},
        {},
        {},
        {},
        {},
        {},
        {},
        vk::ColorComponentFlagBits::eR | vk::ColorComponentFlagBits::eG
            | vk::ColorComponentFlagBits::eB | vk::ColorComponentFlagBits::eA};

    const auto pipelineColorBlendStateCreateInfo =
        vk::PipelineColorBlendStateCreateInfo{
            {},
            {},
            vk::LogicOp::eCopy,
            1,
            &colorBlendAttachmentState};

    auto graphicsPipelineCreateInfo = vk::GraphicsPipelineCreateInfo{
        {},
        shaderStages,
        &vertexInputStateCreateInfo,
        &inputAssemblyCreateInfo,
        {},
        &pipelineViewportStateCreateInfo,
        &pipelineRasterizationStateCreateInfo,
        &pipelineMultisampleStateCreateInfo,
        {},
        &pipelineColorBlendStateCreateInfo,
        {},
        *pipelineLayout,
        *renderPass.handle,
        0};

    return vk::raii::Pipeline{device.handle, nullptr, graphicsPipelineCreateInfo};
}

auto Pipeline::rebuild(vk::Extent2D newExtent) -> void
{
    if (newExtent == extent) {
        return;
    }

    handle = createPipeline(device, renderPass, layout, vertexCode, fragmentCode, newExtent);
    extent = newExtent;

    spdlog::debug("Graphics pipeline rebuilt for {}x{}", extent.width, extent.height);
}

auto Pipeline::renderTarget() const -> const RenderPass &
{
    return renderPass;
}
