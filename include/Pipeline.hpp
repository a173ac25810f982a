#pragma once

#include <vulkan/vulkan_raii.hpp>

#include <cstdint>
#include <span>
#include <vector>

#include "Device.hpp"
#include "RenderPass.hpp"
#include "ResourceGraph.hpp"

// Triangle pipeline: no vertex input, fixed viewport covering the whole
// target, back-face culling with clockwise front faces, no depth, no blending.
struct Pipeline {
    Pipeline(
        const Device          &device,
        const RenderPass      &renderPass,
        std::vector<uint32_t>  vertexCode,
        std::vector<uint32_t>  fragmentCode,
        vk::Extent2D           extent,
        ResourceGraph         &graph);

    static auto createPipeline(
        const Device                   &device,
        const RenderPass               &renderPass,
        const vk::raii::PipelineLayout &pipelineLayout,
        std::span<const uint32_t>       vertexCode,
        std::span<const uint32_t>       fragmentCode,
        vk::Extent2D                    extent) -> vk::raii::Pipeline;

    // The viewport is baked in, so a new extent needs a new pipeline
    auto rebuild(vk::Extent2D newExtent) -> void;

    [[nodiscard]]
    auto renderTarget() const -> const RenderPass &;

    ResourceToken            token;
    const Device            &device;
    const RenderPass        &renderPass;
    std::vector<uint32_t>    vertexCode;
    std::vector<uint32_t>    fragmentCode;
    vk::Extent2D             extent;
    vk::raii::PipelineLayout layout;
    vk::raii::Pipeline       handle;
};
