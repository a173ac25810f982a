#pragma once

#include <vulkan/vulkan_raii.hpp>

#include "Device.hpp"
#include "ResourceGraph.hpp"

// One color attachment in the presentation format, cleared on load and handed
// to the presentation engine at the end of the single subpass.
struct RenderPass {
    RenderPass(
        const Device  &device,
        vk::Format     colorFormat,
        ResourceGraph &graph);

    static auto createRenderPass(
        const Device &device,
        vk::Format    colorFormat) -> vk::raii::RenderPass;

    ResourceToken        token;
    vk::Format           colorFormat;
    vk::raii::RenderPass handle;
};
