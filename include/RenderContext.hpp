#pragma once

#include <vector>
#include <vulkan/vulkan_raii.hpp>

#include "Device.hpp"
#include "Instance.hpp"
#include "PhysicalDevice.hpp"
#include "RendererConfig.hpp"
#include "ResourceGraph.hpp"
#include "Surface.hpp"
#include "Swapchain.hpp"
#include "Window.hpp"

struct RenderContext {
    // Core Vulkan context
    Instance       instance;
    Surface        surface;
    PhysicalDevice physicalDevice;
    Device         device;

    // Surface-dependent resources
    Swapchain swapchain;

    // Construction
    RenderContext(
        const RendererConfig            &config,
        const Window                    &window,
        const std::vector<const char *> &requiredExtensions,
        ResourceGraph                   &graph);

    [[nodiscard]]
    auto extent() const -> vk::Extent2D;

    [[nodiscard]]
    auto colorFormat() const -> vk::Format;
};
