#pragma once

#include <vector>

#include <vulkan/vulkan_raii.hpp>

#include "Instance.hpp"
#include "PhysicalDevice.hpp"
#include "ResourceGraph.hpp"
#include "Window.hpp"

struct Device {
    Device(
        const Instance                  &instance,
        const PhysicalDevice            &physicalDevice,
        const Window                    &window,
        const std::vector<const char *> &requiredExtensions,
        ResourceGraph                   &graph);

    static auto createDevice(
        const PhysicalDevice            &physicalDevice,
        const std::vector<const char *> &requiredExtensions) -> vk::raii::Device;

    auto waitIdle() const -> void;

    ResourceToken      token;
    const Window      &window;
    QueueFamilyIndices queueFamilyIndices;
    vk::raii::Device   handle;
    vk::raii::Queue    graphicsQueue;
    vk::raii::Queue    presentQueue;
};
