#pragma once

#include <vulkan/vulkan_raii.hpp>

#include "Device.hpp"
#include "ResourceGraph.hpp"

// Command pool with a single primary buffer that can be reset on its own
struct Command {
    Command(
        const Device  &device,
        ResourceGraph &graph);

    ResourceToken           token;
    vk::raii::CommandPool   pool;
    vk::raii::CommandBuffer buffer;
};
