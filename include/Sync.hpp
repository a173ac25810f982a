#pragma once

#include <vulkan/vulkan_raii.hpp>

#include "Device.hpp"
#include "ResourceGraph.hpp"

// Synchronization for one frame slot. The fence starts signaled so the first
// wait on a fresh slot returns immediately. Render-complete semaphores belong
// to the swapchain images.
struct FrameSync {
    FrameSync(
        const Device  &device,
        ResourceGraph &graph);

    ResourceToken       token;
    vk::raii::Semaphore imageAvailable;
    vk::raii::Fence     inFlight;
};
