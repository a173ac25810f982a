#pragma once

#include <vulkan/vulkan_raii.hpp>

#include "Instance.hpp"
#include "ResourceGraph.hpp"
#include "Window.hpp"

struct Surface {

    Surface(
        const Instance &instance,
        const Window   &window,
        ResourceGraph  &graph);

    static auto createSurface(
        const Instance &instance,
        const Window   &window) -> vk::raii::SurfaceKHR;

    ResourceToken        token;
    vk::raii::SurfaceKHR handle;
};
