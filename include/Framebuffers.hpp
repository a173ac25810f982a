#pragma once

#include <cstddef>
#include <vector>

#include <vulkan/vulkan_raii.hpp>

#include "Device.hpp"
#include "RenderPass.hpp"
#include "ResourceGraph.hpp"
#include "Swapchain.hpp"

// One framebuffer per swapchain image view
struct Framebuffers {
    Framebuffers(
        const Device     &device,
        const Swapchain  &swapchain,
        const RenderPass &renderPass,
        ResourceGraph    &graph);

    auto create() -> void;

    // Releases every framebuffer, newest first
    auto clear() -> void;

    [[nodiscard]]
    auto size() const -> std::size_t;

    [[nodiscard]]
    auto operator[](uint32_t imageIndex) const -> const vk::raii::Framebuffer &;

    const Device     &device;
    const Swapchain  &swapchain;
    const RenderPass &renderPass;
    ResourceGraph    &graph;

    std::vector<ResourceToken>         tokens;
    std::vector<vk::raii::Framebuffer> handles;
};
