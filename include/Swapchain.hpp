#pragma once

#include <cstdint>
#include <span>
#include <vector>

#include <vulkan/vulkan_raii.hpp>

#include "Device.hpp"
#include "FrameBackend.hpp"
#include "PhysicalDevice.hpp"
#include "ResourceGraph.hpp"
#include "Surface.hpp"

struct Swapchain {
    Swapchain(
        const Device         &device,
        const PhysicalDevice &physicalDevice,
        const Surface        &surface,
        ResourceGraph        &graph);

    auto create(vk::SwapchainKHR oldSwapchain = {}) -> void;

    // Blocks while the window has no area. False when the window was asked to
    // close in the meantime.
    [[nodiscard]]
    auto waitForDrawableExtent() const -> bool;

    // Rebuilds from the old handle; the window must have a non-zero area
    auto recreate() -> void;

    // B8G8R8A8 sRGB, else any sRGB-nonlinear format, else the first one
    [[nodiscard]]
    static auto chooseSurfaceFormat(std::span<const vk::SurfaceFormatKHR> availableFormats)
        -> vk::SurfaceFormatKHR;

    [[nodiscard]]
    static auto choosePresentMode(std::span<const vk::PresentModeKHR> availablePresentModes)
        -> vk::PresentModeKHR;

    [[nodiscard]]
    static auto chooseExtent(
        const vk::SurfaceCapabilitiesKHR &caps,
        const vk::Extent2D               &desired) -> vk::Extent2D;

    [[nodiscard]]
    static auto chooseImageCount(const vk::SurfaceCapabilitiesKHR &caps) -> uint32_t;

    [[nodiscard]]
    auto createSwapchain(vk::SwapchainKHR oldSwapchain) -> vk::raii::SwapchainKHR;

    [[nodiscard]]
    auto acquireNextImage(
        vk::Semaphore signalSemaphore,
        uint64_t      timeout) -> AcquireResult;

    [[nodiscard]]
    auto present(
        const vk::raii::Queue &queue,
        vk::Semaphore          waitSemaphore,
        uint32_t               imageIndex) -> TargetStatus;

    [[nodiscard]]
    auto extent() const -> vk::Extent2D;

    // Signaled by the submission rendering into the image, waited on by its
    // presentation. Kept per image so a semaphore is only re-signaled once
    // the presentation engine has handed the image back.
    [[nodiscard]]
    auto renderFinishedSemaphore(uint32_t imageIndex) const -> vk::Semaphore;

    ResourceToken         token;
    const Device         &device;
    const PhysicalDevice &physicalDevice;
    const Surface        &surface;

    vk::raii::SwapchainKHR           handle = nullptr;
    vk::Extent2D                     swapchainExtent;
    std::vector<vk::Image>           images;
    std::vector<vk::raii::ImageView> imageViews;
    std::vector<vk::raii::Semaphore> renderFinishedSemaphores;
    vk::Format                       imageFormat = vk::Format::eUndefined;
    vk::PresentModeKHR               presentMode = vk::PresentModeKHR::eFifo;
};
