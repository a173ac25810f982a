#include "Swapchain.hpp"

#include "Window.hpp"

#include <spdlog/spdlog.h>
#include <vulkan/vulkan_to_string.hpp>

#include <algorithm>
#include <array>
#include <limits>
#include <stdexcept>
#include <tuple>

Swapchain::Swapchain(
    const Device         &device,
    const PhysicalDevice &physicalDevice,
    const Surface        &surface,
    ResourceGraph        &graph)
    : token{graph, ResourceKind::Swapchain, {device.token.handle(), surface.token.handle()}},
      device{device},
      physicalDevice{physicalDevice},
      surface{surface}
{
    create();
}

auto Swapchain::chooseSurfaceFormat(
    std::span<const vk::SurfaceFormatKHR> availableFormats) -> vk::SurfaceFormatKHR
{
    if (availableFormats.empty()) {
        throw std::invalid_argument{"Surface reports no formats"};
    }

    constexpr auto preferredFormat     = vk::Format::eB8G8R8A8Srgb;
    constexpr auto preferredColorSpace = vk::ColorSpaceKHR::eSrgbNonlinear;

    for (auto format : availableFormats) {
        if (format.format == preferredFormat && format.colorSpace == preferredColorSpace) {
            return format;
        }
    }

    for (auto format : availableFormats) {
        if (format.colorSpace == preferredColorSpace) {
            return format;
        }
    }

    return availableFormats.front();
}

auto Swapchain::choosePresentMode(
    std::span<const vk::PresentModeKHR> availablePresentModes) -> vk::PresentModeKHR
{
    for (auto mode : availablePresentModes) {
        if (mode == vk::PresentModeKHR::eMailbox) {
            return mode;
        }
    }

    // the only mode every implementation must support
    return vk::PresentModeKHR::eFifo;
}

auto Swapchain::chooseExtent(
    const vk::SurfaceCapabilitiesKHR &capabilities,
    const vk::Extent2D               &desired) -> vk::Extent2D
{
    if (capabilities.currentExtent.width != std::numeric_limits<uint32_t>::max()) {
        return capabilities.currentExtent;
    }
    vk::Extent2D extent{
        std::clamp(
            desired.width,
            capabilities.minImageExtent.width,
            capabilities.maxImageExtent.width),
        std::clamp(
            desired.height,
            capabilities.minImageExtent.height,
            capabilities.maxImageExtent.height)};

    return extent;
}

auto Swapchain::chooseImageCount(const vk::SurfaceCapabilitiesKHR &capabilities)
    -> uint32_t
{
    const auto imageCount = capabilities.minImageCount + 1;

    // a max of zero means no upper limit
    if (capabilities.maxImageCount > 0) {
        return std::min(imageCount, capabilities.maxImageCount);
    }

    return imageCount;
}

auto Swapchain::createSwapchain(vk::SwapchainKHR oldSwapchain) -> vk::raii::SwapchainKHR
{
    const auto capabilities =
        physicalDevice.handle.getSurfaceCapabilitiesKHR(*surface.handle);

    const auto formats = physicalDevice.handle.getSurfaceFormatsKHR(*surface.handle);

    const auto presentModes =
        physicalDevice.handle.getSurfacePresentModesKHR(*surface.handle);

    const auto surfaceFormat = chooseSurfaceFormat(formats);
    presentMode              = choosePresentMode(presentModes);
    imageFormat              = surfaceFormat.format;
    const auto desiredExtent = getFramebufferExtent(device.window.get());
    swapchainExtent          = chooseExtent(capabilities, desiredExtent);

    if (swapchainExtent.width == 0 || swapchainExtent.height == 0) {
        throw std::runtime_error("Cannot create swapchain with zero extent");
    }

    const auto imageCount = chooseImageCount(capabilities);

    const auto graphicsFamilyQueueIndex = device.queueFamilyIndices.graphicsIndex;
    const auto presentFamilyQueueIndex  = device.queueFamilyIndices.presentIndex;

    const auto concurrent = (graphicsFamilyQueueIndex != presentFamilyQueueIndex);

    const auto queueFamilies =
        std::array{graphicsFamilyQueueIndex, presentFamilyQueueIndex};

    vk::SwapchainCreateInfoKHR createInfo{
        {},
        *surface.handle,
        imageCount,
        surfaceFormat.format,
        surfaceFormat.colorSpace,
        swapchainExtent,
        1u,
        vk::ImageUsageFlagBits::eColorAttachment,
        concurrent ? vk::SharingMode::eConcurrent : vk::SharingMode::eExclusive,
        concurrent ? static_cast<uint32_t>(queueFamilies.size()) : 0u,
        concurrent ? queueFamilies.data() : nullptr,
        capabilities.currentTransform,
        vk::CompositeAlphaFlagBitsKHR::eOpaque,
        presentMode,
        vk::True,
        oldSwapchain};

    return vk::raii::SwapchainKHR(device.handle, createInfo);
}

auto Swapchain::create(vk::SwapchainKHR oldSwapchain) -> void
{
    handle = createSwapchain(oldSwapchain);

    images = handle.getImages();
    imageViews.clear();
    renderFinishedSemaphores.clear();

    for (vk::Image image : images) {
        imageViews.emplace_back(
            device.handle,
            vk::ImageViewCreateInfo{
                {},
                image,
                vk::ImageViewType::e2D,
                imageFormat,
                {},
                {vk::ImageAspectFlagBits::eColor, 0, 1, 0, 1}});

        renderFinishedSemaphores.emplace_back(device.handle, vk::SemaphoreCreateInfo{});
    }

    spdlog::debug(
        "Swapchain created: {} images, {}x{}, {}, {}",
        images.size(),
        swapchainExtent.width,
        swapchainExtent.height,
        vk::to_string(imageFormat),
        vk::to_string(presentMode));
}

auto Swapchain::waitForDrawableExtent() const -> bool
{
    // a minimized window has no area to present to
    auto framebufferExtent = getFramebufferExtent(device.window.get());
    while (framebufferExtent.width == 0 || framebufferExtent.height == 0) {
        if (waitEvents(device.window.get())) {
            return false;
        }
        framebufferExtent = getFramebufferExtent(device.window.get());
    }

    return true;
}

auto Swapchain::recreate() -> void
{
    device.waitIdle();

    renderFinishedSemaphores.clear();
    imageViews.clear();
    images.clear();

    // retired only after its replacement exists
    auto oldSwapchain = std::move(handle);
    create(*oldSwapchain);
}

auto Swapchain::renderFinishedSemaphore(uint32_t imageIndex) const -> vk::Semaphore
{
    return *renderFinishedSemaphores.at(imageIndex);
}

auto Swapchain::acquireNextImage(
    vk::Semaphore signalSemaphore,
    uint64_t      timeout) -> AcquireResult
{
    vk::Result result;
    uint32_t   imageIndex = 0;

    try {
        std::tie(result, imageIndex) = handle.acquireNextImage(timeout, signalSemaphore);
    } catch (const vk::OutOfDateKHRError &) {
        return {TargetStatus::OutOfDate, 0};
    }

    switch (result) {
    case vk::Result::eSuccess:
        return {TargetStatus::Ready, imageIndex};
    case vk::Result::eSuboptimalKHR:
        return {TargetStatus::Suboptimal, imageIndex};
    case vk::Result::eErrorOutOfDateKHR:
        return {TargetStatus::OutOfDate, 0};
    default:
        throw std::runtime_error{
            fmt::format("Swapchain image acquire failed: {}", vk::to_string(result))};
    }
}

auto Swapchain::present(
    const vk::raii::Queue &queue,
    vk::Semaphore          waitSemaphore,
    uint32_t               imageIndex) -> TargetStatus
{
    vk::Result result;

    try {
        result = queue.presentKHR(vk::PresentInfoKHR{waitSemaphore, *handle, imageIndex});
    } catch (const vk::OutOfDateKHRError &) {
        return TargetStatus::OutOfDate;
    }

    if (result == vk::Result::eErrorOutOfDateKHR) {
        return TargetStatus::OutOfDate;
    }

    if (result == vk::Result::eSuboptimalKHR) {
        return TargetStatus::Suboptimal;
    }

    return TargetStatus::Ready;
}

auto Swapchain::extent() const -> vk::Extent2D
{
    return swapchainExtent;
}
