#pragma once

#include <vulkan/vulkan_raii.hpp>

#include <cstddef>
#include <functional>
#include <limits>
#include <optional>
#include <span>
#include <string>
#include <vector>

#include "Instance.hpp"
#include "Surface.hpp"

struct QueueFamilyIndices {
    uint32_t graphicsIndex = std::numeric_limits<uint32_t>::max();
    uint32_t presentIndex  = std::numeric_limits<uint32_t>::max();

    auto complete() const -> bool
    {
        return graphicsIndex != std::numeric_limits<uint32_t>::max()
            && presentIndex != std::numeric_limits<uint32_t>::max();
    }

    auto unified() const -> bool
    {
        return complete() && graphicsIndex == presentIndex;
    }
};

// What an adapter offers for presenting to one surface
struct AdapterSupport {
    std::string              name;
    vk::PhysicalDeviceType   type = vk::PhysicalDeviceType::eOther;
    QueueFamilyIndices       queueFamilies;
    std::vector<std::string> missingExtensions;
    std::size_t              formatCount      = 0;
    std::size_t              presentModeCount = 0;

    [[nodiscard]]
    auto suitable() const -> bool;

    // Empty when suitable
    [[nodiscard]]
    auto rejectionReason() const -> std::string;
};

struct PhysicalDevice {

    PhysicalDevice(
        const Instance                  &instance,
        const Surface                   &surface,
        const std::vector<const char *> &requiredExtensions);

    // Prefers one family that can both draw and present, otherwise the first
    // of each.
    static auto findQueueFamilies(
        std::span<const vk::QueueFamilyProperties> families,
        const std::function<bool(uint32_t)>       &supportsPresent) -> QueueFamilyIndices;

    static auto findQueueFamilies(
        const vk::raii::PhysicalDevice &physicalDevice,
        const Surface                  &surface) -> QueueFamilyIndices;

    static auto getMissingExtensions(
        const vk::raii::PhysicalDevice  &physicalDevice,
        const std::vector<const char *> &requiredExtensions)
        -> std::vector<std::string>;

    static auto querySupport(
        const vk::raii::PhysicalDevice  &physicalDevice,
        const Surface                   &surface,
        const std::vector<const char *> &requiredExtensions) -> AdapterSupport;

    // First suitable adapter in enumeration order
    static auto selectAdapter(std::span<const AdapterSupport> adapters)
        -> std::optional<std::size_t>;

    static auto choosePhysicalDevice(
        const Instance                  &instance,
        const Surface                   &surface,
        const std::vector<const char *> &requiredExtensions)
        -> vk::raii::PhysicalDevice;

    vk::raii::PhysicalDevice handle;
    QueueFamilyIndices       queueFamilyIndices;
};
