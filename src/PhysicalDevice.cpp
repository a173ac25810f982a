#include "PhysicalDevice.hpp"

#include <spdlog/spdlog.h>
#include <vulkan/vulkan_to_string.hpp>

#include <algorithm>
#include <iterator>
#include <sstream>
#include <stdexcept>
#include <string_view>

auto AdapterSupport::suitable() const -> bool
{
    return queueFamilies.complete() && missingExtensions.empty() && formatCount > 0
        && presentModeCount > 0;
}

auto AdapterSupport::rejectionReason() const -> std::string
{
    std::ostringstream reason;

    if (queueFamilies.graphicsIndex == std::numeric_limits<uint32_t>::max()) {
        reason << "no graphics-capable queue family; ";
    }
    if (queueFamilies.presentIndex == std::numeric_limits<uint32_t>::max()) {
        reason << "no queue family can present to the surface; ";
    }
    for (const auto &extension : missingExtensions) {
        reason << "missing extension " << extension << "; ";
    }
    if (missingExtensions.empty() && formatCount == 0) {
        reason << "no surface formats; ";
    }
    if (missingExtensions.empty() && presentModeCount == 0) {
        reason << "no present modes; ";
    }

    auto text = reason.str();
    if (text.size() >= 2) {
        text.resize(text.size() - 2);
    }
    return text;
}

PhysicalDevice::PhysicalDevice(
    const Instance                  &instance,
    const Surface                   &surface,
    const std::vector<const char *> &requiredExtensions)
    : handle{choosePhysicalDevice(
          instance,
          surface,
          requiredExtensions)},
      queueFamilyIndices{findQueueFamilies(
          handle,
          surface)}
{
    spdlog::info("Selected adapter \"{}\"", handle.getProperties().deviceName.data());
}

auto PhysicalDevice::findQueueFamilies(
    std::span<const vk::QueueFamilyProperties> families,
    const std::function<bool(uint32_t)>       &supportsPresent) -> QueueFamilyIndices
{
    auto queueFamilyIndices = QueueFamilyIndices{};

    for (uint32_t index = 0; index < families.size(); ++index) {
        const auto graphics =
            static_cast<bool>(families[index].queueFlags & vk::QueueFlagBits::eGraphics);
        const auto present = supportsPresent(index);

        if (graphics && present) {
            return {index, index};
        }

        if (graphics
            && queueFamilyIndices.graphicsIndex
                   == std::numeric_limits<uint32_t>::max()) {
            queueFamilyIndices.graphicsIndex = index;
        }

        if (present
            && queueFamilyIndices.presentIndex
                   == std::numeric_limits<uint32_t>::max()) {
            queueFamilyIndices.presentIndex = index;
        }
    }

    return queueFamilyIndices;
}

auto PhysicalDevice::findQueueFamilies(
    const vk::raii::PhysicalDevice &physicalDevice,
    const Surface                  &surface) -> QueueFamilyIndices
{
    const auto queueFamilyProperties = physicalDevice.getQueueFamilyProperties();

    return findQueueFamilies(queueFamilyProperties, [&](uint32_t index) {
        return physicalDevice.getSurfaceSupportKHR(index, *surface.handle) == vk::True;
    });
}

// --------------------------------------------------------------
// Helper: return a list of missing extensions for this device
// --------------------------------------------------------------
auto PhysicalDevice::getMissingExtensions(
    const vk::raii::PhysicalDevice  &physicalDevice,
    const std::vector<const char *> &requiredExtensions) -> std::vector<std::string>
{
    const auto deviceExtensions = physicalDevice.enumerateDeviceExtensionProperties();

    auto missingExtensions = std::vector<std::string>{};

    for (const auto *required : requiredExtensions) {
        const auto present = std::ranges::any_of(
            deviceExtensions,
            [required](const vk::ExtensionProperties &properties) {
                return std::string_view{properties.extensionName.data()}
                    == std::string_view{required};
            });

        if (!present) {
            missingExtensions.emplace_back(required);
        }
    }

    return missingExtensions;
}

auto PhysicalDevice::querySupport(
    const vk::raii::PhysicalDevice  &physicalDevice,
    const Surface                   &surface,
    const std::vector<const char *> &requiredExtensions) -> AdapterSupport
{
    const auto properties = physicalDevice.getProperties();

    auto support = AdapterSupport{
        .name              = properties.deviceName.data(),
        .type              = properties.deviceType,
        .queueFamilies     = findQueueFamilies(physicalDevice, surface),
        .missingExtensions = getMissingExtensions(physicalDevice, requiredExtensions)};

    // surface queries are only meaningful once the swapchain extension exists
    if (support.missingExtensions.empty()) {
        support.formatCount = physicalDevice.getSurfaceFormatsKHR(*surface.handle).size();
        support.presentModeCount =
            physicalDevice.getSurfacePresentModesKHR(*surface.handle).size();
    }

    return support;
}

auto PhysicalDevice::selectAdapter(std::span<const AdapterSupport> adapters)
    -> std::optional<std::size_t>
{
    const auto found = std::ranges::find_if(adapters, &AdapterSupport::suitable);

    if (found == adapters.end()) {
        return std::nullopt;
    }

    return static_cast<std::size_t>(std::distance(adapters.begin(), found));
}

auto PhysicalDevice::choosePhysicalDevice(
    const Instance                  &instance,
    const Surface                   &surface,
    const std::vector<const char *> &requiredExtensions) -> vk::raii::PhysicalDevice
{
    auto physicalDevices = vk::raii::PhysicalDevices{instance.handle};

    if (physicalDevices.empty()) {
        throw std::runtime_error{"No Vulkan-capable devices found."};
    }

    auto adapters = std::vector<AdapterSupport>{};
    adapters.reserve(physicalDevices.size());

    for (const auto &physicalDevice : physicalDevices) {
        adapters.push_back(querySupport(physicalDevice, surface, requiredExtensions));

        spdlog::debug(
            "Found adapter \"{}\" ({})",
            adapters.back().name,
            vk::to_string(adapters.back().type));
    }

    if (const auto selected = selectAdapter(adapters)) {
        return std::move(physicalDevices[*selected]);
    }

    // collect diagnostic information for the failure
    std::stringstream diagnostic;
    diagnostic << "No suitable adapter:";
    for (const auto &adapter : adapters) {
        diagnostic << "\n\t\"" << adapter.name << "\": " << adapter.rejectionReason();
    }

    throw std::runtime_error(diagnostic.str());
}
