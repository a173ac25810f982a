#include "Device.hpp"

#include <spdlog/spdlog.h>

#include <set>
#include <vector>

Device::Device(
    const Instance                  &instance,
    const PhysicalDevice            &physicalDevice,
    const Window                    &window,
    const std::vector<const char *> &requiredExtensions,
    ResourceGraph                   &graph)
    : token{graph, ResourceKind::Device, {instance.token.handle()}},
      window{window},
      queueFamilyIndices{physicalDevice.queueFamilyIndices},
      handle{createDevice(
          physicalDevice,
          requiredExtensions)},
      graphicsQueue(
          handle,
          queueFamilyIndices.graphicsIndex,
          0),
      presentQueue(
          handle,
          queueFamilyIndices.presentIndex,
          0)
{
    spdlog::debug(
        "Logical device created (graphics family {}, present family {})",
        queueFamilyIndices.graphicsIndex,
        queueFamilyIndices.presentIndex);
}

auto Device::createDevice(
    const PhysicalDevice            &physicalDevice,
    const std::vector<const char *> &requiredExtensions) -> vk::raii::Device
{
    const auto &queueFamilyIndices = physicalDevice.queueFamilyIndices;

    const float queuePriority = 1.0f;

    std::vector<vk::DeviceQueueCreateInfo> queueCreateInfos;
    std::set<uint32_t>                     uniqueQueueFamilies = {
        queueFamilyIndices.graphicsIndex,
        queueFamilyIndices.presentIndex};

    for (uint32_t familyIndex : uniqueQueueFamilies) {
        queueCreateInfos
            .emplace_back(vk::DeviceQueueCreateFlags{}, familyIndex, 1, &queuePriority);
    }

    auto deviceCreateInfo =
        vk::DeviceCreateInfo{{}, queueCreateInfos, {}, requiredExtensions};

    return {physicalDevice.handle, deviceCreateInfo};
}

auto Device::waitIdle() const -> void
{
    handle.waitIdle();
}
