#include "Instance.hpp"

#include "Window.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <stdexcept>
#include <string_view>

namespace
{

constexpr auto validationLayerName = std::string_view{"VK_LAYER_KHRONOS_validation"};

} // namespace

Instance::Instance(
    const RendererConfig &config,
    DiagnosticSink        diagnosticSink,
    ResourceGraph        &graph)
    : token{graph, ResourceKind::Context},
      sink{std::make_unique<DiagnosticSink>(std::move(diagnosticSink))},
      context{},
      handle{createInstance(
          context,
          config.enableValidation,
          *sink)},
      debugUtils{createDebugUtilsMessenger(
          handle,
          config.enableValidation,
          *sink)}
{
    spdlog::debug(
        "Vulkan instance created (validation {})",
        config.enableValidation ? "enabled" : "disabled");
}

auto Instance::getInstanceLayers(
    const vk::raii::Context &context,
    bool                     enableValidation) -> std::vector<const char *>
{
    if (!enableValidation) {
        return {};
    }

    const auto availableLayers = context.enumerateInstanceLayerProperties();

    const auto found = std::ranges::any_of(
        availableLayers,
        [](const vk::LayerProperties &properties) {
            return std::string_view{properties.layerName.data()} == validationLayerName;
        });

    // Drop validation layer if not present
    if (!found) {
        spdlog::warn("Validation layer not found, continuing without it.");
        return {};
    }

    return {validationLayerName.data()};
}

auto Instance::createDebugUtilsMessenger(
    const vk::raii::Instance &instance,
    bool                      enableValidation,
    DiagnosticSink           &sink) -> vk::raii::DebugUtilsMessengerEXT
{
    if (!enableValidation) {
        return nullptr;
    }

    return {instance, makeDebugUtilsMessengerCreateInfo(sink)};
}

auto Instance::createInstance(
    const vk::raii::Context &context,
    bool                     enableValidation,
    DiagnosticSink          &sink) -> vk::raii::Instance
{
    const auto instanceLayers = getInstanceLayers(context, enableValidation);

    // Add SDL platform extensions
    auto instanceExtensions = getRequiredInstanceExtensions();

    if (enableValidation) {
        instanceExtensions.push_back(VK_EXT_DEBUG_UTILS_EXTENSION_NAME);
    }

    // Validate that all instance extensions are available
    const auto availableExtensions = context.enumerateInstanceExtensionProperties();

    for (const auto *extension : instanceExtensions) {
        const auto available = std::ranges::any_of(
            availableExtensions,
            [extension](const vk::ExtensionProperties &properties) {
                return std::string_view{properties.extensionName.data()}
                    == std::string_view{extension};
            });

        if (!available) {
            throw std::runtime_error{fmt::format(
                "Required Vulkan instance extension missing: {}",
                extension)};
        }
    }

    const auto applicationInfo =
        vk::ApplicationInfo{"Trigon", 1, "Trigon", 1, vk::ApiVersion13};

    auto instanceCreateInfo = vk::InstanceCreateInfo{
        {},
        &applicationInfo,
        instanceLayers,
        instanceExtensions};

    // report problems during instance creation and destruction as well
    const auto messengerCreateInfo = makeDebugUtilsMessengerCreateInfo(sink);
    if (enableValidation) {
        instanceCreateInfo.pNext = &messengerCreateInfo;
    }

    // construct vk::raii::Instance
    return {context, instanceCreateInfo};
}
