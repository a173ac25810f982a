#pragma once

#include <vulkan/vulkan_raii.hpp>

#include <memory>
#include <vector>

#include "Diagnostics.hpp"
#include "RendererConfig.hpp"
#include "ResourceGraph.hpp"

struct Instance {

    Instance(
        const RendererConfig &config,
        DiagnosticSink        diagnosticSink,
        ResourceGraph        &graph);

    static auto createInstance(
        const vk::raii::Context &context,
        bool                     enableValidation,
        DiagnosticSink          &sink) -> vk::raii::Instance;

    static auto createDebugUtilsMessenger(
        const vk::raii::Instance &instance,
        bool                      enableValidation,
        DiagnosticSink           &sink) -> vk::raii::DebugUtilsMessengerEXT;

    // Layers that are both requested and available
    static auto getInstanceLayers(
        const vk::raii::Context &context,
        bool                     enableValidation) -> std::vector<const char *>;

    ResourceToken token;

    // Heap allocated so the messenger's user data pointer stays valid
    std::unique_ptr<DiagnosticSink> sink;

    vk::raii::Context                context;
    vk::raii::Instance               handle;
    vk::raii::DebugUtilsMessengerEXT debugUtils;
};
