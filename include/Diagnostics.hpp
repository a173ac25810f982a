#pragma once

#include <spdlog/spdlog.h>
#include <vulkan/vulkan.hpp>

#include <functional>
#include <string_view>

enum class DiagnosticSeverity { Verbose, Info, Warning, Error };

enum class DiagnosticCategory { General, Performance, Validation };

// Receives backend diagnostics synchronously on the thread that made the
// offending call.
using DiagnosticSink = std::function<
    void(DiagnosticSeverity, DiagnosticCategory, std::string_view message)>;

auto toString(DiagnosticSeverity severity) -> std::string_view;
auto toString(DiagnosticCategory category) -> std::string_view;

// Throws std::logic_error for anything but a single known severity bit
auto toDiagnosticSeverity(vk::DebugUtilsMessageSeverityFlagBitsEXT severity)
    -> DiagnosticSeverity;

auto toDiagnosticCategory(vk::DebugUtilsMessageTypeFlagsEXT types) -> DiagnosticCategory;

auto toLogLevel(DiagnosticSeverity severity) -> spdlog::level::level_enum;

// Sink forwarding every diagnostic to the default spdlog logger at the
// matching level
auto makeLogSink() -> DiagnosticSink;

// Messenger callback; pUserData must point at a DiagnosticSink
VKAPI_ATTR vk::Bool32 VKAPI_CALL debugMessageFunc(
    vk::DebugUtilsMessageSeverityFlagBitsEXT      messageSeverity,
    vk::DebugUtilsMessageTypeFlagsEXT             messageTypes,
    vk::DebugUtilsMessengerCallbackDataEXT const *pCallbackData,
    void                                         *pUserData) noexcept;

auto makeDebugUtilsMessengerCreateInfo(DiagnosticSink &sink)
    -> vk::DebugUtilsMessengerCreateInfoEXT;
