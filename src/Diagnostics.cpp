#include "Diagnostics.hpp"

#include <vulkan/vulkan_to_string.hpp>

#include <sstream>
#include <stdexcept>
#include <string>

auto toString(DiagnosticSeverity severity) -> std::string_view
{
    switch (severity) {
    case DiagnosticSeverity::Verbose:
        return "verbose";
    case DiagnosticSeverity::Info:
        return "info";
    case DiagnosticSeverity::Warning:
        return "warning";
    case DiagnosticSeverity::Error:
        return "error";
    }
    return "unknown";
}

auto toString(DiagnosticCategory category) -> std::string_view
{
    switch (category) {
    case DiagnosticCategory::General:
        return "general";
    case DiagnosticCategory::Performance:
        return "performance";
    case DiagnosticCategory::Validation:
        return "validation";
    }
    return "unknown";
}

auto toDiagnosticSeverity(vk::DebugUtilsMessageSeverityFlagBitsEXT severity)
    -> DiagnosticSeverity
{
    switch (severity) {
    case vk::DebugUtilsMessageSeverityFlagBitsEXT::eVerbose:
        return DiagnosticSeverity::Verbose;
    case vk::DebugUtilsMessageSeverityFlagBitsEXT::eInfo:
        return DiagnosticSeverity::Info;
    case vk::DebugUtilsMessageSeverityFlagBitsEXT::eWarning:
        return DiagnosticSeverity::Warning;
    case vk::DebugUtilsMessageSeverityFlagBitsEXT::eError:
        return DiagnosticSeverity::Error;
    default:
        throw std::logic_error{fmt::format(
            "Unknown diagnostic severity 0x{:x}",
            static_cast<uint32_t>(severity))};
    }
}

auto toDiagnosticCategory(vk::DebugUtilsMessageTypeFlagsEXT types) -> DiagnosticCategory
{
    if (types & vk::DebugUtilsMessageTypeFlagBitsEXT::eValidation) {
        return DiagnosticCategory::Validation;
    }
    if (types & vk::DebugUtilsMessageTypeFlagBitsEXT::ePerformance) {
        return DiagnosticCategory::Performance;
    }
    return DiagnosticCategory::General;
}

auto toLogLevel(DiagnosticSeverity severity) -> spdlog::level::level_enum
{
    switch (severity) {
    case DiagnosticSeverity::Verbose:
        return spdlog::level::trace;
    case DiagnosticSeverity::Info:
        return spdlog::level::info;
    case DiagnosticSeverity::Warning:
        return spdlog::level::warn;
    case DiagnosticSeverity::Error:
        return spdlog::level::err;
    }
    throw std::logic_error{"Unknown diagnostic severity"};
}

auto makeLogSink() -> DiagnosticSink
{
    return [](DiagnosticSeverity severity,
              DiagnosticCategory category,
              std::string_view   message) {
        spdlog::log(toLogLevel(severity), "[vulkan:{}] {}", toString(category), message);
    };
}

// adapted from the Vulkan-Hpp samples
VKAPI_ATTR vk::Bool32 VKAPI_CALL debugMessageFunc(
    vk::DebugUtilsMessageSeverityFlagBitsEXT      messageSeverity,
    vk::DebugUtilsMessageTypeFlagsEXT             messageTypes,
    vk::DebugUtilsMessengerCallbackDataEXT const *pCallbackData,
    void                                         *pUserData) noexcept
{
    // Unknown severities throw out of this noexcept callback and terminate
    const auto severity = toDiagnosticSeverity(messageSeverity);
    const auto category = toDiagnosticCategory(messageTypes);

    std::ostringstream message;

    if (pCallbackData->pMessageIdName) {
        message << "<" << pCallbackData->pMessageIdName << "> ";
    }
    message << pCallbackData->pMessage;

    for (uint32_t i = 0; i < pCallbackData->objectCount; i++) {
        const auto &object = pCallbackData->pObjects[i];
        message << "\n\t" << vk::to_string(object.objectType) << " 0x" << std::hex
                << object.objectHandle << std::dec;
        if (object.pObjectName) {
            message << " \"" << object.pObjectName << "\"";
        }
    }

    const auto &sink = *static_cast<DiagnosticSink *>(pUserData);
    sink(severity, category, message.str());

    // never abort the call that triggered the message
    return vk::False;
}

auto makeDebugUtilsMessengerCreateInfo(DiagnosticSink &sink)
    -> vk::DebugUtilsMessengerCreateInfoEXT
{
    const auto severityFlags = vk::DebugUtilsMessageSeverityFlagsEXT{
        vk::DebugUtilsMessageSeverityFlagBitsEXT::eVerbose
        | vk::DebugUtilsMessageSeverityFlagBitsEXT::eInfo
        | vk::DebugUtilsMessageSeverityFlagBitsEXT::eWarning
        | vk::DebugUtilsMessageSeverityFlagBitsEXT::eError};

    const auto messageTypeFlags = vk::DebugUtilsMessageTypeFlagsEXT{
        vk::DebugUtilsMessageTypeFlagBitsEXT::eGeneral
        | vk::DebugUtilsMessageTypeFlagBitsEXT::ePerformance
        | vk::DebugUtilsMessageTypeFlagBitsEXT::eValidation};

    return vk::DebugUtilsMessengerCreateInfoEXT{
        {},
        severityFlags,
        messageTypeFlags,
        &debugMessageFunc,
        &sink};
}
