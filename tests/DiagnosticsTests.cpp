#include "CapturedLog.hpp"
#include "Diagnostics.hpp"

#include <fmt/format.h>

#include <stdexcept>
#include <string>
#include <vector>

namespace
{

struct Received {
    DiagnosticSeverity severity;
    DiagnosticCategory category;
    std::string        message;
};

bool test_severity_maps_one_to_one()
{
    using Bits = vk::DebugUtilsMessageSeverityFlagBitsEXT;

    return toDiagnosticSeverity(Bits::eVerbose) == DiagnosticSeverity::Verbose
        && toDiagnosticSeverity(Bits::eInfo) == DiagnosticSeverity::Info
        && toDiagnosticSeverity(Bits::eWarning) == DiagnosticSeverity::Warning
        && toDiagnosticSeverity(Bits::eError) == DiagnosticSeverity::Error
        && toLogLevel(DiagnosticSeverity::Verbose) == spdlog::level::trace
        && toLogLevel(DiagnosticSeverity::Info) == spdlog::level::info
        && toLogLevel(DiagnosticSeverity::Warning) == spdlog::level::warn
        && toLogLevel(DiagnosticSeverity::Error) == spdlog::level::err;
}

bool test_unknown_severity_is_fatal()
{
    // two bits at once is not a single severity
    const auto combined = static_cast<vk::DebugUtilsMessageSeverityFlagBitsEXT>(
        VK_DEBUG_UTILS_MESSAGE_SEVERITY_WARNING_BIT_EXT
        | VK_DEBUG_UTILS_MESSAGE_SEVERITY_ERROR_BIT_EXT);

    try {
        (void)toDiagnosticSeverity(combined);
    } catch (const std::logic_error &) {
        return true;
    }
    return false;
}

bool test_category_priority()
{
    using Bits = vk::DebugUtilsMessageTypeFlagBitsEXT;

    return toDiagnosticCategory(Bits::eGeneral) == DiagnosticCategory::General
        && toDiagnosticCategory(Bits::ePerformance) == DiagnosticCategory::Performance
        && toDiagnosticCategory(Bits::eValidation) == DiagnosticCategory::Validation
        && toDiagnosticCategory(Bits::ePerformance | Bits::eValidation)
               == DiagnosticCategory::Validation
        && toDiagnosticCategory(Bits::eGeneral | Bits::ePerformance)
               == DiagnosticCategory::Performance;
}

bool test_callback_forwards_to_sink()
{
    auto received = std::vector<Received>{};

    DiagnosticSink sink = [&](DiagnosticSeverity severity,
                              DiagnosticCategory category,
                              std::string_view   message) {
        received.push_back({severity, category, std::string{message}});
    };

    auto data           = vk::DebugUtilsMessengerCallbackDataEXT{};
    data.pMessageIdName = "VUID-vkQueueSubmit-test";
    data.pMessage       = "fence is already in use";

    const auto result = debugMessageFunc(
        vk::DebugUtilsMessageSeverityFlagBitsEXT::eError,
        vk::DebugUtilsMessageTypeFlagBitsEXT::eValidation,
        &data,
        &sink);

    if (result != vk::False || received.size() != 1) return false;

    return received[0].severity == DiagnosticSeverity::Error
        && received[0].category == DiagnosticCategory::Validation
        && received[0].message == "<VUID-vkQueueSubmit-test> fence is already in use";
}

bool test_messenger_create_info_targets_sink()
{
    DiagnosticSink sink = [](DiagnosticSeverity, DiagnosticCategory, std::string_view) {};

    const auto createInfo = makeDebugUtilsMessengerCreateInfo(sink);

    return createInfo.pUserData == &sink && createInfo.pfnUserCallback != nullptr
        && (createInfo.messageSeverity & vk::DebugUtilsMessageSeverityFlagBitsEXT::eVerbose)
        && (createInfo.messageType & vk::DebugUtilsMessageTypeFlagBitsEXT::ePerformance);
}

bool test_log_sink_uses_matching_level()
{
    CapturedLog log{spdlog::level::trace};

    const auto sink = makeLogSink();
    sink(DiagnosticSeverity::Warning, DiagnosticCategory::Performance, "slow path");
    sink(DiagnosticSeverity::Verbose, DiagnosticCategory::General, "loader chatter");

    const auto lines = log.entries();

    return lines.size() == 2 && lines[0].first == spdlog::level::warn
        && lines[0].second == "[vulkan:performance] slow path"
        && lines[1].first == spdlog::level::trace;
}

} // namespace

int main()
{
    const bool ok_severity = test_severity_maps_one_to_one();
    const bool ok_unknown  = test_unknown_severity_is_fatal();
    const bool ok_category = test_category_priority();
    const bool ok_callback = test_callback_forwards_to_sink();
    const bool ok_create   = test_messenger_create_info_targets_sink();
    const bool ok_log_sink = test_log_sink_uses_matching_level();

    if (!ok_severity) fmt::print(stderr, "[diagnostics-tests] severity mapping wrong\n");
    if (!ok_unknown) fmt::print(stderr, "[diagnostics-tests] unknown severity accepted\n");
    if (!ok_category) fmt::print(stderr, "[diagnostics-tests] category priority wrong\n");
    if (!ok_callback) fmt::print(stderr, "[diagnostics-tests] callback did not reach sink\n");
    if (!ok_create) fmt::print(stderr, "[diagnostics-tests] messenger create info wrong\n");
    if (!ok_log_sink) fmt::print(stderr, "[diagnostics-tests] log sink level wrong\n");

    if (!(ok_severity && ok_unknown && ok_category && ok_callback && ok_create
          && ok_log_sink)) {
        return 1;
    }
    fmt::print(stderr, "[diagnostics-tests] all tests passed\n");
    return 0;
}
