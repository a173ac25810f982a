#include "Application.hpp"
#include "RendererConfig.hpp"

#include <spdlog/spdlog.h>
#include <vulkan/vulkan_raii.hpp>

#include <exception>
#include <vector>

auto main(
    int   argc,
    char *argv[]) -> int
{
    try {
        const auto args   = std::vector<const char *>(argv + (argc > 0 ? 1 : 0), argv + argc);
        const auto config = parseConfig(args);

        spdlog::set_level(config.logLevel);

        auto application = Application{config};
        application.run();
    } catch (const vk::SystemError &error) {
        spdlog::error("Vulkan error: {}", error.what());
        return 1;
    } catch (const std::exception &error) {
        spdlog::error("{}", error.what());
        return 1;
    }

    return 0;
}
