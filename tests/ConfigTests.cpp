#include "RendererConfig.hpp"

#include <fmt/format.h>

#include <stdexcept>
#include <vector>

namespace
{

auto parse(std::vector<const char *> args) -> RendererConfig
{
    return parseConfig(args);
}

bool rejects(std::vector<const char *> args)
{
    try {
        (void)parse(std::move(args));
    } catch (const std::invalid_argument &) {
        return true;
    }
    return false;
}

bool test_defaults()
{
    const auto config = parse({});

    return config.windowTitle == "Hello, Triangle" && config.windowWidth == 800
        && config.windowHeight == 600 && config.framesInFlight == 1
        && config.fenceTimeout == std::numeric_limits<uint64_t>::max()
        && config.acquireTimeout == std::numeric_limits<uint64_t>::max()
        && config.logLevel == spdlog::level::info
        && config.vertexShaderPath.filename() == "triangle.vert.spv"
        && config.fragmentShaderPath.filename() == "triangle.frag.spv"
        && config.enableValidation == (TRIGON_ENABLE_VALIDATION != 0);
}

bool test_flags()
{
    const auto config = parse(
        {"--validation",
         "--frames",
         "2",
         "--width",
         "1024",
         "--height",
         "768",
         "--log-level",
         "debug"});

    if (!config.enableValidation || config.framesInFlight != 2 || config.windowWidth != 1024
        || config.windowHeight != 768 || config.logLevel != spdlog::level::debug) {
        return false;
    }

    // the last validation switch wins
    return !parse({"--validation", "--no-validation"}).enableValidation;
}

bool test_shader_directory()
{
    const auto config = parse({"build/shaders"});

    return config.vertexShaderPath == std::filesystem::path{"build/shaders/triangle.vert.spv"}
        && config.fragmentShaderPath
               == std::filesystem::path{"build/shaders/triangle.frag.spv"};
}

bool test_bad_arguments()
{
    return rejects({"--fullscreen"}) && rejects({"--frames"}) && rejects({"--frames", "0"})
        && rejects({"--frames", "two"}) && rejects({"--width", "-5"})
        && rejects({"--height", "12px"}) && rejects({"--log-level", "loud"})
        && rejects({"shaders", "more-shaders"});
}

bool test_window_size_fits_int()
{
    // 2147483648 would wrap negative once handed to SDL
    if (!rejects({"--width", "2147483648"}) || !rejects({"--height", "4294967295"})) {
        return false;
    }

    const auto config = parse({"--width", "2147483647", "--frames", "4294967295"});
    return config.windowWidth == 2147483647u && config.framesInFlight == 4294967295u;
}

bool test_log_level_names()
{
    return parse({"--log-level", "warning"}).logLevel == spdlog::level::warn
        && parse({"--log-level", "off"}).logLevel == spdlog::level::off
        && parse({"--log-level", "trace"}).logLevel == spdlog::level::trace;
}

} // namespace

int main()
{
    const bool ok_defaults  = test_defaults();
    const bool ok_flags     = test_flags();
    const bool ok_directory = test_shader_directory();
    const bool ok_bad       = test_bad_arguments();
    const bool ok_size      = test_window_size_fits_int();
    const bool ok_levels    = test_log_level_names();

    if (!ok_defaults) fmt::print(stderr, "[config-tests] defaults wrong\n");
    if (!ok_flags) fmt::print(stderr, "[config-tests] flags not applied\n");
    if (!ok_directory) fmt::print(stderr, "[config-tests] shader directory not applied\n");
    if (!ok_bad) fmt::print(stderr, "[config-tests] malformed arguments accepted\n");
    if (!ok_size) fmt::print(stderr, "[config-tests] window size bound wrong\n");
    if (!ok_levels) fmt::print(stderr, "[config-tests] log level names not accepted\n");

    if (!(ok_defaults && ok_flags && ok_directory && ok_bad && ok_size && ok_levels)) {
        return 1;
    }
    fmt::print(stderr, "[config-tests] all tests passed\n");
    return 0;
}
