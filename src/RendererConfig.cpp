#include "RendererConfig.hpp"

#include <fmt/format.h>

#include <charconv>
#include <climits>
#include <stdexcept>
#include <string_view>

namespace
{

auto parseCount(
    std::string_view flag,
    std::string_view value,
    uint32_t         maximum = std::numeric_limits<uint32_t>::max()) -> uint32_t
{
    auto result           = uint32_t{0};
    const auto *end       = value.data() + value.size();
    const auto [ptr, err] = std::from_chars(value.data(), end, result);

    if (err != std::errc{} || ptr != end || result == 0 || result > maximum) {
        throw std::invalid_argument{
            fmt::format("{} expects a positive integer, got \"{}\"", flag, value)};
    }

    return result;
}

// Window sizes are handed to SDL as int
constexpr auto maxWindowSize = static_cast<uint32_t>(INT_MAX);

// Accepts spdlog's level names ("trace" ... "critical", "off")
auto parseLogLevel(std::string_view name) -> spdlog::level::level_enum
{
    const auto level = spdlog::level::from_str(std::string{name});

    if (level == spdlog::level::off && name != "off") {
        throw std::invalid_argument{fmt::format("Unknown log level \"{}\"", name)};
    }

    return level;
}

} // namespace

auto parseConfig(std::span<const char *const> args) -> RendererConfig
{
    auto config = RendererConfig{};

    auto shaderDirectorySet = false;

    for (std::size_t i = 0; i < args.size(); ++i) {
        const auto arg = std::string_view{args[i]};

        auto nextValue = [&]() -> std::string_view {
            if (i + 1 >= args.size()) {
                throw std::invalid_argument{fmt::format("{} expects a value", arg)};
            }
            return args[++i];
        };

        if (arg == "--validation") {
            config.enableValidation = true;
        } else if (arg == "--no-validation") {
            config.enableValidation = false;
        } else if (arg == "--frames") {
            config.framesInFlight = parseCount(arg, nextValue());
        } else if (arg == "--width") {
            config.windowWidth = parseCount(arg, nextValue(), maxWindowSize);
        } else if (arg == "--height") {
            config.windowHeight = parseCount(arg, nextValue(), maxWindowSize);
        } else if (arg == "--log-level") {
            config.logLevel = parseLogLevel(nextValue());
        } else if (arg.starts_with("--")) {
            throw std::invalid_argument{fmt::format("Unknown option \"{}\"", arg)};
        } else if (!shaderDirectorySet) {
            const auto shaderDirectory = std::filesystem::path{arg};
            config.vertexShaderPath    = shaderDirectory / "triangle.vert.spv";
            config.fragmentShaderPath  = shaderDirectory / "triangle.frag.spv";
            shaderDirectorySet         = true;
        } else {
            throw std::invalid_argument{
                fmt::format("Unexpected argument \"{}\"", arg)};
        }
    }

    return config;
}
