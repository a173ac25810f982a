#pragma once

#include <spdlog/common.h>

#include <cstdint>
#include <filesystem>
#include <limits>
#include <span>
#include <string>

#ifndef TRIGON_SHADER_DIR
#define TRIGON_SHADER_DIR "shaders"
#endif

#ifndef TRIGON_ENABLE_VALIDATION
#define TRIGON_ENABLE_VALIDATION 0
#endif

struct RendererConfig {
    // Window
    std::string windowTitle  = "Hello, Triangle";
    uint32_t    windowWidth  = 800;
    uint32_t    windowHeight = 600;

    // Precompiled SPIR-V, entry point "main" in both
    std::filesystem::path vertexShaderPath =
        std::filesystem::path{TRIGON_SHADER_DIR} / "triangle.vert.spv";
    std::filesystem::path fragmentShaderPath =
        std::filesystem::path{TRIGON_SHADER_DIR} / "triangle.frag.spv";

    // Khronos validation layer + debug messenger
    bool enableValidation = TRIGON_ENABLE_VALIDATION != 0;

    uint32_t framesInFlight = 1;

    // Nanoseconds; max() waits forever
    uint64_t fenceTimeout   = std::numeric_limits<uint64_t>::max();
    uint64_t acquireTimeout = std::numeric_limits<uint64_t>::max();

    spdlog::level::level_enum logLevel = spdlog::level::info;
};

// Command line: [--validation | --no-validation] [--frames <n>]
// [--log-level <level>] [--width <n>] [--height <n>] [shader-directory]
//
// Throws std::invalid_argument on unknown flags or malformed values.
auto parseConfig(std::span<const char *const> args) -> RendererConfig;
