#pragma once

#include <vulkan/vulkan_raii.hpp>

#include <cstdint>
#include <filesystem>
#include <span>
#include <string>
#include <vector>

struct ShaderReflection {
    std::string             entryPoint;
    vk::ShaderStageFlagBits stage = vk::ShaderStageFlagBits::eVertex;
};

auto readShaderBlob(const std::filesystem::path &path) -> std::vector<char>;

// Throws std::invalid_argument unless the blob is a non-empty sequence of
// 32-bit words
auto validateShaderBlob(std::span<const char> blob) -> void;

auto toSpirvWords(std::span<const char> blob) -> std::vector<uint32_t>;

// Throws std::runtime_error if the module is not a single "main" entry point
// of the expected stage
auto reflectShader(
    std::span<const uint32_t> code,
    vk::ShaderStageFlagBits   expectedStage) -> ShaderReflection;

// Reads, validates and reflects one precompiled stage
auto loadShader(
    const std::filesystem::path &path,
    vk::ShaderStageFlagBits      expectedStage) -> std::vector<uint32_t>;

auto createShaderModule(
    const vk::raii::Device   &device,
    std::span<const uint32_t> code) -> vk::raii::ShaderModule;
