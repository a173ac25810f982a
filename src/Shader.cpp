#include "Shader.hpp"

#include <spdlog/spdlog.h>
#include <spirv_reflect.h>
#include <vulkan/vulkan_to_string.hpp>

#include <cstring>
#include <fstream>
#include <stdexcept>
#include <string_view>

auto readShaderBlob(const std::filesystem::path &path) -> std::vector<char>
{
    std::ifstream file(path, std::ios::ate | std::ios::binary);

    if (!file.is_open()) {
        throw std::runtime_error(
            fmt::format("failed to open shader file \"{}\".", path.string()));
    }

    auto fileSize = static_cast<std::size_t>(file.tellg());
    auto buffer   = std::vector<char>(fileSize);

    file.seekg(0);
    file.read(buffer.data(), static_cast<std::streamsize>(fileSize));

    if (!file) {
        throw std::runtime_error(
            fmt::format("failed to read shader file \"{}\".", path.string()));
    }

    return buffer;
}

auto validateShaderBlob(std::span<const char> blob) -> void
{
    if (blob.empty()) {
        throw std::invalid_argument{"shader blob is empty"};
    }

    if (blob.size() % sizeof(uint32_t) != 0) {
        throw std::invalid_argument{fmt::format(
            "shader blob size {} is not a multiple of {}",
            blob.size(),
            sizeof(uint32_t))};
    }
}

auto toSpirvWords(std::span<const char> blob) -> std::vector<uint32_t>
{
    validateShaderBlob(blob);

    // copy into words so the module create info gets aligned storage
    auto words = std::vector<uint32_t>(blob.size() / sizeof(uint32_t));
    std::memcpy(words.data(), blob.data(), blob.size());

    return words;
}

auto reflectShader(
    std::span<const uint32_t> code,
    vk::ShaderStageFlagBits   expectedStage) -> ShaderReflection
{
    auto reflection = spv_reflect::ShaderModule(code.size_bytes(), code.data());

    if (reflection.GetResult() != SPV_REFLECT_RESULT_SUCCESS) {
        throw std::runtime_error(
            "could not process shader code (is it a valid SPIR-V bytecode?)");
    }

    const auto &shaderModule = reflection.GetShaderModule();

    if (shaderModule.entry_point_count != 1 || shaderModule.entry_point_name == nullptr) {
        throw std::runtime_error(fmt::format(
            "shader module has {} entry points, expected exactly one",
            shaderModule.entry_point_count));
    }

    auto data = ShaderReflection{
        .entryPoint = shaderModule.entry_point_name,
        .stage = static_cast<vk::ShaderStageFlagBits>(shaderModule.shader_stage)};

    if (data.entryPoint != "main") {
        throw std::runtime_error(fmt::format(
            "shader entry point is \"{}\", expected \"main\"",
            data.entryPoint));
    }

    if (data.stage != expectedStage) {
        throw std::runtime_error(fmt::format(
            "shader stage is {}, expected {}",
            vk::to_string(data.stage),
            vk::to_string(expectedStage)));
    }

    return data;
}

auto loadShader(
    const std::filesystem::path &path,
    vk::ShaderStageFlagBits      expectedStage) -> std::vector<uint32_t>
{
    const auto blob = readShaderBlob(path);

    auto code = toSpirvWords(blob);
    reflectShader(code, expectedStage);

    spdlog::debug(
        "Loaded {} shader \"{}\" ({} bytes)",
        vk::to_string(expectedStage),
        path.string(),
        blob.size());

    return code;
}

auto createShaderModule(
    const vk::raii::Device   &device,
    std::span<const uint32_t> code) -> vk::raii::ShaderModule
{
    return vk::raii::ShaderModule{
        device,
        vk::ShaderModuleCreateInfo{{}, code.size_bytes(), code.data()}};
}
