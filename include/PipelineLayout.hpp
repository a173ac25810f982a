#pragma once
// PipelineLayout.hpp
//

#include <vulkan/vulkan_raii.hpp>

// No descriptor sets and no push constants
vk::raii::PipelineLayout createPipelineLayout(const vk::raii::Device &device);
