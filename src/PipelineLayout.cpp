// PipelineLayout.cpp
#include "PipelineLayout.hpp"

vk::raii::PipelineLayout createPipelineLayout(const vk::raii::Device &device)
{
    return {device, vk::PipelineLayoutCreateInfo{}};
}
