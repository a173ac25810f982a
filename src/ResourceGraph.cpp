#include "ResourceGraph.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <iterator>
#include <new>
#include <stdexcept>
#include <utility>

auto toString(ResourceKind kind) -> std::string_view
{
    switch (kind) {
    case ResourceKind::Context:
        return "Context";
    case ResourceKind::Surface:
        return "Surface";
    case ResourceKind::Device:
        return "Device";
    case ResourceKind::Swapchain:
        return "Swapchain";
    case ResourceKind::RenderPass:
        return "RenderPass";
    case ResourceKind::Pipeline:
        return "Pipeline";
    case ResourceKind::Framebuffer:
        return "Framebuffer";
    case ResourceKind::CommandRecorder:
        return "CommandRecorder";
    case ResourceKind::FrameSync:
        return "FrameSync";
    }
    return "Unknown";
}

ResourceGraph::~ResourceGraph()
{
    if (const auto remaining = liveCount(); remaining != 0) {
        spdlog::error("Resource graph destroyed with {} live objects", remaining);
    }
}

auto ResourceGraph::find(ResourceHandle handle) -> Node *
{
    auto &slab = slabs[static_cast<std::size_t>(handle.kind)];

    if (handle.index >= slab.size()) {
        return nullptr;
    }

    auto &node = slab[handle.index];
    if (!node.live || node.generation != handle.generation) {
        return nullptr;
    }

    return &node;
}

auto ResourceGraph::find(ResourceHandle handle) const -> const Node *
{
    return const_cast<ResourceGraph *>(this)->find(handle);
}

auto ResourceGraph::acquire(
    ResourceKind                    kind,
    std::span<const ResourceHandle> dependencies) -> ResourceHandle
{
    for (const auto &dependency : dependencies) {
        if (!find(dependency)) {
            throw std::logic_error{fmt::format(
                "Cannot acquire {}: dependency {}#{} is not live",
                toString(kind),
                toString(dependency.kind),
                dependency.index)};
        }
    }

    auto &slab = slabs[static_cast<std::size_t>(kind)];

    // reuse the first free slot, bumping its generation
    auto slot = std::ranges::find_if(slab, [](const Node &node) { return !node.live; });
    if (slot == slab.end()) {
        slab.emplace_back();
        slot = std::prev(slab.end());
    }

    slot->live       = true;
    slot->sequence   = nextSequence++;
    slot->dependents = 0;
    slot->dependencies.assign(dependencies.begin(), dependencies.end());

    for (const auto &dependency : dependencies) {
        ++find(dependency)->dependents;
    }

    const auto handle = ResourceHandle{
        kind,
        static_cast<uint32_t>(std::distance(slab.begin(), slot)),
        slot->generation};

    spdlog::trace("acquired {}#{}", toString(kind), handle.index);

    return handle;
}

// A zero dependent count means the handle was stale
auto ResourceGraph::recordViolation(
    ResourceHandle handle,
    uint32_t       liveDependents) noexcept -> void
{
    ++violationTotal;

    try {
        auto message = liveDependents == 0
            ? fmt::format(
                  "{}#{} released twice or never acquired",
                  toString(handle.kind),
                  handle.index)
            : fmt::format(
                  "{}#{} released while still in use by {} object(s)",
                  toString(handle.kind),
                  handle.index,
                  liveDependents);

        spdlog::error("Ownership violation: {}", message);
        violationLog.push_back(std::move(message));
    } catch (const std::bad_alloc &) {
        spdlog::error(
            "Ownership violation on {}#{} (message dropped)",
            toString(handle.kind),
            handle.index);
    }
}

auto ResourceGraph::release(ResourceHandle handle) noexcept -> void
{
    auto *node = find(handle);

    if (!node) {
        recordViolation(handle, 0);
        return;
    }

    if (node->dependents != 0) {
        recordViolation(handle, node->dependents);
    }

    for (const auto &dependency : node->dependencies) {
        if (auto *parent = find(dependency); parent && parent->dependents > 0) {
            --parent->dependents;
        }
    }

    node->live = false;
    node->dependencies.clear();
    ++node->generation;

    spdlog::trace("released {}#{}", toString(handle.kind), handle.index);
}

auto ResourceGraph::isLive(ResourceHandle handle) const -> bool
{
    return find(handle) != nullptr;
}

auto ResourceGraph::liveCount() const -> std::size_t
{
    auto count = std::size_t{0};
    for (const auto &slab : slabs) {
        count += static_cast<std::size_t>(
            std::ranges::count_if(slab, [](const Node &node) { return node.live; }));
    }
    return count;
}

auto ResourceGraph::dependentCount(ResourceHandle handle) const -> uint32_t
{
    const auto *node = find(handle);
    return node ? node->dependents : 0u;
}

auto ResourceGraph::teardownOrder() const -> std::vector<ResourceHandle>
{
    auto ordered = std::vector<std::pair<uint64_t, ResourceHandle>>{};

    for (std::size_t kind = 0; kind < slabs.size(); ++kind) {
        const auto &slab = slabs[kind];
        for (uint32_t index = 0; index < slab.size(); ++index) {
            if (slab[index].live) {
                ordered.emplace_back(
                    slab[index].sequence,
                    ResourceHandle{
                        static_cast<ResourceKind>(kind),
                        index,
                        slab[index].generation});
            }
        }
    }

    std::ranges::sort(ordered, [](const auto &lhs, const auto &rhs) {
        return lhs.first > rhs.first;
    });

    auto handles = std::vector<ResourceHandle>{};
    handles.reserve(ordered.size());
    for (const auto &[sequence, handle] : ordered) {
        handles.push_back(handle);
    }

    return handles;
}

auto ResourceGraph::violationCount() const -> std::size_t
{
    return violationTotal;
}

auto ResourceGraph::violations() const -> const std::vector<std::string> &
{
    return violationLog;
}

ResourceToken::ResourceToken(
    ResourceGraph                        &graph,
    ResourceKind                          kind,
    std::initializer_list<ResourceHandle> dependencies)
    : graph{&graph},
      tokenHandle{graph.acquire(
          kind,
          std::span<const ResourceHandle>{dependencies.begin(), dependencies.size()})}
{
}

ResourceToken::~ResourceToken()
{
    reset();
}

ResourceToken::ResourceToken(ResourceToken &&other) noexcept
    : graph{std::exchange(other.graph, nullptr)},
      tokenHandle{other.tokenHandle}
{
}

auto ResourceToken::operator=(ResourceToken &&other) noexcept -> ResourceToken &
{
    if (this != &other) {
        reset();
        graph       = std::exchange(other.graph, nullptr);
        tokenHandle = other.tokenHandle;
    }
    return *this;
}

auto ResourceToken::handle() const -> ResourceHandle
{
    return tokenHandle;
}

auto ResourceToken::reset() noexcept -> void
{
    if (graph) {
        std::exchange(graph, nullptr)->release(tokenHandle);
    }
}
