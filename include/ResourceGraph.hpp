#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <span>
#include <string>
#include <string_view>
#include <vector>

enum class ResourceKind : uint8_t {
    Context,
    Surface,
    Device,
    Swapchain,
    RenderPass,
    Pipeline,
    Framebuffer,
    CommandRecorder,
    FrameSync,
};

constexpr std::size_t resourceKindCount = 9;

auto toString(ResourceKind kind) -> std::string_view;

struct ResourceHandle {
    ResourceKind kind       = ResourceKind::Context;
    uint32_t     index      = 0;
    uint32_t     generation = 0;

    friend auto operator==(
        const ResourceHandle &,
        const ResourceHandle &) -> bool = default;
};

// Ledger of live backend objects and the objects they keep alive. Nodes live in
// one slab per kind and are addressed by (kind, index, generation). A node can
// only be acquired once all of its dependencies are live, so reverse
// acquisition order is always a valid teardown order.
class ResourceGraph
{
  public:
    ResourceGraph() = default;
    ~ResourceGraph();

    ResourceGraph(const ResourceGraph &)                     = delete;
    auto operator=(const ResourceGraph &) -> ResourceGraph & = delete;

    // Throws std::logic_error when a dependency is not live
    auto acquire(
        ResourceKind                    kind,
        std::span<const ResourceHandle> dependencies = {}) -> ResourceHandle;

    // Releasing a node that still has live dependents, or a stale handle, is
    // recorded as a violation instead of throwing: release runs from
    // destructors.
    auto release(ResourceHandle handle) noexcept -> void;

    [[nodiscard]]
    auto isLive(ResourceHandle handle) const -> bool;

    [[nodiscard]]
    auto liveCount() const -> std::size_t;

    [[nodiscard]]
    auto dependentCount(ResourceHandle handle) const -> uint32_t;

    // Live nodes, dependents before the nodes they depend on
    [[nodiscard]]
    auto teardownOrder() const -> std::vector<ResourceHandle>;

    // Messages of recorded violations; a message that cannot be allocated is
    // dropped but still counted
    [[nodiscard]]
    auto violations() const -> const std::vector<std::string> &;

    [[nodiscard]]
    auto violationCount() const -> std::size_t;

  private:
    struct Node {
        uint32_t                    generation = 0;
        bool                        live       = false;
        uint64_t                    sequence   = 0;
        uint32_t                    dependents = 0;
        std::vector<ResourceHandle> dependencies;
    };

    auto find(ResourceHandle handle) -> Node *;
    auto find(ResourceHandle handle) const -> const Node *;
    auto recordViolation(
        ResourceHandle handle,
        uint32_t       liveDependents) noexcept -> void;

    std::array<std::vector<Node>, resourceKindCount> slabs;
    uint64_t                                         nextSequence = 0;
    std::vector<std::string>                         violationLog;
    std::size_t                                      violationTotal = 0;
};

// Registration of one object in a ResourceGraph for as long as the token lives.
// Declared before the wrapped handle so the handle is destroyed first.
class ResourceToken
{
  public:
    ResourceToken() = default;

    ResourceToken(
        ResourceGraph                        &graph,
        ResourceKind                          kind,
        std::initializer_list<ResourceHandle> dependencies = {});

    ~ResourceToken();

    ResourceToken(ResourceToken &&other) noexcept;
    auto operator=(ResourceToken &&other) noexcept -> ResourceToken &;

    ResourceToken(const ResourceToken &)                     = delete;
    auto operator=(const ResourceToken &) -> ResourceToken & = delete;

    [[nodiscard]]
    auto handle() const -> ResourceHandle;

    auto reset() noexcept -> void;

  private:
    ResourceGraph *graph = nullptr;
    ResourceHandle tokenHandle;
};
