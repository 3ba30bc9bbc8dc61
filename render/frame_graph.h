#pragma once

#include <cstdint>
#include <span>
#include <string>
#include <utility>
#include <vector>

namespace skygrid::render {

enum class PassQueue : std::uint8_t {
    Graphics,
    Compute,
};

enum class ResourceAccess : std::uint8_t {
    Read,
    Write,
    ReadWrite,
};

struct PassDesc {
    const char* name = "unnamed";
    PassQueue queue = PassQueue::Graphics;
};

struct GraphPass {
    std::string name;
    PassQueue queue = PassQueue::Graphics;
};

struct GraphResource {
    std::string name;
};

struct ResourceUse {
    std::uint32_t pass = 0;
    std::uint32_t resource = 0;
    ResourceAccess access = ResourceAccess::Read;
};

// Declares passes and the resources they touch, then orders them.
// Edges come from explicit dependencies plus, once deriveResourceDependencies() runs, every
// pair of consecutive declared users of a resource where at least one of them writes.
class FrameGraph {
public:
    using PassId = std::uint32_t;
    using ResourceId = std::uint32_t;

    void reset();
    PassId addPass(const PassDesc& desc);
    ResourceId addResource(const char* name);
    void addDependency(PassId producer, PassId consumer);
    void addResourceUse(PassId pass, ResourceId resource, ResourceAccess access);
    void deriveResourceDependencies();

    [[nodiscard]] std::span<const GraphPass> passes() const;
    [[nodiscard]] std::span<const GraphResource> resources() const;
    [[nodiscard]] std::span<const std::pair<PassId, PassId>> dependencies() const;
    [[nodiscard]] std::span<const ResourceUse> resourceUses() const;

    // Kahn topological sort. Returns false on a cycle, leaving the partial order in outOrder.
    [[nodiscard]] bool buildExecutionOrder(std::vector<PassId>* outOrder) const;

    // True when `pass` is the first user of `resource` in `order`. The first user clears an
    // attachment and every later one loads it.
    [[nodiscard]] bool isFirstUse(const std::vector<PassId>& order, PassId pass, ResourceId resource) const;

private:
    [[nodiscard]] bool uses(PassId pass, ResourceId resource) const;

    std::vector<GraphPass> m_passes;
    std::vector<GraphResource> m_resources;
    std::vector<std::pair<PassId, PassId>> m_dependencies;
    std::vector<ResourceUse> m_resourceUses;
};

} // namespace skygrid::render
