#include "render/frame_graph.h"

#include <algorithm>
#include <queue>

namespace skygrid::render {

void FrameGraph::reset() {
    m_passes.clear();
    m_resources.clear();
    m_dependencies.clear();
    m_resourceUses.clear();
}

FrameGraph::PassId FrameGraph::addPass(const PassDesc& desc) {
    GraphPass pass{};
    pass.name = (desc.name != nullptr && desc.name[0] != '\0') ? desc.name : "unnamed";
    pass.queue = desc.queue;
    const PassId id = static_cast<PassId>(m_passes.size());
    m_passes.push_back(std::move(pass));
    return id;
}

FrameGraph::ResourceId FrameGraph::addResource(const char* name) {
    GraphResource resource{};
    resource.name = (name != nullptr && name[0] != '\0') ? name : "unnamed";
    const ResourceId id = static_cast<ResourceId>(m_resources.size());
    m_resources.push_back(std::move(resource));
    return id;
}

void FrameGraph::addDependency(PassId producer, PassId consumer) {
    if (producer == consumer || producer >= m_passes.size() || consumer >= m_passes.size()) {
        return;
    }
    const std::pair<PassId, PassId> edge{producer, consumer};
    if (std::find(m_dependencies.begin(), m_dependencies.end(), edge) == m_dependencies.end()) {
        m_dependencies.push_back(edge);
    }
}

void FrameGraph::addResourceUse(PassId pass, ResourceId resource, ResourceAccess access) {
    if (pass >= m_passes.size() || resource >= m_resources.size()) {
        return;
    }
    m_resourceUses.push_back(ResourceUse{pass, resource, access});
}

void FrameGraph::deriveResourceDependencies() {
    for (ResourceId resource = 0; resource < m_resources.size(); ++resource) {
        const ResourceUse* previous = nullptr;
        for (const ResourceUse& use : m_resourceUses) {
            if (use.resource != resource) {
                continue;
            }
            if (previous != nullptr
                && (previous->access != ResourceAccess::Read || use.access != ResourceAccess::Read)) {
                addDependency(previous->pass, use.pass);
            }
            previous = &use;
        }
    }
}

std::span<const GraphPass> FrameGraph::passes() const {
    return std::span<const GraphPass>(m_passes.data(), m_passes.size());
}

std::span<const GraphResource> FrameGraph::resources() const {
    return std::span<const GraphResource>(m_resources.data(), m_resources.size());
}

std::span<const std::pair<FrameGraph::PassId, FrameGraph::PassId>> FrameGraph::dependencies() const {
    return std::span<const std::pair<PassId, PassId>>(m_dependencies.data(), m_dependencies.size());
}

std::span<const ResourceUse> FrameGraph::resourceUses() const {
    return std::span<const ResourceUse>(m_resourceUses.data(), m_resourceUses.size());
}

bool FrameGraph::buildExecutionOrder(std::vector<PassId>* outOrder) const {
    if (outOrder == nullptr) {
        return false;
    }
    outOrder->clear();
    if (m_passes.empty()) {
        return true;
    }

    std::vector<std::vector<PassId>> adjacency(m_passes.size());
    std::vector<std::uint32_t> indegree(m_passes.size(), 0u);
    for (const auto& [producer, consumer] : m_dependencies) {
        adjacency[producer].push_back(consumer);
        ++indegree[consumer];
    }

    // FIFO over declaration order keeps independent passes in the order they were added.
    std::queue<PassId> ready;
    for (PassId passId = 0; passId < m_passes.size(); ++passId) {
        if (indegree[passId] == 0u) {
            ready.push(passId);
        }
    }

    outOrder->reserve(m_passes.size());
    while (!ready.empty()) {
        const PassId passId = ready.front();
        ready.pop();
        outOrder->push_back(passId);
        for (const PassId consumer : adjacency[passId]) {
            if (--indegree[consumer] == 0u) {
                ready.push(consumer);
            }
        }
    }
    return outOrder->size() == m_passes.size();
}

bool FrameGraph::uses(PassId pass, ResourceId resource) const {
    return std::any_of(m_resourceUses.begin(), m_resourceUses.end(), [&](const ResourceUse& use) {
        return use.pass == pass && use.resource == resource;
    });
}

bool FrameGraph::isFirstUse(const std::vector<PassId>& order, PassId pass, ResourceId resource) const {
    for (const PassId candidate : order) {
        if (uses(candidate, resource)) {
            return candidate == pass;
        }
    }
    return false;
}

} // namespace skygrid::render
