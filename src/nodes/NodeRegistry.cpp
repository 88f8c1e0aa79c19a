#include "nodes/NodeRegistry.hpp"
#include "nodes/DefinedNode.hpp"
#include <algorithm>
#include <set>

namespace flowgraph {
namespace nodes {

NodeRegistry& NodeRegistry::instance() {
    static NodeRegistry instance;
    return instance;
}

void NodeRegistry::registerNode(NodeDefinitionPtr definition) {
    if (definition) {
        std::string name = definition->getName();
        std::string category = definition->getCategory();
        m_entries[name] = Entry{std::move(category), std::move(definition), nullptr};
    }
}

void NodeRegistry::registerFactory(const std::string& name, const std::string& category, NodeFactory factory) {
    if (factory) {
        m_entries[name] = Entry{category, nullptr, std::move(factory)};
    }
}

void NodeRegistry::unregisterNode(const std::string& name) {
    m_entries.erase(name);
}

const NodeRegistry::Entry* NodeRegistry::findEntry(const std::string& name) const {
    // Try exact match first
    auto it = m_entries.find(name);
    if (it != m_entries.end()) {
        return &it->second;
    }

    // "category/name" falls back to the part after '/'
    size_t slashPos = name.find('/');
    if (slashPos != std::string::npos) {
        it = m_entries.find(name.substr(slashPos + 1));
        if (it != m_entries.end()) {
            return &it->second;
        }
    }

    return nullptr;
}

NodeDefinitionPtr NodeRegistry::getNode(const std::string& name) const {
    const Entry* entry = findEntry(name);
    return entry ? entry->definition : nullptr;
}

bool NodeRegistry::hasNode(const std::string& name) const {
    return findEntry(name) != nullptr;
}

std::unique_ptr<Node> NodeRegistry::create(const std::string& typeName) const {
    const Entry* entry = findEntry(typeName);
    if (!entry) {
        return nullptr;
    }
    if (entry->factory) {
        return entry->factory();
    }
    return std::make_unique<DefinedNode>(entry->definition);
}

std::vector<std::string> NodeRegistry::getNodeNames() const {
    std::vector<std::string> names;
    names.reserve(m_entries.size());
    for (const auto& [name, entry] : m_entries) {
        names.push_back(name);
    }
    std::sort(names.begin(), names.end());
    return names;
}

std::vector<std::string> NodeRegistry::getNodeNamesInCategory(const std::string& category) const {
    std::vector<std::string> names;
    for (const auto& [name, entry] : m_entries) {
        if (entry.category == category) {
            names.push_back(name);
        }
    }
    std::sort(names.begin(), names.end());
    return names;
}

std::vector<std::string> NodeRegistry::getCategories() const {
    std::set<std::string> categories;
    for (const auto& [name, entry] : m_entries) {
        categories.insert(entry.category);
    }
    return std::vector<std::string>(categories.begin(), categories.end());
}

void NodeRegistry::clear() {
    m_entries.clear();
}

} // namespace nodes
} // namespace flowgraph
