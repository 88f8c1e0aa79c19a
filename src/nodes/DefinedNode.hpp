#pragma once

#include "graph/Node.hpp"
#include "nodes/NodeDefinition.hpp"

namespace flowgraph {
namespace nodes {

/**
 * Node instance backed by a registered NodeDefinition
 *
 * Pins are created from the definition in declaration order. The
 * definition's execute function runs against a NodeContext; an error
 * set on the context is raised as std::runtime_error.
 */
class DefinedNode : public Node {
public:
    explicit DefinedNode(NodeDefinitionPtr definition);

    const NodeDefinition& getDefinition() const { return *m_definition; }

protected:
    void onExecute() override;

private:
    friend class NodeContext;

    NodeDefinitionPtr m_definition;
};

} // namespace nodes
} // namespace flowgraph
