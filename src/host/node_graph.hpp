#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "core/errors/bridge_errors.hpp"

namespace hostbridge::host {

// One component or parameter on the visual-programming canvas. Parameters
// belong to a component and carry its guid; wires are recorded on both
// ends as targets (downstream) and sources (upstream).
struct GraphNode {
    std::string instance_guid;
    std::string name;
    std::string nick_name;
    std::string description;
    std::string category;
    std::string subcategory;
    std::string kind;  // "component", "input" or "output"
    std::optional<std::string> component_guid;
    std::vector<std::string> sources;
    std::vector<std::string> targets;
};

struct ComponentDefinition {
    std::string name;
    std::string nick_name;
    std::string description;
    std::string category;
    std::string subcategory;
    std::vector<std::string> inputs;
    std::vector<std::string> outputs;
};

// In-memory stand-in for the host's node-graph editor document. Closed
// until a definition is loaded or a component is added. Not thread safe:
// only the host's execution turn may touch it.
class NodeGraph {
public:
    bool is_open() const { return open_; }
    void close();

    // Replaces the graph with a definition of the form
    // {"components": [{"name", "nickname", "category", "subcategory",
    //                  "description", "inputs": [..], "outputs": [..]}],
    //  "wires": [{"from": "Nick.Output", "to": "Nick.Input"}]}.
    // On error the current graph is left untouched.
    core::errors::Result<bool> load_definition(const nlohmann::json& definition);

    // Adds a component with one parameter node per input and output and
    // returns the component guid. Nick names must be unique.
    core::errors::Result<std::string> add_component(const ComponentDefinition& component);

    // Wires "Nick.Output" to "Nick.Input".
    core::errors::Result<bool> connect(const std::string& from, const std::string& to);

    const std::vector<GraphNode>& nodes() const { return nodes_; }
    const GraphNode* find(const std::string& guid) const;
    std::size_t component_count() const;

    // Guid-keyed map of every node, the shape get-context calls return.
    nlohmann::json context() const;

private:
    GraphNode* find_node(const std::string& guid);
    GraphNode* find_param(const std::string& reference, const std::string& kind);

    std::vector<GraphNode> nodes_;
    bool open_ = false;
};

nlohmann::json describe_node(const GraphNode& node);

}  // namespace hostbridge::host
