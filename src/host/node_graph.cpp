#include "host/node_graph.hpp"

#include <algorithm>
#include <utility>
#include "core/config/ids.hpp"

namespace hostbridge::host {

using core::errors::BridgeError;
using core::errors::ErrorKind;
using nlohmann::json;

namespace {

BridgeError definition_error(std::string message) {
    return BridgeError{ErrorKind::Shape, std::move(message), "invalid_definition"};
}

void add_unique(std::vector<std::string>& list, const std::string& value) {
    if (std::find(list.begin(), list.end(), value) == list.end()) {
        list.push_back(value);
    }
}

core::errors::Result<std::vector<std::string>> string_list(const json& component,
                                                          const char* key) {
    std::vector<std::string> out;
    if (!component.contains(key)) {
        return out;
    }
    const json& values = component.at(key);
    if (!values.is_array()) {
        return definition_error(std::string("component ") + key + " must be an array");
    }
    for (const auto& value : values) {
        if (!value.is_string() || value.get<std::string>().empty()) {
            return definition_error(std::string("component ") + key +
                                    " must be non-empty strings");
        }
        out.push_back(value.get<std::string>());
    }
    return out;
}

std::string string_field(const json& object, const char* key) {
    if (object.contains(key) && object.at(key).is_string()) {
        return object.at(key).get<std::string>();
    }
    return "";
}

}  // namespace

json describe_node(const GraphNode& node) {
    return json{{"instanceGuid", node.instance_guid},
                {"name", node.name},
                {"nickName", node.nick_name},
                {"description", node.description},
                {"category", node.category},
                {"subCategory", node.subcategory},
                {"kind", node.kind},
                {"componentGuid",
                 node.component_guid ? json(*node.component_guid) : json(nullptr)},
                {"sources", node.sources},
                {"targets", node.targets}};
}

void NodeGraph::close() {
    nodes_.clear();
    open_ = false;
}

const GraphNode* NodeGraph::find(const std::string& guid) const {
    for (const auto& node : nodes_) {
        if (node.instance_guid == guid) {
            return &node;
        }
    }
    return nullptr;
}

GraphNode* NodeGraph::find_node(const std::string& guid) {
    for (auto& node : nodes_) {
        if (node.instance_guid == guid) {
            return &node;
        }
    }
    return nullptr;
}

std::size_t NodeGraph::component_count() const {
    return static_cast<std::size_t>(std::count_if(
        nodes_.begin(), nodes_.end(),
        [](const GraphNode& node) { return node.kind == "component"; }));
}

GraphNode* NodeGraph::find_param(const std::string& reference, const std::string& kind) {
    const auto dot = reference.rfind('.');
    if (dot == std::string::npos || dot == 0 || dot + 1 == reference.size()) {
        return nullptr;
    }
    const std::string nick = reference.substr(0, dot);
    const std::string param = reference.substr(dot + 1);

    for (auto& node : nodes_) {
        if (node.kind != kind || node.name != param || !node.component_guid) {
            continue;
        }
        const GraphNode* owner = find(*node.component_guid);
        if (owner != nullptr && owner->nick_name == nick) {
            return &node;
        }
    }
    return nullptr;
}

core::errors::Result<std::string> NodeGraph::add_component(
    const ComponentDefinition& component) {
    if (component.name.empty()) {
        return definition_error("component name must not be empty");
    }
    const std::string nick = component.nick_name.empty() ? component.name : component.nick_name;
    for (const auto& node : nodes_) {
        if (node.kind == "component" && node.nick_name == nick) {
            return definition_error("duplicate component nickname: " + nick);
        }
    }
    for (const auto* params : {&component.inputs, &component.outputs}) {
        std::vector<std::string> seen;
        for (const auto& name : *params) {
            if (std::find(seen.begin(), seen.end(), name) != seen.end()) {
                return definition_error("duplicate parameter " + name + " on " + nick);
            }
            seen.push_back(name);
        }
    }

    GraphNode owner;
    owner.instance_guid = core::config::generate_guid();
    owner.name = component.name;
    owner.nick_name = nick;
    owner.description = component.description;
    owner.category = component.category;
    owner.subcategory = component.subcategory;
    owner.kind = "component";

    std::vector<GraphNode> params;
    for (const auto& name : component.inputs) {
        GraphNode input;
        input.instance_guid = core::config::generate_guid();
        input.name = name;
        input.nick_name = name;
        input.category = component.category;
        input.subcategory = component.subcategory;
        input.kind = "input";
        input.component_guid = owner.instance_guid;
        // An input feeds its own component.
        input.targets.push_back(owner.instance_guid);
        owner.sources.push_back(input.instance_guid);
        params.push_back(std::move(input));
    }
    for (const auto& name : component.outputs) {
        GraphNode output;
        output.instance_guid = core::config::generate_guid();
        output.name = name;
        output.nick_name = name;
        output.category = component.category;
        output.subcategory = component.subcategory;
        output.kind = "output";
        output.component_guid = owner.instance_guid;
        output.sources.push_back(owner.instance_guid);
        owner.targets.push_back(output.instance_guid);
        params.push_back(std::move(output));
    }

    const std::string guid = owner.instance_guid;
    nodes_.push_back(std::move(owner));
    for (auto& param : params) {
        nodes_.push_back(std::move(param));
    }
    open_ = true;
    return guid;
}

core::errors::Result<bool> NodeGraph::connect(const std::string& from, const std::string& to) {
    GraphNode* source = find_param(from, "output");
    if (source == nullptr) {
        return definition_error("unknown output: " + from);
    }
    GraphNode* target = find_param(to, "input");
    if (target == nullptr) {
        return definition_error("unknown input: " + to);
    }
    add_unique(source->targets, target->instance_guid);
    add_unique(target->sources, source->instance_guid);
    return true;
}

core::errors::Result<bool> NodeGraph::load_definition(const json& definition) {
    if (!definition.is_object()) {
        return definition_error("definition must be a JSON object");
    }

    NodeGraph staged;
    staged.open_ = true;

    const json components = definition.value("components", json::array());
    if (!components.is_array()) {
        return definition_error("components must be an array");
    }
    for (const auto& entry : components) {
        if (!entry.is_object()) {
            return definition_error("each component must be an object");
        }
        ComponentDefinition component;
        component.name = string_field(entry, "name");
        component.nick_name = string_field(entry, "nickname");
        component.description = string_field(entry, "description");
        component.category = string_field(entry, "category");
        component.subcategory = string_field(entry, "subcategory");

        auto inputs = string_list(entry, "inputs");
        if (core::errors::is_error(inputs)) {
            return core::errors::get_error(inputs);
        }
        auto outputs = string_list(entry, "outputs");
        if (core::errors::is_error(outputs)) {
            return core::errors::get_error(outputs);
        }
        component.inputs = std::move(core::errors::get_value(inputs));
        component.outputs = std::move(core::errors::get_value(outputs));

        auto added = staged.add_component(component);
        if (core::errors::is_error(added)) {
            return core::errors::get_error(added);
        }
    }

    const json wires = definition.value("wires", json::array());
    if (!wires.is_array()) {
        return definition_error("wires must be an array");
    }
    for (const auto& wire : wires) {
        const std::string from = wire.is_object() ? string_field(wire, "from") : "";
        const std::string to = wire.is_object() ? string_field(wire, "to") : "";
        if (from.empty() || to.empty()) {
            return definition_error("each wire needs string from and to");
        }
        auto connected = staged.connect(from, to);
        if (core::errors::is_error(connected)) {
            return core::errors::get_error(connected);
        }
    }

    *this = std::move(staged);
    return true;
}

json NodeGraph::context() const {
    json graph = json::object();
    for (const auto& node : nodes_) {
        graph[node.instance_guid] = describe_node(node);
    }
    return graph;
}

}  // namespace hostbridge::host
