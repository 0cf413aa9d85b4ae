// -*- c++ -*-
//
// Network: node and edge bookkeeping

#include <boolnet/network.hpp>

namespace Bn {

void Network::add_node(const Node& node) {
    if (node.id.empty()) {
        throw ConfigurationException("node id must not be empty");
    }
    if (has_node(node.id)) {
        throw ConfigurationException("node \"" + node.id + "\" is multiply defined");
    }
    index_[node.id] = nodes_.size();
    nodes_.push_back(node);
}

void Network::add_edge(const Edge& edge) {
    if (!has_node(edge.source)) {
        throw ConfigurationException("edge source \"" + edge.source + "\" is not a node");
    }
    if (!has_node(edge.target)) {
        throw ConfigurationException("edge target \"" + edge.target + "\" is not a node");
    }
    edges_.push_back(edge);
}

void Network::fix(const std::string& id, bool value) {
    if (!has_node(id)) {
        throw ConfigurationException("cannot fix unknown node \"" + id + "\"");
    }
    perturbations_[id] = value;
}

const Node& Network::node(const std::string& id) const {
    auto it = index_.find(id);
    if (it == index_.end()) {
        throw ConfigurationException("unknown node \"" + id + "\"");
    }
    return nodes_[it->second];
}

RuleLines Network::rule_lines() const {
    RuleLines lines = rules_;
    for (const auto& node : nodes_) {
        if (!node.rule.empty()) {
            lines.push_back(node.id + " = " + node.rule);
        }
    }
    return lines;
}

}  // namespace Bn
