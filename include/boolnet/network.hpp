// -*- c++ -*-
//
// Node, Edge and Network: the data model every analysis mode reads

#ifndef BN_NETWORK__H
#define BN_NETWORK__H

#include <boolnet/exception.hpp>
#include <map>
#include <string>
#include <unordered_map>
#include <vector>

namespace Bn {

struct Node {
    std::string id;
    std::string label;  // empty means "same as id"
    bool has_bias = false;
    double bias = 0.0;
    std::string rule;  // optional right-hand side of "id = rule"

    Node() = default;
    explicit Node(const std::string& i, const std::string& l = "")
        : id(i)
        , label(l) {}
    Node(const std::string& i, const std::string& l, double b)
        : id(i)
        , label(l)
        , has_bias(true)
        , bias(b) {}

    [[nodiscard]] const std::string& display_label() const {
        return label.empty() ? id : label;
    }
};

struct Edge {
    std::string source;
    std::string target;
    double weight = 1.0;

    Edge() = default;
    Edge(const std::string& s, const std::string& t, double w = 1.0)
        : source(s)
        , target(t)
        , weight(w) {}
};

using Nodes = std::vector<Node>;
using Edges = std::vector<Edge>;
using RuleLines = std::vector<std::string>;

// Nodes pinned to a fixed value on every update (knock-out = false, knock-in = true).
// std::map keeps iteration order stable for reporting.
using Perturbations = std::map<std::string, bool>;

class Network {
   public:
    Network() = default;

    // Throws ConfigurationException on an empty or duplicate id
    void add_node(const Node& node);
    // Throws ConfigurationException when source or target is not a node
    void add_edge(const Edge& edge);
    void add_rule(const std::string& line) {
        rules_.push_back(line);
    }
    void set_rules(const RuleLines& lines) {
        rules_ = lines;
    }
    // Throws ConfigurationException when id is not a node
    void fix(const std::string& id, bool value);

    [[nodiscard]] const Nodes& nodes() const {
        return nodes_;
    }
    [[nodiscard]] const Edges& edges() const {
        return edges_;
    }
    [[nodiscard]] const Perturbations& perturbations() const {
        return perturbations_;
    }
    [[nodiscard]] size_t size() const {
        return nodes_.size();
    }
    [[nodiscard]] bool empty() const {
        return nodes_.empty();
    }

    [[nodiscard]] bool has_node(const std::string& id) const {
        return index_.find(id) != index_.end();
    }
    [[nodiscard]] const Node& node(const std::string& id) const;

    // Explicit rule lines followed by "id = rule" for every node carrying a rule
    [[nodiscard]] RuleLines rule_lines() const;

   private:
    Nodes nodes_;
    Edges edges_;
    RuleLines rules_;
    Perturbations perturbations_;
    std::unordered_map<std::string, size_t> index_;
};

}  // namespace Bn

#endif  // BN_NETWORK__H
