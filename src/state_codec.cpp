// -*- c++ -*-
//
// StateCodec: canonical node order and State <-> named value conversion

#include "state_codec.hpp"

#include <cctype>
#include <sstream>

namespace Bn {

static std::string fold_case(const std::string& s) {
    std::string folded = s;
    for (char& c : folded) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return folded;
}

static std::vector<std::string> input_order(const Nodes& nodes) {
    std::vector<std::string> order;
    order.reserve(nodes.size());
    for (const auto& node : nodes) {
        order.push_back(node.id);
    }
    return order;
}

StateCodec::StateCodec(const Nodes& nodes) {
    build(nodes, input_order(nodes));
}

StateCodec::StateCodec(const Nodes& nodes, const std::vector<std::string>& order) {
    build(nodes, order);
}

void StateCodec::build(const Nodes& nodes, const std::vector<std::string>& order) {
    if (nodes.size() > MAX_NODES) {
        std::ostringstream what;
        what << "network has " << nodes.size() << " nodes; at most " << MAX_NODES
             << " can be encoded in a state";
        throw ConfigurationException(what.str());
    }
    if (order.size() != nodes.size()) {
        throw ConfigurationException("node order must list every node exactly once");
    }

    std::unordered_map<std::string, const Node*> by_id;
    for (const auto& node : nodes) {
        if (!by_id.emplace(node.id, &node).second) {
            throw ConfigurationException("node \"" + node.id + "\" is multiply defined");
        }
    }

    order_.reserve(order.size());
    for (const auto& id : order) {
        auto it = by_id.find(id);
        if (it == by_id.end()) {
            throw ConfigurationException("node order names unknown node \"" + id + "\"");
        }
        if (!index_.emplace(id, order_.size()).second) {
            throw ConfigurationException("node order lists \"" + id + "\" more than once");
        }
        labels_[id] = it->second->display_label();
        order_.push_back(id);
    }

    // Labels are registered first so that an id always wins over a label
    for (size_t i = 0; i < order_.size(); i++) {
        folded_[fold_case(labels_[order_[i]])] = i;
    }
    for (size_t i = 0; i < order_.size(); i++) {
        folded_[fold_case(order_[i])] = i;
    }
}

size_t StateCodec::index_of(const std::string& id) const {
    auto it = index_.find(id);
    if (it == index_.end()) {
        throw ConfigurationException("unknown node \"" + id + "\"");
    }
    return it->second;
}

size_t StateCodec::resolve(const std::string& name) const {
    auto it = index_.find(name);
    if (it != index_.end()) {
        return it->second;
    }
    auto fi = folded_.find(fold_case(name));
    if (fi != folded_.end()) {
        return fi->second;
    }
    return npos;
}

State StateCodec::encode(const NamedValues& values) const {
    State state = 0;
    for (const auto& entry : values) {
        state = with_bit(state, index_of(entry.first), entry.second);
    }
    return state;
}

NamedValues StateCodec::decode(State state) const {
    NamedValues values;
    values.reserve(order_.size());
    for (size_t i = 0; i < order_.size(); i++) {
        values[order_[i]] = bit(state, i);
    }
    return values;
}

std::string StateCodec::format(State state) const {
    std::string binary(order_.size(), '0');
    for (size_t i = 0; i < order_.size(); i++) {
        if (bit(state, i)) {
            binary[i] = '1';
        }
    }
    return binary;
}

State StateCodec::parse(const std::string& binary) const {
    if (binary.size() != order_.size()) {
        std::ostringstream what;
        what << "state \"" << binary << "\" has " << binary.size() << " bits; expected "
             << order_.size();
        throw ConfigurationException(what.str());
    }
    State state = 0;
    for (size_t i = 0; i < binary.size(); i++) {
        if (binary[i] != '0' && binary[i] != '1') {
            throw ConfigurationException("state \"" + binary + "\" contains a non-binary digit");
        }
        state = with_bit(state, i, binary[i] == '1');
    }
    return state;
}

StateSnapshot StateCodec::snapshot(State state) const {
    StateSnapshot snap;
    snap.binary = format(state);
    snap.values.reserve(order_.size());
    for (size_t i = 0; i < order_.size(); i++) {
        snap.values[order_[i]] = bit(state, i) ? 1 : 0;
    }
    return snap;
}

}  // namespace Bn
