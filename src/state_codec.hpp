// -*- c++ -*-
//
// StateCodec: canonical node order and State <-> named value conversion
//
// Node i of the canonical order owns bit i of a State. The order is the
// input order of the node list unless an explicit order is supplied.

#ifndef BN_STATE_CODEC__H
#define BN_STATE_CODEC__H

#include <boolnet/analysis_results.hpp>
#include <boolnet/exception.hpp>
#include <boolnet/network.hpp>
#include <limits>
#include <string>
#include <unordered_map>
#include <vector>

namespace Bn {

using NamedValues = std::unordered_map<std::string, bool>;

class StateCodec {
   public:
    static constexpr size_t MAX_NODES = 64;
    static constexpr size_t npos = std::numeric_limits<size_t>::max();

    // Throws ConfigurationException for more than MAX_NODES nodes
    explicit StateCodec(const Nodes& nodes);
    // order must be a permutation of the node ids
    StateCodec(const Nodes& nodes, const std::vector<std::string>& order);

    [[nodiscard]] size_t size() const {
        return order_.size();
    }
    [[nodiscard]] const std::vector<std::string>& order() const {
        return order_;
    }
    [[nodiscard]] const NodeLabels& labels() const {
        return labels_;
    }

    // Throws ConfigurationException for an unknown id
    [[nodiscard]] size_t index_of(const std::string& id) const;

    // Exact id first, then case-insensitive id or label; npos when nothing matches
    [[nodiscard]] size_t resolve(const std::string& name) const;

    // Missing ids default to false; unknown ids throw ConfigurationException
    [[nodiscard]] State encode(const NamedValues& values) const;
    [[nodiscard]] NamedValues decode(State state) const;

    // "101" means node 0 = 1, node 1 = 0, node 2 = 1
    [[nodiscard]] std::string format(State state) const;
    [[nodiscard]] State parse(const std::string& binary) const;

    [[nodiscard]] StateSnapshot snapshot(State state) const;

    static bool bit(State state, size_t index) {
        return ((state >> index) & State{1}) != 0;
    }
    static State with_bit(State state, size_t index, bool value) {
        const State mask = State{1} << index;
        return value ? (state | mask) : (state & ~mask);
    }

   private:
    void build(const Nodes& nodes, const std::vector<std::string>& order);

    std::vector<std::string> order_;
    NodeLabels labels_;
    std::unordered_map<std::string, size_t> index_;
    std::unordered_map<std::string, size_t> folded_;  // lower-cased id/label -> index
};

}  // namespace Bn

#endif  // BN_STATE_CODEC__H
