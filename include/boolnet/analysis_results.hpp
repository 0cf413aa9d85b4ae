// -*- c++ -*-
//
// Data structures returned by the deterministic and probabilistic analyses

#ifndef BN_ANALYSIS_RESULTS__H
#define BN_ANALYSIS_RESULTS__H

#include <cstdint>
#include <string>
#include <unordered_map>
#include <vector>

namespace Bn {

// Network state: bit i holds the value of node i in canonical order
using State = std::uint64_t;

using NodeLabels = std::unordered_map<std::string, std::string>;

// Human-readable view of a State
struct StateSnapshot {
    std::string binary;                           // character i is node i
    std::unordered_map<std::string, int> values;  // node id -> 0/1
};

enum class AttractorKind { FixedPoint, Cycle };

struct Attractor {
    size_t id = 0;
    AttractorKind kind = AttractorKind::FixedPoint;
    size_t period = 1;
    std::vector<State> states;  // in update order, states[0] -> states[1] -> ...
    std::vector<StateSnapshot> snapshots;
    std::uint64_t basin_size = 0;
    double basin_share = 0.0;

    [[nodiscard]] bool is_fixed_point() const {
        return kind == AttractorKind::FixedPoint;
    }
};

using Attractors = std::vector<Attractor>;

struct AnalysisResult {
    std::vector<std::string> node_order;
    NodeLabels node_labels;
    Attractors attractors;
    std::uint64_t explored_state_count = 0;
    double total_state_space = 0.0;  // 2^n, kept as double so n = 64 fits
    bool truncated = false;
    bool cancelled = false;
    std::uint64_t unresolved_states = 0;
    std::vector<std::string> warnings;

    [[nodiscard]] std::uint64_t total_basin_size() const {
        std::uint64_t total = 0;
        for (const auto& a : attractors) {
            total += a.basin_size;
        }
        return total;
    }
};

struct ProbabilisticResult {
    std::vector<std::string> node_order;
    std::unordered_map<std::string, double> probabilities;
    std::unordered_map<std::string, double> potential_energies;
    bool converged = false;
    int iterations = 0;
    std::vector<std::string> warnings;
};

}  // namespace Bn

#endif  // BN_ANALYSIS_RESULTS__H
