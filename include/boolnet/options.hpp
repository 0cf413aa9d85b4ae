// -*- c++ -*-
//
// Option structures for the analysis modes

#ifndef BN_OPTIONS__H
#define BN_OPTIONS__H

#include <cstdint>
#include <string>
#include <unordered_map>

namespace Bn {

class CancellationToken;

// Largest node count searched exhaustively under the default state cap,
// and the largest kept in a dense memo
constexpr size_t MAX_EXHAUSTIVE_NODES = 24;
constexpr std::uint64_t DEFAULT_STATE_CAP = std::uint64_t{1} << MAX_EXHAUSTIVE_NODES;
constexpr std::uint64_t DEFAULT_STEP_CAP = std::uint64_t{1} << MAX_EXHAUSTIVE_NODES;

// What a rule-less node does in rule-based mode
enum class UnruledPolicy {
    Hold,   // keep its current value
    Off,    // always 0
    Reject  // refuse to analyze the network
};

// What a weighted node does when its score equals its threshold
enum class TieBehavior {
    Hold,  // keep its current value
    Off,   // zero-as-zero
    On     // zero-as-one
};

enum class ThresholdMode {
    Absolute,  // threshold = multiplier
    InDegree   // threshold = multiplier * max(sum of |incoming weights|, 1)
};

struct RuleOptions {
    UnruledPolicy unruled = UnruledPolicy::Hold;
};

struct WeightedOptions {
    double threshold_multiplier = 0.5;
    ThresholdMode threshold_mode = ThresholdMode::Absolute;
    TieBehavior tie = TieBehavior::Hold;
    // Overrides the node's own bias
    std::unordered_map<std::string, double> biases;
};

struct SearchOptions {
    std::uint64_t state_cap = DEFAULT_STATE_CAP;  // maximum initial states
    std::uint64_t step_cap = DEFAULT_STEP_CAP;    // maximum trajectory length
    std::uint64_t seed = 0;                       // sampled strategy seed
    const CancellationToken* cancellation = nullptr;
};

struct RelaxationOptions {
    double noise = 0.25;            // mu, > 0
    double self_degradation = 0.1;  // c, in [0, 1]
    int max_iterations = 500;
    double tolerance = 1e-4;
    double initial_probability = 0.5;
    double threshold_multiplier = 0.0;
    std::unordered_map<std::string, double> initial_probabilities;
    std::unordered_map<std::string, double> biases;
    std::unordered_map<std::string, double> basal_activity;
};

// Name conversions shared by the CLI and the reports.
// The parse functions throw ConfigurationException on unknown names.
UnruledPolicy parse_unruled_policy(const std::string& name);
TieBehavior parse_tie_behavior(const std::string& name);
ThresholdMode parse_threshold_mode(const std::string& name);
std::string to_string(UnruledPolicy policy);
std::string to_string(TieBehavior tie);
std::string to_string(ThresholdMode mode);

}  // namespace Bn

#endif  // BN_OPTIONS__H
