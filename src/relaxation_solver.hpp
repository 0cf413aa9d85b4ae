// -*- c++ -*-
//
// RelaxationSolver: mean-field steady-state activation probabilities of a
// weighted network under logistic noise
//
// Each sweep computes, for every node, the stimulus from the current
// probabilities of its predecessors plus its bias and basal activity, and
// moves the node halfway toward target(). A node with no stimulus decays by
// the self-degradation factor; any other node follows the logistic response
// to its net input. Perturbed nodes stay at 0 or 1.

#ifndef BN_RELAXATION_SOLVER__H
#define BN_RELAXATION_SOLVER__H

#include <boolnet/analysis_results.hpp>
#include <boolnet/network.hpp>
#include <boolnet/options.hpp>
#include <vector>

namespace Bn {

class RelaxationSolver {
   public:
    static constexpr double RELAXATION_RATE = 0.5;
    static constexpr double MIN_PROBABILITY = 1e-9;
    // Stimuli smaller than this count as no input
    static constexpr double ZERO_STIMULUS = 1e-9;

    // Throws ConfigurationException when options fail check()
    explicit RelaxationSolver(const RelaxationOptions& options = RelaxationOptions());

    [[nodiscard]] ProbabilisticResult solve(const Network& network) const;

    static void check(const RelaxationOptions& options);

    // Logistic response to net input, scale = noise
    static double response(double net_input, const RelaxationOptions& options);
    // Value a node with the given probability and stimulus relaxes toward:
    // (1 - c) * p without stimulus, else response(stimulus - threshold - c * p)
    static double target(double probability, double stimulus, const RelaxationOptions& options);
    static double potential_energy(double probability);

   private:
    RelaxationOptions options_;
};

}  // namespace Bn

#endif  // BN_RELAXATION_SOLVER__H
