// -*- c++ -*-
//
// RelaxationSolver: damped Jacobi sweeps over node activation probabilities

#include "relaxation_solver.hpp"

#include <boolnet/exception.hpp>
#include <algorithm>
#include <boost/math/distributions/logistic.hpp>
#include <cmath>
#include <sstream>
#include <unordered_map>

namespace Bn {

static void check_probability(const std::string& what, double p) {
    if (!(p >= 0.0 && p <= 1.0)) {
        std::ostringstream msg;
        msg << what << " must be in [0, 1], got " << p;
        throw ConfigurationException(msg.str());
    }
}

static void check_known(const Network& network,
                        const std::unordered_map<std::string, double>& values,
                        const std::string& what) {
    for (const auto& entry : values) {
        if (!network.has_node(entry.first)) {
            throw ConfigurationException(what + " names unknown node \"" + entry.first + "\"");
        }
        if (!std::isfinite(entry.second)) {
            throw ConfigurationException(what + " of node \"" + entry.first +
                                         "\" must be a finite number");
        }
    }
}

RelaxationSolver::RelaxationSolver(const RelaxationOptions& options)
    : options_(options) {
    check(options_);
}

void RelaxationSolver::check(const RelaxationOptions& options) {
    if (!(options.noise > 0.0) || !std::isfinite(options.noise)) {
        throw ConfigurationException("noise must be a positive finite number");
    }
    if (!(options.self_degradation >= 0.0 && options.self_degradation <= 1.0)) {
        throw ConfigurationException("self-degradation must be in [0, 1]");
    }
    if (options.max_iterations < 1) {
        throw ConfigurationException("maximum iterations must be at least 1");
    }
    if (!(options.tolerance > 0.0)) {
        throw ConfigurationException("tolerance must be positive");
    }
    if (!std::isfinite(options.threshold_multiplier)) {
        throw ConfigurationException("threshold multiplier must be a finite number");
    }
    check_probability("initial probability", options.initial_probability);
    for (const auto& entry : options.initial_probabilities) {
        check_probability("initial probability of \"" + entry.first + "\"", entry.second);
    }
}

double RelaxationSolver::response(double net_input, const RelaxationOptions& options) {
    boost::math::logistic_distribution<double> logistic(0.0, options.noise);
    return boost::math::cdf(logistic, net_input);
}

double RelaxationSolver::target(double probability, double stimulus,
                                const RelaxationOptions& options) {
    if (std::fabs(stimulus) < ZERO_STIMULUS) {
        return (1.0 - options.self_degradation) * probability;
    }
    double net_input =
        stimulus - options.threshold_multiplier - options.self_degradation * probability;
    return response(net_input, options);
}

double RelaxationSolver::potential_energy(double probability) {
    return -std::log(std::max(probability, MIN_PROBABILITY));
}

ProbabilisticResult RelaxationSolver::solve(const Network& network) const {
    ProbabilisticResult result;
    if (network.empty()) {
        result.converged = true;
        result.warnings.emplace_back("No nodes supplied; analysis skipped.");
        return result;
    }

    check_known(network, options_.initial_probabilities, "initial probability");
    check_known(network, options_.biases, "bias override");
    check_known(network, options_.basal_activity, "basal activity");

    const Nodes& nodes = network.nodes();
    const size_t n = nodes.size();
    std::unordered_map<std::string, size_t> index;
    for (size_t i = 0; i < n; i++) {
        index[nodes[i].id] = i;
        result.node_order.push_back(nodes[i].id);
    }

    struct Incoming {
        size_t source;
        double weight;
    };
    std::vector<std::vector<Incoming>> incoming(n);
    for (const auto& edge : network.edges()) {
        if (edge.weight == 0.0) {
            continue;
        }
        if (!std::isfinite(edge.weight)) {
            throw ConfigurationException("edge " + edge.source + " -> " + edge.target +
                                         " has a non-finite weight");
        }
        incoming[index.at(edge.target)].push_back(Incoming{index.at(edge.source), edge.weight});
    }

    // Constant part of each node's stimulus
    std::vector<double> drive(n, 0.0);
    std::vector<double> p(n, options_.initial_probability);
    std::vector<bool> pinned(n, false);
    for (size_t i = 0; i < n; i++) {
        const Node& node = nodes[i];
        auto bi = options_.biases.find(node.id);
        if (bi != options_.biases.end()) {
            drive[i] += bi->second;
        } else if (node.has_bias) {
            drive[i] += node.bias;
        }
        auto ba = options_.basal_activity.find(node.id);
        if (ba != options_.basal_activity.end()) {
            drive[i] += ba->second;
        }
        auto ip = options_.initial_probabilities.find(node.id);
        if (ip != options_.initial_probabilities.end()) {
            p[i] = ip->second;
        }
    }
    for (const auto& fixed : network.perturbations()) {
        size_t i = index.at(fixed.first);
        pinned[i] = true;
        p[i] = fixed.second ? 1.0 : 0.0;
    }

    std::vector<double> next(n);
    for (int iteration = 1; iteration <= options_.max_iterations; iteration++) {
        double max_delta = 0.0;
        for (size_t i = 0; i < n; i++) {
            if (pinned[i]) {
                next[i] = p[i];
                continue;
            }
            double stimulus = drive[i];
            for (const auto& in : incoming[i]) {
                stimulus += in.weight * p[in.source];
            }
            double f = target(p[i], stimulus, options_);
            next[i] = std::clamp(p[i] + RELAXATION_RATE * (f - p[i]), 0.0, 1.0);
            max_delta = std::max(max_delta, std::fabs(next[i] - p[i]));
        }
        p.swap(next);
        result.iterations = iteration;
        if (max_delta < options_.tolerance) {
            result.converged = true;
            break;
        }
    }

    if (!result.converged) {
        std::ostringstream what;
        what << "Relaxation did not converge within " << options_.max_iterations
             << " iterations (tolerance " << options_.tolerance << ").";
        result.warnings.push_back(what.str());
    }

    for (size_t i = 0; i < n; i++) {
        result.probabilities[nodes[i].id] = p[i];
        result.potential_energies[nodes[i].id] = potential_energy(p[i]);
    }
    return result;
}

}  // namespace Bn
