// -*- c++ -*-
//
// Synchronous update functions

#include "update_function.hpp"

#include <algorithm>
#include <cmath>
#include <sstream>

namespace Bn {

void UpdateFunction::set_perturbations(const Perturbations& perturbations,
                                       const StateCodec& codec) {
    pinned_mask_ = 0;
    pinned_values_ = 0;
    for (const auto& p : perturbations) {
        size_t index = codec.index_of(p.first);
        pinned_mask_ = StateCodec::with_bit(pinned_mask_, index, true);
        pinned_values_ = StateCodec::with_bit(pinned_values_, index, p.second);
    }
}

//// RuleUpdate ////

RuleUpdate::RuleUpdate(const CompiledRules& rules, const StateCodec& codec,
                       const RuleOptions& options, const Perturbations& perturbations)
    : rules_(codec.size())
    , unruled_(options.unruled) {
    using Kind = RuleDiagnostic::Kind;

    RuleDiagnostics diagnostics;
    std::vector<std::string> missing;
    auto resolver = [&codec, &missing](const std::string& name) {
        size_t index = codec.resolve(name);
        if (index == StateCodec::npos &&
            std::find(missing.begin(), missing.end(), name) == missing.end()) {
            missing.push_back(name);
        }
        // Unknown leaves bind to bit 0; the tree is discarded when anything is missing
        return index == StateCodec::npos ? size_t{0} : index;
    };

    for (const auto& rule : rules) {
        size_t target = codec.resolve(rule.target);
        if (target == StateCodec::npos) {
            diagnostics.emplace_back(rule.line, Kind::UnknownNode,
                                     "Line " + std::to_string(rule.line) + ": rule target \"" +
                                         rule.target + "\" is not a node of the network",
                                     std::vector<std::string>{rule.target});
            continue;
        }
        if (rules_[target]) {
            diagnostics.emplace_back(rule.line, Kind::DuplicateTarget,
                                     "Line " + std::to_string(rule.line) + ": node \"" +
                                         codec.order()[target] + "\" already has a rule",
                                     std::vector<std::string>{rule.target});
            continue;
        }
        rules_[target] = rule.expression.bind(resolver);
    }

    if (!missing.empty()) {
        std::ostringstream what;
        what << "Rules reference unknown nodes ";
        for (size_t i = 0; i < missing.size(); i++) {
            what << (i > 0 ? ", " : "") << "\"" << missing[i] << "\"";
        }
        diagnostics.emplace_back(0, Kind::UnknownNode, what.str(), missing);
    }
    if (!diagnostics.empty()) {
        throw CompilationException(std::move(diagnostics));
    }

    if (unruled_ == UnruledPolicy::Reject) {
        std::vector<std::string> unruled;
        for (size_t i = 0; i < rules_.size(); i++) {
            if (!rules_[i]) {
                unruled.push_back(codec.order()[i]);
            }
        }
        if (!unruled.empty()) {
            std::ostringstream what;
            what << "nodes without a rule:";
            for (const auto& id : unruled) {
                what << " " << id;
            }
            throw ConfigurationException(what.str());
        }
    }

    set_perturbations(perturbations, codec);
}

State RuleUpdate::next(State state) const {
    State next_state = 0;
    for (size_t i = 0; i < rules_.size(); i++) {
        bool value = false;
        if (rules_[i]) {
            value = rules_[i]->evaluate(state);
        } else if (unruled_ == UnruledPolicy::Hold) {
            value = StateCodec::bit(state, i);
        }
        next_state = StateCodec::with_bit(next_state, i, value);
    }
    return apply_perturbations(next_state);
}

//// ThresholdUpdate ////

ThresholdUpdate::ThresholdUpdate(const Network& network, const StateCodec& codec,
                                 const WeightedOptions& options)
    : incoming_(codec.size())
    , bias_(codec.size(), 0.0)
    , threshold_(codec.size(), options.threshold_multiplier)
    , tie_(options.tie) {
    if (!std::isfinite(options.threshold_multiplier)) {
        throw ConfigurationException("threshold multiplier must be a finite number");
    }

    std::vector<double> abs_in(codec.size(), 0.0);
    for (const auto& edge : network.edges()) {
        if (edge.weight == 0.0) {
            continue;
        }
        if (!std::isfinite(edge.weight)) {
            throw ConfigurationException("edge " + edge.source + " -> " + edge.target +
                                         " has a non-finite weight");
        }
        size_t source = codec.index_of(edge.source);
        size_t target = codec.index_of(edge.target);
        incoming_[target].push_back(Incoming{source, edge.weight});
        abs_in[target] += std::fabs(edge.weight);
    }

    for (const auto& node : network.nodes()) {
        size_t index = codec.index_of(node.id);
        auto bi = options.biases.find(node.id);
        if (bi != options.biases.end()) {
            bias_[index] = bi->second;
        } else if (node.has_bias) {
            bias_[index] = node.bias;
        }
    }
    for (const auto& b : options.biases) {
        (void)codec.index_of(b.first);  // reject overrides for unknown nodes
    }

    for (size_t i = 0; i < codec.size(); i++) {
        if (options.threshold_mode == ThresholdMode::InDegree) {
            threshold_[i] = options.threshold_multiplier * std::max(abs_in[i], 1.0);
        }
        if (incoming_[i].empty() && bias_[i] == 0.0) {
            input_mask_ = StateCodec::with_bit(input_mask_, i, true);
        }
    }

    set_perturbations(network.perturbations(), codec);
}

double ThresholdUpdate::score(State state, size_t index) const {
    double sum = bias_[index];
    for (const auto& in : incoming_[index]) {
        if (StateCodec::bit(state, in.source)) {
            sum += in.weight;
        }
    }
    return sum;
}

State ThresholdUpdate::next(State state) const {
    State next_state = 0;
    for (size_t i = 0; i < incoming_.size(); i++) {
        bool current = StateCodec::bit(state, i);
        bool value = current;
        if (!StateCodec::bit(input_mask_, i)) {
            double s = score(state, i);
            if (s > threshold_[i]) {
                value = true;
            } else if (s < threshold_[i]) {
                value = false;
            } else {
                switch (tie_) {
                    case TieBehavior::Hold:
                        value = current;
                        break;
                    case TieBehavior::Off:
                        value = false;
                        break;
                    case TieBehavior::On:
                        value = true;
                        break;
                }
            }
        }
        next_state = StateCodec::with_bit(next_state, i, value);
    }
    return apply_perturbations(next_state);
}

}  // namespace Bn
