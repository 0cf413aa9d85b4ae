// -*- c++ -*-
//
// Synchronous update functions: every node computes its next value from the
// same current State.
//
// RuleUpdate evaluates compiled boolean rules. ThresholdUpdate compares a
// weighted sum of active predecessors plus bias against a threshold. Both
// honor perturbations (nodes pinned to a fixed value).

#ifndef BN_UPDATE_FUNCTION__H
#define BN_UPDATE_FUNCTION__H

#include <boolnet/analysis_results.hpp>
#include <boolnet/network.hpp>
#include <boolnet/options.hpp>
#include <vector>

#include "expression.hpp"
#include "rule_compiler.hpp"
#include "state_codec.hpp"

namespace Bn {

class UpdateFunction {
   public:
    virtual ~UpdateFunction() = default;

    [[nodiscard]] virtual State next(State state) const = 0;
    // Number of nodes, i.e. bits of a State
    [[nodiscard]] virtual size_t size() const = 0;

   protected:
    // Pins perturbed nodes; codec resolves ids
    void set_perturbations(const Perturbations& perturbations, const StateCodec& codec);
    [[nodiscard]] State apply_perturbations(State state) const {
        return (state & ~pinned_mask_) | pinned_values_;
    }

   private:
    State pinned_mask_ = 0;
    State pinned_values_ = 0;
};

class RuleUpdate : public UpdateFunction {
   public:
    // Binds rule targets and leaves to the codec's nodes. Names that match no
    // node throw CompilationException (UnknownNode); rule-less nodes under
    // UnruledPolicy::Reject throw ConfigurationException.
    RuleUpdate(const CompiledRules& rules, const StateCodec& codec, const RuleOptions& options,
               const Perturbations& perturbations = Perturbations());

    [[nodiscard]] State next(State state) const override;
    [[nodiscard]] size_t size() const override {
        return rules_.size();
    }

   private:
    std::vector<Expression> rules_;  // indexed by node; null when the node has no rule
    UnruledPolicy unruled_;
};

class ThresholdUpdate : public UpdateFunction {
   public:
    struct Incoming {
        size_t source;
        double weight;
    };

    ThresholdUpdate(const Network& network, const StateCodec& codec, const WeightedOptions& options);

    [[nodiscard]] State next(State state) const override;
    [[nodiscard]] size_t size() const override {
        return incoming_.size();
    }

    [[nodiscard]] double threshold(size_t index) const {
        return threshold_[index];
    }
    [[nodiscard]] double bias(size_t index) const {
        return bias_[index];
    }
    // Weighted sum of active predecessors plus bias
    [[nodiscard]] double score(State state, size_t index) const;

   private:
    std::vector<std::vector<Incoming>> incoming_;
    std::vector<double> bias_;
    std::vector<double> threshold_;
    State input_mask_ = 0;  // nodes with no incoming edge and no bias keep their value
    TieBehavior tie_;
};

}  // namespace Bn

#endif  // BN_UPDATE_FUNCTION__H
