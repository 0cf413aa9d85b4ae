// -*- c++ -*-
//
// Analyzer: entry point tying the network readers, the rule compiler, the
// attractor search and the relaxation solver together

#ifndef BN_ANALYZER__H
#define BN_ANALYZER__H

#include <boolnet/analysis_results.hpp>
#include <boolnet/exception.hpp>
#include <boolnet/network.hpp>
#include <boolnet/options.hpp>
#include <string>

namespace Bn {

enum class Mode { None, Rules, Weighted, Probabilistic };

Mode parse_mode(const std::string& name);

class Analyzer {
   public:
    Analyzer() = default;

    // Validates the configuration; throws ConfigurationException listing every problem
    void check() const;
    void read_rules();
    void read_network();

    void set_mode(Mode mode) {
        mode_ = mode;
    }
    [[nodiscard]] Mode mode() const {
        return mode_;
    }

    void set_rules_file(const std::string& file) {
        rules_file_ = file;
    }
    void set_network_file(const std::string& file) {
        network_file_ = file;
    }
    void set_network(const Network& network) {
        network_ = network;
    }
    [[nodiscard]] const Network& network() const {
        return network_;
    }

    void set_rule_options(const RuleOptions& options) {
        rule_options_ = options;
    }
    void set_weighted_options(const WeightedOptions& options) {
        weighted_options_ = options;
    }
    void set_search_options(const SearchOptions& options) {
        search_options_ = options;
    }
    void set_relaxation_options(const RelaxationOptions& options) {
        relaxation_options_ = options;
    }

    // Pure functions over the loaded network
    [[nodiscard]] RuleDiagnostics validateRules() const;
    [[nodiscard]] AnalysisResult getRuleAnalysis() const;
    [[nodiscard]] AnalysisResult getWeightedAnalysis() const;
    [[nodiscard]] ProbabilisticResult getProbabilisticAnalysis() const;

   private:
    Mode mode_ = Mode::None;
    std::string rules_file_;
    std::string network_file_;
    Network network_;

    RuleOptions rule_options_;
    WeightedOptions weighted_options_;
    SearchOptions search_options_;
    RelaxationOptions relaxation_options_;
};

}  // namespace Bn

#endif  // BN_ANALYZER__H
