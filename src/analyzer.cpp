// -*- c++ -*-
//
// Analyzer: configuration checks, input loading and the three analyses

#include <boolnet/analyzer.hpp>
#include <sstream>

#include "attractor_search.hpp"
#include "network_reader.hpp"
#include "relaxation_solver.hpp"
#include "rule_compiler.hpp"
#include "state_codec.hpp"
#include "update_function.hpp"

namespace Bn {

static void append_error(std::ostringstream& errors, const std::string& message) {
    if (errors.tellp() > 0) {
        errors << "; ";
    }
    errors << message;
}

void Analyzer::check() const {
    std::ostringstream errors;

    switch (mode_) {
        case Mode::None:
            append_error(errors, "please specify `-m' properly");
            break;
        case Mode::Rules:
            if (rules_file_.empty() && network_file_.empty() && network_.rule_lines().empty()) {
                append_error(errors, "please specify `-r' properly");
            }
            break;
        case Mode::Weighted:
        case Mode::Probabilistic:
            if (network_file_.empty() && network_.empty()) {
                append_error(errors, "please specify `-n' properly");
            }
            break;
    }

    if (mode_ == Mode::Probabilistic) {
        try {
            RelaxationSolver::check(relaxation_options_);
        } catch (const ConfigurationException& e) {
            append_error(errors, e.message());
        }
    }
    if (search_options_.state_cap == 0) {
        append_error(errors, "state cap must be at least 1");
    }
    if (search_options_.step_cap == 0) {
        append_error(errors, "step cap must be at least 1");
    }

    std::string error_str = errors.str();
    if (!error_str.empty()) {
        throw ConfigurationException(error_str);
    }
}

//// read ////

void Analyzer::read_network() {
    if (network_file_.empty()) {
        return;
    }
    NetworkReader reader(network_file_);
    reader.parse();
    Network network = reader.network();
    network.set_rules(network_.rule_lines());
    network_ = network;
}

void Analyzer::read_rules() {
    if (rules_file_.empty()) {
        return;
    }
    network_.set_rules(read_rule_lines(rules_file_));
}

//// analyses ////

// Node ids and labels; rules may refer to a node by either
static std::vector<std::string> declared_names(const Network& network) {
    std::vector<std::string> names;
    for (const auto& node : network.nodes()) {
        names.push_back(node.id);
        names.push_back(node.display_label());
    }
    return names;
}

// Without a node list the rule targets are the nodes, in rule order
static Nodes rule_nodes(const Network& network, const CompiledRules& rules) {
    if (!network.empty()) {
        return network.nodes();
    }
    Nodes nodes;
    for (const auto& rule : rules) {
        nodes.emplace_back(rule.target);
    }
    return nodes;
}

static void describe(AnalysisResult& result, const StateCodec& codec) {
    result.node_order = codec.order();
    result.node_labels = codec.labels();
    for (auto& attractor : result.attractors) {
        attractor.snapshots.clear();
        for (State state : attractor.states) {
            attractor.snapshots.push_back(codec.snapshot(state));
        }
    }
}

RuleDiagnostics Analyzer::validateRules() const {
    RuleCompiler compiler(declared_names(network_));
    RuleLines lines = network_.rule_lines();
    RuleDiagnostics diagnostics = compiler.validate(lines);
    if (!diagnostics.empty()) {
        return diagnostics;
    }

    // Binding problems surface as diagnostics too
    CompiledRules rules = compiler.compile(lines);
    StateCodec codec(rule_nodes(network_, rules));
    try {
        RuleUpdate update(rules, codec, rule_options_, network_.perturbations());
        (void)update;
    } catch (const CompilationException& e) {
        return e.diagnostics();
    }
    return diagnostics;
}

AnalysisResult Analyzer::getRuleAnalysis() const {
    RuleCompiler compiler(declared_names(network_));
    CompiledRules rules = compiler.compile(network_.rule_lines());

    StateCodec codec(rule_nodes(network_, rules));
    RuleUpdate update(rules, codec, rule_options_, network_.perturbations());

    AnalysisResult result = AttractorSearch(search_options_).run(update);
    describe(result, codec);
    return result;
}

AnalysisResult Analyzer::getWeightedAnalysis() const {
    StateCodec codec(network_.nodes());
    ThresholdUpdate update(network_, codec, weighted_options_);

    AnalysisResult result = AttractorSearch(search_options_).run(update);
    describe(result, codec);
    return result;
}

ProbabilisticResult Analyzer::getProbabilisticAnalysis() const {
    return RelaxationSolver(relaxation_options_).solve(network_);
}

}  // namespace Bn
