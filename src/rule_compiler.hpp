// -*- c++ -*-
//
// RuleCompiler: validates a rule set and turns each "target = expression"
// line into a CompiledRule
//
// All lines are checked before anything is reported, so a caller sees every
// problem of the rule set at once. Blank lines and lines starting with '#'
// are skipped but keep their line numbers.

#ifndef BN_RULE_COMPILER__H
#define BN_RULE_COMPILER__H

#include <boolnet/exception.hpp>
#include <boolnet/network.hpp>
#include <string>
#include <unordered_set>
#include <vector>

#include "expression.hpp"

namespace Bn {

struct CompiledRule {
    std::string target;
    Expression expression;  // leaves refer to names, not yet bound
    int line = 0;
    std::vector<std::string> variables;  // in order of first appearance
};

using CompiledRules = std::vector<CompiledRule>;

class RuleCompiler {
   public:
    // Names declared outside the rule set (node ids and labels of the
    // network) count as defined; they match case-insensitively
    RuleCompiler() = default;
    explicit RuleCompiler(const std::vector<std::string>& declared);

    // Returns every diagnostic for the rule set; empty when it compiles
    [[nodiscard]] RuleDiagnostics validate(const RuleLines& lines) const;

    // Throws CompilationException carrying all diagnostics
    [[nodiscard]] CompiledRules compile(const RuleLines& lines) const;

    // Math function names, operator words and literals
    [[nodiscard]] static bool is_reserved(const std::string& name);
    [[nodiscard]] static bool is_valid_target(const std::string& name);

   private:
    CompiledRules compile_lines(const RuleLines& lines, RuleDiagnostics& diagnostics) const;

    std::unordered_set<std::string> declared_;  // lower-cased
};

}  // namespace Bn

#endif  // BN_RULE_COMPILER__H
