// -*- c++ -*-
//
// RuleCompiler: validates a rule set and compiles it into expression trees

#include "rule_compiler.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>

#include "rule_lexer.hpp"
#include "rule_parser.hpp"

namespace Bn {

static const char* const RESERVED_WORDS[] = {
    // math functions
    "sin", "cos", "tan", "log", "ln", "log10", "exp", "pi", "sinh", "cosh", "tanh", "abs",
    // operator words and literals of the rule grammar
    "not", "and", "or", "xor", "nand", "nor", "true", "false"};

static std::string trim(const std::string& s) {
    const char* ws = " \t\r\n";
    size_t first = s.find_first_not_of(ws);
    if (first == std::string::npos) {
        return "";
    }
    size_t last = s.find_last_not_of(ws);
    return s.substr(first, last - first + 1);
}

static std::string to_lower(const std::string& s) {
    std::string lower = s;
    for (char& c : lower) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return lower;
}

static std::string line_prefix(int line) {
    return "Line " + std::to_string(line) + ": ";
}

bool RuleCompiler::is_reserved(const std::string& name) {
    std::string lower = to_lower(name);
    return std::any_of(std::begin(RESERVED_WORDS), std::end(RESERVED_WORDS),
                       [&lower](const char* word) { return lower == word; });
}

bool RuleCompiler::is_valid_target(const std::string& name) {
    return !name.empty() && std::all_of(name.begin(), name.end(), RuleLexer::is_identifier_char);
}

RuleCompiler::RuleCompiler(const std::vector<std::string>& declared) {
    for (const auto& name : declared) {
        declared_.insert(to_lower(name));
    }
}

RuleDiagnostics RuleCompiler::validate(const RuleLines& lines) const {
    RuleDiagnostics diagnostics;
    (void)compile_lines(lines, diagnostics);
    return diagnostics;
}

CompiledRules RuleCompiler::compile(const RuleLines& lines) const {
    RuleDiagnostics diagnostics;
    CompiledRules rules = compile_lines(lines, diagnostics);
    if (!diagnostics.empty()) {
        throw CompilationException(std::move(diagnostics));
    }
    return rules;
}

CompiledRules RuleCompiler::compile_lines(const RuleLines& lines,
                                          RuleDiagnostics& diagnostics) const {
    using Kind = RuleDiagnostic::Kind;

    CompiledRules rules;
    std::unordered_set<std::string> targets;
    std::vector<std::string> references;  // identifiers in order of appearance

    for (size_t i = 0; i < lines.size(); i++) {
        const int line_number = static_cast<int>(i) + 1;
        const std::string line = trim(lines[i]);
        if (line.empty() || line[0] == '#') {
            continue;
        }

        size_t eq = line.find('=');
        if (eq == std::string::npos) {
            diagnostics.emplace_back(line_number, Kind::MissingSeparator,
                                     line_prefix(line_number) + "missing equals sign (=)");
            continue;
        }

        std::string target = trim(line.substr(0, eq));
        std::string rhs = trim(line.substr(eq + 1));

        if (target.empty()) {
            diagnostics.emplace_back(line_number, Kind::MissingTarget,
                                     line_prefix(line_number) + "missing target node name");
            continue;
        }

        // A malformed target is reported but its expression is still checked
        bool target_ok = true;
        if (!is_valid_target(target)) {
            diagnostics.emplace_back(line_number, Kind::InvalidTarget,
                                     line_prefix(line_number) + "node name \"" + target +
                                         "\" contains invalid characters",
                                     std::vector<std::string>{target});
            target_ok = false;
        } else if (is_reserved(target)) {
            diagnostics.emplace_back(line_number, Kind::ReservedTarget,
                                     line_prefix(line_number) + "node name \"" + target +
                                         "\" uses reserved word",
                                     std::vector<std::string>{target});
            target_ok = false;
        }

        if (target_ok) {
            if (targets.count(target) != 0) {
                diagnostics.emplace_back(line_number, Kind::DuplicateTarget,
                                         line_prefix(line_number) + "node \"" + target +
                                             "\" is defined multiple times",
                                         std::vector<std::string>{target});
                target_ok = false;
            } else {
                targets.insert(target);
            }
        }

        if (rhs.empty()) {
            diagnostics.emplace_back(line_number, Kind::MissingExpression,
                                     line_prefix(line_number) + "missing Boolean expression for \"" +
                                         target + "\"",
                                     std::vector<std::string>{target});
            continue;
        }

        Expression expression;
        try {
            expression = RuleParser(rhs).parse();
        } catch (const RuleSyntaxError& e) {
            diagnostics.emplace_back(line_number, Kind::SyntaxError,
                                     line_prefix(line_number) + "invalid Boolean expression for \"" +
                                         target + "\" (" + e.message() + ")",
                                     std::vector<std::string>{target});
            continue;
        }

        CompiledRule rule;
        rule.target = target;
        rule.expression = expression;
        rule.line = line_number;
        expression->collect_variables(rule.variables);
        for (const auto& name : rule.variables) {
            if (is_reserved(name)) {
                diagnostics.emplace_back(line_number, Kind::ReservedVariable,
                                         line_prefix(line_number) + "expression for \"" + target +
                                             "\" uses reserved word \"" + name + "\"",
                                         std::vector<std::string>{name});
                continue;
            }
            references.push_back(name);
        }
        if (target_ok) {
            rules.push_back(std::move(rule));
        }
    }

    // Undefined variables are checked against every target of the rule set
    std::vector<std::string> undefined;
    for (const auto& name : references) {
        if (targets.count(name) == 0 && declared_.count(to_lower(name)) == 0 &&
            std::find(undefined.begin(), undefined.end(), name) == undefined.end()) {
            undefined.push_back(name);
        }
    }
    if (!undefined.empty()) {
        std::ostringstream what;
        what << (undefined.size() == 1 ? "Undefined variable " : "Undefined variables ");
        for (size_t i = 0; i < undefined.size(); i++) {
            if (i > 0) {
                what << ", ";
            }
            what << "\"" << undefined[i] << "\"";
        }
        what << " used in expressions";
        diagnostics.emplace_back(0, Kind::UndefinedVariable, what.str(), undefined);
    }

    return rules;
}

}  // namespace Bn
