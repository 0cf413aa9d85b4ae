// -*- c++ -*-
//
// RuleParser: recursive-descent parser for the right-hand side of a rule
//
//   expr   := term   { ("||" | OR) term }
//   term   := factor { ("&&" | AND | XOR | NAND | NOR) factor }
//   factor := ("!" | NOT) factor | "(" expr ")" | TRUE | FALSE | identifier

#ifndef BN_RULE_PARSER__H
#define BN_RULE_PARSER__H

#include <boolnet/exception.hpp>
#include <string>

#include "expression.hpp"
#include "rule_lexer.hpp"

namespace Bn {

// Thrown by RuleParser; column is 1-based within the expression
class RuleSyntaxError : public Exception {
   public:
    RuleSyntaxError(size_t column, const std::string& message)
        : Exception("column " + std::to_string(column) + ": " + message)
        , column_(column) {}

    [[nodiscard]] size_t column() const {
        return column_;
    }

   private:
    size_t column_;
};

class RuleParser {
   public:
    // Deepest expression tree accepted, counting both nesting and operator chains
    static constexpr size_t MAX_DEPTH = 256;

    explicit RuleParser(const std::string& expression);

    // Parses the whole expression; throws RuleSyntaxError
    [[nodiscard]] Expression parse();

   private:
    using Token = RuleLexer::iterator;
    using Kind = RuleToken::Kind;

    Expression parse_or();
    Expression parse_and();
    Expression parse_factor();

    [[nodiscard]] const RuleToken& peek() const {
        return *token_;
    }
    const RuleToken& take();
    [[noreturn]] void unexpectedToken(const RuleToken& token) const;
    void checkDepth(const Expression& e, const RuleToken& token) const;

    RuleLexer lexer_;
    Token token_;
    size_t nesting_ = 0;
};

}  // namespace Bn

#endif  // BN_RULE_PARSER__H
