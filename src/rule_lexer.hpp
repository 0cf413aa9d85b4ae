// -*- c++ -*-
//
// RuleLexer: splits a rule expression into tokens
// Recognizes "!", "&&", "||", parentheses, identifiers and the word forms
// NOT/AND/OR/XOR/NAND/NOR/TRUE/FALSE (case-insensitive). Anything else becomes
// an Invalid token; the parser decides how to report it.

#ifndef BN_RULE_LEXER__H
#define BN_RULE_LEXER__H

#include <string>
#include <vector>

namespace Bn {

struct RuleToken {
    enum class Kind { Identifier, True, False, Not, And, Or, Xor, Nand, Nor, LParen, RParen, Invalid, End };

    Kind kind = Kind::End;
    std::string text;
    size_t column = 0;  // 1-based position in the expression

    RuleToken() = default;
    RuleToken(Kind k, const std::string& t, size_t c)
        : kind(k)
        , text(t)
        , column(c) {}
};

class RuleLexer {
   public:
    using Tokens = std::vector<RuleToken>;
    using iterator = Tokens::const_iterator;

    explicit RuleLexer(const std::string& expression);

    [[nodiscard]] iterator begin() const {
        return tokens_.begin();
    }
    // The last token is always Kind::End
    [[nodiscard]] iterator end() const {
        return tokens_.end();
    }
    [[nodiscard]] const Tokens& tokens() const {
        return tokens_;
    }

    static bool is_identifier_start(char c);
    static bool is_identifier_char(char c);

   private:
    void tokenize(const std::string& expression);
    static RuleToken::Kind classify_word(const std::string& word);

    Tokens tokens_;
};

}  // namespace Bn

#endif  // BN_RULE_LEXER__H
