// -*- c++ -*-
//
// RuleLexer: splits a rule expression into tokens

#include "rule_lexer.hpp"

#include <cctype>

namespace Bn {

RuleLexer::RuleLexer(const std::string& expression) {
    tokenize(expression);
}

bool RuleLexer::is_identifier_start(char c) {
    return std::isalpha(static_cast<unsigned char>(c)) != 0 || c == '_';
}

bool RuleLexer::is_identifier_char(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) != 0 || c == '_';
}

static std::string to_upper(const std::string& word) {
    std::string upper = word;
    for (char& c : upper) {
        c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    }
    return upper;
}

RuleToken::Kind RuleLexer::classify_word(const std::string& word) {
    std::string upper = to_upper(word);
    if (upper == "TRUE") {
        return RuleToken::Kind::True;
    }
    if (upper == "FALSE") {
        return RuleToken::Kind::False;
    }
    if (upper == "NOT") {
        return RuleToken::Kind::Not;
    }
    if (upper == "AND") {
        return RuleToken::Kind::And;
    }
    if (upper == "OR") {
        return RuleToken::Kind::Or;
    }
    if (upper == "XOR") {
        return RuleToken::Kind::Xor;
    }
    if (upper == "NAND") {
        return RuleToken::Kind::Nand;
    }
    if (upper == "NOR") {
        return RuleToken::Kind::Nor;
    }
    return RuleToken::Kind::Identifier;
}

void RuleLexer::tokenize(const std::string& expression) {
    tokens_.clear();
    size_t i = 0;
    const size_t length = expression.length();

    while (i < length) {
        char c = expression[i];
        size_t column = i + 1;

        if (std::isspace(static_cast<unsigned char>(c)) != 0) {
            ++i;
        } else if (c == '(') {
            tokens_.emplace_back(RuleToken::Kind::LParen, "(", column);
            ++i;
        } else if (c == ')') {
            tokens_.emplace_back(RuleToken::Kind::RParen, ")", column);
            ++i;
        } else if (c == '!') {
            tokens_.emplace_back(RuleToken::Kind::Not, "!", column);
            ++i;
        } else if (c == '&' && i + 1 < length && expression[i + 1] == '&') {
            tokens_.emplace_back(RuleToken::Kind::And, "&&", column);
            i += 2;
        } else if (c == '|' && i + 1 < length && expression[i + 1] == '|') {
            tokens_.emplace_back(RuleToken::Kind::Or, "||", column);
            i += 2;
        } else if (is_identifier_start(c)) {
            size_t end = i + 1;
            while (end < length && is_identifier_char(expression[end])) {
                ++end;
            }
            std::string word = expression.substr(i, end - i);
            tokens_.emplace_back(classify_word(word), word, column);
            i = end;
        } else {
            // Digits, single '&' or '|', '=' and every other character
            size_t end = i + 1;
            if (std::isdigit(static_cast<unsigned char>(c)) != 0) {
                while (end < length && is_identifier_char(expression[end])) {
                    ++end;
                }
            }
            tokens_.emplace_back(RuleToken::Kind::Invalid, expression.substr(i, end - i), column);
            i = end;
        }
    }

    tokens_.emplace_back(RuleToken::Kind::End, "", length + 1);
}

}  // namespace Bn
