// -*- c++ -*-
//
// RuleParser: recursive-descent parser for the right-hand side of a rule

#include "rule_parser.hpp"

namespace Bn {

RuleParser::RuleParser(const std::string& expression)
    : lexer_(expression)
    , token_(lexer_.begin()) {}

Expression RuleParser::parse() {
    token_ = lexer_.begin();
    nesting_ = 0;
    if (peek().kind == Kind::End) {
        throw RuleSyntaxError(peek().column, "empty expression");
    }
    Expression e = parse_or();
    if (peek().kind != Kind::End) {
        unexpectedToken(peek());
    }
    return e;
}

const RuleToken& RuleParser::take() {
    const RuleToken& token = *token_;
    if (token.kind != Kind::End) {
        ++token_;
    }
    return token;
}

void RuleParser::unexpectedToken(const RuleToken& token) const {
    if (token.kind == Kind::End) {
        throw RuleSyntaxError(token.column, "unexpected end of expression");
    }
    throw RuleSyntaxError(token.column, "unexpected token \"" + token.text + "\"");
}

void RuleParser::checkDepth(const Expression& e, const RuleToken& token) const {
    if (e->depth() > MAX_DEPTH) {
        throw RuleSyntaxError(token.column, "expression nested deeper than " +
                                                std::to_string(MAX_DEPTH) + " levels");
    }
}

Expression RuleParser::parse_or() {
    Expression left = parse_and();
    while (peek().kind == Kind::Or) {
        const RuleToken& op = take();
        Expression right = parse_and();
        left = Expression::binary(Op::Or, left, right);
        checkDepth(left, op);
    }
    return left;
}

Expression RuleParser::parse_and() {
    Expression left = parse_factor();
    while (true) {
        Op op = Op::And;
        switch (peek().kind) {
            case Kind::And:
                op = Op::And;
                break;
            case Kind::Xor:
                op = Op::Xor;
                break;
            case Kind::Nand:
                op = Op::Nand;
                break;
            case Kind::Nor:
                op = Op::Nor;
                break;
            default:
                return left;
        }
        const RuleToken& op_token = take();
        Expression right = parse_factor();
        left = Expression::binary(op, left, right);
        checkDepth(left, op_token);
    }
}

Expression RuleParser::parse_factor() {
    const RuleToken& token = take();
    if ((token.kind == Kind::Not || token.kind == Kind::LParen) && ++nesting_ > MAX_DEPTH) {
        throw RuleSyntaxError(token.column, "expression nested deeper than " +
                                                std::to_string(MAX_DEPTH) + " levels");
    }
    switch (token.kind) {
        case Kind::Not: {
            Expression negated = Expression::negate(parse_factor());
            nesting_--;
            return negated;
        }
        case Kind::LParen: {
            Expression inner = parse_or();
            nesting_--;
            const RuleToken& close = take();
            if (close.kind != Kind::RParen) {
                if (close.kind == Kind::End) {
                    throw RuleSyntaxError(close.column, "missing \")\"");
                }
                unexpectedToken(close);
            }
            return inner;
        }
        case Kind::True:
            return Expression::constant(true);
        case Kind::False:
            return Expression::constant(false);
        case Kind::Identifier:
            return Expression::variable(token.text);
        default:
            unexpectedToken(token);
    }
}

}  // namespace Bn
