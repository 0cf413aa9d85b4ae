// -*- c++ -*-
//
// Boolean expression tree for update rules

#include "expression.hpp"

#include <algorithm>
#include <utility>

namespace Bn {

const char* op_symbol(Op op) {
    switch (op) {
        case Op::Not:
            return "!";
        case Op::And:
            return "&&";
        case Op::Or:
            return "||";
        case Op::Xor:
            return "XOR";
        case Op::Nand:
            return "NAND";
        case Op::Nor:
            return "NOR";
        default:
            return "";
    }
}

Expression Expression::constant(bool value) {
    return Expression(std::make_shared<ExpressionImpl>(Op::Const, value, "", ExpressionImpl::UNBOUND,
                                                       nullptr, nullptr));
}

Expression Expression::variable(const std::string& name) {
    return Expression(std::make_shared<ExpressionImpl>(Op::Variable, false, name,
                                                       ExpressionImpl::UNBOUND, nullptr, nullptr));
}

Expression Expression::negate(const Expression& operand) {
    if (!operand) {
        throw RuntimeException("Expression: null operand for \"!\"");
    }
    return Expression(std::make_shared<ExpressionImpl>(Op::Not, false, "", ExpressionImpl::UNBOUND,
                                                       operand, nullptr));
}

Expression Expression::binary(Op op, const Expression& left, const Expression& right) {
    if (op == Op::Const || op == Op::Variable || op == Op::Not) {
        throw RuntimeException("Expression: operator is not binary");
    }
    if (!left || !right) {
        throw RuntimeException(std::string("Expression: null operand for \"") + op_symbol(op) + "\"");
    }
    return Expression(
        std::make_shared<ExpressionImpl>(op, false, "", ExpressionImpl::UNBOUND, left, right));
}

Expression Expression::bind(const Resolver& resolver) const {
    const ExpressionImpl& e = **this;
    switch (e.op()) {
        case Op::Const:
            return *this;
        case Op::Variable: {
            size_t index = resolver(e.name());
            if (index == ExpressionImpl::UNBOUND) {
                throw RuntimeException("Expression: unresolved variable \"" + e.name() + "\"");
            }
            return Expression(std::make_shared<ExpressionImpl>(Op::Variable, false, e.name(), index,
                                                               nullptr, nullptr));
        }
        case Op::Not:
            return negate(e.left().bind(resolver));
        default:
            return binary(e.op(), e.left().bind(resolver), e.right().bind(resolver));
    }
}

bool ExpressionImpl::evaluate(State state) const {
    switch (op_) {
        case Op::Const:
            return value_;
        case Op::Variable:
            if (index_ == UNBOUND) {
                throw RuntimeException("Expression: variable \"" + name_ + "\" is not bound");
            }
            return ((state >> index_) & State{1}) != 0;
        case Op::Not:
            return !left_->evaluate(state);
        case Op::And:
            return left_->evaluate(state) && right_->evaluate(state);
        case Op::Or:
            return left_->evaluate(state) || right_->evaluate(state);
        case Op::Xor:
            return left_->evaluate(state) != right_->evaluate(state);
        case Op::Nand:
            return !(left_->evaluate(state) && right_->evaluate(state));
        case Op::Nor:
            return !(left_->evaluate(state) || right_->evaluate(state));
    }
    throw RuntimeException("Expression: unknown operator");
}

void ExpressionImpl::collect_variables(std::vector<std::string>& names) const {
    if (op_ == Op::Variable) {
        if (std::find(names.begin(), names.end(), name_) == names.end()) {
            names.push_back(name_);
        }
        return;
    }
    if (left_) {
        left_->collect_variables(names);
    }
    if (right_) {
        right_->collect_variables(names);
    }
}

size_t ExpressionImpl::node_count() const {
    size_t count = 1;
    if (left_) {
        count += left_->node_count();
    }
    if (right_) {
        count += right_->node_count();
    }
    return count;
}

std::string ExpressionImpl::to_string() const {
    switch (op_) {
        case Op::Const:
            return value_ ? "true" : "false";
        case Op::Variable:
            return name_;
        case Op::Not:
            return "(!" + left_->to_string() + ")";
        default:
            return "(" + left_->to_string() + " " + op_symbol(op_) + " " + right_->to_string() + ")";
    }
}

}  // namespace Bn
