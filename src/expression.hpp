// -*- c++ -*-
//
// Boolean expression tree for update rules
//
// Trees are immutable once built. A freshly parsed tree refers to nodes by
// name; bind() produces a copy whose leaves refer to bit positions, which is
// what evaluate() reads. Evaluating an unbound variable is an error.
//
// Example:
//   Expression e = Expression::binary(Op::And, Expression::variable("a"),
//                                     Expression::negate(Expression::variable("b")));
//   Expression bound = e.bind(resolver);   // a -> 0, b -> 1
//   bound->evaluate(0b01);                 // a=1, b=0 -> true

#ifndef BN_EXPRESSION__H
#define BN_EXPRESSION__H

#include <boolnet/analysis_results.hpp>
#include <algorithm>
#include <boolnet/exception.hpp>
#include <functional>
#include <limits>
#include <memory>
#include <string>
#include <vector>

#include "handle.hpp"

namespace Bn {

class ExpressionImpl;

enum class Op { Const, Variable, Not, And, Or, Xor, Nand, Nor };

class Expression : public HandleBase<ExpressionImpl> {
   public:
    using HandleBase<ExpressionImpl>::HandleBase;

    // Returns the bit position for a name, or UNBOUND when it is unknown
    using Resolver = std::function<size_t(const std::string& name)>;

    static Expression constant(bool value);
    static Expression variable(const std::string& name);
    static Expression negate(const Expression& operand);
    static Expression binary(Op op, const Expression& left, const Expression& right);

    // Throws RuntimeException naming the first unresolvable variable
    [[nodiscard]] Expression bind(const Resolver& resolver) const;
};

class ExpressionImpl {
   public:
    static constexpr size_t UNBOUND = std::numeric_limits<size_t>::max();

    ExpressionImpl(Op op, bool value, std::string name, size_t index, Expression left,
                   Expression right)
        : op_(op)
        , value_(value)
        , name_(std::move(name))
        , index_(index)
        , left_(std::move(left))
        , right_(std::move(right))
        , depth_(1 + std::max(left_ ? left_->depth() : 0, right_ ? right_->depth() : 0)) {}

    [[nodiscard]] Op op() const {
        return op_;
    }
    [[nodiscard]] bool value() const {
        return value_;
    }
    [[nodiscard]] const std::string& name() const {
        return name_;
    }
    [[nodiscard]] size_t index() const {
        return index_;
    }
    [[nodiscard]] const Expression& left() const {
        return left_;
    }
    [[nodiscard]] const Expression& right() const {
        return right_;
    }

    [[nodiscard]] bool evaluate(State state) const;

    // Variable names in order of first appearance, without duplicates
    void collect_variables(std::vector<std::string>& names) const;

    // Number of nodes in the tree
    [[nodiscard]] size_t node_count() const;

    // Length of the longest root-to-leaf path; a leaf has depth 1
    [[nodiscard]] size_t depth() const {
        return depth_;
    }

    // Fully parenthesized form, e.g. "(a && (!b))"
    [[nodiscard]] std::string to_string() const;

   private:
    Op op_;
    bool value_;
    std::string name_;
    size_t index_;
    Expression left_;
    Expression right_;
    size_t depth_;
};

const char* op_symbol(Op op);

}  // namespace Bn

#endif  // BN_EXPRESSION__H
