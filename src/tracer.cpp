/*==============================================================================
 *     File: tracer.cpp
 *  Created: 2025-06-02 21:30
 *
 *  Description: Propagation rules of the gradient and Hessian tracers.
 *
 *============================================================================*/

#include <cmath>
#include <format>
#include <string>

#include "tracer.h"

namespace sd {

/*------------------------------------------------------------------------------
 *          Traits lookup
 *----------------------------------------------------------------------------*/
const UnaryOpTraits& traits(UnaryOp op)
{
    auto k = static_cast<std::size_t>(op);
    if (k >= unary_op_traits.size()) {
        throw UnsupportedOperation(std::format("unary op id {}", k));
    }
    return unary_op_traits[k];
}


const BinaryOpTraits& traits(BinaryOp op)
{
    auto k = static_cast<std::size_t>(op);
    if (k >= binary_op_traits.size()) {
        throw UnsupportedOperation(std::format("binary op id {}", k));
    }
    return binary_op_traits[k];
}


double apply(UnaryOp op, double x)
{
    switch (op) {
        case UnaryOp::Neg:    return -x;
        case UnaryOp::Abs:    return std::fabs(x);
        case UnaryOp::Sign:   return (x > 0) - (x < 0);
        case UnaryOp::Floor:  return std::floor(x);
        case UnaryOp::Ceil:   return std::ceil(x);
        case UnaryOp::Round:  return std::round(x);
        case UnaryOp::Trunc:  return std::trunc(x);
        case UnaryOp::Sqrt:   return std::sqrt(x);
        case UnaryOp::Square: return x * x;
        case UnaryOp::Cbrt:   return std::cbrt(x);
        case UnaryOp::Exp:    return std::exp(x);
        case UnaryOp::Exp2:   return std::exp2(x);
        case UnaryOp::Expm1:  return std::expm1(x);
        case UnaryOp::Log:    return std::log(x);
        case UnaryOp::Log2:   return std::log2(x);
        case UnaryOp::Log10:  return std::log10(x);
        case UnaryOp::Log1p:  return std::log1p(x);
        case UnaryOp::Sin:    return std::sin(x);
        case UnaryOp::Cos:    return std::cos(x);
        case UnaryOp::Tan:    return std::tan(x);
        case UnaryOp::Asin:   return std::asin(x);
        case UnaryOp::Acos:   return std::acos(x);
        case UnaryOp::Atan:   return std::atan(x);
        case UnaryOp::Sinh:   return std::sinh(x);
        case UnaryOp::Cosh:   return std::cosh(x);
        case UnaryOp::Tanh:   return std::tanh(x);
        case UnaryOp::Erf:    return std::erf(x);
    }

    throw UnsupportedOperation(
        std::format("unary op id {}", static_cast<int>(op))
    );
}


double apply(BinaryOp op, double a, double b)
{
    switch (op) {
        case BinaryOp::Add:          return a + b;
        case BinaryOp::Sub:          return a - b;
        case BinaryOp::Mul:          return a * b;
        case BinaryOp::Div:          return a / b;
        case BinaryOp::Pow:          return std::pow(a, b);
        case BinaryOp::Atan2:        return std::atan2(a, b);
        case BinaryOp::Hypot:        return std::hypot(a, b);
        case BinaryOp::Min:          return std::fmin(a, b);
        case BinaryOp::Max:          return std::fmax(a, b);
        case BinaryOp::Less:         return a < b;
        case BinaryOp::Greater:      return a > b;
        case BinaryOp::LessEqual:    return a <= b;
        case BinaryOp::GreaterEqual: return a >= b;
        case BinaryOp::Equal:        return a == b;
        case BinaryOp::NotEqual:     return a != b;
    }

    throw UnsupportedOperation(
        std::format("binary op id {}", static_cast<int>(op))
    );
}


/*------------------------------------------------------------------------------
 *          GradientTracer
 *----------------------------------------------------------------------------*/
GradientTracer GradientTracer::input(csint i)
{
    return GradientTracer(IndexSet::singleton(i));
}


GradientTracer GradientTracer::unary(UnaryOp op, const GradientTracer& a)
{
    if (traits(op).der1_zero) {
        return GradientTracer();  // locally constant
    }
    return a;
}


GradientTracer GradientTracer::binary(
    BinaryOp op,
    const GradientTracer& a,
    const GradientTracer& b
)
{
    const auto& t = traits(op);
    GradientTracer out;

    if (!t.der1_zero_a) {
        out.grad_ |= a.grad_;
    }

    if (!t.der1_zero_b) {
        out.grad_ |= b.grad_;
    }

    return out;
}


std::ostream& operator<<(std::ostream& os, const GradientTracer& t)
{
    os << "GradientTracer(" << t.gradient() << ")";
    return os;
}


/*------------------------------------------------------------------------------
 *          HessianTracer
 *----------------------------------------------------------------------------*/
HessianTracer HessianTracer::input(csint i)
{
    HessianTracer t;
    t.grad_.insert(i);
    return t;
}


IndexSet HessianTracer::hessian_row(csint i) const
{
    auto it = hess_.find(i);
    return (it == hess_.end()) ? IndexSet() : it->second;
}


void HessianTracer::add_outer_(const IndexSet& a, const IndexSet& b)
{
    if (a.empty() || b.empty()) {
        return;
    }
    for (const auto& i : a.to_vector()) {
        hess_[i] |= b;
    }

    for (const auto& j : b.to_vector()) {
        hess_[j] |= a;
    }
}


void HessianTracer::merge_hessian_(const HessianTracer& other)
{
    for (const auto& [i, row] : other.hess_) {
        hess_[i] |= row;
    }
}


HessianTracer HessianTracer::unary(UnaryOp op, const HessianTracer& a)
{
    const auto& t = traits(op);

    if (t.der1_zero) {
        return HessianTracer();  // locally constant
    }

    HessianTracer out(a);

    if (!t.der2_zero) {
        out.add_outer_(a.grad_, a.grad_);
    }

    return out;
}


HessianTracer HessianTracer::binary(
    BinaryOp op,
    const HessianTracer& a,
    const HessianTracer& b
)
{
    const auto& t = traits(op);
    HessianTracer out;

    // First-order terms carry the operands' own Hessians
    if (!t.der1_zero_a) {
        out.grad_ |= a.grad_;
        out.merge_hessian_(a);
    }

    if (!t.der1_zero_b) {
        out.grad_ |= b.grad_;
        out.merge_hessian_(b);
    }

    // Second-order terms
    if (!t.der2_zero_a) {
        out.add_outer_(a.grad_, a.grad_);
    }

    if (!t.der2_zero_b) {
        out.add_outer_(b.grad_, b.grad_);
    }

    if (!t.cross_zero) {
        out.add_outer_(a.grad_, b.grad_);
    }

    return out;
}


std::ostream& operator<<(std::ostream& os, const HessianTracer& t)
{
    os << "HessianTracer(" << t.gradient() << ", {";
    bool first = true;
    for (const auto& [i, row] : t.hessian()) {
        if (!first) {
            os << ", ";
        }
        os << i << ": " << row;
        first = false;
    }
    os << "})";
    return os;
}


}  // namespace sd

/*==============================================================================
 *============================================================================*/
