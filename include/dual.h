//==============================================================================
//     File: dual.h
//  Created: 2025-06-03 18:05
//
//  Description: Local tracer pairing a primal value with a tracer.
//
//==============================================================================

#ifndef _SPARSEDIFF_DUAL_H_
#define _SPARSEDIFF_DUAL_H_

#include <iostream>

#include "types.h"
#include "tracer.h"

namespace sd {

/** A primal value together with a tracer `T` (GradientTracer or
 * HessianTracer).
 *
 * Comparisons are decided on the primal values, so a function may branch on
 * a Dual. The resulting sparsity pattern is only valid for the branch taken.
 * `min` and `max` propagate only the argument that is selected.
 */
template <typename T>
class Dual : public TracerOps<Dual<T>>
{
    double primal_ = 0.0;
    T tracer_;

    public:
        Dual() = default;

        /** A constant. */
        Dual(double c) : primal_(c) {}

        Dual(double c, const T& t) : primal_(c), tracer_(t) {}

        /** Seed the value of input `i`. */
        static Dual input(double x, csint i) { return Dual(x, T::input(i)); }

        double primal() const { return primal_; }
        const T& tracer() const { return tracer_; }

        explicit operator double() const { return primal_; }

        static Dual unary(UnaryOp op, const Dual& a)
        {
            return Dual(apply(op, a.primal_), T::unary(op, a.tracer_));
        }

        static Dual binary(BinaryOp op, const Dual& a, const Dual& b)
        {
            double v = apply(op, a.primal_, b.primal_);

            // At a tie both arguments are kept
            switch (op) {
                case BinaryOp::Min:
                    if (a.primal_ < b.primal_) return Dual(v, a.tracer_);
                    if (b.primal_ < a.primal_) return Dual(v, b.tracer_);
                    break;
                case BinaryOp::Max:
                    if (a.primal_ > b.primal_) return Dual(v, a.tracer_);
                    if (b.primal_ > a.primal_) return Dual(v, b.tracer_);
                    break;
                default:
                    break;
            }

            return Dual(v, T::binary(op, a.tracer_, b.tracer_));
        }

        friend bool operator<(const Dual& a, const Dual& b)  { return a.primal_ < b.primal_; }
        friend bool operator>(const Dual& a, const Dual& b)  { return a.primal_ > b.primal_; }
        friend bool operator<=(const Dual& a, const Dual& b) { return a.primal_ <= b.primal_; }
        friend bool operator>=(const Dual& a, const Dual& b) { return a.primal_ >= b.primal_; }
        friend bool operator==(const Dual& a, const Dual& b) { return a.primal_ == b.primal_; }
        friend bool operator!=(const Dual& a, const Dual& b) { return a.primal_ != b.primal_; }

        /** Select between two values on a condition known at `x`. */
        friend Dual ifelse(bool cond, const Dual& a, const Dual& b)
        {
            return cond ? a : b;
        }
};


template <typename T>
std::ostream& operator<<(std::ostream& os, const Dual<T>& d)
{
    os << "Dual(" << d.primal() << ", " << d.tracer() << ")";
    return os;
}


}  // namespace sd

#endif  // _SPARSEDIFF_DUAL_H_

//==============================================================================
//==============================================================================
