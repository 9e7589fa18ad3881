//==============================================================================
//     File: tracer.h
//  Created: 2025-06-02 20:41
//
//  Description: Operator-overloading tracers for sparsity detection.
//
//    A tracer carries the set of input indices that a value may depend on.
//    Every supported primitive is an entry of the closed enumerations
//    `UnaryOp` and `BinaryOp`, whose derivative properties are declared once
//    in the traits tables below. Operators and the <cmath>-named functions
//    forward to those tables.
//
//==============================================================================

#ifndef _SPARSEDIFF_TRACER_H_
#define _SPARSEDIFF_TRACER_H_

#include <array>
#include <cstddef>
#include <iostream>
#include <map>
#include <string>
#include <string_view>

#include "types.h"
#include "errors.h"
#include "index_set.h"

namespace sd {

/*------------------------------------------------------------------------------
 *          Supported primitives
 *----------------------------------------------------------------------------*/
enum class UnaryOp
{
    Neg, Abs, Sign, Floor, Ceil, Round, Trunc,
    Sqrt, Square, Cbrt,
    Exp, Exp2, Expm1, Log, Log2, Log10, Log1p,
    Sin, Cos, Tan, Asin, Acos, Atan,
    Sinh, Cosh, Tanh, Erf
};


enum class BinaryOp
{
    Add, Sub, Mul, Div, Pow, Atan2, Hypot, Min, Max,
    Less, Greater, LessEqual, GreaterEqual, Equal, NotEqual
};


/// Derivative properties of `f(x)`.
struct UnaryOpTraits
{
    std::string_view name;
    bool der1_zero;  // f' == 0 everywhere (locally constant)
    bool der2_zero;  // f'' == 0 everywhere (piecewise linear)
};


/// Derivative properties of `f(a, b)`.
struct BinaryOpTraits
{
    std::string_view name;
    bool der1_zero_a;  // df/da == 0
    bool der1_zero_b;  // df/db == 0
    bool der2_zero_a;  // d2f/da2 == 0
    bool der2_zero_b;  // d2f/db2 == 0
    bool cross_zero;   // d2f/dadb == 0
};


// Indexed by the enumerator value
inline constexpr std::array<UnaryOpTraits, 27> unary_op_traits = {{
    {"neg",   false, true},
    {"abs",   false, true},
    {"sign",  true,  true},
    {"floor", true,  true},
    {"ceil",  true,  true},
    {"round", true,  true},
    {"trunc", true,  true},
    {"sqrt",  false, false},
    {"square", false, false},
    {"cbrt",  false, false},
    {"exp",   false, false},
    {"exp2",  false, false},
    {"expm1", false, false},
    {"log",   false, false},
    {"log2",  false, false},
    {"log10", false, false},
    {"log1p", false, false},
    {"sin",   false, false},
    {"cos",   false, false},
    {"tan",   false, false},
    {"asin",  false, false},
    {"acos",  false, false},
    {"atan",  false, false},
    {"sinh",  false, false},
    {"cosh",  false, false},
    {"tanh",  false, false},
    {"erf",   false, false}
}};


inline constexpr std::array<BinaryOpTraits, 15> binary_op_traits = {{
    {"+",     false, false, true,  true,  true},
    {"-",     false, false, true,  true,  true},
    {"*",     false, false, true,  true,  false},
    {"/",     false, false, true,  false, false},
    {"pow",   false, false, false, false, false},
    {"atan2", false, false, false, false, false},
    {"hypot", false, false, false, false, false},
    {"min",   false, false, true,  true,  true},
    {"max",   false, false, true,  true,  true},
    {"<",     true,  true,  true,  true,  true},
    {">",     true,  true,  true,  true,  true},
    {"<=",    true,  true,  true,  true,  true},
    {">=",    true,  true,  true,  true,  true},
    {"==",    true,  true,  true,  true,  true},
    {"!=",    true,  true,  true,  true,  true}
}};


/** Look up the traits of an operation.
 *
 * @throws UnsupportedOperation if `op` is not one of the enumerators.
 */
const UnaryOpTraits& traits(UnaryOp op);
const BinaryOpTraits& traits(BinaryOp op);


/** Evaluate an operation on plain numbers. Comparisons return 1.0 or 0.0. */
double apply(UnaryOp op, double x);
double apply(BinaryOp op, double a, double b);


/*------------------------------------------------------------------------------
 *          Operator overloads shared by all tracer types
 *----------------------------------------------------------------------------*/
/** Arithmetic and math functions of a tracer type `D`.
 *
 * `D` provides `static D unary(UnaryOp, const D&)` and
 * `static D binary(BinaryOp, const D&, const D&)`, and is implicitly
 * constructible from `double`, so that mixed expressions like `2.0 * x`
 * resolve to these (non-template) friends.
 */
template <typename D>
class TracerOps
{
    public:
        friend D operator+(const D& a) { return a; }
        friend D operator-(const D& a) { return D::unary(UnaryOp::Neg, a); }

        friend D operator+(const D& a, const D& b) { return D::binary(BinaryOp::Add, a, b); }
        friend D operator-(const D& a, const D& b) { return D::binary(BinaryOp::Sub, a, b); }
        friend D operator*(const D& a, const D& b) { return D::binary(BinaryOp::Mul, a, b); }
        friend D operator/(const D& a, const D& b) { return D::binary(BinaryOp::Div, a, b); }

        friend D& operator+=(D& a, const D& b) { a = a + b; return a; }
        friend D& operator-=(D& a, const D& b) { a = a - b; return a; }
        friend D& operator*=(D& a, const D& b) { a = a * b; return a; }
        friend D& operator/=(D& a, const D& b) { a = a / b; return a; }

        friend D abs(const D& a)    { return D::unary(UnaryOp::Abs, a); }
        friend D fabs(const D& a)   { return D::unary(UnaryOp::Abs, a); }
        friend D sign(const D& a)   { return D::unary(UnaryOp::Sign, a); }
        friend D floor(const D& a)  { return D::unary(UnaryOp::Floor, a); }
        friend D ceil(const D& a)   { return D::unary(UnaryOp::Ceil, a); }
        friend D round(const D& a)  { return D::unary(UnaryOp::Round, a); }
        friend D trunc(const D& a)  { return D::unary(UnaryOp::Trunc, a); }
        friend D sqrt(const D& a)   { return D::unary(UnaryOp::Sqrt, a); }
        friend D square(const D& a) { return D::unary(UnaryOp::Square, a); }
        friend D cbrt(const D& a)   { return D::unary(UnaryOp::Cbrt, a); }
        friend D exp(const D& a)    { return D::unary(UnaryOp::Exp, a); }
        friend D exp2(const D& a)   { return D::unary(UnaryOp::Exp2, a); }
        friend D expm1(const D& a)  { return D::unary(UnaryOp::Expm1, a); }
        friend D log(const D& a)    { return D::unary(UnaryOp::Log, a); }
        friend D log2(const D& a)   { return D::unary(UnaryOp::Log2, a); }
        friend D log10(const D& a)  { return D::unary(UnaryOp::Log10, a); }
        friend D log1p(const D& a)  { return D::unary(UnaryOp::Log1p, a); }
        friend D sin(const D& a)    { return D::unary(UnaryOp::Sin, a); }
        friend D cos(const D& a)    { return D::unary(UnaryOp::Cos, a); }
        friend D tan(const D& a)    { return D::unary(UnaryOp::Tan, a); }
        friend D asin(const D& a)   { return D::unary(UnaryOp::Asin, a); }
        friend D acos(const D& a)   { return D::unary(UnaryOp::Acos, a); }
        friend D atan(const D& a)   { return D::unary(UnaryOp::Atan, a); }
        friend D sinh(const D& a)   { return D::unary(UnaryOp::Sinh, a); }
        friend D cosh(const D& a)   { return D::unary(UnaryOp::Cosh, a); }
        friend D tanh(const D& a)   { return D::unary(UnaryOp::Tanh, a); }
        friend D erf(const D& a)    { return D::unary(UnaryOp::Erf, a); }

        friend D pow(const D& a, const D& b)   { return D::binary(BinaryOp::Pow, a, b); }
        friend D atan2(const D& a, const D& b) { return D::binary(BinaryOp::Atan2, a, b); }
        friend D hypot(const D& a, const D& b) { return D::binary(BinaryOp::Hypot, a, b); }
        friend D min(const D& a, const D& b)   { return D::binary(BinaryOp::Min, a, b); }
        friend D max(const D& a, const D& b)   { return D::binary(BinaryOp::Max, a, b); }
        friend D fmin(const D& a, const D& b)  { return D::binary(BinaryOp::Min, a, b); }
        friend D fmax(const D& a, const D& b)  { return D::binary(BinaryOp::Max, a, b); }
};


/** Comparisons of global tracers.
 *
 * The result is a tracer with an empty dependency set. Branching on it
 * throws `UnsupportedOperation`.
 */
template <typename D>
class GlobalComparisonOps
{
    public:
        friend D operator<(const D& a, const D& b)  { return D::binary(BinaryOp::Less, a, b); }
        friend D operator>(const D& a, const D& b)  { return D::binary(BinaryOp::Greater, a, b); }
        friend D operator<=(const D& a, const D& b) { return D::binary(BinaryOp::LessEqual, a, b); }
        friend D operator>=(const D& a, const D& b) { return D::binary(BinaryOp::GreaterEqual, a, b); }
        friend D operator==(const D& a, const D& b) { return D::binary(BinaryOp::Equal, a, b); }
        friend D operator!=(const D& a, const D& b) { return D::binary(BinaryOp::NotEqual, a, b); }

        /** Select between two tracers on a traced condition.
         *
         * Both branches may be taken, so the result depends on both.
         */
        friend D ifelse(
            [[maybe_unused]] const D& cond,
            const D& a,
            const D& b
        )
        {
            return D::binary(BinaryOp::Add, a, b);
        }
};


/*------------------------------------------------------------------------------
 *          First-order tracer
 *----------------------------------------------------------------------------*/
class GradientTracer : public TracerOps<GradientTracer>,
                       public GlobalComparisonOps<GradientTracer>
{
    IndexSet grad_;

    public:
        GradientTracer() = default;

        /** A constant. Depends on no inputs. */
        GradientTracer([[maybe_unused]] double c) {}

        explicit GradientTracer(const IndexSet& grad) : grad_(grad) {}

        /** Seed the tracer of input `i` with `{i}`. */
        static GradientTracer input(csint i);

        const IndexSet& gradient() const { return grad_; }

        /** Propagate the dependency set through `op`. */
        static GradientTracer unary(UnaryOp op, const GradientTracer& a);
        static GradientTracer binary(
            BinaryOp op,
            const GradientTracer& a,
            const GradientTracer& b
        );

        explicit operator bool() const
        {
            throw UnsupportedOperation("branching on a global tracer");
        }

        explicit operator double() const
        {
            throw UnsupportedOperation("conversion of a global tracer to a number");
        }
};


/*------------------------------------------------------------------------------
 *          Second-order tracer
 *----------------------------------------------------------------------------*/
class HessianTracer : public TracerOps<HessianTracer>,
                      public GlobalComparisonOps<HessianTracer>
{
    IndexSet grad_;
    std::map<csint, IndexSet> hess_;  // symmetric, row i -> columns

    /// Add `a × b ∪ b × a` to the Hessian pattern.
    void add_outer_(const IndexSet& a, const IndexSet& b);

    /// Union another Hessian pattern into this one.
    void merge_hessian_(const HessianTracer& other);

    public:
        HessianTracer() = default;

        /** A constant. Depends on no inputs. */
        HessianTracer([[maybe_unused]] double c) {}

        /** Seed the tracer of input `i` with gradient `{i}`. */
        static HessianTracer input(csint i);

        const IndexSet& gradient() const { return grad_; }
        const std::map<csint, IndexSet>& hessian() const { return hess_; }

        /** Return the set of `j` with `H(i, j)` possibly non-zero. */
        IndexSet hessian_row(csint i) const;

        static HessianTracer unary(UnaryOp op, const HessianTracer& a);
        static HessianTracer binary(
            BinaryOp op,
            const HessianTracer& a,
            const HessianTracer& b
        );

        explicit operator bool() const
        {
            throw UnsupportedOperation("branching on a global tracer");
        }

        explicit operator double() const
        {
            throw UnsupportedOperation("conversion of a global tracer to a number");
        }
};


std::ostream& operator<<(std::ostream& os, const GradientTracer& t);
std::ostream& operator<<(std::ostream& os, const HessianTracer& t);


}  // namespace sd

#endif  // _SPARSEDIFF_TRACER_H_

//==============================================================================
//==============================================================================
