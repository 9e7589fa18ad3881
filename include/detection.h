//==============================================================================
//     File: detection.h
//  Created: 2025-06-03 19:47
//
//  Description: Jacobian and Hessian sparsity detection by tracing a generic
//    function with GradientTracer / HessianTracer values.
//
//==============================================================================

#ifndef _SPARSEDIFF_DETECTION_H_
#define _SPARSEDIFF_DETECTION_H_

#include <type_traits>  // is_same_v
#include <vector>

#include "types.h"
#include "csc.h"
#include "tracer.h"
#include "dual.h"

namespace sd {

/** Build the `m × n` pattern with `(j, i)` stored iff `i` is in the
 * dependency set of output `j`.
 */
CSCMatrix gradient_pattern(const std::vector<GradientTracer>& y, csint n);

/** Build the symmetric `n × n` Hessian pattern of a scalar output. */
CSCMatrix hessian_pattern(const HessianTracer& y, csint n);


namespace detail {

inline const GradientTracer& tracer_of(const GradientTracer& t) { return t; }
inline const HessianTracer& tracer_of(const HessianTracer& t) { return t; }

template <typename T>
const T& tracer_of(const Dual<T>& d) { return d.tracer(); }


/** Seed one tracer per input. */
template <typename V>
std::vector<V> seed_inputs(const std::vector<double>& x)
{
    std::vector<V> xt;
    xt.reserve(x.size());

    for (csint i = 0; i < static_cast<csint>(x.size()); i++) {
        if constexpr (std::is_same_v<V, GradientTracer> || std::is_same_v<V, HessianTracer>) {
            xt.push_back(V::input(i));
        } else {
            xt.push_back(V::input(x[i], i));
        }
    }

    return xt;
}


template <typename V, typename F>
CSCMatrix trace_jacobian(F&& f, const std::vector<double>& x)
{
    auto xt = seed_inputs<V>(x);
    auto yt = f(xt);

    std::vector<GradientTracer> y;
    y.reserve(yt.size());
    for (const auto& v : yt) {
        y.push_back(tracer_of(v));
    }

    return gradient_pattern(y, x.size());
}


template <typename V, typename F>
CSCMatrix trace_hessian(F&& f, const std::vector<double>& x)
{
    auto xt = seed_inputs<V>(x);
    V yt = f(xt);
    return hessian_pattern(tracer_of(yt), x.size());
}

}  // namespace detail


/** Compute the sparsity pattern of the Jacobian of `f` at `x`.
 *
 * `f` is called once with a `std::vector` of tracers and must return a
 * `std::vector` of the same scalar type. It must be generic over its scalar
 * type, e.g. a template or a generic lambda, and call math functions
 * unqualified so that the tracer overloads are found.
 *
 * @param f  the function `R^n -> R^m`
 * @param x  the input point. With `TracingMode::Global`, only its size is
 *        used. With `TracingMode::Local`, branches are decided at `x`.
 * @param mode  global or local tracing
 *
 * @return S  the symbolic `m × n` pattern, in canonical format. Entries are a
 *         superset of the structurally non-zero Jacobian entries.
 *
 * @throws UnsupportedOperation if `f` branches on, or converts, a global
 *         tracer.
 */
template <typename F>
CSCMatrix jacobian_sparsity(
    F&& f,
    const std::vector<double>& x,
    TracingMode mode=TracingMode::Global
)
{
    if (mode == TracingMode::Local) {
        return detail::trace_jacobian<Dual<GradientTracer>>(f, x);
    }
    return detail::trace_jacobian<GradientTracer>(f, x);
}


/** Compute the sparsity pattern of the Hessian of a scalar `f` at `x`.
 *
 * `f` takes a `std::vector` of tracers and returns a single value of the
 * same scalar type.
 *
 * @return H  the symmetric symbolic `n × n` pattern, in canonical format.
 *
 * @throws UnsupportedOperation if `f` branches on, or converts, a global
 *         tracer.
 */
template <typename F>
CSCMatrix hessian_sparsity(
    F&& f,
    const std::vector<double>& x,
    TracingMode mode=TracingMode::Global
)
{
    if (mode == TracingMode::Local) {
        return detail::trace_hessian<Dual<HessianTracer>>(f, x);
    }
    return detail::trace_hessian<HessianTracer>(f, x);
}


}  // namespace sd

#endif  // _SPARSEDIFF_DETECTION_H_

//==============================================================================
//==============================================================================
