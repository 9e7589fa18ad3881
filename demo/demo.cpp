/*==============================================================================
 *     File: demo.cpp
 *  Created: 2025-05-15 10:18
 *
 *  Description: Helpers shared by the SparseDiff demo programs.
 *
 *============================================================================*/

#include <chrono>
#include <format>
#include <iomanip>
#include <iostream>
#include <limits>     // numeric_limits
#include <vector>

#include "sparsediff.h"
#include "demo.h"


namespace sd {


std::ostream& operator<<(std::ostream& os, const VertexOrder& order)
{
    switch (order) {
        case VertexOrder::Natural:
            os << "Natural            ";
            break;
        case VertexOrder::LargestFirst:
            os << "LargestFirst       ";
            break;
        case VertexOrder::SmallestLast:
            os << "SmallestLast       ";
            break;
        case VertexOrder::IncidenceDegree:
            os << "IncidenceDegree    ";
            break;
        case VertexOrder::DynamicLargestFirst:
            os << "DynamicLargestFirst";
            break;
        case VertexOrder::Random:
            os << "Random             ";
            break;
        default:
            os << "UnknownVertexOrder ";
            break;
    }

    return os;
}


std::ostream& operator<<(std::ostream& os, const Decompression& decompression)
{
    os << (decompression == Decompression::Direct ? "direct" : "substitution");
    return os;
}


TimePoint tic() { return Clock::now(); }


double toc(TimePoint start_time)
{
    TimePoint end_time = Clock::now();
    auto duration = end_time - start_time;
    // Convert to a double
    std::chrono::duration<double> seconds = duration;
    return seconds.count();
}


CSCMatrix make_sym(const CSCMatrix& A)
{
    CSCMatrix AT = A.T();
    // Drop diagonal entries from AT
    AT.fkeep([](csint i, csint j, [[maybe_unused]] double aij) { return i != j; });
    return A + AT;
}


double max_error(const CSCMatrix& A, const CSCMatrix& B)
{
    constexpr double inf = std::numeric_limits<double>::infinity();
    return norm(A.to_dense_vector() - B.to_dense_vector(), inf);
}


void run_coloring(
    const CSCMatrix& A,
    const ColoringProblem& problem,
    const GreedyColoringAlgorithm& algorithm
)
{
    TimePoint t = tic();
    ColoringResult result = coloring(A, problem, algorithm);
    double t_color = toc(t);

    t = tic();
    CSCMatrix D = decompress(compress(A, result), result);
    double t_decomp = toc(t);

    std::cout << algorithm.order << " " << std::setw(12) << algorithm.decompression
        << std::format(
            "  colors: {:4d}  time: {:.2e} + {:.2e} s  error: {:.2e}",
            result.ncolors(), t_color, t_decomp, max_error(A, D))
        << std::endl;
}


}  // namespace sd

/*==============================================================================
 *============================================================================*/
