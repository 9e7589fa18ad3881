/*==============================================================================
 *     File: coloring_perf.cpp
 *  Created: 2025-06-12 14:07
 *
 *  Time the greedy colorings and the decompression on random symmetric
 *  patterns of increasing size, and report the number of colors used.
 *
 *============================================================================*/

#include <chrono>
#include <cstdlib>
#include <format>
#include <iostream>
#include <string>
#include <vector>

#include "sparsediff.h"

using namespace sd;


namespace {

using Clock = std::chrono::steady_clock;


double seconds_since(Clock::time_point start)
{
    std::chrono::duration<double> dt = Clock::now() - start;
    return dt.count();
}

}  // namespace


/*------------------------------------------------------------------------------
 *         Main Loop
 *----------------------------------------------------------------------------*/
int main()
{
    const unsigned int SEED = 565656;
    const std::vector<csint> Ns = {100, 200, 500, 1000, 2000};
    const double mean_degree = 8.0;

    struct Case
    {
        std::string name;
        ColoringProblem problem;
        GreedyColoringAlgorithm algorithm;
    };

    const std::vector<Case> cases = {
        {"column", {Structure::Nonsymmetric, Partition::Column}, {}},
        {"row",    {Structure::Nonsymmetric, Partition::Row}, {}},
        {"star",   {Structure::Symmetric}, {VertexOrder::SmallestLast, Decompression::Direct}},
        {"acyclic", {Structure::Symmetric}, {VertexOrder::SmallestLast, Decompression::Substitution}}
    };

    std::cout << std::format(
        "{:>8}{:>10}{:>10}{:>14}{:>14}",
        "N", "method", "colors", "color [s]", "decomp [s]") << std::endl;

    for (const csint N : Ns) {
        double density = mean_degree / N;
        CSCMatrix A = COOMatrix::random_symmetric(N, density, SEED).tocsc();

        for (const auto& c : cases) {
            auto start = Clock::now();
            ColoringResult result = coloring(A, c.problem, c.algorithm);
            double t_color = seconds_since(start);

            auto B = compress(A, result);

            start = Clock::now();
            CSCMatrix D = decompress(B, result);
            double t_decomp = seconds_since(start);

            if (D.nnz() != A.nnz()) {
                std::cerr << "Decompression lost entries for N = " << N << std::endl;
                return EXIT_FAILURE;
            }

            std::cout << std::format(
                "{:>8}{:>10}{:>10}{:>14.3e}{:>14.3e}",
                N, c.name, result.ncolors(), t_color, t_decomp) << std::endl;
        }
    }

    return EXIT_SUCCESS;
};

/*==============================================================================
 *============================================================================*/
