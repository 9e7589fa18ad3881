/*==============================================================================
 *     File: demo2.cpp
 *  Created: 2025-05-06 12:45
 *
 *  Description: Star and acyclic coloring of a symmetric matrix read from
 *  stdin, with each vertex ordering.
 *
 *============================================================================*/

#include <cstdlib>   // EXIT_SUCCESS
#include <iostream>

#include "sparsediff.h"
#include "demo.h"

using namespace sd;


int main(int argc, char* argv[])
{
    COOMatrix T = (argc > 1)
        ? COOMatrix::from_file(argv[1])
        : COOMatrix::from_stream(std::cin);
    CSCMatrix A = T.tocsc();

    // Symmetric inputs may be stored as one triangle only
    if (!A.is_structurally_symmetric()) {
        A = make_sym(A);
    }

    // Star and acyclic colorings need every diagonal entry
    A = A.add_diagonal(1.0);

    auto [M, N] = A.shape();
    std::cout << "--- Hessian: " << M << "-by-" << N
        << ", nnz: " << A.nnz() << std::endl;

    for (Decompression decompression : {Decompression::Direct, Decompression::Substitution}) {
        for (VertexOrder order : {
                VertexOrder::Natural,
                VertexOrder::LargestFirst,
                VertexOrder::SmallestLast,
                VertexOrder::IncidenceDegree,
                VertexOrder::DynamicLargestFirst
            }) {
            run_coloring(A, {Structure::Symmetric}, {order, decompression});
        }
    }

    return EXIT_SUCCESS;
}


/*==============================================================================
 *============================================================================*/
