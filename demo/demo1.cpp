/*==============================================================================
 *     File: demo1.cpp
 *  Created: 2025-05-06 11:20
 *
 *  Description: Color the columns and rows of a Jacobian read from stdin.
 *
 *============================================================================*/

#include <cstdlib>   // EXIT_SUCCESS
#include <iostream>

#include "sparsediff.h"
#include "demo.h"


using namespace sd;


int main(int argc, char* argv[]) {
    // Load a matrix from a file, or from stdin
    COOMatrix T = (argc > 1)
        ? COOMatrix::from_file(argv[1])
        : COOMatrix::from_stream(std::cin);
    CSCMatrix A(T);

    auto [M, N] = A.shape();
    std::cout << "--- Jacobian: " << M << "-by-" << N
        << ", nnz: " << A.nnz() << std::endl;

    for (Partition partition : {Partition::Column, Partition::Row}) {
        std::cout << (partition == Partition::Column ? "column" : "row")
            << " partition:" << std::endl;

        for (VertexOrder order : {
                VertexOrder::Natural,
                VertexOrder::LargestFirst,
                VertexOrder::SmallestLast,
                VertexOrder::IncidenceDegree,
                VertexOrder::DynamicLargestFirst,
                VertexOrder::Random
            }) {
            run_coloring(
                A,
                {Structure::Nonsymmetric, partition},
                {order, Decompression::Direct, 1}
            );
        }
    }

    return EXIT_SUCCESS;
}


/*==============================================================================
 *============================================================================*/
