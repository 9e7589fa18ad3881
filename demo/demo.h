//==============================================================================
//     File: demo.h
//  Created: 2025-05-15 10:16
//
//  Description: Header file for SparseDiff demo programs.
//
//==============================================================================

#ifndef _SPARSEDIFF_DEMO_H_
#define _SPARSEDIFF_DEMO_H_

#include <chrono>
#include <iostream>
#include <string>
#include <vector>

#include "sparsediff.h"


namespace sd {


// Time-keeping functions
using Clock = std::chrono::steady_clock;  // never goes backwards
using TimePoint = Clock::time_point;

/** Start and stop a timer */
TimePoint tic();
double toc(TimePoint start_time);


/** Make a matrix symmetric.
 *
 * This function takes a matrix stored as either a lower or upper triangular,
 * and creates a symmetric matrix by adding the transpose of the matrix to
 * itself.
 *
 * @param A  The input matrix to be made symmetric.
 *
 * @return  A symmetric matrix.
 */
CSCMatrix make_sym(const CSCMatrix& A);


/** Compute the max-norm of the difference between two matrices. */
double max_error(const CSCMatrix& A, const CSCMatrix& B);


/** Color a pattern, print the result, and check the round trip of `A`.
 *
 * @param A  the matrix whose pattern is colored
 * @param problem  the structure and partition
 * @param algorithm  the vertex order and decompression
 */
void run_coloring(
    const CSCMatrix& A,
    const ColoringProblem& problem,
    const GreedyColoringAlgorithm& algorithm
);


std::ostream& operator<<(std::ostream& os, const VertexOrder& order);
std::ostream& operator<<(std::ostream& os, const Decompression& decompression);


}  // namespace sd

#endif  // _SPARSEDIFF_DEMO_H_

//==============================================================================
//==============================================================================
