//==============================================================================
//     File: example_matrices.h
//  Created: 2025-03-20 15:14
//
//  Description: Small sparsity patterns and matrices with known colorings,
//    used in the tests and demos.
//
//==============================================================================

#ifndef _SPARSEDIFF_EXAMPLE_MATRICES_H_
#define _SPARSEDIFF_EXAMPLE_MATRICES_H_

#include "types.h"

namespace sd {

/** 4 x 6 Jacobian pattern with 3 column colors and 3 row colors.
 *
 *     [[0, 0, 1, 1, 0, 1],
 *      [1, 0, 0, 0, 1, 0],
 *      [0, 1, 0, 0, 1, 0],
 *      [0, 1, 1, 0, 0, 0]]
 */
CSCMatrix tutorial_pattern();

/** 4 x 5 numeric Jacobian whose columns split into 2 orthogonal groups.
 *
 *     [[1, 0, 0, 0, 8],
 *      [2, 3, 0, 0, 0],
 *      [0, 4, 5, 0, 0],
 *      [0, 0, 6, 7, 0]]
 */
CSCMatrix banded_jacobian();

/** 4 x 4 symmetric numeric matrix with values 1..7 on its distinct entries.
 *
 *     [[1, 2, 3, 0],
 *      [2, 4, 0, 5],
 *      [3, 0, 6, 0],
 *      [0, 5, 0, 7]]
 */
CSCMatrix ijkl_hessian();

/** N x N tridiagonal matrix, whose graph is a path. */
CSCMatrix tridiagonal(csint N);

/** N x N arrow matrix, whose graph is a star centered at vertex 0. */
CSCMatrix arrowhead(csint N);

}  // namespace sd

#endif  // _SPARSEDIFF_EXAMPLE_MATRICES_H_

//==============================================================================
//==============================================================================
