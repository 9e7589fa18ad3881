/*==============================================================================
 *     File: example_matrices.cpp
 *  Created: 2025-03-20 15:11
 *
 *  Description: Definitions of example matrices for testing.
 *
 *============================================================================*/

#include <vector>

#include "types.h"
#include "example_matrices.h"
#include "csc.h"
#include "coo.h"

namespace sd {


CSCMatrix tutorial_pattern()
{
    std::vector<csint> rows = {1, 2, 3, 0, 3, 0, 1, 2, 0};
    std::vector<csint> cols = {0, 1, 1, 2, 2, 3, 4, 4, 5};
    return COOMatrix({}, rows, cols, {4, 6}).tocsc();
}


CSCMatrix banded_jacobian()
{
    // Columns {0, 2} and {1, 3, 4} are structurally orthogonal
    std::vector<csint>  rows = {0,   1,   1,   2,   2,   3,   3,   0};
    std::vector<csint>  cols = {0,   0,   1,   1,   2,   2,   3,   4};
    std::vector<double> vals = {1.0, 2.0, 3.0, 4.0, 5.0, 6.0, 7.0, 8.0};
    return COOMatrix(vals, rows, cols, {4, 5}).tocsc();
}


CSCMatrix ijkl_hessian()
{
    std::vector<csint>  rows = {0, 1, 2, 0, 1, 3, 0, 2, 1, 3};
    std::vector<csint>  cols = {0, 0, 0, 1, 1, 1, 2, 2, 3, 3};
    std::vector<double> vals = {1, 2, 3, 2, 4, 5, 3, 6, 5, 7};
    return COOMatrix(vals, rows, cols, {4, 4}).tocsc();
}


CSCMatrix tridiagonal(csint N)
{
    COOMatrix A({N, N}, 3 * N);

    for (csint i = 0; i < N; i++) {
        if (i > 0) {
            A.insert(i, i - 1, -1.0);
        }
        A.insert(i, i, 2.0);
        if (i < N - 1) {
            A.insert(i, i + 1, -1.0);
        }
    }

    return A.tocsc();
}


CSCMatrix arrowhead(csint N)
{
    COOMatrix A({N, N}, 3 * N);

    for (csint i = 0; i < N; i++) {
        A.insert(i, i, static_cast<double>(i + 1));
        if (i > 0) {
            A.insert(0, i, 1.0);
            A.insert(i, 0, 1.0);
        }
    }

    return A.tocsc();
}


}  // namespace sd

/*==============================================================================
 *============================================================================*/
