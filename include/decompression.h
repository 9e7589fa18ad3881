//==============================================================================
//     File: decompression.h
//  Created: 2025-06-11 09:37
//
//  Description: Compression of a matrix into per-color products, and the
//    recovery of its entries from those products.
//
//==============================================================================

#ifndef _SPARSEDIFF_DECOMPRESSION_H_
#define _SPARSEDIFF_DECOMPRESSION_H_

#include <vector>

#include "types.h"
#include "csc.h"
#include "coloring.h"

namespace sd {

/** Compute the compressed products of a known matrix.
 *
 * For a column partition or a symmetric problem, `B[c] = A s_c`; for a row
 * partition, `B[c] = A^T s_c`, where `s_c` is the seed of color `c`.
 *
 * @param A  a matrix whose pattern is contained in `result.pattern()`
 * @param result  a coloring
 *
 * @return B  one product per color
 *
 * @throws std::invalid_argument if the shape of `A` differs from the pattern.
 */
std::vector<std::vector<double>> compress(
    const CSCMatrix& A,
    const ColoringResult& result
);


/** Recover a matrix from its compressed products.
 *
 * @param B  one product per color, each of length `result.compressed_size()`
 * @param result  the coloring used to compute `B`
 *
 * @return A  a matrix with exactly the structure of `result.pattern()`
 *
 * @throws std::invalid_argument if the number or length of the products is
 *         wrong.
 */
CSCMatrix decompress(
    const std::vector<std::vector<double>>& B,
    const ColoringResult& result
);


/** Compute a sparse Jacobian from Jacobian-vector products.
 *
 * @param product  `s -> J s` (JVP) for a column partition, or `s -> J^T s`
 *        (VJP) for a row partition
 * @param result  a coloring of a nonsymmetric problem
 *
 * @throws std::invalid_argument if `result` is for a symmetric problem.
 */
CSCMatrix sparse_jacobian(const ProductFunc& product, const ColoringResult& result);


/** Compute a sparse Hessian from Hessian-vector products `s -> H s`.
 *
 * @throws std::invalid_argument if `result` is for a nonsymmetric problem.
 */
CSCMatrix sparse_hessian(const ProductFunc& product, const ColoringResult& result);


}  // namespace sd

#endif  // _SPARSEDIFF_DECOMPRESSION_H_

//==============================================================================
//==============================================================================
