//==============================================================================
//     File: verification.h
//  Created: 2025-06-08 16:40
//
//  Description: Checks that a coloring satisfies its discipline.
//
//==============================================================================

#ifndef _SPARSEDIFF_VERIFICATION_H_
#define _SPARSEDIFF_VERIFICATION_H_

#include <vector>

#include "types.h"
#include "csc.h"
#include "graph.h"

namespace sd {

/** Return true if no two columns of the same color share a non-zero row.
 *
 * @param S  an `m × n` pattern
 * @param colors  the color of each of the `n` columns
 */
bool structurally_orthogonal_columns(
    const CSCMatrix& S,
    const std::vector<csint>& colors
);

/** Return true if no two rows of the same color share a non-zero column. */
bool structurally_orthogonal_rows(
    const CSCMatrix& S,
    const std::vector<csint>& colors
);

/** Return true if vertices within distance `k` have different colors.
 *
 * @throws PreconditionViolated if `k < 1`.
 */
bool is_distance_k_coloring(
    const AdjacencyGraph& G,
    const std::vector<csint>& colors,
    csint k=1
);

/** Return true if `colors` is a star coloring of `G`.
 *
 * The coloring is proper and every path on 4 vertices uses at least 3
 * colors. Equivalently, for every edge `(u, v)`, `v` is the only neighbor of
 * `u` with color `colors[v]`, or `u` is the only neighbor of `v` with color
 * `colors[u]`.
 */
bool is_star_coloring(const AdjacencyGraph& G, const std::vector<csint>& colors);

/** Return true if `colors` is an acyclic coloring of `G`.
 *
 * The coloring is proper and every cycle uses at least 3 colors, i.e. every
 * subgraph induced by two colors is a forest.
 */
bool is_acyclic_coloring(const AdjacencyGraph& G, const std::vector<csint>& colors);


}  // namespace sd

#endif  // _SPARSEDIFF_VERIFICATION_H_

//==============================================================================
//==============================================================================
