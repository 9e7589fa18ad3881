//==============================================================================
//     File: ordering.h
//  Created: 2025-06-06 14:03
//
//  Description: Vertex ordering heuristics for greedy coloring.
//
//==============================================================================

#ifndef _SPARSEDIFF_ORDERING_H_
#define _SPARSEDIFF_ORDERING_H_

#include <vector>

#include "types.h"
#include "graph.h"

namespace sd {

/** Compute the order in which a greedy coloring visits the vertices.
 *
 * @param G  the graph
 * @param order  the ordering heuristic
 *        - `Natural`: `0, 1, ..., n-1`.
 *        - `LargestFirst`: decreasing degree, ties by index.
 *        - `SmallestLast`: repeatedly remove a vertex of minimum degree from
 *          the remaining graph; visit them in the reverse order of removal.
 *        - `IncidenceDegree`: repeatedly pick the vertex with the most
 *          already-ordered neighbors.
 *        - `DynamicLargestFirst`: repeatedly pick the vertex with the most
 *          not-yet-ordered neighbors.
 *        - `Random`: a random permutation generated from `seed`.
 * @param seed  the random seed for `Random`. A seed of 0 gives the natural
 *        order.
 *
 * @return p  a permutation of `0..n-1`.
 */
std::vector<csint> vertex_order(
    const AdjacencyGraph& G,
    VertexOrder order=VertexOrder::Natural,
    unsigned seed=0
);


/** Order one side of a bipartite graph.
 *
 * Degree-based heuristics use the degrees of the intersection graph of that
 * side, i.e. the number of distance-2 neighbors.
 */
std::vector<csint> vertex_order(
    const BipartiteGraph& G,
    Side side,
    VertexOrder order=VertexOrder::Natural,
    unsigned seed=0
);


/** Return true if `p` is a permutation of `0..n-1`. */
bool is_valid_permutation(const std::vector<csint>& p, csint n);


}  // namespace sd

#endif  // _SPARSEDIFF_ORDERING_H_

//==============================================================================
//==============================================================================
