//==============================================================================
//     File: graph.h
//  Created: 2025-06-05 10:22
//
//  Description: Graph views of sparsity patterns. Both graphs keep their
//    adjacency in canonical symbolic CSCMatrix storage, so the neighbors of a
//    vertex are a contiguous, sorted slice of row indices.
//
//==============================================================================

#ifndef _SPARSEDIFF_GRAPH_H_
#define _SPARSEDIFF_GRAPH_H_

#include <span>
#include <vector>

#include "types.h"
#include "csc.h"

namespace sd {

/// The vertex set of a bipartite graph that is being colored.
using Side = Partition;


/** The adjacency graph of a square, structurally symmetric pattern.
 *
 * Vertices are the matrix indices. `(i, j)` is an edge iff `i != j` and
 * `S(i, j)` is stored. Diagonal entries are not edges.
 */
class AdjacencyGraph
{
    CSCMatrix A_;  // canonical symbolic, no diagonal

    public:
        AdjacencyGraph() = default;

        /** Build the graph of a pattern.
         *
         * @param S  a square, structurally symmetric matrix. Values, if any,
         *        are ignored.
         *
         * @throws InvalidStructure if `S` is not square or not structurally
         *         symmetric.
         */
        explicit AdjacencyGraph(const CSCMatrix& S);

        csint num_vertices() const { return A_.shape()[1]; }

        /** Return the number of (undirected) edges. */
        csint num_edges() const { return A_.nnz() / 2; }

        /** Return the sorted neighbors of `v`. */
        std::span<const csint> neighbors(csint v) const { return A_.column(v); }

        csint degree(csint v) const;
        csint max_degree() const;

        /** Return true if `(u, v)` is an edge. O(log degree(v)) time. */
        bool has_edge(csint u, csint v) const;

        /** The symbolic adjacency matrix (no diagonal). */
        const CSCMatrix& matrix() const { return A_; }
};


/** The bipartite graph of a rectangular pattern.
 *
 * Row vertices `0..m-1` and column vertices `0..n-1` are distinct; `(i, j)`
 * is an edge iff `S(i, j)` is stored.
 */
class BipartiteGraph
{
    CSCMatrix S_;   // canonical symbolic pattern, m × n
    CSCMatrix ST_;  // its transpose, n × m

    public:
        BipartiteGraph() = default;
        explicit BipartiteGraph(const CSCMatrix& S);

        csint num_rows() const { return S_.shape()[0]; }
        csint num_cols() const { return S_.shape()[1]; }

        /** Return the number of vertices on one side. */
        csint num_vertices(Side side) const;

        /** Return the sorted rows adjacent to column `j`. */
        std::span<const csint> column_neighbors(csint j) const { return S_.column(j); }

        /** Return the sorted columns adjacent to row `i`. */
        std::span<const csint> row_neighbors(csint i) const { return ST_.column(i); }

        /** Return the neighbors of vertex `v` of the given side. */
        std::span<const csint> neighbors(Side side, csint v) const;

        const CSCMatrix& matrix() const { return S_; }
        const CSCMatrix& transpose() const { return ST_; }
};


/** Build the column intersection graph of a pattern.
 *
 * Columns `j` and `k` are adjacent iff they share a non-zero row, i.e. the
 * off-diagonal pattern of `S^T S`. A distance-1 coloring of this graph is a
 * partial distance-2 coloring of the columns of `S`.
 */
AdjacencyGraph column_intersection_graph(const CSCMatrix& S);

/** Build the row intersection graph, the off-diagonal pattern of `S S^T`. */
AdjacencyGraph row_intersection_graph(const CSCMatrix& S);

/** Build the intersection graph of one side of a bipartite graph. */
AdjacencyGraph intersection_graph(const BipartiteGraph& G, Side side);

/** Compute the `k`-th power of a graph.
 *
 * `u` and `v` are adjacent in `G^k` iff `0 < dist(u, v) <= k` in `G`.
 *
 * @throws PreconditionViolated if `k < 1`.
 */
AdjacencyGraph graph_power(const AdjacencyGraph& G, csint k);


}  // namespace sd

#endif  // _SPARSEDIFF_GRAPH_H_

//==============================================================================
//==============================================================================
