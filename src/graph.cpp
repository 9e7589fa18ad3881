/*==============================================================================
 *     File: graph.cpp
 *  Created: 2025-06-05 10:48
 *
 *  Description: Implements the adjacency and bipartite graphs of a pattern.
 *
 *============================================================================*/

#include <algorithm>  // binary_search, max
#include <format>
#include <string>

#include "errors.h"
#include "graph.h"

namespace sd {

/*------------------------------------------------------------------------------
 *         AdjacencyGraph
 *----------------------------------------------------------------------------*/
AdjacencyGraph::AdjacencyGraph(const CSCMatrix& S)
{
    auto [M, N] = S.shape();

    if (M != N) {
        throw InvalidStructure(
            std::format(
                "Adjacency graph requires a square matrix, got shape ({}, {}).", M, N
            )
        );
    }

    if (!S.is_structurally_symmetric()) {
        throw InvalidStructure("Matrix is not structurally symmetric.");
    }

    // No self-edges in the graph
    A_ = S.pattern().drop_diagonal();
}


csint AdjacencyGraph::degree(csint v) const
{
    return A_.indptr()[v+1] - A_.indptr()[v];
}


csint AdjacencyGraph::max_degree() const
{
    csint d = 0;
    for (csint v = 0; v < num_vertices(); v++) {
        d = std::max(d, degree(v));
    }
    return d;
}


bool AdjacencyGraph::has_edge(csint u, csint v) const
{
    auto nbrs = neighbors(v);
    return std::binary_search(nbrs.begin(), nbrs.end(), u);
}


/*------------------------------------------------------------------------------
 *         BipartiteGraph
 *----------------------------------------------------------------------------*/
BipartiteGraph::BipartiteGraph(const CSCMatrix& S)
    : S_(S.pattern()),
      ST_(S_.transpose(false))
{}


csint BipartiteGraph::num_vertices(Side side) const
{
    return (side == Side::Column) ? num_cols() : num_rows();
}


std::span<const csint> BipartiteGraph::neighbors(Side side, csint v) const
{
    return (side == Side::Column) ? column_neighbors(v) : row_neighbors(v);
}


/*------------------------------------------------------------------------------
 *         Derived graphs
 *----------------------------------------------------------------------------*/
AdjacencyGraph column_intersection_graph(const CSCMatrix& S)
{
    CSCMatrix P = S.pattern();
    CSCMatrix PT = P.transpose(false);
    return AdjacencyGraph(PT * P);  // diagonal is dropped by the graph
}


AdjacencyGraph row_intersection_graph(const CSCMatrix& S)
{
    CSCMatrix P = S.pattern();
    CSCMatrix PT = P.transpose(false);
    return AdjacencyGraph(P * PT);
}


AdjacencyGraph intersection_graph(const BipartiteGraph& G, Side side)
{
    // The stored matrices are already canonical patterns
    const CSCMatrix& S = G.matrix();
    const CSCMatrix& ST = G.transpose();
    return (side == Side::Column) ? AdjacencyGraph(ST * S) : AdjacencyGraph(S * ST);
}


AdjacencyGraph graph_power(const AdjacencyGraph& G, csint k)
{
    if (k < 1) {
        throw PreconditionViolated(
            std::format("Graph power requires k >= 1, got {}.", k)
        );
    }

    // (A + I)^k has (u, v) stored iff dist(u, v) <= k
    CSCMatrix P = G.matrix().add_diagonal();
    CSCMatrix R = P;

    for (csint p = 1; p < k; p++) {
        R = (R * P).pattern();
    }

    return AdjacencyGraph(R);
}


}  // namespace sd

/*==============================================================================
 *============================================================================*/
