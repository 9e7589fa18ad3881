//==============================================================================
//     File: coloring.h
//  Created: 2025-06-09 11:15
//
//  Description: Greedy graph colorings of sparsity patterns and the
//    ColoringResult that drives compression and decompression.
//
//==============================================================================

#ifndef _SPARSEDIFF_COLORING_H_
#define _SPARSEDIFF_COLORING_H_

#include <iostream>
#include <string>
#include <vector>

#include "types.h"
#include "csc.h"
#include "graph.h"

namespace sd {

/// What is being colored.
struct ColoringProblem
{
    Structure structure = Structure::Nonsymmetric;
    Partition partition = Partition::Column;  // symmetric problems use Column
};


/// How the greedy coloring is run.
struct GreedyColoringAlgorithm
{
    VertexOrder order = VertexOrder::Natural;
    Decompression decompression = Decompression::Direct;
    unsigned seed = 0;  // for VertexOrder::Random
};


/// The value of one stored entry is `B[color][index]`.
struct DirectEntry
{
    csint color = -1;  // -1 if the entry is recovered by substitution
    csint index = -1;
};


/** One step of substitution through a two-colored tree.
 *
 * `u` is a leaf whose only unresolved neighbor is `p`. The step reads
 * `H(u, p) = R[color_p][u]` from the residual compressed products `R`,
 * stores it in the entries `(u, p)` and `(p, u)` of the pattern, then
 * subtracts it from `R[color_u][p]`.
 */
struct SubstitutionStep
{
    csint u;
    csint p;
    csint color_u;
    csint color_p;
    csint entry_up;  // storage index of (u, p)
    csint entry_pu;  // storage index of (p, u)
};


/** A verified coloring of a sparsity pattern and its decompression plan.
 *
 * The result is immutable. It may be reused for every compressed evaluation
 * of a matrix with the same pattern.
 */
class ColoringResult
{
    CSCMatrix S_;                   // canonical symbolic pattern
    std::vector<csint> colors_;     // one per column, row or vertex
    csint ncolors_ = 0;
    ColoringProblem problem_;
    GreedyColoringAlgorithm algorithm_;
    std::vector<DirectEntry> direct_;        // one per stored entry of S_
    std::vector<SubstitutionStep> steps_;    // in peeling order

    void verify_() const;
    void build_direct_plan_();
    void build_substitution_plan_();

    public:
        /** Verify a coloring and compute its decompression plan.
         *
         * @param S  the sparsity pattern
         * @param colors  the 0-based color of each column (column partition
         *        or symmetric problems) or each row (row partition)
         * @param problem  what was colored
         * @param algorithm  how it was colored
         *
         * @throws std::logic_error if `colors` does not satisfy the discipline
         *         of `problem` and `algorithm`.
         */
        ColoringResult(
            const CSCMatrix& S,
            const std::vector<csint>& colors,
            const ColoringProblem& problem,
            const GreedyColoringAlgorithm& algorithm
        );

        const CSCMatrix& pattern() const { return S_; }
        const std::vector<csint>& colors() const { return colors_; }
        csint ncolors() const { return ncolors_; }
        const ColoringProblem& problem() const { return problem_; }
        const GreedyColoringAlgorithm& algorithm() const { return algorithm_; }
        Decompression decompression() const { return algorithm_.decompression; }

        /** Return the indices of each color, in increasing order. */
        std::vector<std::vector<csint>> color_groups() const;

        /** Return one 0/1 indicator vector per color.
         *
         * The seeds have length `n` for column partitions and symmetric
         * problems, and length `m` for row partitions.
         */
        std::vector<std::vector<double>> seeds() const;

        /** Length of each compressed product, `m` or `n`. */
        csint compressed_size() const;

        const std::vector<DirectEntry>& direct_plan() const { return direct_; }
        const std::vector<SubstitutionStep>& substitution_plan() const { return steps_; }

        std::string to_string() const;
        void print(std::ostream& os=std::cout) const;
};


std::ostream& operator<<(std::ostream& os, const ColoringResult& result);


/*------------------------------------------------------------------------------
 *          Greedy colorings
 *----------------------------------------------------------------------------*/
/** Color one side of a bipartite graph so that vertices at distance 2 differ.
 *
 * Same-colored columns (or rows) are structurally orthogonal.
 *
 * @param G  the bipartite graph of a pattern
 * @param side  color the columns or the rows
 * @param order  the order in which to visit the vertices of `side`
 *
 * @return colors  the 0-based color of each vertex of `side`
 *
 * @throws std::invalid_argument if `order` is not a permutation.
 */
std::vector<csint> partial_distance2_coloring(
    const BipartiteGraph& G,
    Side side,
    const std::vector<csint>& order
);


/** Color a graph so that vertices within distance `k` differ.
 *
 * @throws PreconditionViolated if `k < 1`.
 * @throws std::invalid_argument if `order` is not a permutation.
 */
std::vector<csint> distance_k_coloring(
    const AdjacencyGraph& G,
    csint k,
    const std::vector<csint>& order
);


/** Star coloring: proper, and every path on 4 vertices uses 3 colors. */
std::vector<csint> star_coloring(
    const AdjacencyGraph& G,
    const std::vector<csint>& order
);


/** Acyclic coloring: proper, and every cycle uses 3 colors. */
std::vector<csint> acyclic_coloring(
    const AdjacencyGraph& G,
    const std::vector<csint>& order
);


/** Color a sparsity pattern for compressed differentiation.
 *
 * Nonsymmetric problems are colored with a partial distance-2 coloring of
 * the columns or rows. Symmetric problems use a star coloring for direct
 * decompression and an acyclic coloring for substitution.
 *
 * @param S  the sparsity pattern. Values, if any, are ignored.
 * @param problem  the structure and partition
 * @param algorithm  the vertex order and decompression
 *
 * @return the verified coloring and its decompression plan
 *
 * @throws InvalidStructure if a symmetric problem is given a pattern that is
 *         not square or not structurally symmetric.
 * @throws PreconditionViolated if a symmetric pattern has a missing
 *         diagonal entry, or substitution is requested for a nonsymmetric
 *         problem, or a symmetric problem uses a row partition.
 */
ColoringResult coloring(
    const CSCMatrix& S,
    const ColoringProblem& problem={},
    const GreedyColoringAlgorithm& algorithm={}
);


}  // namespace sd

#endif  // _SPARSEDIFF_COLORING_H_

//==============================================================================
//==============================================================================
