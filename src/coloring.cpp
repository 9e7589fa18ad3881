/*==============================================================================
 *     File: coloring.cpp
 *  Created: 2025-06-09 11:52
 *
 *  Description: Implements greedy colorings and the ColoringResult
 *    decompression plans.
 *
 *============================================================================*/

#include <algorithm>  // sort, lower_bound, max_element
#include <array>
#include <format>
#include <iterator>   // distance
#include <sstream>
#include <stdexcept>
#include <string>

#include "errors.h"
#include "utils.h"
#include "ordering.h"
#include "verification.h"
#include "coloring.h"

namespace sd {

namespace {

void check_order(const std::vector<csint>& order, csint N)
{
    if (!is_valid_permutation(order, N)) {
        throw std::invalid_argument(
            std::format("Vertex order must be a permutation of 0..{}.", N - 1)
        );
    }
}


/// Smallest color `c` with `forbidden[c] != v`.
csint smallest_allowed(const std::vector<csint>& forbidden, csint v)
{
    csint c = 0;
    while (forbidden[c] == v) {
        c++;
    }
    return c;
}


/// Storage index of entry `(i, j)` of a canonical pattern.
csint entry_index(const CSCMatrix& S, csint i, csint j)
{
    auto col = S.column(j);
    auto t = std::lower_bound(col.begin(), col.end(), i);
    if (t == col.end() || *t != i) {
        throw std::logic_error(
            std::format("Entry ({}, {}) is not in the pattern.", i, j)
        );
    }
    return S.indptr()[j] + static_cast<csint>(std::distance(col.begin(), t));
}


std::string discipline_name(const ColoringProblem& problem, const GreedyColoringAlgorithm& algorithm)
{
    if (problem.structure == Structure::Symmetric) {
        return (algorithm.decompression == Decompression::Direct)
            ? "star coloring, direct"
            : "acyclic coloring, substitution";
    }
    return (problem.partition == Partition::Column)
        ? "partial distance-2 column coloring, direct"
        : "partial distance-2 row coloring, direct";
}

}  // namespace


/*------------------------------------------------------------------------------
 *         Greedy colorings
 *----------------------------------------------------------------------------*/
std::vector<csint> partial_distance2_coloring(
    const BipartiteGraph& G,
    Side side,
    const std::vector<csint>& order
)
{
    csint N = G.num_vertices(side);
    check_order(order, N);

    Side other = (side == Side::Column) ? Side::Row : Side::Column;

    std::vector<csint> colors(N, -1);
    std::vector<csint> forbidden(N + 1, -1);  // forbidden[c] == v if c is taken

    for (const auto& v : order) {
        for (const auto& i : G.neighbors(side, v)) {
            for (const auto& w : G.neighbors(other, i)) {
                if (w != v && colors[w] >= 0) {
                    forbidden[colors[w]] = v;
                }
            }
        }
        colors[v] = smallest_allowed(forbidden, v);
    }

    return colors;
}


std::vector<csint> distance_k_coloring(
    const AdjacencyGraph& G,
    csint k,
    const std::vector<csint>& order
)
{
    if (k < 1) {
        throw PreconditionViolated(
            std::format("Distance-k coloring requires k >= 1, got {}.", k)
        );
    }

    csint N = G.num_vertices();
    check_order(order, N);

    std::vector<csint> colors(N, -1);
    std::vector<csint> forbidden(N + 1, -1);
    std::vector<csint> mark(N, -1);
    std::vector<csint> frontier, next;

    for (const auto& v : order) {
        // Breadth-first search to depth k
        mark[v] = v;
        frontier.assign(1, v);

        for (csint d = 0; d < k && !frontier.empty(); d++) {
            next.clear();
            for (const auto& u : frontier) {
                for (const auto& w : G.neighbors(u)) {
                    if (mark[w] != v) {
                        mark[w] = v;
                        next.push_back(w);
                        if (colors[w] >= 0) {
                            forbidden[colors[w]] = v;
                        }
                    }
                }
            }
            std::swap(frontier, next);
        }

        colors[v] = smallest_allowed(forbidden, v);
    }

    return colors;
}


std::vector<csint> star_coloring(
    const AdjacencyGraph& G,
    const std::vector<csint>& order
)
{
    csint N = G.num_vertices();
    check_order(order, N);

    std::vector<csint> colors(N, -1);
    std::vector<csint> forbidden(N + 1, -1);
    std::vector<csint> seen(N + 1, -1);      // seen[a] == v if a is a neighbor color
    std::vector<csint> repeated(N + 1, -1);  // repeated[a] == v if seen twice

    for (const auto& v : order) {
        // Proper coloring
        for (const auto& w : G.neighbors(v)) {
            if (colors[w] >= 0) {
                csint a = colors[w];
                forbidden[a] = v;
                if (seen[a] == v) {
                    repeated[a] = v;
                }
                seen[a] = v;
            }
        }

        // Path v - w - x - y with colors c, a, c, a: forbid colors[x]
        for (const auto& w : G.neighbors(v)) {
            if (colors[w] < 0) {
                continue;
            }

            for (const auto& x : G.neighbors(w)) {
                if (x == v || colors[x] < 0 || forbidden[colors[x]] == v) {
                    continue;
                }

                for (const auto& y : G.neighbors(x)) {
                    if (y != w && colors[y] == colors[w]) {
                        forbidden[colors[x]] = v;
                        break;
                    }
                }
            }
        }

        // Path x - v - w - y with colors a, c, a, c: two neighbors share
        // color a, so no neighbor of them may share the color of v
        for (const auto& w : G.neighbors(v)) {
            if (colors[w] < 0 || repeated[colors[w]] != v) {
                continue;
            }

            for (const auto& y : G.neighbors(w)) {
                if (y != v && colors[y] >= 0) {
                    forbidden[colors[y]] = v;
                }
            }
        }

        colors[v] = smallest_allowed(forbidden, v);
    }

    return colors;
}


std::vector<csint> acyclic_coloring(
    const AdjacencyGraph& G,
    const std::vector<csint>& order
)
{
    csint N = G.num_vertices();
    check_order(order, N);

    std::vector<csint> colors(N, -1);
    std::vector<csint> forbidden(N + 1, -1);
    std::vector<csint> visited(N, -1);  // search id of the last visit
    csint search = 0;
    csint ncolors = 0;

    std::vector<std::array<csint, 2>> nbr;  // {color, vertex} of colored neighbors
    std::vector<csint> queue;

    // True if two of the vertices in `W` are joined by a path whose vertices
    // all have colors a or c.
    auto connected = [&](const std::vector<csint>& W, csint a, csint c) {
        search++;
        for (const auto& w : W) {
            if (visited[w] == search) {
                return true;  // reached from an earlier vertex of W
            }

            visited[w] = search;
            queue.assign(1, w);

            while (!queue.empty()) {
                csint x = queue.back();
                queue.pop_back();
                for (const auto& y : G.neighbors(x)) {
                    if (visited[y] != search && (colors[y] == a || colors[y] == c)) {
                        visited[y] = search;
                        queue.push_back(y);
                    }
                }
            }
        }
        return false;
    };

    for (const auto& v : order) {
        nbr.clear();
        for (const auto& w : G.neighbors(v)) {
            if (colors[w] >= 0) {
                forbidden[colors[w]] = v;
                nbr.push_back({colors[w], w});
            }
        }

        std::sort(nbr.begin(), nbr.end());

        // Groups of neighbors that share a color
        std::vector<std::vector<csint>> groups;
        std::vector<csint> group_color;
        for (std::size_t k = 0; k < nbr.size(); ) {
            std::size_t e = k;
            while (e < nbr.size() && nbr[e][0] == nbr[k][0]) {
                e++;
            }
            if (e - k > 1) {
                groups.emplace_back();
                group_color.push_back(nbr[k][0]);
                for (std::size_t q = k; q < e; q++) {
                    groups.back().push_back(nbr[q][1]);
                }
            }
            k = e;
        }

        // A new color never closes a cycle, so the search ends at ncolors
        for (csint c = 0; c <= ncolors; c++) {
            if (forbidden[c] == v) {
                continue;
            }

            bool closes_cycle = false;
            for (std::size_t g = 0; g < groups.size() && !closes_cycle; g++) {
                closes_cycle = connected(groups[g], group_color[g], c);
            }

            if (!closes_cycle) {
                colors[v] = c;
                break;
            }
        }

        ncolors = std::max(ncolors, colors[v] + 1);
    }

    return colors;
}


/*------------------------------------------------------------------------------
 *         Main entry point
 *----------------------------------------------------------------------------*/
ColoringResult coloring(
    const CSCMatrix& S,
    const ColoringProblem& problem,
    const GreedyColoringAlgorithm& algorithm
)
{
    std::vector<csint> colors;

    if (problem.structure == Structure::Symmetric) {
        if (problem.partition != Partition::Column) {
            throw PreconditionViolated("Symmetric problems use a column partition.");
        }

        AdjacencyGraph G(S);  // throws if not square and symmetric

        if (!S.has_full_diagonal()) {
            throw PreconditionViolated(
                "Star and acyclic coloring require a non-zero diagonal."
            );
        }

        auto order = vertex_order(G, algorithm.order, algorithm.seed);

        if (algorithm.decompression == Decompression::Direct) {
            colors = star_coloring(G, order);
        } else {
            colors = acyclic_coloring(G, order);
        }
    } else {
        if (algorithm.decompression != Decompression::Direct) {
            throw PreconditionViolated(
                "Substitution is only available for symmetric problems."
            );
        }

        BipartiteGraph G(S);
        auto order = vertex_order(G, problem.partition, algorithm.order, algorithm.seed);
        colors = partial_distance2_coloring(G, problem.partition, order);
    }

    return ColoringResult(S, colors, problem, algorithm);
}


/*------------------------------------------------------------------------------
 *         ColoringResult
 *----------------------------------------------------------------------------*/
ColoringResult::ColoringResult(
    const CSCMatrix& S,
    const std::vector<csint>& colors,
    const ColoringProblem& problem,
    const GreedyColoringAlgorithm& algorithm
) : S_(S.pattern()),
    colors_(colors),
    problem_(problem),
    algorithm_(algorithm)
{
    ncolors_ = colors_.empty() ? 0 : *std::max_element(colors_.begin(), colors_.end()) + 1;

    verify_();
    build_direct_plan_();

    if (algorithm_.decompression == Decompression::Substitution) {
        build_substitution_plan_();
    }
}


void ColoringResult::verify_() const
{
    bool valid = false;

    if (problem_.structure == Structure::Symmetric) {
        AdjacencyGraph G(S_);

        if (algorithm_.decompression == Decompression::Direct) {
            valid = is_star_coloring(G, colors_);
        } else {
            valid = is_acyclic_coloring(G, colors_);
        }
    } else {
        if (algorithm_.decompression != Decompression::Direct) {
            throw PreconditionViolated(
                "Substitution is only available for symmetric problems."
            );
        }

        if (problem_.partition == Partition::Column) {
            valid = structurally_orthogonal_columns(S_, colors_);
        } else {
            valid = structurally_orthogonal_rows(S_, colors_);
        }
    }

    if (!valid) {
        throw std::logic_error(
            std::format("Coloring is not a valid {}.", discipline_name(problem_, algorithm_))
        );
    }
}


void ColoringResult::build_direct_plan_()
{
    csint N = S_.shape()[1];
    const auto& Si = S_.indices();
    const auto& Sp = S_.indptr();

    direct_.assign(S_.nnz(), DirectEntry{});

    // Number of entries of column j with color c
    auto count_color = [this](csint j, csint c) {
        csint n = 0;
        for (const auto& k : S_.column(j)) {
            n += (colors_[k] == c);
        }
        return n;
    };

    for (csint j = 0; j < N; j++) {
        for (csint p = Sp[j]; p < Sp[j+1]; p++) {
            csint i = Si[p];

            if (problem_.structure == Structure::Nonsymmetric) {
                if (problem_.partition == Partition::Column) {
                    direct_[p] = {colors_[j], i};  // A(i, j) = B[color(j)][i]
                } else {
                    direct_[p] = {colors_[i], j};  // A(i, j) = C[color(i)][j]
                }
            } else if (i == j) {
                direct_[p] = {colors_[i], i};
            } else if (algorithm_.decompression == Decompression::Direct) {
                // Column i of S is row i, by symmetry
                if (count_color(i, colors_[j]) == 1) {
                    direct_[p] = {colors_[j], i};  // j is a star center
                } else if (count_color(j, colors_[i]) == 1) {
                    direct_[p] = {colors_[i], j};  // i is a star center
                } else {
                    throw std::logic_error(
                        std::format("Entry ({}, {}) cannot be recovered directly.", i, j)
                    );
                }
            }
            // else: recovered by substitution
        }
    }
}


void ColoringResult::build_substitution_plan_()
{
    csint N = S_.shape()[1];

    // Group the edges by the pair of colors at their ends
    std::vector<std::array<csint, 4>> edges;  // {c_lo, c_hi, u, v}
    for (csint v = 0; v < N; v++) {
        for (const auto& u : S_.column(v)) {
            if (u > v) {
                csint a = std::min(colors_[u], colors_[v]);
                csint b = std::max(colors_[u], colors_[v]);
                edges.push_back({a, b, u, v});
            }
        }
    }

    std::sort(edges.begin(), edges.end());

    std::vector<csint> deg(N, 0), lo(N, 0), hi(N, 0);
    std::vector<std::array<csint, 3>> inc;  // {vertex, neighbor, edge}
    std::vector<bool> used;
    std::vector<csint> worklist;

    std::size_t start = 0;
    while (start < edges.size()) {
        std::size_t end = start;
        while (end < edges.size()
               && edges[end][0] == edges[start][0]
               && edges[end][1] == edges[start][1]) {
            end++;
        }

        // Incidence lists of the two-colored forest
        csint ne = end - start;
        inc.clear();
        for (csint e = 0; e < ne; e++) {
            const auto& E = edges[start + e];
            inc.push_back({E[2], E[3], e});
            inc.push_back({E[3], E[2], e});
        }
        std::sort(inc.begin(), inc.end());

        for (csint k = 0; k < static_cast<csint>(inc.size()); k++) {
            csint x = inc[k][0];
            if (k == 0 || inc[k-1][0] != x) {
                lo[x] = k;
            }
            hi[x] = k + 1;
        }

        worklist.clear();
        for (csint k = 0; k < static_cast<csint>(inc.size()); k++) {
            csint x = inc[k][0];
            if (k == lo[x]) {
                deg[x] = hi[x] - lo[x];
                if (deg[x] == 1) {
                    worklist.push_back(x);
                }
            }
        }

        // Peel the leaves
        used.assign(ne, false);
        csint nused = 0;

        while (!worklist.empty()) {
            csint u = worklist.back();
            worklist.pop_back();

            if (deg[u] != 1) {
                continue;  // already peeled
            }

            for (csint k = lo[u]; k < hi[u]; k++) {
                if (used[inc[k][2]]) {
                    continue;
                }

                csint p = inc[k][1];
                used[inc[k][2]] = true;
                nused++;
                deg[u]--;
                deg[p]--;

                steps_.push_back({
                    u, p, colors_[u], colors_[p],
                    entry_index(S_, u, p),
                    entry_index(S_, p, u)
                });

                if (deg[p] == 1) {
                    worklist.push_back(p);
                }
                break;
            }
        }

        if (nused != ne) {
            throw std::logic_error("Two-colored subgraph contains a cycle.");
        }

        start = end;
    }
}


std::vector<std::vector<csint>> ColoringResult::color_groups() const
{
    std::vector<std::vector<csint>> groups(ncolors_);
    for (csint k = 0; k < static_cast<csint>(colors_.size()); k++) {
        groups[colors_[k]].push_back(k);
    }
    return groups;
}


std::vector<std::vector<double>> ColoringResult::seeds() const
{
    std::vector<std::vector<double>> out(ncolors_, std::vector<double>(colors_.size(), 0.0));
    for (std::size_t k = 0; k < colors_.size(); k++) {
        out[colors_[k]][k] = 1.0;
    }
    return out;
}


csint ColoringResult::compressed_size() const
{
    auto [M, N] = S_.shape();
    if (problem_.structure == Structure::Nonsymmetric
        && problem_.partition == Partition::Column) {
        return M;
    }
    return N;
}


std::string ColoringResult::to_string() const
{
    auto [M, N] = S_.shape();
    std::stringstream ss;

    ss << std::format(
        "<SparseDiff Coloring of a ({}, {}) pattern\n"
        "        with {} colors, {}>",
        M, N, ncolors_, discipline_name(problem_, algorithm_));

    auto groups = color_groups();
    for (csint c = 0; c < ncolors_; c++) {
        ss << "\n" << c << ": ";
        print_vec(groups[c], ss, "");
    }

    return ss.str();
}


void ColoringResult::print(std::ostream& os) const
{
    os << to_string() << std::endl;
}


std::ostream& operator<<(std::ostream& os, const ColoringResult& result)
{
    result.print(os);
    return os;
}


}  // namespace sd

/*==============================================================================
 *============================================================================*/
