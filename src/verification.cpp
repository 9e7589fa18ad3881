/*==============================================================================
 *     File: verification.cpp
 *  Created: 2025-06-08 16:58
 *
 *  Description: Implements checks of coloring disciplines.
 *
 *============================================================================*/

#include <algorithm>  // sort, max_element, min, max
#include <array>
#include <format>
#include <string>
#include <utility>    // swap

#include "errors.h"
#include "verification.h"

namespace sd {

namespace {

/// Colors must be non-negative and one per vertex.
bool valid_colors(const std::vector<csint>& colors, csint N)
{
    if (static_cast<csint>(colors.size()) != N) {
        return false;
    }
    return std::all_of(colors.begin(), colors.end(), [](csint c) { return c >= 0; });
}


csint num_colors(const std::vector<csint>& colors)
{
    return colors.empty() ? 0 : *std::max_element(colors.begin(), colors.end()) + 1;
}


/// No two entries of one column of `S` are in rows of the same color.
bool orthogonal_within_columns(const CSCMatrix& S, const std::vector<csint>& colors)
{
    auto [M, N] = S.shape();

    if (!valid_colors(colors, M)) {
        return false;
    }

    std::vector<csint> mark(num_colors(colors), -1);

    for (csint j = 0; j < N; j++) {
        for (const auto& i : S.column(j)) {
            csint c = colors[i];
            if (mark[c] == j) {
                return false;  // two rows of color c meet in column j
            }
            mark[c] = j;
        }
    }

    return true;
}


/// Union-find root with path halving.
csint find_root(std::vector<csint>& parent, csint i)
{
    while (parent[i] != i) {
        parent[i] = parent[parent[i]];
        i = parent[i];
    }
    return i;
}

}  // namespace


bool structurally_orthogonal_columns(
    const CSCMatrix& S,
    const std::vector<csint>& colors
)
{
    // Columns of S are the rows of S^T
    return orthogonal_within_columns(S.pattern().transpose(false), colors);
}


bool structurally_orthogonal_rows(
    const CSCMatrix& S,
    const std::vector<csint>& colors
)
{
    return orthogonal_within_columns(S.pattern(), colors);
}


bool is_distance_k_coloring(
    const AdjacencyGraph& G,
    const std::vector<csint>& colors,
    csint k
)
{
    if (k < 1) {
        throw PreconditionViolated(
            std::format("Distance-k coloring requires k >= 1, got {}.", k)
        );
    }

    csint N = G.num_vertices();

    if (!valid_colors(colors, N)) {
        return false;
    }

    // Breadth-first search to depth k from every vertex
    std::vector<csint> mark(N, -1);
    std::vector<csint> frontier, next;

    for (csint v = 0; v < N; v++) {
        mark[v] = v;
        frontier.assign(1, v);

        for (csint d = 0; d < k && !frontier.empty(); d++) {
            next.clear();
            for (const auto& u : frontier) {
                for (const auto& w : G.neighbors(u)) {
                    if (mark[w] != v) {
                        if (colors[w] == colors[v]) {
                            return false;
                        }
                        mark[w] = v;
                        next.push_back(w);
                    }
                }
            }
            std::swap(frontier, next);
        }
    }

    return true;
}


bool is_star_coloring(const AdjacencyGraph& G, const std::vector<csint>& colors)
{
    if (!is_distance_k_coloring(G, colors, 1)) {
        return false;
    }

    // Number of neighbors of u with color c
    auto count_color = [&G, &colors](csint u, csint c) {
        csint n = 0;
        for (const auto& w : G.neighbors(u)) {
            n += (colors[w] == c);
        }
        return n;
    };

    for (csint v = 0; v < G.num_vertices(); v++) {
        for (const auto& u : G.neighbors(v)) {
            if (u < v) {
                continue;  // each edge once
            }

            // A two-colored path w - v - u - x exists through edge (v, u)
            if (count_color(v, colors[u]) > 1 && count_color(u, colors[v]) > 1) {
                return false;
            }
        }
    }

    return true;
}


bool is_acyclic_coloring(const AdjacencyGraph& G, const std::vector<csint>& colors)
{
    if (!is_distance_k_coloring(G, colors, 1)) {
        return false;
    }

    csint N = G.num_vertices();

    // Group the edges by the pair of colors at their ends
    std::vector<std::array<csint, 4>> edges;  // {c_lo, c_hi, u, v}
    edges.reserve(G.num_edges());

    for (csint v = 0; v < N; v++) {
        for (const auto& u : G.neighbors(v)) {
            if (u > v) {
                csint a = std::min(colors[u], colors[v]);
                csint b = std::max(colors[u], colors[v]);
                edges.push_back({a, b, u, v});
            }
        }
    }

    std::sort(edges.begin(), edges.end());

    // Each two-colored subgraph must be a forest
    std::vector<csint> parent(N);
    for (csint i = 0; i < N; i++) {
        parent[i] = i;
    }

    std::size_t start = 0;
    while (start < edges.size()) {
        std::size_t end = start;
        while (end < edges.size()
               && edges[end][0] == edges[start][0]
               && edges[end][1] == edges[start][1]) {
            end++;
        }

        bool acyclic = true;
        for (std::size_t e = start; e < end && acyclic; e++) {
            csint ru = find_root(parent, edges[e][2]);
            csint rv = find_root(parent, edges[e][3]);
            if (ru == rv) {
                acyclic = false;  // edge closes a cycle
            } else {
                parent[ru] = rv;
            }
        }

        // Reset the vertices touched by this group
        for (std::size_t e = start; e < end; e++) {
            parent[edges[e][2]] = edges[e][2];
            parent[edges[e][3]] = edges[e][3];
        }

        if (!acyclic) {
            return false;
        }

        start = end;
    }

    return true;
}


}  // namespace sd

/*==============================================================================
 *============================================================================*/
