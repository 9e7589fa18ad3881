/*==============================================================================
 *     File: ordering.cpp
 *  Created: 2025-06-06 14:31
 *
 *  Description: Implements vertex ordering heuristics for greedy coloring.
 *
 *============================================================================*/

#include <algorithm>  // max, min
#include <numeric>    // iota
#include <stdexcept>

#include "utils.h"
#include "ordering.h"

namespace sd {

namespace {

/** Doubly-linked lists of vertices bucketed by an integer key.
 *
 * `head[d]` is the first vertex with key `d`, and `next`/`last` link the
 * vertices of one list, as in the degree lists of minimum degree ordering.
 */
struct DegreeLists
{
    std::vector<csint> head, next, last, key;

    DegreeLists(csint N, csint max_key)
        : head(max_key + 1, -1),
          next(N, -1),
          last(N, -1),
          key(N, 0)
    {}

    void insert(csint i, csint d)
    {
        key[i] = d;
        if (head[d] != -1) {
            last[head[d]] = i;
        }
        next[i] = head[d];  // put node i in list d
        last[i] = -1;
        head[d] = i;
    }

    void remove(csint i)
    {
        if (next[i] != -1) {
            last[next[i]] = last[i];
        }
        if (last[i] != -1) {
            next[last[i]] = next[i];
        } else {
            head[key[i]] = next[i];
        }
    }
};


std::vector<csint> smallest_last(const AdjacencyGraph& G)
{
    csint N = G.num_vertices();
    std::vector<csint> p(N);
    std::vector<bool> removed(N, false);
    DegreeLists L(N, N);

    for (csint i = N - 1; i >= 0; i--) {
        L.insert(i, G.degree(i));
    }

    csint mindeg = 0;

    for (csint k = N - 1; k >= 0; k--) {
        while (L.head[mindeg] == -1) {
            mindeg++;
        }

        csint v = L.head[mindeg];
        L.remove(v);
        removed[v] = true;
        p[k] = v;  // removed last is visited first

        for (const auto& w : G.neighbors(v)) {
            if (!removed[w]) {
                L.remove(w);
                L.insert(w, L.key[w] - 1);
                mindeg = std::min(mindeg, L.key[w]);
            }
        }
    }

    return p;
}


std::vector<csint> incidence_degree(const AdjacencyGraph& G)
{
    csint N = G.num_vertices();
    std::vector<csint> p;
    p.reserve(N);
    std::vector<bool> ordered(N, false);
    DegreeLists L(N, N);

    for (csint i = N - 1; i >= 0; i--) {
        L.insert(i, 0);  // no ordered neighbors yet
    }

    csint maxinc = 0;

    for (csint k = 0; k < N; k++) {
        while (L.head[maxinc] == -1) {
            maxinc--;
        }

        csint v = L.head[maxinc];
        L.remove(v);
        ordered[v] = true;
        p.push_back(v);

        for (const auto& w : G.neighbors(v)) {
            if (!ordered[w]) {
                L.remove(w);
                L.insert(w, L.key[w] + 1);
                maxinc = std::max(maxinc, L.key[w]);
            }
        }
    }

    return p;
}


std::vector<csint> dynamic_largest_first(const AdjacencyGraph& G)
{
    csint N = G.num_vertices();
    std::vector<csint> p;
    p.reserve(N);
    std::vector<bool> ordered(N, false);
    DegreeLists L(N, N);

    csint maxdeg = 0;
    for (csint i = N - 1; i >= 0; i--) {
        L.insert(i, G.degree(i));
        maxdeg = std::max(maxdeg, G.degree(i));
    }

    for (csint k = 0; k < N; k++) {
        while (L.head[maxdeg] == -1) {
            maxdeg--;
        }

        csint v = L.head[maxdeg];
        L.remove(v);
        ordered[v] = true;
        p.push_back(v);

        for (const auto& w : G.neighbors(v)) {
            if (!ordered[w]) {
                L.remove(w);
                L.insert(w, L.key[w] - 1);
            }
        }
    }

    return p;
}


std::vector<csint> natural_or_random(csint N, VertexOrder order, unsigned seed)
{
    if (order == VertexOrder::Random) {
        return randperm(N, static_cast<csint>(seed & 0x7fffffff));  // non-negative
    }

    std::vector<csint> p(N);
    std::iota(p.begin(), p.end(), 0);
    return p;
}

}  // namespace


std::vector<csint> vertex_order(
    const AdjacencyGraph& G,
    VertexOrder order,
    unsigned seed
)
{
    csint N = G.num_vertices();

    switch (order) {
        case VertexOrder::Natural:
        case VertexOrder::Random:
            return natural_or_random(N, order, seed);
        case VertexOrder::LargestFirst: {
            std::vector<csint> neg_degree(N);
            for (csint v = 0; v < N; v++) {
                neg_degree[v] = -G.degree(v);
            }
            return argsort(neg_degree);  // stable, so ties keep index order
        }
        case VertexOrder::SmallestLast:
            return smallest_last(G);
        case VertexOrder::IncidenceDegree:
            return incidence_degree(G);
        case VertexOrder::DynamicLargestFirst:
            return dynamic_largest_first(G);
    }

    throw std::invalid_argument("Invalid vertex order specified!");
}


std::vector<csint> vertex_order(
    const BipartiteGraph& G,
    Side side,
    VertexOrder order,
    unsigned seed
)
{
    if (order == VertexOrder::Natural || order == VertexOrder::Random) {
        return natural_or_random(G.num_vertices(side), order, seed);
    }

    return vertex_order(intersection_graph(G, side), order, seed);
}


bool is_valid_permutation(const std::vector<csint>& p, csint n)
{
    if (static_cast<csint>(p.size()) != n) {
        return false;
    }

    std::vector<bool> seen(n, false);
    for (const auto& k : p) {
        if (k < 0 || k >= n || seen[k]) {
            return false;
        }
        seen[k] = true;
    }

    return true;
}


}  // namespace sd

/*==============================================================================
 *============================================================================*/
