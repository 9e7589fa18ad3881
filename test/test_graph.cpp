/*==============================================================================
 *     File: test_graph.cpp
 *  Created: 2025-06-06 15:12
 *
 *  Description: Test the graph views of a pattern and the vertex orderings.
 *
 *============================================================================*/

#include <catch2/catch_test_macros.hpp>

#include <vector>

#include "sparsediff.h"
#include "test_helpers.h"

namespace sd {


static std::vector<csint> to_vec(std::span<const csint> s)
{
    return std::vector<csint>(s.begin(), s.end());
}


TEST_CASE("Adjacency graph", "[graph][AdjacencyGraph]")
{
    SECTION("Path graph of the ijkl Hessian") {
        AdjacencyGraph G(ijkl_hessian());

        CHECK(G.num_vertices() == 4);
        CHECK(G.num_edges() == 3);
        CHECK(G.max_degree() == 2);
        CHECK(G.degree(2) == 1);
        CHECK(to_vec(G.neighbors(0)) == std::vector<csint>{1, 2});
        CHECK(to_vec(G.neighbors(3)) == std::vector<csint>{1});
        CHECK(G.has_edge(2, 0));
        CHECK(G.has_edge(0, 2));
        CHECK_FALSE(G.has_edge(2, 3));
        CHECK_FALSE(G.has_edge(0, 0));
    }

    SECTION("The diagonal is not an edge") {
        AdjacencyGraph G(tridiagonal(5));

        CHECK(G.num_edges() == 4);
        CHECK(G.matrix().is_symbolic());
        CHECK_FALSE(G.matrix().has_full_diagonal());
    }

    SECTION("Non-square pattern") {
        CHECK_THROWS_AS(AdjacencyGraph(tutorial_pattern()), InvalidStructure);
    }

    SECTION("Nonsymmetric pattern") {
        CSCMatrix L = COOMatrix({}, {0, 1, 1}, {0, 0, 1}, {2, 2}).tocsc();
        CHECK_THROWS_AS(AdjacencyGraph(L), InvalidStructure);
    }
}


TEST_CASE("Bipartite graph", "[graph][BipartiteGraph]")
{
    BipartiteGraph G(tutorial_pattern());

    CHECK(G.num_rows() == 4);
    CHECK(G.num_cols() == 6);
    CHECK(G.num_vertices(Side::Column) == 6);
    CHECK(G.num_vertices(Side::Row) == 4);
    CHECK(to_vec(G.column_neighbors(4)) == std::vector<csint>{1, 2});
    CHECK(to_vec(G.row_neighbors(0)) == std::vector<csint>{2, 3, 5});
    CHECK(to_vec(G.neighbors(Side::Row, 3)) == std::vector<csint>{1, 2});
}


TEST_CASE("Intersection graphs", "[graph][intersection]")
{
    CSCMatrix S = tutorial_pattern();

    SECTION("Columns sharing a row") {
        AdjacencyGraph G = column_intersection_graph(S);

        CHECK(G.num_vertices() == 6);
        CHECK(G.num_edges() == 6);
        CHECK(to_vec(G.neighbors(0)) == std::vector<csint>{4});
        CHECK(to_vec(G.neighbors(2)) == std::vector<csint>{1, 3, 5});
        CHECK(to_vec(G.neighbors(5)) == std::vector<csint>{2, 3});
    }

    SECTION("Rows sharing a column") {
        AdjacencyGraph G = row_intersection_graph(S);

        CHECK(G.num_vertices() == 4);
        CHECK(G.num_edges() == 3);
        CHECK(to_vec(G.neighbors(3)) == std::vector<csint>{0, 2});
        CHECK(to_vec(G.neighbors(1)) == std::vector<csint>{2});
    }

    SECTION("From the bipartite graph") {
        BipartiteGraph B(S);

        AdjacencyGraph C = intersection_graph(B, Side::Column);
        AdjacencyGraph R = intersection_graph(B, Side::Row);

        CHECK(C.matrix().indices() == column_intersection_graph(S).matrix().indices());
        CHECK(C.matrix().indptr() == column_intersection_graph(S).matrix().indptr());
        CHECK(R.matrix().indices() == row_intersection_graph(S).matrix().indices());
    }

    SECTION("Numeric values are ignored") {
        CSCMatrix J = banded_jacobian();
        AdjacencyGraph G = column_intersection_graph(J);

        // Column 0 shares row 0 with column 4 and row 1 with column 1
        CHECK(to_vec(G.neighbors(0)) == std::vector<csint>{1, 4});
        CHECK(G.matrix().is_symbolic());
    }
}


TEST_CASE("Graph power", "[graph][power]")
{
    AdjacencyGraph G(tridiagonal(5));  // path 0 - 1 - 2 - 3 - 4

    SECTION("First power is the graph") {
        AdjacencyGraph P = graph_power(G, 1);
        CHECK(P.matrix().indptr() == G.matrix().indptr());
        CHECK(P.matrix().indices() == G.matrix().indices());
    }

    SECTION("Square of a path") {
        AdjacencyGraph P = graph_power(G, 2);
        CHECK(P.num_edges() == 7);
        CHECK(to_vec(P.neighbors(2)) == std::vector<csint>{0, 1, 3, 4});
        CHECK(to_vec(P.neighbors(0)) == std::vector<csint>{1, 2});
    }

    SECTION("Large powers are complete") {
        CHECK(graph_power(G, 4).num_edges() == 10);
        CHECK(graph_power(G, 10).num_edges() == 10);
    }

    SECTION("Invalid power") {
        CHECK_THROWS_AS(graph_power(G, 0), PreconditionViolated);
    }
}


TEST_CASE("Vertex orderings", "[ordering]")
{
    AdjacencyGraph G(tridiagonal(5));  // degrees 1, 2, 2, 2, 1

    SECTION("Natural") {
        CHECK(vertex_order(G) == std::vector<csint>{0, 1, 2, 3, 4});
    }

    SECTION("Largest first keeps ties in index order") {
        CHECK(vertex_order(G, VertexOrder::LargestFirst) == std::vector<csint>{1, 2, 3, 0, 4});
    }

    SECTION("Smallest last peels the path from one end") {
        CHECK(vertex_order(G, VertexOrder::SmallestLast) == std::vector<csint>{4, 3, 2, 1, 0});
    }

    SECTION("Incidence degree follows the path") {
        CHECK(vertex_order(G, VertexOrder::IncidenceDegree) == std::vector<csint>{0, 1, 2, 3, 4});
    }

    SECTION("Dynamic largest first") {
        CHECK(vertex_order(G, VertexOrder::DynamicLargestFirst) == std::vector<csint>{1, 3, 4, 2, 0});
    }

    SECTION("Random") {
        CHECK(vertex_order(G, VertexOrder::Random, 0) == vertex_order(G));

        auto p = vertex_order(G, VertexOrder::Random, 42);
        CHECK(is_valid_permutation(p, 5));
        CHECK(p == vertex_order(G, VertexOrder::Random, 42));
    }

    SECTION("Every order is a permutation") {
        CSCMatrix A = random_symmetric_csc(40, 0.1, 7);
        AdjacencyGraph R(A);

        for (auto order : {
                VertexOrder::Natural,
                VertexOrder::LargestFirst,
                VertexOrder::SmallestLast,
                VertexOrder::IncidenceDegree,
                VertexOrder::DynamicLargestFirst,
                VertexOrder::Random
            }) {
            CAPTURE(order);
            CHECK(is_valid_permutation(vertex_order(R, order, 3), 40));
        }
    }

    SECTION("Bipartite sides use the intersection degrees") {
        BipartiteGraph B(tutorial_pattern());

        CHECK(vertex_order(B, Side::Column, VertexOrder::LargestFirst)
              == std::vector<csint>{2, 1, 3, 4, 5, 0});
        CHECK(vertex_order(B, Side::Row) == std::vector<csint>{0, 1, 2, 3});
    }
}


TEST_CASE("Permutation check", "[ordering]")
{
    CHECK(is_valid_permutation({0, 2, 1}, 3));
    CHECK(is_valid_permutation({}, 0));
    CHECK_FALSE(is_valid_permutation({0, 0, 1}, 3));
    CHECK_FALSE(is_valid_permutation({0, 1}, 3));
    CHECK_FALSE(is_valid_permutation({0, 3, 1}, 3));
    CHECK_FALSE(is_valid_permutation({0, -1, 1}, 3));
}


}  // namespace sd

/*==============================================================================
 *============================================================================*/
