/*==============================================================================
 *     File: test_coloring.cpp
 *  Created: 2025-06-10 09:55
 *
 *  Description: Test the greedy colorings, their verification, and the
 *    ColoringResult.
 *
 *============================================================================*/

#include <catch2/catch_test_macros.hpp>
#include <catch2/generators/catch_generators_all.hpp>

#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include "sparsediff.h"
#include "test_helpers.h"

namespace sd {


// Cycle 0 - 1 - 2 - 3 - 0 with a full diagonal
static CSCMatrix cycle4()
{
    std::vector<csint> i = {0, 1, 2, 3, 0, 1, 1, 2, 2, 3, 3, 0};
    std::vector<csint> j = {0, 1, 2, 3, 1, 0, 2, 1, 3, 2, 0, 3};
    return COOMatrix({}, i, j, {4, 4}).tocsc();
}


static const std::vector<VertexOrder> all_orders = {
    VertexOrder::Natural,
    VertexOrder::LargestFirst,
    VertexOrder::SmallestLast,
    VertexOrder::IncidenceDegree,
    VertexOrder::DynamicLargestFirst,
    VertexOrder::Random
};


TEST_CASE("Partial distance-2 coloring", "[coloring][distance2]")
{
    CSCMatrix S = tutorial_pattern();
    BipartiteGraph G(S);

    SECTION("Columns") {
        auto colors = partial_distance2_coloring(G, Side::Column, {0, 1, 2, 3, 4, 5});
        CHECK(colors == std::vector<csint>{0, 0, 1, 0, 1, 2});
        CHECK(structurally_orthogonal_columns(S, colors));
    }

    SECTION("Rows") {
        auto colors = partial_distance2_coloring(G, Side::Row, {0, 1, 2, 3});
        CHECK(colors == std::vector<csint>{0, 0, 1, 2});
        CHECK(structurally_orthogonal_rows(S, colors));
    }

    SECTION("Banded Jacobian") {
        BipartiteGraph B(banded_jacobian());
        CHECK(partial_distance2_coloring(B, Side::Column, {0, 1, 2, 3, 4})
              == std::vector<csint>{0, 1, 0, 1, 1});
        CHECK(partial_distance2_coloring(B, Side::Row, {0, 1, 2, 3})
              == std::vector<csint>{0, 1, 0, 1});
    }

    SECTION("Reverse order") {
        auto colors = partial_distance2_coloring(G, Side::Column, {5, 4, 3, 2, 1, 0});
        CHECK(structurally_orthogonal_columns(S, colors));
    }

    SECTION("Invalid order") {
        CHECK_THROWS_AS(
            partial_distance2_coloring(G, Side::Column, {0, 1, 2}),
            std::invalid_argument
        );
        CHECK_THROWS_AS(
            partial_distance2_coloring(G, Side::Row, {0, 1, 1, 3}),
            std::invalid_argument
        );
    }
}


TEST_CASE("Distance-k coloring", "[coloring][distancek]")
{
    AdjacencyGraph G(tridiagonal(5));
    std::vector<csint> natural = {0, 1, 2, 3, 4};

    SECTION("Distance 1") {
        auto colors = distance_k_coloring(G, 1, natural);
        CHECK(colors == std::vector<csint>{0, 1, 0, 1, 0});
        CHECK(is_distance_k_coloring(G, colors, 1));
        CHECK_FALSE(is_distance_k_coloring(G, colors, 2));
    }

    SECTION("Distance 2") {
        auto colors = distance_k_coloring(G, 2, natural);
        CHECK(colors == std::vector<csint>{0, 1, 2, 0, 1});
        CHECK(is_distance_k_coloring(G, colors, 2));
    }

    SECTION("Distance 2 is a distance-1 coloring of the square") {
        auto colors = distance_k_coloring(G, 2, natural);
        CHECK(is_distance_k_coloring(graph_power(G, 2), colors, 1));
    }

    SECTION("Invalid distance") {
        CHECK_THROWS_AS(distance_k_coloring(G, 0, natural), PreconditionViolated);
        CHECK_THROWS_AS(is_distance_k_coloring(G, {0, 1, 0, 1, 0}, 0), PreconditionViolated);
    }
}


TEST_CASE("Star and acyclic coloring", "[coloring][star][acyclic]")
{
    SECTION("Star coloring of the ijkl Hessian") {
        AdjacencyGraph G(ijkl_hessian());
        auto colors = star_coloring(G, {0, 1, 2, 3});

        CHECK(colors == std::vector<csint>{0, 1, 1, 2});
        CHECK(is_star_coloring(G, colors));
    }

    SECTION("Tridiagonal") {
        AdjacencyGraph G(tridiagonal(4));
        std::vector<csint> natural = {0, 1, 2, 3};

        CHECK(star_coloring(G, natural) == std::vector<csint>{0, 1, 0, 2});
        CHECK(acyclic_coloring(G, natural) == std::vector<csint>{0, 1, 0, 1});
    }

    SECTION("Arrowhead needs two colors") {
        AdjacencyGraph G(arrowhead(6));
        std::vector<csint> natural = {0, 1, 2, 3, 4, 5};

        CHECK(star_coloring(G, natural) == std::vector<csint>{0, 1, 1, 1, 1, 1});
        CHECK(acyclic_coloring(G, natural) == std::vector<csint>{0, 1, 1, 1, 1, 1});
    }

    SECTION("Two colors on a path of 4 vertices") {
        AdjacencyGraph G(tridiagonal(4));
        std::vector<csint> colors = {0, 1, 0, 1};

        CHECK_FALSE(is_star_coloring(G, colors));
        CHECK_FALSE(brute_force_is_star(G, colors));
        CHECK(is_acyclic_coloring(G, colors));
        CHECK(brute_force_is_acyclic(G, colors));
    }

    SECTION("Two colors on a cycle of 4 vertices") {
        AdjacencyGraph G(cycle4());
        std::vector<csint> colors = {0, 1, 0, 1};

        CHECK(is_distance_k_coloring(G, colors, 1));
        CHECK_FALSE(is_acyclic_coloring(G, colors));
        CHECK_FALSE(brute_force_is_acyclic(G, colors));

        auto acyclic = acyclic_coloring(G, {0, 1, 2, 3});
        CHECK(is_acyclic_coloring(G, acyclic));
    }

    SECTION("Improper colorings are rejected") {
        AdjacencyGraph G(tridiagonal(4));
        CHECK_FALSE(is_star_coloring(G, {0, 0, 1, 2}));
        CHECK_FALSE(is_acyclic_coloring(G, {0, 0, 1, 2}));
        CHECK_FALSE(is_star_coloring(G, {0, 1, 0}));
        CHECK_FALSE(is_acyclic_coloring(G, {0, -1, 0, 1}));
    }
}


TEST_CASE("Greedy colorings on random patterns", "[coloring][random]")
{
    unsigned int seed = GENERATE(range(1u, 21u));
    auto order = GENERATE(from_range(all_orders));
    CAPTURE(seed, order);

    CSCMatrix A = random_symmetric_csc(25, 0.15, seed);
    AdjacencyGraph G(A);
    auto p = vertex_order(G, order, seed);

    auto star = star_coloring(G, p);
    auto acyclic = acyclic_coloring(G, p);
    auto d2 = distance_k_coloring(G, 2, p);

    SECTION("Each coloring is valid") {
        CHECK(is_star_coloring(G, star));
        CHECK(brute_force_is_star(G, star));
        CHECK(is_acyclic_coloring(G, acyclic));
        CHECK(brute_force_is_acyclic(G, acyclic));
        CHECK(is_distance_k_coloring(G, d2, 2));
    }

    SECTION("Each coloring is valid in the weaker discipline") {
        // distance-2 => star => acyclic => distance-1
        CHECK(is_star_coloring(G, d2));
        CHECK(is_acyclic_coloring(G, star));
        CHECK(is_distance_k_coloring(G, acyclic, 1));
    }

    SECTION("Partial distance-2 colorings are structurally orthogonal") {
        CSCMatrix J = random_csc(20, 15, 0.15, seed);
        BipartiteGraph B(J);

        auto cols = partial_distance2_coloring(
            B, Side::Column, vertex_order(B, Side::Column, order, seed)
        );
        CHECK(structurally_orthogonal_columns(J, cols));
        CHECK(brute_force_is_structurally_orthogonal(J, cols, Side::Column));

        auto rows = partial_distance2_coloring(
            B, Side::Row, vertex_order(B, Side::Row, order, seed)
        );
        CHECK(structurally_orthogonal_rows(J, rows));
        CHECK(brute_force_is_structurally_orthogonal(J, rows, Side::Row));

        // Same-colored columns of the intersection graph are never adjacent
        CHECK(is_distance_k_coloring(column_intersection_graph(J), cols, 1));
    }
}


TEST_CASE("Column and row colorings of random Jacobians", "[coloring][distance2][random]")
{
    auto [M, N, density] = GENERATE(table<csint, csint, double>({
        { 1, 50, 0.2},
        {50,  1, 0.2},
        {10,  8, 0.3},
        {30, 20, 0.1},
        {20, 45, 0.1},
        {50, 50, 0.05},
        {50, 50, 0.2}
    }));
    unsigned int seed = GENERATE(range(1u, 6u));
    auto order = GENERATE(from_range(all_orders));
    Partition partition = GENERATE(Partition::Column, Partition::Row);
    CAPTURE(M, N, density, seed, order, partition);

    CSCMatrix J = random_csc(M, N, density, seed);
    BipartiteGraph B(J);

    auto colors = partial_distance2_coloring(
        B, partition, vertex_order(B, partition, order, seed)
    );

    REQUIRE(static_cast<csint>(colors.size()) == B.num_vertices(partition));
    CHECK(brute_force_is_structurally_orthogonal(J, colors, partition));

    // The entry point produces the same coloring
    ColoringResult result = coloring(
        J, {Structure::Nonsymmetric, partition}, {order, Decompression::Direct, seed}
    );
    CHECK(result.colors() == colors);
}


TEST_CASE("Greedy colorings against the minimum", "[coloring][chromatic]")
{
    SECTION("Path of 4 vertices") {
        AdjacencyGraph G(tridiagonal(4));

        csint min_star = brute_force_min_colors(4,
            [&](const std::vector<csint>& c) { return is_star_coloring(G, c); });
        csint min_acyclic = brute_force_min_colors(4,
            [&](const std::vector<csint>& c) { return is_acyclic_coloring(G, c); });

        CHECK(min_star == 3);
        CHECK(min_acyclic == 2);
    }

    SECTION("Cycle of 4 vertices") {
        AdjacencyGraph G(cycle4());

        csint min_acyclic = brute_force_min_colors(4,
            [&](const std::vector<csint>& c) { return is_acyclic_coloring(G, c); });

        CHECK(min_acyclic == 3);
    }

    SECTION("Greedy never beats the minimum") {
        for (unsigned int seed : {11u, 12u, 13u}) {
            CSCMatrix A = random_symmetric_csc(7, 0.3, seed);
            AdjacencyGraph G(A);
            csint N = G.num_vertices();

            csint min_star = brute_force_min_colors(N,
                [&](const std::vector<csint>& c) { return is_star_coloring(G, c); });
            csint min_acyclic = brute_force_min_colors(N,
                [&](const std::vector<csint>& c) { return is_acyclic_coloring(G, c); });

            CHECK(min_acyclic <= min_star);

            for (const auto& order : all_orders) {
                CAPTURE(seed, order);
                auto p = vertex_order(G, order, seed);
                ColoringResult star = coloring(A, {Structure::Symmetric}, {order, Decompression::Direct, seed});
                ColoringResult acyclic = coloring(A, {Structure::Symmetric}, {order, Decompression::Substitution, seed});

                CHECK(star.ncolors() >= min_star);
                CHECK(acyclic.ncolors() >= min_acyclic);
                CHECK(star.colors() == star_coloring(G, p));
            }
        }
    }
}


TEST_CASE("Coloring entry point", "[coloring][ColoringResult]")
{
    SECTION("Column partition") {
        ColoringResult result = coloring(tutorial_pattern());

        CHECK(result.colors() == std::vector<csint>{0, 0, 1, 0, 1, 2});
        CHECK(result.ncolors() == 3);
        CHECK(result.compressed_size() == 4);
        CHECK(result.color_groups() == std::vector<std::vector<csint>>{{0, 1, 3}, {2, 4}, {5}});
        CHECK(result.decompression() == Decompression::Direct);
        CHECK(result.pattern().is_symbolic());

        auto seeds = result.seeds();
        REQUIRE(seeds.size() == 3);
        CHECK(seeds[0] == std::vector<double>{1, 1, 0, 1, 0, 0});
        CHECK(seeds[2] == std::vector<double>{0, 0, 0, 0, 0, 1});
    }

    SECTION("Row partition") {
        ColoringResult result = coloring(
            tutorial_pattern(),
            {Structure::Nonsymmetric, Partition::Row}
        );

        CHECK(result.colors() == std::vector<csint>{0, 0, 1, 2});
        CHECK(result.compressed_size() == 6);
        CHECK(result.seeds()[0] == std::vector<double>{1, 1, 0, 0});
    }

    SECTION("Values of the input are ignored") {
        ColoringResult A = coloring(banded_jacobian());
        ColoringResult B = coloring(banded_jacobian().pattern());

        CHECK(A.colors() == B.colors());
        CHECK(A.pattern().indices() == B.pattern().indices());
        CHECK(A.color_groups() == std::vector<std::vector<csint>>{{0, 2}, {1, 3, 4}});
    }

    SECTION("Symmetric, direct") {
        ColoringResult result = coloring(ijkl_hessian(), {Structure::Symmetric});

        CHECK(result.colors() == std::vector<csint>{0, 1, 1, 2});
        CHECK(result.compressed_size() == 4);
        CHECK(result.substitution_plan().empty());
        CHECK(result.direct_plan().size() == 10);
    }

    SECTION("Symmetric, substitution") {
        ColoringResult result = coloring(
            tridiagonal(4),
            {Structure::Symmetric},
            {VertexOrder::Natural, Decompression::Substitution}
        );

        CHECK(result.colors() == std::vector<csint>{0, 1, 0, 1});
        CHECK(result.ncolors() == 2);
        CHECK_FALSE(result.substitution_plan().empty());
    }

    SECTION("Empty pattern") {
        ColoringResult result = coloring(CSCMatrix({}, {}, {0, 0, 0}, {3, 2}));

        CHECK(result.ncolors() == 1);
        CHECK(result.colors() == std::vector<csint>{0, 0});
    }

    SECTION("Printing") {
        ColoringResult result = coloring(ijkl_hessian(), {Structure::Symmetric});

        std::string expect =
            "<SparseDiff Coloring of a (4, 4) pattern\n"
            "        with 3 colors, star coloring, direct>\n"
            "0: [0]\n"
            "1: [1, 2]\n"
            "2: [3]";

        CHECK(result.to_string() == expect);

        std::stringstream s;
        s << result;
        CHECK(s.str() == expect + "\n");
    }
}


TEST_CASE("Coloring errors", "[coloring][errors]")
{
    SECTION("Symmetric coloring of a non-square pattern") {
        CHECK_THROWS_AS(
            coloring(tutorial_pattern(), {Structure::Symmetric}),
            InvalidStructure
        );
    }

    SECTION("Symmetric coloring of a nonsymmetric pattern") {
        CSCMatrix L = COOMatrix({}, {0, 1, 1}, {0, 0, 1}, {2, 2}).tocsc();
        CHECK_THROWS_AS(coloring(L, {Structure::Symmetric}), InvalidStructure);
    }

    SECTION("Missing diagonal") {
        CHECK_THROWS_AS(
            coloring(ijkl_hessian().drop_diagonal(), {Structure::Symmetric}),
            PreconditionViolated
        );
    }

    SECTION("Symmetric problem with a row partition") {
        CHECK_THROWS_AS(
            coloring(ijkl_hessian(), {Structure::Symmetric, Partition::Row}),
            PreconditionViolated
        );
    }

    SECTION("Substitution for a nonsymmetric problem") {
        CHECK_THROWS_AS(
            coloring(
                tutorial_pattern(),
                {Structure::Nonsymmetric, Partition::Column},
                {VertexOrder::Natural, Decompression::Substitution}
            ),
            PreconditionViolated
        );
    }

    SECTION("Invalid colors are rejected by the result") {
        // Columns 2 and 3 share row 0
        CHECK_THROWS_AS(
            ColoringResult(tutorial_pattern(), {0, 0, 0, 0, 0, 0}, {}, {}),
            std::logic_error
        );

        // A proper coloring of a path on 4 vertices that is not a star coloring
        CHECK_THROWS_AS(
            ColoringResult(tridiagonal(4), {0, 1, 0, 1}, {Structure::Symmetric}, {}),
            std::logic_error
        );
    }

    SECTION("A valid coloring is accepted") {
        ColoringResult result(tutorial_pattern(), {0, 1, 2, 3, 4, 5}, {}, {});
        CHECK(result.ncolors() == 6);
    }
}


}  // namespace sd

/*==============================================================================
 *============================================================================*/
