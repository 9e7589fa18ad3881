/*==============================================================================
 *     File: test_coomatrix.cpp
 *  Created: 2025-05-08 11:38
 *
 *  Description: Test COOMatrix constructors and other basic functions.
 *
 *============================================================================*/

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_all.hpp>

#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include "sparsediff.h"
#include "test_helpers.h"

namespace sd {


// 4 x 4 non-symmetric example. Davis, pp 7-8, Eqn (2.1)
static COOMatrix davis_example_small()
{
    std::vector<csint>  i = {2,    1,    3,    0,    1,    3,    3,    1,    0,    2};
    std::vector<csint>  j = {2,    0,    3,    2,    1,    0,    1,    3,    0,    1};
    std::vector<double> v = {3.0,  3.1,  1.0,  3.2,  2.9,  3.5,  0.4,  0.9,  4.5,  1.7};
    return COOMatrix {v, i, j};
}


TEST_CASE("COOMatrix Constructors", "[COOMatrix][constructor]")
{
    SECTION("Empty constructor") {
        COOMatrix A;

        CHECK(A.nnz() == 0);
        CHECK(A.nzmax() == 0);
        CHECK(A.shape() == Shape{0, 0});
    }

    SECTION("Make new from given shape") {
        COOMatrix A{{56, 37}};
        CHECK(A.nnz() == 0);
        CHECK(A.nzmax() == 0);
        CHECK(A.shape() == Shape{56, 37});
    }

    SECTION("Allocate new from shape and nzmax") {
        int nzmax = 1e4;
        COOMatrix A{{56, 37}, nzmax};
        CHECK(A.nnz() == 0);
        CHECK(A.nzmax() >= nzmax);
        CHECK(A.shape() == Shape{56, 37});
    }

    SECTION("From (v, i, j) literals") {
        std::vector<csint>  i{2,    1,    3,    0,    1,    3,    3,    1,    0,    2};
        std::vector<csint>  j{2,    0,    3,    2,    1,    0,    1,    3,    0,    1};
        std::vector<double> v{3.0,  3.1,  1.0,  3.2,  2.9,  3.5,  0.4,  0.9,  4.5,  1.7};
        COOMatrix A{v, i, j};

        CHECK(A.nnz() == 10);
        CHECK(A.nzmax() >= 10);
        CHECK(A.shape() == Shape{4, 4});
        CHECK(A.row() == i);
        CHECK(A.col() == j);
        CHECK(A.data() == v);
    }

    SECTION("Symbolic from (i, j) only") {
        COOMatrix A{{}, {0, 1, 2}, {1, 2, 0}, {3, 3}};

        CHECK(A.nnz() == 3);
        CHECK(A.data().empty());
        CHECK(A.shape() == Shape{3, 3});
    }

    SECTION("Inconsistent sizes") {
        CHECK_THROWS_AS(COOMatrix({1.0, 2.0}, {0, 1}, {0}), std::invalid_argument);
        CHECK_THROWS_AS(COOMatrix({1.0}, {0, 1}, {0, 1}), std::invalid_argument);
    }

    SECTION("Index out of bounds of the given shape") {
        CHECK_THROWS_AS(COOMatrix({1.0}, {3}, {0}, {3, 3}), std::runtime_error);
        CHECK_THROWS_AS(COOMatrix({1.0}, {0}, {3}, {3, 3}), std::runtime_error);
    }
}


TEST_CASE("COOMatrix methods", "[COOMatrix][methods]")
{
    auto A = davis_example_small();

    SECTION("Printing") {
        std::stringstream s;
        std::string expect;

        SECTION("Print short") {
            expect =
                "<SparseDiff COOrdinate Sparse matrix\n"
                "        with 10 stored elements and shape (4, 4)>\n";

            A.print(s);  // default verbose=false
        }

        SECTION("Print verbose") {
            expect =
                "<SparseDiff COOrdinate Sparse matrix\n"
                "        with 10 stored elements and shape (4, 4)>\n"
                "(2, 2):  3\n"
                "(1, 0):  3.1\n"
                "(3, 3):  1\n"
                "(0, 2):  3.2\n"
                "(1, 1):  2.9\n"
                "(3, 0):  3.5\n"
                "(3, 1):  0.4\n"
                "(1, 3):  0.9\n"
                "(0, 0):  4.5\n"
                "(2, 1):  1.7\n";

            SECTION("Print from function") {
                A.print(s, true);
            }

            SECTION("Print from operator<< overload") {
                s << A;
            }
        }

        REQUIRE(s.str() == expect);
    }

    SECTION("Insert an existing element to create a duplicate") {
        A.insert(3, 3, 56.0);

        REQUIRE(A.nnz() == 11);
        REQUIRE(A.nzmax() >= 11);
        REQUIRE(A.shape() == Shape{4, 4});
    }

    SECTION("Insert a new element that changes the dimensions") {
        A.insert(4, 3, 69.0);

        REQUIRE(A.nnz() == 11);
        REQUIRE(A.nzmax() >= 11);
        REQUIRE(A.shape() == Shape{5, 4});
    }

    SECTION("Pattern and value insertion do not mix") {
        CHECK_THROWS_AS(A.insert(0, 1), std::runtime_error);

        COOMatrix P;
        P.insert(0, 1);
        CHECK_THROWS_AS(P.insert(1, 0, 2.0), std::runtime_error);
    }

    SECTION("Tranpose") {
        auto A_T = A.transpose();
        auto A_TT = A.T();

        REQUIRE(A_T.row() == A.col());
        REQUIRE(A_T.col() == A.row());
        REQUIRE(A_T.row() == A_TT.row());
        REQUIRE(A_T.col() == A_TT.col());
        REQUIRE(&A != &A_T);
    }

    SECTION("Read from a stream") {
        std::stringstream ss(
            "2 2 3.0\n1 0 3.1\n3 3 1.0\n0 2 3.2\n1 1 2.9\n"
            "3 0 3.5\n3 1 0.4\n1 3 0.9\n0 0 4.5\n2 1 1.7\n"
        );
        auto F = COOMatrix::from_stream(ss);

        REQUIRE(A.row() == F.row());
        REQUIRE(A.col() == F.col());
        REQUIRE(A.data() == F.data());
    }

    SECTION("Read a malformed stream") {
        std::stringstream ss("0 0 1.0\n1 x\n");
        REQUIRE_THROWS_AS(COOMatrix::from_stream(ss), std::runtime_error);
    }

    SECTION("Conversion to dense array: Column-major") {
        std::vector<double> expect{
            4.5, 3.1, 0.0, 3.5,
            0.0, 2.9, 1.7, 0.4,
            3.2, 0.0, 3.0, 0.0,
            0.0, 0.9, 0.0, 1.0
        };

        REQUIRE(A.to_dense_vector() == expect);
        REQUIRE(A.to_dense_vector('F') == expect);
    }

    SECTION("Conversion to dense array: Row-major") {
        std::vector<double> expect{
            4.5, 0.0, 3.2, 0.0,
            3.1, 2.9, 0.0, 0.9,
            0.0, 1.7, 3.0, 0.0,
            3.5, 0.4, 0.0, 1.0
        };

        REQUIRE(A.to_dense_vector('C') == expect);
    }

    SECTION("Matrix-vector product") {
        std::vector<double> x{1, 2, 3, 4};
        std::vector<double> expect{14.1, 12.5, 12.4, 8.3};

        CHECK_THAT(is_close(A * x, expect, 1e-13), Catch::Matchers::AllTrue());
    }
}


TEST_CASE("COOMatrix random generation", "[COOMatrix][random]")
{
    SECTION("Generate random matrix") {
        double density = 0.25;
        csint M = 5, N = 10;
        unsigned int seed = 56;  // seed for reproducibility
        auto A = COOMatrix::random(M, N, density, seed);

        REQUIRE(A.shape() == Shape{M, N});
        REQUIRE(A.nnz() == (csint)(density * M * N));
    }

    SECTION("Generate random symmetric matrix") {
        auto A = COOMatrix::random_symmetric(20, 0.2, 56).tocsc();

        REQUIRE(A.shape() == Shape{20, 20});
        CHECK(A.is_symmetric());
        CHECK(A.has_full_diagonal());
    }
}


TEST_CASE("COOMatrix to CSC with duplicates", "[COOMatrix][tocsc]")
{
    SECTION("Numeric duplicates are summed") {
        COOMatrix A({1.0, 2.0, 3.0}, {0, 0, 1}, {0, 0, 1});
        CSCMatrix C = A.tocsc();

        CHECK(C.nnz() == 2);
        CHECK(C(0, 0) == 3.0);
        CHECK(C(1, 1) == 3.0);
    }

    SECTION("Symbolic duplicates are merged") {
        COOMatrix A({}, {0, 0, 1}, {0, 0, 1});
        CSCMatrix C = A.tocsc();

        CHECK(C.is_symbolic());
        CHECK(C.nnz() == 2);
        CHECK(C(0, 0) == 1.0);
    }
}


}  // namespace sd

/*==============================================================================
 *============================================================================*/
