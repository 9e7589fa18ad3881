/*==============================================================================
 *     File: test_tracer.cpp
 *  Created: 2025-06-03 09:41
 *
 *  Description: Test IndexSet and the propagation rules of the tracers.
 *
 *============================================================================*/

#include <catch2/catch_test_macros.hpp>

#include <cmath>
#include <sstream>
#include <string>
#include <vector>

#include "sparsediff.h"
#include "test_helpers.h"

namespace sd {


TEST_CASE("IndexSet", "[IndexSet]")
{
    SECTION("Empty set") {
        IndexSet s;
        CHECK(s.empty());
        CHECK(s.count() == 0);
        CHECK(s.to_vector().empty());
        CHECK_FALSE(s.contains(0));
    }

    SECTION("Insert across words") {
        IndexSet s(10);
        s.insert(3).insert(64).insert(130);

        CHECK(s.count() == 3);
        CHECK(s.contains(64));
        CHECK_FALSE(s.contains(63));
        CHECK_FALSE(s.contains(-1));
        CHECK(s.to_vector() == std::vector<csint>{3, 64, 130});
    }

    SECTION("Negative index") {
        IndexSet s;
        CHECK_THROWS_AS(s.insert(-1), std::out_of_range);
        CHECK_THROWS_AS(IndexSet(-1), std::invalid_argument);
    }

    SECTION("Union") {
        IndexSet a = IndexSet::singleton(1);
        IndexSet b = IndexSet::singleton(100);

        IndexSet c = a | b;
        CHECK(c.to_vector() == std::vector<csint>{1, 100});

        a |= b;
        CHECK(a == c);
    }

    SECTION("Equality ignores capacity") {
        IndexSet a = IndexSet::singleton(200);
        a.clear();
        a.insert(2);

        CHECK(a == IndexSet::singleton(2));

        IndexSet b = IndexSet::singleton(2) | IndexSet::singleton(150);
        IndexSet c = IndexSet::singleton(2);
        CHECK_FALSE(b == c);
    }

    SECTION("Printing") {
        std::stringstream s;
        s << (IndexSet::singleton(0) | IndexSet::singleton(1)) << " " << IndexSet();
        CHECK(s.str() == "{0, 1} {}");
    }
}


TEST_CASE("Operator traits", "[tracer][traits]")
{
    SECTION("Table lookup") {
        CHECK(traits(UnaryOp::Sin).name == "sin");
        CHECK_FALSE(traits(UnaryOp::Sin).der1_zero);
        CHECK(traits(UnaryOp::Floor).der1_zero);
        CHECK(traits(UnaryOp::Abs).der2_zero);

        CHECK(traits(BinaryOp::Mul).name == "*");
        CHECK_FALSE(traits(BinaryOp::Mul).cross_zero);
        CHECK(traits(BinaryOp::Mul).der2_zero_a);
        CHECK(traits(BinaryOp::Div).der2_zero_a);
        CHECK_FALSE(traits(BinaryOp::Div).der2_zero_b);
        CHECK(traits(BinaryOp::Less).der1_zero_a);
    }

    SECTION("Every enumerator has an entry") {
        for (std::size_t k = 0; k < unary_op_traits.size(); k++) {
            CHECK_NOTHROW(traits(static_cast<UnaryOp>(k)));
        }
        for (std::size_t k = 0; k < binary_op_traits.size(); k++) {
            CHECK_NOTHROW(traits(static_cast<BinaryOp>(k)));
        }
    }

    SECTION("Invalid operation id") {
        CHECK_THROWS_AS(traits(static_cast<UnaryOp>(99)), UnsupportedOperation);
        CHECK_THROWS_AS(traits(static_cast<BinaryOp>(99)), UnsupportedOperation);
        CHECK_THROWS_AS(apply(static_cast<UnaryOp>(99), 1.0), UnsupportedOperation);
    }

    SECTION("Evaluation") {
        CHECK(apply(UnaryOp::Neg, 2.0) == -2.0);
        CHECK(apply(UnaryOp::Sign, -3.0) == -1.0);
        CHECK(apply(UnaryOp::Square, 3.0) == 9.0);
        CHECK(apply(BinaryOp::Pow, 2.0, 3.0) == 8.0);
        CHECK(apply(BinaryOp::Min, 2.0, 3.0) == 2.0);
        CHECK(apply(BinaryOp::Less, 2.0, 3.0) == 1.0);
        CHECK(apply(BinaryOp::Equal, 2.0, 3.0) == 0.0);
    }
}


TEST_CASE("GradientTracer propagation", "[tracer][GradientTracer]")
{
    auto x0 = GradientTracer::input(0);
    auto x1 = GradientTracer::input(1);
    auto x2 = GradientTracer::input(2);

    using V = std::vector<csint>;

    SECTION("Arithmetic") {
        CHECK((x0 * x1).gradient().to_vector() == V{0, 1});
        CHECK((x0 - x2).gradient().to_vector() == V{0, 2});
        CHECK((x0 / x1).gradient().to_vector() == V{0, 1});
        CHECK((-x1).gradient().to_vector() == V{1});
    }

    SECTION("Constants") {
        CHECK((x0 + 2.0).gradient().to_vector() == V{0});
        CHECK((2.0 * x1).gradient().to_vector() == V{1});
        CHECK(GradientTracer(3.0).gradient().empty());

        GradientTracer y = 1.0;
        y += x2;
        y *= x0;
        CHECK(y.gradient().to_vector() == V{0, 2});
    }

    SECTION("Math functions") {
        CHECK(sin(x2).gradient().to_vector() == V{2});
        CHECK(exp(x0 * x1).gradient().to_vector() == V{0, 1});
        CHECK(pow(x0, 2.0).gradient().to_vector() == V{0});
        CHECK(hypot(x0, x2).gradient().to_vector() == V{0, 2});
        CHECK(min(x0, x2).gradient().to_vector() == V{0, 2});
    }

    SECTION("Locally constant functions") {
        CHECK(floor(x0).gradient().empty());
        CHECK(sign(x0 * x1).gradient().empty());
        CHECK((round(x0) + x1).gradient().to_vector() == V{1});
    }

    SECTION("Comparisons and selection") {
        GradientTracer c = (x0 < x1);
        CHECK(c.gradient().empty());
        CHECK(ifelse(x0 < x1, x0, x2).gradient().to_vector() == V{0, 2});
    }

    SECTION("Branching and conversion throw") {
        CHECK_THROWS_AS(static_cast<bool>(x0 > x1), UnsupportedOperation);
        CHECK_THROWS_AS(static_cast<double>(x0), UnsupportedOperation);
    }

    SECTION("Printing") {
        std::stringstream s;
        s << x0 * x1;
        CHECK(s.str() == "GradientTracer({0, 1})");
    }
}


TEST_CASE("HessianTracer propagation", "[tracer][HessianTracer]")
{
    auto x0 = HessianTracer::input(0);
    auto x1 = HessianTracer::input(1);
    auto x2 = HessianTracer::input(2);

    using V = std::vector<csint>;

    SECTION("Linear functions have no Hessian") {
        HessianTracer y = x0 + 3.0 * x1 - x2;
        CHECK(y.gradient().to_vector() == V{0, 1, 2});
        CHECK(y.hessian().empty());
    }

    SECTION("Product has only the cross term") {
        HessianTracer y = x0 * x1;
        CHECK(y.hessian_row(0).to_vector() == V{1});
        CHECK(y.hessian_row(1).to_vector() == V{0});
        CHECK(y.hessian_row(2).empty());
    }

    SECTION("Square has a diagonal term") {
        HessianTracer y = x0 * x0;
        CHECK(y.hessian_row(0).to_vector() == V{0});
        CHECK(square(x1).hessian_row(1).to_vector() == V{1});
    }

    SECTION("Nonlinear unary functions") {
        HessianTracer y = exp(x0 + x1);
        CHECK(y.hessian_row(0).to_vector() == V{0, 1});
        CHECK(y.hessian_row(1).to_vector() == V{0, 1});
    }

    SECTION("Division is nonlinear in the denominator") {
        HessianTracer y = x0 / x1;
        CHECK(y.hessian_row(0).to_vector() == V{1});
        CHECK(y.hessian_row(1).to_vector() == V{0, 1});
    }

    SECTION("Piecewise linear functions keep the operand's Hessian") {
        HessianTracer y = abs(x0 * x1) + x2;
        CHECK(y.gradient().to_vector() == V{0, 1, 2});
        CHECK(y.hessian_row(0).to_vector() == V{1});
        CHECK(y.hessian_row(1).to_vector() == V{0});
        CHECK(y.hessian_row(2).empty());
    }

    SECTION("Locally constant functions drop everything") {
        HessianTracer y = sign(x0 * x1);
        CHECK(y.gradient().empty());
        CHECK(y.hessian().empty());
    }

    SECTION("Composition") {
        // sin(x0 * x1) * x2
        HessianTracer y = sin(x0 * x1) * x2;
        CHECK(y.hessian_row(0).to_vector() == V{0, 1, 2});
        CHECK(y.hessian_row(1).to_vector() == V{0, 1, 2});
        CHECK(y.hessian_row(2).to_vector() == V{0, 1});
    }

    SECTION("Printing") {
        std::stringstream s;
        s << x0 * x1;
        CHECK(s.str() == "HessianTracer({0, 1}, {0: {1}, 1: {0}})");
    }
}


TEST_CASE("Dual numbers", "[tracer][Dual]")
{
    using V = std::vector<csint>;

    SECTION("Gradient") {
        auto x = Dual<GradientTracer>::input(2.0, 0);
        auto y = Dual<GradientTracer>::input(3.0, 1);

        auto z = x * y + 1.0;
        CHECK(z.primal() == 7.0);
        CHECK(z.tracer().gradient().to_vector() == V{0, 1});
        CHECK(static_cast<double>(z) == 7.0);
    }

    SECTION("Comparisons use the primal value") {
        auto x = Dual<GradientTracer>::input(2.0, 0);
        auto y = Dual<GradientTracer>::input(3.0, 1);

        CHECK(x < y);
        CHECK(y >= x);
        CHECK_FALSE(x == y);
        CHECK(ifelse(x > y, x, y).tracer().gradient().to_vector() == V{1});
    }

    SECTION("Min and max keep the selected argument") {
        auto x = Dual<GradientTracer>::input(2.0, 0);
        auto y = Dual<GradientTracer>::input(3.0, 1);

        CHECK(min(x, y).primal() == 2.0);
        CHECK(min(x, y).tracer().gradient().to_vector() == V{0});
        CHECK(max(x, y).tracer().gradient().to_vector() == V{1});
    }

    SECTION("Min and max keep both arguments at a tie") {
        auto x = Dual<GradientTracer>::input(2.0, 0);
        auto y = Dual<GradientTracer>::input(2.0, 1);

        CHECK(min(x, y).primal() == 2.0);
        CHECK(min(x, y).tracer().gradient().to_vector() == V{0, 1});
        CHECK(max(x, y).tracer().gradient().to_vector() == V{0, 1});

        auto u = Dual<HessianTracer>::input(1.0, 0);
        auto w = Dual<HessianTracer>::input(1.0, 1);
        auto z = max(u * u, w);
        CHECK(z.tracer().gradient().to_vector() == V{0, 1});
        CHECK(z.tracer().hessian_row(0).to_vector() == V{0});
    }

    SECTION("Hessian") {
        auto x = Dual<HessianTracer>::input(0.5, 0);
        auto y = Dual<HessianTracer>::input(1.5, 1);

        auto z = x * x + y;
        CHECK(z.primal() == 1.75);
        CHECK(z.tracer().hessian_row(0).to_vector() == V{0});
        CHECK(z.tracer().hessian_row(1).empty());
    }
}


}  // namespace sd

/*==============================================================================
 *============================================================================*/
