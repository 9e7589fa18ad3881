/*==============================================================================
 *     File: demo3.cpp
 *  Created: 2025-05-06 14:02
 *
 *  Description: Detect, color, and evaluate the sparse Jacobian of a chained
 *  function and the sparse Hessian of the Rosenbrock function.
 *
 *============================================================================*/

#include <cmath>
#include <cstdlib>   // EXIT_SUCCESS
#include <iostream>
#include <vector>

#include "sparsediff.h"
#include "demo.h"

using namespace sd;


// f_i(x) = x_i^2 x_{i+1}, i = 0..n-2
template <typename T>
std::vector<T> chain(const std::vector<T>& x)
{
    std::vector<T> y;
    for (std::size_t i = 0; i + 1 < x.size(); i++) {
        y.push_back(x[i] * x[i] * x[i + 1]);
    }
    return y;
}


// sum_i 100 (x_{i+1} - x_i^2)^2 + (1 - x_i)^2
template <typename T>
T rosenbrock(const std::vector<T>& x)
{
    T f = 0.0;
    for (std::size_t i = 0; i + 1 < x.size(); i++) {
        T a = x[i + 1] - x[i] * x[i];
        T b = 1.0 - x[i];
        f += 100.0 * a * a + b * b;
    }
    return f;
}


int main(void)
{
    const csint N = 8;
    std::vector<double> x(N);
    for (csint i = 0; i < N; i++) {
        x[i] = 0.5 + 0.1 * i;
    }

    //--------------------------------------------------------------------------
    //        Jacobian
    //--------------------------------------------------------------------------
    CSCMatrix S = jacobian_sparsity(
        [](const auto& v) { return chain(v); },
        x
    );
    std::cout << "Jacobian pattern:\n";
    S.print_dense();

    ColoringResult jac = coloring(S);
    std::cout << jac << std::endl;

    // J s, by hand
    ProductFunc jvp = [&x](const std::vector<double>& s) {
        std::vector<double> out(x.size() - 1);
        for (std::size_t i = 0; i + 1 < x.size(); i++) {
            out[i] = 2 * x[i] * x[i + 1] * s[i] + x[i] * x[i] * s[i + 1];
        }
        return out;
    };

    CSCMatrix J = sparse_jacobian(jvp, jac);
    std::cout << "Jacobian:\n";
    J.print_dense();

    //--------------------------------------------------------------------------
    //        Hessian
    //--------------------------------------------------------------------------
    CSCMatrix H_pattern = hessian_sparsity(
        [](const auto& v) { return rosenbrock(v); },
        x
    );
    std::cout << "Hessian pattern:\n";
    H_pattern.print_dense();

    for (Decompression decompression : {Decompression::Direct, Decompression::Substitution}) {
        ColoringResult hess = coloring(
            H_pattern,
            {Structure::Symmetric},
            {VertexOrder::Natural, decompression}
        );
        std::cout << hess << std::endl;

        // H s, by hand
        ProductFunc hvp = [&x](const std::vector<double>& s) {
            std::vector<double> out(x.size(), 0.0);
            for (std::size_t i = 0; i + 1 < x.size(); i++) {
                double hii = 1200 * x[i] * x[i] - 400 * x[i + 1] + 2;
                double hij = -400 * x[i];
                out[i] += hii * s[i] + hij * s[i + 1];
                out[i + 1] += hij * s[i] + 200 * s[i + 1];
            }
            return out;
        };

        CSCMatrix H = sparse_hessian(hvp, hess);
        std::cout << "Hessian (" << decompression << "):\n";
        H.print_dense();
    }

    return EXIT_SUCCESS;
}


/*==============================================================================
 *============================================================================*/
