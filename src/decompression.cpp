/*==============================================================================
 *     File: decompression.cpp
 *  Created: 2025-06-11 10:02
 *
 *  Description: Implements compression and decompression with a coloring.
 *
 *============================================================================*/

#include <format>
#include <stdexcept>
#include <string>

#include "decompression.h"

namespace sd {

namespace {

std::vector<std::vector<double>> evaluate_products(
    const ProductFunc& product,
    const ColoringResult& result
)
{
    std::vector<std::vector<double>> B;
    B.reserve(result.ncolors());

    for (const auto& s : result.seeds()) {
        B.push_back(product(s));
    }

    return B;
}

}  // namespace


std::vector<std::vector<double>> compress(
    const CSCMatrix& A,
    const ColoringResult& result
)
{
    if (A.shape() != result.pattern().shape()) {
        throw std::invalid_argument("Matrix shape does not match the pattern!");
    }

    bool transposed = result.problem().structure == Structure::Nonsymmetric
                      && result.problem().partition == Partition::Row;

    std::vector<std::vector<double>> B;
    B.reserve(result.ncolors());

    for (const auto& s : result.seeds()) {
        B.push_back(transposed ? A.tdot(s) : A.dot(s));
    }

    return B;
}


CSCMatrix decompress(
    const std::vector<std::vector<double>>& B,
    const ColoringResult& result
)
{
    if (static_cast<csint>(B.size()) != result.ncolors()) {
        throw std::invalid_argument(
            std::format(
                "Expected {} compressed products, got {}.",
                result.ncolors(), B.size()
            )
        );
    }

    csint L = result.compressed_size();
    for (const auto& b : B) {
        if (static_cast<csint>(b.size()) != L) {
            throw std::invalid_argument(
                std::format(
                    "Compressed products must have length {}, got {}.", L, b.size()
                )
            );
        }
    }

    const CSCMatrix& S = result.pattern();
    const auto& plan = result.direct_plan();
    std::vector<double> values(S.nnz());

    // Entries read from a single compressed value
    for (csint p = 0; p < S.nnz(); p++) {
        if (plan[p].color >= 0) {
            values[p] = B[plan[p].color][plan[p].index];
        }
    }

    // Entries solved by peeling two-colored trees
    if (!result.substitution_plan().empty()) {
        auto R = B;  // residual products

        for (const auto& step : result.substitution_plan()) {
            double h = R[step.color_p][step.u];  // H(u, p)
            values[step.entry_up] = h;
            values[step.entry_pu] = h;
            R[step.color_u][step.p] -= h;
        }
    }

    return CSCMatrix(values, S.indices(), S.indptr(), S.shape());
}


CSCMatrix sparse_jacobian(const ProductFunc& product, const ColoringResult& result)
{
    if (result.problem().structure != Structure::Nonsymmetric) {
        throw std::invalid_argument("sparse_jacobian requires a nonsymmetric coloring.");
    }

    return decompress(evaluate_products(product, result), result);
}


CSCMatrix sparse_hessian(const ProductFunc& product, const ColoringResult& result)
{
    if (result.problem().structure != Structure::Symmetric) {
        throw std::invalid_argument("sparse_hessian requires a symmetric coloring.");
    }

    return decompress(evaluate_products(product, result), result);
}


}  // namespace sd

/*==============================================================================
 *============================================================================*/
