/*==============================================================================
 *     File: detection.cpp
 *  Created: 2025-06-03 20:16
 *
 *  Description: Extract sparsity patterns from traced outputs.
 *
 *============================================================================*/

#include <format>
#include <stdexcept>
#include <string>

#include "coo.h"
#include "detection.h"

namespace sd {


CSCMatrix gradient_pattern(const std::vector<GradientTracer>& y, csint n)
{
    csint M = y.size();

    csint nz = 0;
    for (const auto& t : y) {
        nz += t.gradient().count();
    }

    COOMatrix S({M, n}, nz);

    for (csint j = 0; j < M; j++) {
        for (const auto& i : y[j].gradient().to_vector()) {
            if (i >= n) {
                throw std::out_of_range(
                    std::format("Dependency on input {} outside of {} inputs.", i, n)
                );
            }
            S.insert(j, i);
        }
    }

    return S.tocsc();
}


CSCMatrix hessian_pattern(const HessianTracer& y, csint n)
{
    COOMatrix H({n, n});

    for (const auto& [i, row] : y.hessian()) {
        for (const auto& j : row.to_vector()) {
            if (i >= n || j >= n) {
                throw std::out_of_range(
                    std::format("Hessian entry ({}, {}) outside of {} inputs.", i, j, n)
                );
            }
            H.insert(i, j);
        }
    }

    return H.tocsc();
}


}  // namespace sd

/*==============================================================================
 *============================================================================*/
