/*==============================================================================
 *     File: sparse_matrix.cpp
 *  Created: 2025-05-09 10:17
 *
 *  Description: Implements the abstract SparseMatrix class.
 *
 *============================================================================*/

#include <algorithm>  // max
#include <cmath>      // fabs, isfinite
#include <format>
#include <iostream>
#include <sstream>
#include <string>

#include "sparse_matrix.h"


namespace sd {


// default destructor
SparseMatrix::~SparseMatrix() = default;


std::string SparseMatrix::to_string(bool verbose, csint threshold) const
{
    auto [M, N] = shape();
    csint nnz_ = nnz();
    std::stringstream ss;

    ss << std::format(
        "<SparseDiff {} matrix\n"
        "        with {} stored elements and shape ({}, {})>",
        get_format_desc_(), nnz_, M, N);

    if (verbose && nnz_ > 0) {
        ss << std::endl;
        if (nnz_ < threshold) {
            // Print all elements
            write_elems_(ss, 0, nnz_);
        } else {
            // Print just the first and last Nelems non-zero elements
            int Nelems = 3;
            write_elems_(ss, 0, Nelems);
            ss << "\n...\n";
            write_elems_(ss, nnz_ - Nelems, nnz_);
        }
    }

    return ss.str();
}


void SparseMatrix::write_elem_(
    std::stringstream& ss,
    csint i,
    csint j,
    const double* v,
    bool use_scientific
) const
{
    auto [M, N] = shape();

    // Compute index width from maximum index
    int row_width = std::to_string(std::max(M - 1, 0)).size();
    int col_width = std::to_string(std::max(N - 1, 0)).size();

    ss << std::format("({:>{}d}, {:>{}d})", i, row_width, j, col_width);

    if (v == nullptr) {
        return;  // symbolic
    }

    // Leading space aligns for "-" signs
    if (use_scientific) {
        ss << std::format(": {: .4e}", *v);
    } else {
        ss << std::format(": {: .4g}", *v);
    }
}


/** Decide on scientific notation from the largest finite value. */
bool use_scientific_notation(const std::vector<double>& v)
{
    double abs_max = 0.0;
    for (const auto& val : v) {
        if (std::isfinite(val)) {
            abs_max = std::max(abs_max, std::fabs(val));
        }
    }

    return (abs_max < 1e-4 || abs_max > 1e4);
}


}  // namespace sd


/*==============================================================================
 *============================================================================*/
