//==============================================================================
//     File: sparse_matrix.h
//  Created: 2025-05-08 20:41
//
//  Description: Header file for the abstract SparseMatrix class.
//
//==============================================================================

#ifndef _SPARSEDIFF_SPARSE_MATRIX_H_
#define _SPARSEDIFF_SPARSE_MATRIX_H_

#include <iostream>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

#include "types.h"
#include "utils.h"  // print_dense_vec

namespace sd {

/** Return true if values should be printed in scientific notation. */
bool use_scientific_notation(const std::vector<double>& v);


class SparseMatrix {
protected:
    /// A short description of the storage format, used when printing.
    virtual std::string_view get_format_desc_() const = 0;

    /** Print elements of the matrix between `start` and `end`.
     *
     * @param ss          the output string stream
     * @param start, end  print the all elements where `p ∈ [start, end)`,
     *        counting in storage order.
     */
    virtual void write_elems_(std::stringstream& ss, csint start, csint end) const = 0;

    /** Write a single element as `(i, j): v`.
     *
     * Symbolic matrices (no values) print only the coordinates.
     */
    void write_elem_(
        std::stringstream& ss,
        csint i,
        csint j,
        const double* v,
        bool use_scientific
    ) const;

public:
    /// Virtual destructor: essential for base classes when using polymorphism.
    virtual ~SparseMatrix();

    virtual csint nnz() const = 0;    // number of non-zeros
    virtual csint nzmax() const = 0;  // maximum number of non-zeros
    virtual Shape shape() const = 0;  // the dimensions of the matrix

    /// The numerical values. Empty for a symbolic matrix.
    virtual const std::vector<double>& data() const = 0;

    /// Matrix-vector right-multiply (see cs_multiply)
    virtual std::vector<double> dot(const std::vector<double>& x) const = 0;

    /// Convert the matrix to a dense array.
    ///
    /// Entries of a symbolic matrix are set to 1.0.
    ///
    /// @param order  the order of the array, either 'C' or 'F' for row-major or
    ///        column-major order.
    ///
    /// @return a copy of the matrix as a dense array.
    virtual std::vector<double> to_dense_vector(const char order='F') const = 0;

    // -------------------------------------------------------------------------
    //         Printing
    // -------------------------------------------------------------------------
    ///  Print the matrix in dense format.
    ///
    /// @param precision  the number of decimal places to print.
    /// @param suppress  if true, small values will be printed as "0".
    /// @param os  a reference to the output stream.
    virtual void print_dense(
        int precision=4,
        bool suppress=true,
        std::ostream& os=std::cout
    ) const
    {
        auto [M, N] = shape();
        print_dense_vec(to_dense_vector('F'), M, N, 'F', precision, suppress, os);
    }

    ///  Convert the matrix to a string.
    ///
    /// @param verbose     if True, print all non-zeros and their coordinates
    /// @param threshold   if `nnz > threshold`, print only the first and last
    ///        3 entries in the matrix. Otherwise, print all entries.
    virtual std::string to_string(
        bool verbose=false,
        csint threshold=1000
    ) const;

    ///  Print the matrix.
    ///
    /// @param os          the output stream, defaults to std::cout
    /// @param verbose     if True, print all non-zeros and their coordinates
    /// @param threshold   if `nz > threshold`, print only the first and last
    ///        3 entries in the matrix. Otherwise, print all entries.
    virtual void print(
        std::ostream& os=std::cout,
        bool verbose=false,
        csint threshold=1000
    ) const
    {
        os << to_string(verbose, threshold) << std::endl;
    }
};  // class SparseMatrix


// inline since it's defined in the header
inline std::ostream& operator<<(std::ostream& os, const SparseMatrix& A)
{
    A.print(os, true);  // verbose printing assumed
    return os;
}


}  // namespace sd

#endif  // _SPARSEDIFF_SPARSE_MATRIX_H_

//==============================================================================
//==============================================================================
