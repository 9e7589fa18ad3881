//==============================================================================
//    File: csc.h
// Created: 2024-10-09 20:57
//
//  Description: Implements the compressed sparse column matrix class. A
//    CSCMatrix without values is a symbolic matrix, i.e. a sparsity pattern.
//
//==============================================================================

#ifndef _SPARSEDIFF_CSC_H_
#define _SPARSEDIFF_CSC_H_

#include <functional>
#include <iostream>
#include <span>
#include <string>
#include <string_view>
#include <sstream>
#include <vector>

#include "types.h"
#include "sparse_matrix.h"

namespace sd {

class CSCMatrix : public SparseMatrix
{
    // Private members
    static constexpr std::string_view format_desc_ = "Compressed Sparse Column";
    std::vector<double> v_;  // numerical values, size nzmax (empty if symbolic)
    std::vector<csint> i_;   // row indices, size nzmax
    std::vector<csint> p_;   // column pointers (CSC size N_);
    csint M_ = 0;            // number of rows
    csint N_ = 0;            // number of columns
    bool has_sorted_indices_ = false;
    bool has_canonical_format_ = false;

    virtual std::string_view get_format_desc_() const override
    {
        return format_desc_;
    }

    virtual void write_elems_(std::stringstream& ss, csint start, csint end) const override;

    /** Check whether every column is sorted. */
    bool test_sorted_() const;

    public:
        friend class COOMatrix;

        /**
         * @typedef KeepFunc
         * @brief A boolean function pointer type that acts on an element of
         * a matrix.
         *
         * This type is used by the function `CSCMatrix::fkeep`. If `fk` returns
         * `true` for `A(i, j)`, that element will be kept in the matrix.
         *
         * @param i, j  the row and column indices of the element
         * @param Aij  the value of the element `A(i, j)`, or 1.0 if the
         *        matrix is symbolic.
         *
         * @return keep  a boolean that is true if the element `A(i, j)` should
         *         be kept in the matrix.
         */
        using KeepFunc = std::function<bool(csint i, csint j, double Aij)>;

        //----------------------------------------------------------------------
        //        Constructors
        //----------------------------------------------------------------------
        CSCMatrix();

        /** Construct a CSCMatrix from arrays of values and coordinates.
         *
         * @param data the values of the entries in the matrix. May be empty
         *        for a symbolic matrix.
         * @param indices row indices of each element.
         * @param indptr array indices of the start of each column in `indices`. The
         *        first `indptr` element is always 0.
         * @param shape  the dimensions of the matrix
         *
         * @return a new CSCMatrix object
         */
        CSCMatrix(
            const std::vector<double>& data,
            const std::vector<csint>& indices,
            const std::vector<csint>& indptr,
            const Shape& shape
        );

        /** Allocate a CSCMatrix for a given shape and number of non-zeros.
         *
         * @param shape  the dimensions of the matrix
         * @param nzmax integer capacity of space to reserve for non-zeros
         * @param values if `true`, allocate space for the values array
         */
        CSCMatrix(const Shape& shape, csint nzmax=0, bool values=true);

        /** Convert a coordinate format matrix to a compressed sparse column
         * matrix in canonical format.
         *
         * The columns are guaranteed to be sorted, no duplicates are allowed,
         * and no numerically zero entries are allowed.
         *
         * This function takes O(M + N + nnz) time.
         *
         * @return a copy of the `COOMatrix` in canonical CSC format.
         */
        CSCMatrix(const COOMatrix& A);

        /** Create a sparse copy of a dense matrix.
         *
         * @param A a dense matrix
         * @param shape the size of the matrix
         * @param order the order of `A`, 'F' (column-major) or 'C' (row-major)
         *
         * @return C a compressed sparse column version of the matrix
         */
        CSCMatrix(
            const std::vector<double>& A,
            const Shape& shape,
            const char order='F'
        );

        /** Reallocate a CSCMatrix to a new number of non-zeros.
         *
         * @param nzmax  maximum number of non-zeros. If `nzmax <= 0`,
         *        then `nzmax` will be set to `nnz()`.
         */
        void realloc(csint nzmax=0);

        //----------------------------------------------------------------------
        //        Accessors
        //----------------------------------------------------------------------
        virtual csint nnz() const override;    // number of non-zeros
        virtual csint nzmax() const override;  // maximum number of non-zeros
        virtual Shape shape() const override;  // the dimensions of the matrix

        const std::vector<csint>& indices() const;     // indices and data
        const std::vector<csint>& indptr() const;
        virtual const std::vector<double>& data() const override;

        /** Return the row indices of column `j`. */
        std::span<const csint> column(csint j) const;

        /** Return true if the matrix has no values. */
        bool is_symbolic() const;

        /** Convert a CSCMatrix to canonical format in-place.
         *
         * The columns are guaranteed to be sorted, no duplicates are allowed,
         * and no numerically zero entries are allowed.
         *
         * @return a reference to itself for method chaining.
         */
        CSCMatrix& to_canonical();

        /** Return the sparsity pattern of the matrix.
         *
         * The pattern is a symbolic matrix in canonical format: columns are
         * sorted and duplicates are merged. Every stored entry is structural,
         * including explicit zeros.
         *
         * @return a symbolic copy of the matrix.
         */
        CSCMatrix pattern() const;

        bool has_sorted_indices() const;
        bool has_canonical_format() const;

        /** Returns true if `A(i, j) == A(j, i)` for all `i, j`.
        *
        * @return true if the matrix is numerically symmetric.
        */
        bool is_symmetric() const;

        /** Returns true if `A(i, j)` is stored iff `A(j, i)` is stored.
         *
         * @return true if the pattern of the matrix is symmetric.
         */
        bool is_structurally_symmetric() const;

        /** Returns true if the matrix is square and every diagonal entry is
         * stored.
         */
        bool has_full_diagonal() const;

        /** Return the value of the requested element.
         *
         * This function takes O(log M) time if the columns are sorted, and O(M) time
         * if they are not.
         *
         * @param i, j the row and column indices of the element to access.
         *
         * @return the value of the element at `(i, j)`, or 1.0 for a stored
         *         element of a symbolic matrix.
         */
        double operator()(csint i, csint j) const;

        //----------------------------------------------------------------------
        //        Format Conversions
        //----------------------------------------------------------------------
        /** Convert a compressed sparse column matrix to a coordinate (triplet)
         * format matrix.
         *
         * @return a copy of the `CSCMatrix` in COO (triplet) format.
         */
        COOMatrix tocoo() const;

        virtual std::vector<double> to_dense_vector(const char order='F') const override;

        /** Transpose the matrix as a copy.
        *
        * This function takes
        *   - O(N) extra space for the workspace
        *   - O(M + N + nnz) time
        *
        * @param values if `true`, copy the values array.
        *
        * @return new CSCMatrix object with transposed rows and columns.
        */
        CSCMatrix transpose(bool values=true) const;
        CSCMatrix T() const;  // transpose a copy (alias)

        /** Sort rows and columns in place via two transposes.
         *
         * This function takes O(M) extra space and O(M * N + nnz) time.
         *
         * @return A  a reference to the matrix, now with sorted columns.
         */
        CSCMatrix& sort();

        /** Sum duplicate entries in place.
         *
         * Duplicates of a symbolic matrix are merged.
         *
         * @return a reference to the object for method chaining
         */
        CSCMatrix& sum_duplicates();

        /** Keep matrix entries for which `fkeep` returns true, remove others.
        *
        * @param fk  a boolean function that acts on each element. If `fk`
        *        returns `true`, that element will be kept in the matrix.
        *
        * @return a reference to the object for method chaining.
        */
        CSCMatrix& fkeep(KeepFunc fk);

        /** Keep matrix entries for which `fkeep` returns true, remove others.
        *
        * @return a copy of the matrix with entries removed.
        */
        CSCMatrix fkeep(KeepFunc fk) const;

        /** Drop any exactly zero entries from the matrix.
         *
         * @return a reference to the object for method chaining
         */
        CSCMatrix& dropzeros();

        /** Drop the diagonal entries of the matrix.
         *
         * @return a copy of the matrix without its diagonal.
         */
        CSCMatrix drop_diagonal() const;

        /** Add any missing diagonal entries to a square matrix.
         *
         * New entries of a numeric matrix have the value `v`.
         *
         * @return a copy of the matrix with a full diagonal.
         */
        CSCMatrix add_diagonal(double v=1.0) const;

        //----------------------------------------------------------------------
        //        Math Operations
        //----------------------------------------------------------------------
        /** Matrix-vector right-multiply `y = A x`. */
        virtual std::vector<double> dot(const std::vector<double>& x) const override;

        /** Matrix-vector left-multiply `y = A^T x`, without forming `A^T`. */
        std::vector<double> tdot(const std::vector<double>& x) const;

        /** Matrix-matrix multiplication `C = A B`.
         *
         * If either matrix is symbolic, the result is symbolic.
         */
        CSCMatrix dot(const CSCMatrix& B) const;

        /** Matrix-matrix addition `C = A + B`.
         *
         * If either matrix is symbolic, the result is symbolic.
         */
        CSCMatrix add(const CSCMatrix& B) const;

        /** Compute `x += beta * A(:, j)`.
         *
         * This function also updates `w`, sets the sparsity pattern in `C._i`,
         * and returns updated `nz`.
         *
         * @param j  column index of `A`
         * @param beta  scalar value by which to multiply `A`
         * @param[in,out] w, x  workspace vectors of row indices and values. If
         *        `x` is not given, only the pattern is computed.
         * @param mark  separator index for `w`. All `w[i] < mark` are row
         *        indices that are not yet in `Cj`.
         * @param[in,out] C  output matrix whose pattern is updated
         * @param nz  current number of non-zeros in `C`.
         *
         * @return nz  updated number of non-zeros in `C`.
         */
        csint scatter(
            csint j,
            double beta,
            std::vector<csint>& w,
            OptionalVectorRef<double> x,
            csint mark,
            CSCMatrix& C,
            csint nz
        ) const;

        //----------------------------------------------------------------------
        //        Other
        //----------------------------------------------------------------------
        /** Check a matrix for valid compressed sparse column format.
         *
         * @param sorted  if true, check if the columns are sorted.
         * @param values  if true, check if the values exist and are all non-zero.
         *
         * @return true if matrix is valid compressed sparse column format.
         *
         * @throws std::runtime_error with a description of the first problem
         */
        bool is_valid(const bool sorted=true, const bool values=false) const;

};  // class CSCMatrix


/*------------------------------------------------------------------------------
 *          Operators
 *----------------------------------------------------------------------------*/
std::vector<double> operator*(const CSCMatrix& A, const std::vector<double>& x);
CSCMatrix operator*(const CSCMatrix& A, const CSCMatrix& B);
CSCMatrix operator+(const CSCMatrix& A, const CSCMatrix& B);


}  // namespace sd

#endif  // _SPARSEDIFF_CSC_H_

//==============================================================================
//==============================================================================
