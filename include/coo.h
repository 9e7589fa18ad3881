//==============================================================================
//    File: coo.h
// Created: 2024-10-01 21:08
//
//  Description: The coordinate (triplet) sparse matrix class, used to
//    assemble sparsity patterns before compression.
//
//==============================================================================

#ifndef _SPARSEDIFF_COO_H_
#define _SPARSEDIFF_COO_H_

#include <iostream>
#include <string>
#include <string_view>
#include <sstream>
#include <vector>

#include "types.h"
#include "sparse_matrix.h"


namespace sd {

class COOMatrix : public SparseMatrix
{
    // Private members
    static constexpr std::string_view format_desc_ = "COOrdinate Sparse";
    std::vector<double> v_;  // numerical values, size nzmax (may be empty)
    std::vector<csint> i_;   // row indices, size nzmax
    std::vector<csint> j_;   // column indices, size nzmax
    csint M_ = 0;            // number of rows
    csint N_ = 0;            // number of columns

    virtual std::string_view get_format_desc_() const override
    {
        return format_desc_;
    }

    virtual void write_elems_(std::stringstream& ss, csint start, csint end) const override;

    public:
        friend class CSCMatrix;

        //----------------------------------------------------------------------
        //        Constructors
        //----------------------------------------------------------------------
        COOMatrix();  // NOTE need default since we have others

        /** Construct a COOMatrix from arrays of values and coordinates.
         *
         * The entries are *not* sorted in any order, and duplicates are allowed.
         * Any duplicates will be summed upon conversion to CSC.
         *
         * @param vals  the values of the entries in the matrix. This vector may
         *        be empty to create a symbolic matrix of just nonzero indices.
         * @param rows, cols  the non-negative integer row and column indices of
         *        the values
         * @param shape  the dimensions of the matrix. If either dimension is
         *        0, it is inferred from the maximum index given.
         *
         * @return a new COOMatrix object
         *
         * @throws std::runtime_error if an index is out of bounds of `shape`
         * @throws std::invalid_argument if the array sizes are inconsistent
         */
        COOMatrix(
            const std::vector<double>& vals,
            const std::vector<csint>& rows,
            const std::vector<csint>& cols,
            const Shape shape=Shape{0, 0}
        );

        /** Allocate a COOMatrix for a given shape and number of non-zeros.
         *
         * @param shape  the dimensions of the matrix
         * @param nzmax  integer capacity of space to reserve for non-zeros
         */
        COOMatrix(const Shape& shape, csint nzmax=0);

        /** Convert a CSCMatrix to a COOMatrix, like Matlab's `find`.
         *
         * @param A a CSCMatrix.
         * @return C the equivalent matrix in triplet form.
         */
        COOMatrix(const CSCMatrix& A);

        /** Read a COOMatrix matrix from a file.
         *
         * The file is expected to be in "triplet format" `(i, j, v)`, where
         * `(i, j)` are the index coordinates, and `v` is the value to be
         * assigned.
         *
         * @param filename  the filename as a string
         *
         * @return A  a new COOMatrix object
         *
         * @throws std::runtime_error if file is not in triplet format
         */
        static COOMatrix from_file(const std::string& filename);

        /** Read a COOMatrix matrix from a stream in triplet format.
         *
         * @param fp  a reference to the input stream.
         *
         * @return A  a new COOMatrix object
         *
         * @throws std::runtime_error if the input is not in triplet format
         */
        static COOMatrix from_stream(std::istream& fp);

        /** Create a random sparse matrix.
         *
         * Values are drawn uniformly from the integers 1..9 so that products
         * and sums of entries are exact in floating point.
         *
         * @param M, N  the dimensions of the matrix
         * @param density  the fraction of non-zero elements
         * @param seed  the random seed. If 0, a random device is used.
         *
         * @return a random sparse matrix
         */
        static COOMatrix random(csint M, csint N, double density=0.1,
                                unsigned int seed=0);

        /** Create a random symmetric sparse matrix with a full diagonal.
         *
         * Each off-diagonal pair `(i, j), (j, i)` is present with probability
         * `density`, independently (an Erdős–Rényi adjacency graph).
         *
         * @param N  the dimension of the matrix
         * @param density  the probability of each off-diagonal pair
         * @param seed  the random seed. If 0, a random device is used.
         *
         * @return a random symmetric sparse matrix
         */
        static COOMatrix random_symmetric(csint N, double density=0.1,
                                          unsigned int seed=0);

        //----------------------------------------------------------------------
        //        Setters and Getters
        //----------------------------------------------------------------------
        virtual csint nnz() const override;    // number of non-zeros
        virtual csint nzmax() const override;  // maximum number of non-zeros
        virtual Shape shape() const override;  // the dimensions of the matrix

        const std::vector<csint>& row() const;     // indices and data
        const std::vector<csint>& col() const;
        virtual const std::vector<double>& data() const override;

        /** Insert a value at a pair of indices.
         *
         * Assigning to an index that is outside of the dimensions of the matrix
         * will just increase the size of the matrix accordingly. Duplicate
         * entries are allowed and will be summed upon compression.
         *
         * @param i, j  integer indices of the matrix
         * @param v     the value to be assigned
         *
         * @return A    a reference to itself for method chaining.
         *
         * @see cs_entry Davis p 12.
         */
        COOMatrix& insert(csint i, csint j, double v);

        /** Insert a structural entry into a symbolic matrix.
         *
         * @param i, j  integer indices of the matrix
         *
         * @return A    a reference to itself for method chaining.
         *
         * @throws std::runtime_error if the matrix already has values
         */
        COOMatrix& insert(csint i, csint j);

        //----------------------------------------------------------------------
        //        Format Conversions
        //----------------------------------------------------------------------
        /** Convert a coordinate format matrix to a compressed sparse column matrix.
         *
         * The columns are not guaranteed to be sorted, and duplicates are allowed.
         *
         * @return a copy of the `COOMatrix` in CSC format.
         */
        CSCMatrix compress() const;

        /** Create a canonical format CSCMatrix from a COOMatrix. */
        CSCMatrix tocsc() const;

        virtual std::vector<double> to_dense_vector(const char order='F') const override;

        //----------------------------------------------------------------------
        //        Math Operations
        //----------------------------------------------------------------------
        /** Transpose the matrix as a copy.
         *
         * @return new COOMatrix object with transposed rows and columns.
         */
        COOMatrix transpose() const;
        COOMatrix T() const;

        /** Multiply a COOMatrix by a dense vector.
         *
         * @param x  the dense vector to multiply by.
         *
         * @return y  the result of the matrix-vector multiplication.
         */
        virtual std::vector<double> dot(const std::vector<double>& x) const override;

};  // class COOMatrix


//------------------------------------------------------------------------------
//        Operator Overloads
//------------------------------------------------------------------------------
std::vector<double> operator*(const COOMatrix& A, const std::vector<double>& x);


}  // namespace sd

#endif  // _SPARSEDIFF_COO_H_

//==============================================================================
//==============================================================================
