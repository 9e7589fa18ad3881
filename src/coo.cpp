/*==============================================================================
 *     File: coo.cpp
 *  Created: 2024-10-01 21:07
 *
 *  Description: Implements the coordinate sparse matrix class.
 *
 *============================================================================*/

#include <algorithm>      // max_element, max
#include <cassert>
#include <format>
#include <fstream>
#include <iostream>
#include <random>
#include <stdexcept>
#include <string>
#include <sstream>
#include <unordered_set>

#include "utils.h"
#include "coo.h"
#include "csc.h"

namespace sd {

/*------------------------------------------------------------------------------
 *     Constructors
 *----------------------------------------------------------------------------*/
COOMatrix::COOMatrix() {};


COOMatrix::COOMatrix(
    const std::vector<double>& vals,
    const std::vector<csint>& rows,
    const std::vector<csint>& cols,
    const Shape shape
) : v_(vals),
    i_(rows),
    j_(cols)
{
    if (i_.size() != j_.size()) {
        throw std::invalid_argument("Index vectors must be the same size.");
    }

    // Allow v_ to be empty for symbolic computation
    if (!v_.empty() && v_.size() != i_.size()) {
        throw std::invalid_argument("Values and indices must be the same size.");
    }

    // Initialize M and N
    if (shape[0] > 0) {
        M_ = shape[0];
    } else {
        // Infer from the given indices
        M_ = i_.empty() ? 0 : *std::max_element(i_.begin(), i_.end()) + 1;
    }

    if (shape[1] > 0) {
        N_ = shape[1];
    } else {
        N_ = j_.empty() ? 0 : *std::max_element(j_.begin(), j_.end()) + 1;
    }

    // Check for any i or j out of bounds
    if (shape[0] && !i_.empty()) {  // shape was given as input, not inferred
        csint max_i = *std::max_element(i_.begin(), i_.end());
        if (max_i >= M_) {
            throw std::runtime_error(
                std::format("Row index out of bounds: {} >= {}", max_i, M_)
            );
        }
    }

    if (shape[1] && !j_.empty()) {
        csint max_j = *std::max_element(j_.begin(), j_.end());
        if (max_j >= N_) {
            throw std::runtime_error(
                std::format("Column index out of bounds: {} >= {}", max_j, N_)
            );
        }
    }
}


COOMatrix::COOMatrix(const Shape& shape, csint nzmax)
    : M_(shape[0]),
      N_(shape[1])
{
    v_.reserve(nzmax);
    i_.reserve(nzmax);
    j_.reserve(nzmax);
}


COOMatrix::COOMatrix(const CSCMatrix& A)
    : v_(A.v_.empty() ? 0 : A.nnz()),
      i_(A.nnz()),
      j_(A.nnz()),
      M_(A.M_),
      N_(A.N_)
{
    bool values = !A.v_.empty();

    // Get all elements in column order
    csint nz = 0;
    for (csint j = 0; j < N_; j++) {
        for (csint p = A.p_[j]; p < A.p_[j+1]; p++) {
            i_[nz] = A.i_[p];
            j_[nz] = j;
            if (values) {
                v_[nz] = A.v_[p];
            }
            nz++;
        }
    }
}


COOMatrix COOMatrix::from_file(const std::string& filename)
{
    std::ifstream file(filename);

    if (!file.is_open()) {
        throw std::runtime_error("Could not open file: " + filename);
    }

    try {
        return from_stream(file);
    } catch (const std::runtime_error& e) {
        throw std::runtime_error(
            "Error reading file: " + filename + "\n" + e.what()
        );
    }
}


COOMatrix COOMatrix::from_stream(std::istream& fp)
{
    csint i, j;
    double v;

    COOMatrix A;

    while (fp) {
        std::string line;
        std::getline(fp, line);
        if (!line.empty()) {
            std::stringstream ss(line);
            if (!(ss >> i >> j >> v))
                throw std::runtime_error("File is not in (i, j, v) format!");
            else
                A.insert(i, j, v);
        }
    }

    return A;
}


COOMatrix COOMatrix::random(csint M, csint N, double density, unsigned int seed)
{
    csint nzmax = M * N * density;

    if (seed == 0) {
        seed = std::random_device{}();
    }

    std::default_random_engine rng(seed);
    std::uniform_int_distribution<csint> idx_dist(0, M * N - 1);
    std::uniform_int_distribution<int> value_dist(1, 9);

    // Create a set of unique random (linear) indices
    std::unordered_set<csint> idx;

    while (static_cast<csint>(idx.size()) < nzmax) {
        idx.insert(idx_dist(rng));
    }

    // Create the (i, j, v) vectors
    std::vector<csint> row_idx(nzmax);
    std::vector<csint> col_idx(nzmax);
    std::vector<double> values(nzmax);

    std::ranges::transform(idx, row_idx.begin(), [N](csint k) { return k / N; });
    std::ranges::transform(idx, col_idx.begin(), [N](csint k) { return k % N; });
    std::ranges::generate(values, [&rng, &value_dist]() { return value_dist(rng); });

    return COOMatrix(values, row_idx, col_idx, {M, N});
}


COOMatrix COOMatrix::random_symmetric(csint N, double density, unsigned int seed)
{
    if (seed == 0) {
        seed = std::random_device{}();
    }

    std::default_random_engine rng(seed);
    std::bernoulli_distribution edge_dist(density);
    std::uniform_int_distribution<int> value_dist(1, 9);

    COOMatrix A({N, N}, N);

    for (csint j = 0; j < N; j++) {
        A.insert(j, j, value_dist(rng));  // full diagonal
        for (csint i = j + 1; i < N; i++) {
            if (edge_dist(rng)) {
                double v = value_dist(rng);
                A.insert(i, j, v);
                A.insert(j, i, v);
            }
        }
    }

    return A;
}


/*------------------------------------------------------------------------------
 *         Setters and Getters
 *----------------------------------------------------------------------------*/
csint COOMatrix::nnz() const { return i_.size(); }
csint COOMatrix::nzmax() const { return i_.capacity(); }

Shape COOMatrix::shape() const
{
    return Shape {M_, N_};
}

const std::vector<csint>& COOMatrix::row() const { return i_; }
const std::vector<csint>& COOMatrix::col() const { return j_; }
const std::vector<double>& COOMatrix::data() const { return v_; }


// cs_entry
COOMatrix& COOMatrix::insert(csint i, csint j, double v)
{
    assert((i >= 0) && (j >= 0));

    if (v_.size() != i_.size()) {
        throw std::runtime_error("Cannot insert a value into a symbolic matrix!");
    }

    i_.push_back(i);
    j_.push_back(j);
    v_.push_back(v);

    M_ = std::max(M_, i+1);
    N_ = std::max(N_, j+1);

    return *this;
}


COOMatrix& COOMatrix::insert(csint i, csint j)
{
    assert((i >= 0) && (j >= 0));

    if (!v_.empty()) {
        throw std::runtime_error("Cannot insert a pattern entry into a numeric matrix!");
    }

    i_.push_back(i);
    j_.push_back(j);

    M_ = std::max(M_, i+1);
    N_ = std::max(N_, j+1);

    return *this;
}


/*------------------------------------------------------------------------------
 *          Format Conversions
 *----------------------------------------------------------------------------*/
CSCMatrix COOMatrix::compress() const
{
    csint nnz_ = nnz();
    bool values = !v_.empty();
    CSCMatrix C {{M_, N_}, nnz_, values};
    std::vector<csint> w(N_);  // workspace

    // Compute number of elements in each column
    for (csint k = 0; k < nnz_; k++)
        w[j_[k]]++;

    // Column pointers are the cumulative sum
    C.p_ = cumsum(w);
    w = C.p_;  // copy back into workspace

    for (csint k = 0; k < nnz_; k++) {
        // A(i, j) is the pth entry in the CSC matrix
        csint p = w[j_[k]]++;  // "pointer" to the current element's column
        C.i_[p] = i_[k];
        if (values) {
            C.v_[p] = v_[k];
        }
    }

    return C;
}


CSCMatrix COOMatrix::tocsc() const { return CSCMatrix(*this); }


std::vector<double> COOMatrix::to_dense_vector(const char order) const
{
    if (order != 'F' && order != 'C') {
        throw std::invalid_argument("Invalid order argument. Use 'F' or 'C'.");
    }

    std::vector<double> arr(M_ * N_, 0.0);

    for (csint k = 0; k < nnz(); k++) {
        // Column- vs row-major order
        csint idx = (order == 'F') ? (i_[k] + j_[k] * M_) : (j_[k] + i_[k] * N_);
        arr[idx] += v_.empty() ? 1.0 : v_[k];  // sum duplicates
    }

    if (v_.empty()) {
        // duplicates in a pattern are still a single entry
        for (auto& a : arr) {
            a = (a != 0.0) ? 1.0 : 0.0;
        }
    }

    return arr;
}


/*------------------------------------------------------------------------------
 *          Math Operations
 *----------------------------------------------------------------------------*/
COOMatrix COOMatrix::transpose() const
{
    return COOMatrix(v_, j_, i_, {N_, M_});
}


COOMatrix COOMatrix::T() const { return this->transpose(); }


std::vector<double> COOMatrix::dot(const std::vector<double>& x) const
{
    if (static_cast<csint>(x.size()) != N_) {
        throw std::invalid_argument("Vector size does not match number of columns!");
    }

    std::vector<double> out(M_);

    for (csint p = 0; p < nnz(); p++) {
        out[i_[p]] += (v_.empty() ? 1.0 : v_[p]) * x[j_[p]];
    }

    return out;
}


std::vector<double> operator*(const COOMatrix& A, const std::vector<double>& x)
{
    return A.dot(x);
}


/*------------------------------------------------------------------------------
 *         Printing
 *----------------------------------------------------------------------------*/
void COOMatrix::write_elems_(std::stringstream& ss, csint start, csint end) const
{
    bool use_scientific = use_scientific_notation(v_);

    for (csint k = start; k < end; k++) {
        write_elem_(ss, i_[k], j_[k], v_.empty() ? nullptr : &v_[k], use_scientific);

        if (k < end - 1) {
            ss << "\n";
        }
    }
}


}  // namespace sd

/*==============================================================================
 *============================================================================*/
