/*==============================================================================
 *     File: csc.cpp
 *  Created: 2024-10-09 20:58
 *
 *  Description: Implements the compressed sparse column matrix class
 *
 *============================================================================*/

#include <algorithm>   // lower_bound, equal
#include <format>
#include <iostream>
#include <new>         // bad_alloc
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include "utils.h"
#include "csc.h"
#include "coo.h"

namespace sd {

/*------------------------------------------------------------------------------
 *     Constructors
 *----------------------------------------------------------------------------*/
CSCMatrix::CSCMatrix() {};


CSCMatrix::CSCMatrix(
    const std::vector<double>& data,
    const std::vector<csint>& indices,
    const std::vector<csint>& indptr,
    const Shape& shape
    )
    : v_(data),
      i_(indices),
      p_(indptr),
      M_(shape[0]),
      N_(shape[1])
{
    if (static_cast<csint>(p_.size()) != N_ + 1) {
        throw std::invalid_argument("indptr must have N + 1 entries.");
    }

    if (!v_.empty() && v_.size() != i_.size()) {
        throw std::invalid_argument("Values and indices must be the same size.");
    }

    has_sorted_indices_ = test_sorted_();
}


CSCMatrix::CSCMatrix(const Shape& shape, csint nzmax, bool values)
    : i_(nzmax),
      p_(shape[1] + 1),
      M_(shape[0]),
      N_(shape[1])
{
    if (values) {
        v_.resize(nzmax);
    } else {
        v_.resize(0);
        v_.shrink_to_fit();
    }
}


CSCMatrix::CSCMatrix(const COOMatrix& A) : CSCMatrix(A.compress())
{
    sum_duplicates();      // O(N) space, O(nnz) time
    if (!v_.empty()) {
        dropzeros();       // O(nnz) time
    }
    sort();                // O(M) space, O(M + N + nnz) time
    has_canonical_format_ = true;
}


CSCMatrix::CSCMatrix(
    const std::vector<double>& A,
    const Shape& shape,
    const char order
) : M_(shape[0]),
    N_(shape[1])
{
    if (static_cast<csint>(A.size()) != M_ * N_) {
        throw std::invalid_argument("Dense array size does not match shape.");
    }

    if (order != 'C' && order != 'F') {
        throw std::invalid_argument("Order must be 'C' or 'F'.");
    }

    // Allocate memory
    v_.reserve(A.size());
    i_.reserve(A.size());
    p_.reserve(N_ + 1);

    csint nz = 0;  // count number of non-zeros

    for (csint j = 0; j < N_; j++) {
        p_.push_back(nz);

        for (csint i = 0; i < M_; i++) {
            // linear index for column- or row-major order
            double val = (order == 'F') ? A[i + j * M_] : A[j + i * N_];

            // Only store non-zeros
            if (val != 0.0) {
                i_.push_back(i);
                v_.push_back(val);
                nz++;
            }
        }
    }

    // Finalize and free unused space
    p_.push_back(nz);
    realloc();

    has_sorted_indices_ = true;    // guaranteed by algorithm
    has_canonical_format_ = true;  // guaranteed by input format
}


void CSCMatrix::realloc(csint nzmax)
{
    csint Z = (nzmax <= 0) ? p_[N_] : nzmax;

    try {
        p_.resize(N_ + 1);  // always contains N_ columns + nz
        i_.resize(Z);
        if (!v_.empty()) {
            v_.resize(Z);
        }
    } catch (const std::bad_alloc& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        std::cerr << "Failed to allocate memory for CSCMatrix." << std::endl;
        throw;  // let calling code handle it
    }

    p_.shrink_to_fit();  // deallocate memory
    i_.shrink_to_fit();
    v_.shrink_to_fit();
}


/*------------------------------------------------------------------------------
 *         Accessors
 *----------------------------------------------------------------------------*/
csint CSCMatrix::nnz() const { return i_.size(); }
csint CSCMatrix::nzmax() const { return i_.capacity(); }
Shape CSCMatrix::shape() const { return Shape {M_, N_}; }

const std::vector<csint>& CSCMatrix::indices() const { return i_; }
const std::vector<csint>& CSCMatrix::indptr() const { return p_; }
const std::vector<double>& CSCMatrix::data() const { return v_; }


std::span<const csint> CSCMatrix::column(csint j) const
{
    return std::span<const csint>(i_.data() + p_[j], p_[j+1] - p_[j]);
}


bool CSCMatrix::is_symbolic() const { return v_.empty(); }


CSCMatrix& CSCMatrix::to_canonical()
{
    sum_duplicates();
    if (!v_.empty()) {
        dropzeros();
    }
    sort();
    has_canonical_format_ = true;
    return *this;
}


CSCMatrix CSCMatrix::pattern() const
{
    CSCMatrix C({M_, N_}, 0, false);
    C.i_ = i_;
    C.p_ = p_;
    C.sum_duplicates();
    C.sort();
    C.has_canonical_format_ = true;
    return C;
}


bool CSCMatrix::has_sorted_indices() const { return has_sorted_indices_; }
bool CSCMatrix::has_canonical_format() const { return has_canonical_format_; }


bool CSCMatrix::is_symmetric() const
{
    if (M_ != N_) {
        return false;
    }

    if (v_.empty()) {
        return is_structurally_symmetric();
    }

    for (csint j = 0; j < N_; j++) {
        for (csint p = p_[j]; p < p_[j+1]; p++) {
            csint i = i_[p];

            if (i == j)
                continue;  // skip diagonal

            if ((*this)(i, j) != (*this)(j, i))
                return false;
        }
    }

    return true;
}


bool CSCMatrix::is_structurally_symmetric() const
{
    if (M_ != N_) {
        return false;
    }

    // Both the pattern and its transpose have sorted columns
    CSCMatrix S = pattern();
    CSCMatrix ST = S.transpose(false);

    return S.p_ == ST.p_ && S.i_ == ST.i_;
}


bool CSCMatrix::has_full_diagonal() const
{
    if (M_ != N_) {
        return false;
    }

    for (csint j = 0; j < N_; j++) {
        auto col = column(j);
        if (std::find(col.begin(), col.end(), j) == col.end()) {
            return false;
        }
    }

    return true;
}


bool CSCMatrix::test_sorted_() const
{
    for (csint j = 0; j < N_; j++) {
        // Check that the column is sorted
        for (csint p = p_[j]; p < p_[j+1] - 1; p++) {
            if (i_[p] > i_[p + 1]) {
                return false;
            }
        }
    }

    return true;
}


double CSCMatrix::operator()(csint i, csint j) const
{
    if (i < 0 || i >= M_ || j < 0 || j >= N_) {
        throw std::out_of_range(
            std::format("Index ({}, {}) out of range.", i, j)
        );
    }

    if (has_canonical_format_) {
        // Binary search for t <= i
        auto start = i_.begin() + p_[j];
        auto end = i_.begin() + p_[j+1];

        auto t = std::lower_bound(start, end, i);

        // Check that we actually found the index t == i
        if (t != end && *t == i) {
            return v_.empty() ? 1.0 : v_[std::distance(i_.begin(), t)];
        } else {
            return 0.0;
        }

    } else {
        // NOTE this code assumes that columns are *not* sorted, and that
        // duplicate entries may exist, so it will search through *every*
        // element in a column.
        double out = 0.0;

        for (csint p = p_[j]; p < p_[j+1]; p++) {
            if (i_[p] == i) {
                if (v_.empty()) {
                    return 1.0;
                }
                out += v_[p];  // sum duplicate entries
            }
        }

        return out;
    }
}


/*------------------------------------------------------------------------------
 *         Format Conversions
 *----------------------------------------------------------------------------*/
COOMatrix CSCMatrix::tocoo() const { return COOMatrix(*this); }


std::vector<double> CSCMatrix::to_dense_vector(const char order) const
{
    if (order != 'F' && order != 'C') {
        throw std::invalid_argument("Invalid order argument. Use 'F' or 'C'.");
    }

    std::vector<double> A(M_ * N_, 0.0);

    for (csint j = 0; j < N_; j++) {
        for (csint p = p_[j]; p < p_[j+1]; p++) {
            // Column- vs row-major order
            csint idx = (order == 'F') ? (i_[p] + j * M_) : (j + i_[p] * N_);

            if (v_.empty()) {
                A[idx] = 1.0; // no values, so set to 1.0
            } else if (has_canonical_format_) {
                A[idx] = v_[p];
            } else {
                A[idx] += v_[p];  // account for duplicates
            }
        }
    }

    return A;
}


CSCMatrix CSCMatrix::transpose(bool values) const
{
    values = values && !v_.empty();

    std::vector<csint> w(M_);   // workspace
    CSCMatrix C({N_, M_}, nnz(), values);  // output

    // Compute number of elements in each row
    for (csint p = 0; p < nnz(); p++)
        w[i_[p]]++;

    // Row pointers are the cumulative sum of the counts, starting with 0.
    C.p_ = cumsum(w);
    w = C.p_;  // copy back into workspace

    for (csint j = 0; j < N_; j++) {
        for (csint p = p_[j]; p < p_[j+1]; p++) {
            // place A(i, j) as C(j, i)
            csint q = w[i_[p]]++;
            C.i_[q] = j;
            if (values) {
                C.v_[q] = v_[p];
            }
        }
    }

    C.has_sorted_indices_ = true;
    C.has_canonical_format_ = has_canonical_format_;

    return C;
}


// Alias for transpose
CSCMatrix CSCMatrix::T() const { return this->transpose(); }


CSCMatrix& CSCMatrix::sort()
{
    // ----- first transpose
    std::vector<csint> w(M_);   // workspace

    bool values = !v_.empty();

    CSCMatrix C({N_, M_}, nnz(), values);  // intermediate transpose

    // Compute number of elements in each row
    for (csint p = 0; p < nnz(); p++)
        w[i_[p]]++;

    // Row pointers are the cumulative sum of the counts, starting with 0.
    C.p_ = cumsum(w);
    w = C.p_;  // copy back into workspace

    for (csint j = 0; j < N_; j++) {
        for (csint p = p_[j]; p < p_[j+1]; p++) {
            // place A(i, j) as C(j, i)
            csint q = w[i_[p]]++;
            C.i_[q] = j;
            if (values) {
                C.v_[q] = v_[p];
            }
        }
    }

    // ----- second transpose
    // Copy column counts to avoid repeat work
    w = p_;

    for (csint j = 0; j < C.N_; j++) {
        for (csint p = C.p_[j]; p < C.p_[j+1]; p++) {
            // place C(i, j) as A(j, i)
            csint q = w[C.i_[p]]++;
            i_[q] = j;
            if (values) {
                v_[q] = C.v_[p];
            }
        }
    }

    has_sorted_indices_ = true;

    return *this;
}


CSCMatrix& CSCMatrix::sum_duplicates()
{
    bool values = !v_.empty();
    csint nz = 0;  // count actual number of non-zeros (excluding dups)
    std::vector<csint> w(M_, -1);                      // row i not yet seen

    for (csint j = 0; j < N_; j++) {
        csint q = nz;                                  // column j will start at q
        for (csint p = p_[j]; p < p_[j + 1]; p++) {
            csint i = i_[p];                          // A(i, j) is nonzero
            if (w[i] >= q) {
                if (values) {
                    v_[w[i]] += v_[p];               // A(i, j) is a duplicate
                }
            } else {
                w[i] = nz;                          // record where row i occurs
                i_[nz] = i;                          // keep A(i, j)
                if (values) {
                    v_[nz] = v_[p];
                }
                nz++;
            }
        }
        p_[j] = q;                                    // record start of column j
    }

    p_[N_] = nz;                                     // finalize A
    realloc();

    return *this;
}


CSCMatrix& CSCMatrix::fkeep(KeepFunc fk)
{
    csint nz = 0;  // count actual number of non-zeros
    bool values = !v_.empty();

    for (csint j = 0; j < N_; j++) {
        csint p = p_[j];  // get current location of column j
        p_[j] = nz;       // record new location of column j
        for (; p < p_[j+1]; p++) {
            if (fk(i_[p], j, values ? v_[p] : 1.0)) {
                if (values) {
                    v_[nz] = v_[p];  // keep A(i, j)
                }
                i_[nz++] = i_[p];
            }
        }
    }

    p_[N_] = nz;    // finalize A
    realloc();

    return *this;
};


CSCMatrix CSCMatrix::fkeep(KeepFunc fk) const
{
    CSCMatrix C(*this);
    return C.fkeep(fk);
}


CSCMatrix& CSCMatrix::dropzeros()
{
    return fkeep([] ([[maybe_unused]] csint i, [[maybe_unused]] csint j, double Aij) {
        return (Aij != 0);
    });
}


CSCMatrix CSCMatrix::drop_diagonal() const
{
    return fkeep([] (csint i, csint j, [[maybe_unused]] double Aij) {
        return (i != j);
    });
}


CSCMatrix CSCMatrix::add_diagonal(double v) const
{
    if (M_ != N_) {
        throw std::invalid_argument("Matrix must be square to add a diagonal.");
    }

    CSCMatrix A(*this);
    A.sum_duplicates();
    A.sort();

    bool values = !A.v_.empty();
    CSCMatrix C({N_, N_}, A.nnz() + N_, values);

    csint nz = 0;
    for (csint j = 0; j < N_; j++) {
        C.p_[j] = nz;
        bool found = false;
        for (csint p = A.p_[j]; p < A.p_[j+1]; p++) {
            csint i = A.i_[p];
            if (!found && i >= j) {
                found = true;
                if (i > j) {
                    // insert the missing diagonal before row i
                    C.i_[nz] = j;
                    if (values) {
                        C.v_[nz] = v;
                    }
                    nz++;
                }
            }
            C.i_[nz] = i;
            if (values) {
                C.v_[nz] = A.v_[p];
            }
            nz++;
        }

        if (!found) {
            C.i_[nz] = j;
            if (values) {
                C.v_[nz] = v;
            }
            nz++;
        }
    }

    C.p_[N_] = nz;
    C.realloc();
    C.has_sorted_indices_ = true;
    C.has_canonical_format_ = true;

    return C;
}


/*------------------------------------------------------------------------------
 *       Math Operations
 *----------------------------------------------------------------------------*/
std::vector<double> CSCMatrix::dot(const std::vector<double>& x) const
{
    if (static_cast<csint>(x.size()) != N_) {
        throw std::invalid_argument("Vector size does not match number of columns!");
    }

    std::vector<double> out(M_);

    for (csint j = 0; j < N_; j++) {
        for (csint p = p_[j]; p < p_[j+1]; p++) {
            out[i_[p]] += (v_.empty() ? 1.0 : v_[p]) * x[j];
        }
    }

    return out;
}


std::vector<double> CSCMatrix::tdot(const std::vector<double>& x) const
{
    if (static_cast<csint>(x.size()) != M_) {
        throw std::invalid_argument("Vector size does not match number of rows!");
    }

    std::vector<double> out(N_);

    for (csint j = 0; j < N_; j++) {
        for (csint p = p_[j]; p < p_[j+1]; p++) {
            out[j] += (v_.empty() ? 1.0 : v_[p]) * x[i_[p]];
        }
    }

    return out;
}


std::vector<double> operator*(const CSCMatrix& A, const std::vector<double>& x)
{
    return A.dot(x);
}


CSCMatrix CSCMatrix::dot(const CSCMatrix& B) const
{
    auto [M, Ka] = shape();
    auto [Kb, N] = B.shape();

    if (Ka != Kb) {
        throw std::invalid_argument("Inner dimensions do not agree!");
    }

    bool values = !v_.empty() && !B.v_.empty();

    CSCMatrix C({M, N}, nnz() + B.nnz(), values);  // output

    // Allocate workspaces
    std::vector<csint> w(M);
    std::vector<double> x;
    if (values) {
        x.resize(M);
    }

    csint nz = 0;  // track total number of non-zeros in C

    for (csint j = 0; j < N; j++) {
        if (nz + M > C.nzmax()) {
            C.realloc(2 * C.nzmax() + M);  // double the size of C
        }

        C.p_[j] = nz;  // column j of C starts here

        // Compute x = A @ B[:, j]
        for (csint p = B.p_[j]; p < B.p_[j+1]; p++) {
            // Compute x += A[:, B.i_[p]] * B.v_[p]
            nz = scatter(B.i_[p], values ? B.v_[p] : 1, w, x, j+1, C, nz);
        }

        // Gather values into the correct locations in C
        if (values) {
            for (csint p = C.p_[j]; p < nz; p++) {
                C.v_[p] = x[C.i_[p]];
            }
        }
    }

    // Finalize and deallocate unused memory
    C.p_[N] = nz;
    C.realloc();

    return C;
}


CSCMatrix operator*(const CSCMatrix& A, const CSCMatrix& B) { return A.dot(B); }


CSCMatrix CSCMatrix::add(const CSCMatrix& B) const
{
    if (shape() != B.shape()) {
        throw std::invalid_argument("Matrix dimensions do not agree!");
    }

    bool values = !v_.empty() && !B.v_.empty();

    CSCMatrix C({M_, N_}, nnz() + B.nnz(), values);  // output

    // Allocate workspaces
    std::vector<csint> w(M_);
    std::vector<double> x;
    if (values) {
        x.resize(M_);
    }

    csint nz = 0;    // track total number of non-zeros in C

    for (csint j = 0; j < N_; j++) {
        C.p_[j] = nz;  // column j of C starts here
        nz = scatter(j, 1.0, w, x, j+1, C, nz);    // A(:, j)
        nz = B.scatter(j, 1.0, w, x, j+1, C, nz);  // B(:, j)

        // Gather results into the correct column of C
        if (values) {
            for (csint p = C.p_[j]; p < nz; p++) {
                C.v_[p] = x[C.i_[p]];
            }
        }
    }

    // Finalize and deallocate unused memory
    C.p_[N_] = nz;
    C.realloc();

    return C;
}


CSCMatrix operator+(const CSCMatrix& A, const CSCMatrix& B) { return A.add(B); }


csint CSCMatrix::scatter(
    csint j,
    double beta,
    std::vector<csint>& w,
    OptionalVectorRef<double> x_ref,
    csint mark,
    CSCMatrix& C,
    csint nz
) const
{
    // Check if x is passed as a reference
    std::vector<double> empty_vec;
    std::vector<double>& x = x_ref ? x_ref->get() : empty_vec;
    bool values = !v_.empty() && !x.empty();

    for (csint p = p_[j]; p < p_[j+1]; p++) {
        csint i = i_[p];           // A(i, j) is non-zero
        if (w[i] < mark) {
            w[i] = mark;             // i is new entry in column j
            C.i_[nz++] = i;          // add i to pattern of C(:, j)
            if (values) {
                x[i] = beta * v_[p];   // x = beta * A(i, j)
            }
        } else {
            if (values) {
                x[i] += beta * v_[p];  // i exists in C(:, j) already
            }
        }
    }

    return nz;
}


/*------------------------------------------------------------------------------
 *         Other
 *----------------------------------------------------------------------------*/
bool CSCMatrix::is_valid(const bool sorted, const bool values) const
{
    // Check number of columns
    if (static_cast<csint>(p_.size()) != (N_ + 1)) {
        throw std::runtime_error("Number of columns inconsistent!");
    }

    if (p_.front() != 0) {
        throw std::runtime_error("First column index should be 0!");
    }

    if (p_.back() != nnz()) {
        throw std::runtime_error("Column counts inconsistent!");
    }

    // Check array sizes
    if (values) {
        if (v_.empty()) {
            throw std::runtime_error("No values!");
        }

        if (i_.size() != v_.size()) {
            throw std::runtime_error("Indices and values sizes inconsistent!");
        }
    }

    for (csint j = 0; j < N_; j++) {
        if (p_[j] > p_[j+1]) {
            throw std::runtime_error("Column pointers not monotonic!");
        }

        for (csint p = p_[j]; p < p_[j+1]; p++) {
            csint i = i_[p];

            if (i < 0 || i >= M_) {
                throw std::runtime_error("Invalid row index!");
            }

            if (sorted && (p < (p_[j+1] - 1)) && (i > i_[p+1])) {
                throw std::runtime_error("Columns not sorted!");
            }

            if (values && v_[p] == 0) {
                throw std::runtime_error("Explicit zeros!");
            }

            // Quick check for duplicates, but won't catch all cases
            if ((p < (p_[j+1] - 1)) && (i == i_[p+1])) {
                throw std::runtime_error("Duplicate entries exist!");
            }
        }
    }

    return true;
}


/*------------------------------------------------------------------------------
 *         Printing
 *----------------------------------------------------------------------------*/
void CSCMatrix::write_elems_(std::stringstream& ss, csint start, csint end) const
{
    bool use_scientific = use_scientific_notation(v_);

    csint n = 0;  // number of elements printed
    for (csint j = 0; j < N_; j++) {
        for (csint p = p_[j]; p < p_[j + 1]; p++) {
            if ((n >= start) && (n < end)) {
                write_elem_(ss, i_[p], j, v_.empty() ? nullptr : &v_[p], use_scientific);

                if (n < end - 1) {
                    ss << "\n";
                }
            }
            n++;
        }
    }
}


}  // namespace sd

/*==============================================================================
 *============================================================================*/
