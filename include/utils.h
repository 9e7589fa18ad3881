//==============================================================================
//    File: utils.h
// Created: 2024-11-02 17:29
//
//  Description: Utility functions for SparseDiff.
//
//==============================================================================

#ifndef _SPARSEDIFF_UTILS_H_
#define _SPARSEDIFF_UTILS_H_

#include <algorithm>  // stable_sort
#include <iostream>
#include <numeric>    // iota
#include <span>
#include <string>
#include <vector>

#include "types.h"

namespace sd {

std::vector<double> operator+(
    const std::vector<double>& a,
    const std::vector<double>& b
);

std::vector<double> operator-(
    const std::vector<double>& a,
    const std::vector<double>& b
);

std::vector<double> operator-(const std::vector<double>& a);

std::vector<double> operator*(const double c, const std::vector<double>& x);
std::vector<double> operator*(const std::vector<double>& x, const double c);
std::vector<double>& operator*=(std::vector<double>& x, const double c);


/** Compute the cumulative sum of a vector, starting with 0.
 *
 * @param w  a reference to a vector of length N.
 *
 * @return p  the cumulative sum of `w`, of length N + 1.
 */
std::vector<csint> cumsum(const std::vector<csint>& w);


/** Sort the indices of a vector.
 *
 * The sort is stable, so ties keep their original relative order.
 */
template <typename T>
std::vector<csint> argsort(const std::vector<T>& vec)
{
    std::vector<csint> idx(vec.size());
    std::iota(idx.begin(), idx.end(), 0);

    // Sort the indices by referencing the vector
    std::stable_sort(
        idx.begin(),
        idx.end(),
        [&vec](csint i, csint j) { return vec[i] < vec[j]; }
    );

    return idx;
}


/** Compute the norm of a vector.
 *
 * @param x  the vector
 * @param ord  the order of the norm. Use `infinity` for the max norm.
 *
 * @return norm  the norm of the vector
 */
double norm(std::span<const double> x, const double ord=2.0);


/*------------------------------------------------------------------------------
 *          Vector Permutations
 *----------------------------------------------------------------------------*/
/** Create a permutation vector of length N.
 *
 * @param N  the length of the permutation
 * @param seed  if `seed` is 0, the identity permutation is returned. If `seed`
 *        is -1, the reverse of the identity is returned. Otherwise, a random
 *        permutation is generated from `seed`.
 *
 * @return the permutation vector
 */
std::vector<csint> randperm(csint N, csint seed=0);


/*------------------------------------------------------------------------------
 *         Printing
 *----------------------------------------------------------------------------*/
/** Print a std::vector. */
template <typename T>
void print_vec(
    const std::vector<T>& vec,
    std::ostream& os=std::cout,
    const std::string end="\n"
)
{
    os << "[";
    for (size_t i = 0; i < vec.size(); i++) {
        os << vec[i];
        if (i < vec.size() - 1) {
            os << ", ";
        }
    }
    os << "]" << end;
}


/** Print a std::vector to an output stream. */
template <typename T>
std::ostream& operator<<(std::ostream& os, const std::vector<T>& vec)
{
    print_vec(vec, os, "");
    return os;
}


/** Print a matrix in dense format.
 *
 * @param A  a dense matrix
 * @param M, N  the number of rows and columns
 * @param order  the order of `A` ('C' for row-major or 'F' for column-major)
 * @param precision  the number of decimal places to print
 * @param suppress  if true, print small values as "0"
 * @param os  the output stream
 */
void print_dense_vec(
    const std::vector<double>& A,
    const csint M,
    const csint N,
    const char order='F',
    const int precision=4,
    const bool suppress=true,
    std::ostream& os=std::cout
);


} // namespace sd

#endif  // _SPARSEDIFF_UTILS_H_

//==============================================================================
//==============================================================================
