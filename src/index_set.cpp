/*==============================================================================
 *     File: index_set.cpp
 *  Created: 2025-06-02 19:20
 *
 *  Description: Implements the IndexSet dynamic bitset.
 *
 *============================================================================*/

#include <algorithm>  // max
#include <bit>        // popcount, countr_zero
#include <format>
#include <stdexcept>
#include <string>

#include "index_set.h"

namespace sd {


IndexSet::IndexSet(csint n)
{
    if (n < 0) {
        throw std::invalid_argument("IndexSet size must be non-negative.");
    }
    words_.reserve((n + word_bits - 1) / word_bits);
}


IndexSet IndexSet::singleton(csint i)
{
    IndexSet s;
    s.insert(i);
    return s;
}


IndexSet& IndexSet::insert(csint i)
{
    if (i < 0) {
        throw std::out_of_range(std::format("Negative index: {}", i));
    }

    std::size_t k = i / word_bits;
    if (k >= words_.size()) {
        words_.resize(k + 1, 0);
    }
    words_[k] |= word_type{1} << (i % word_bits);

    return *this;
}


bool IndexSet::contains(csint i) const
{
    if (i < 0) {
        return false;
    }

    std::size_t k = i / word_bits;
    return k < words_.size() && ((words_[k] >> (i % word_bits)) & 1);
}


bool IndexSet::empty() const
{
    return std::all_of(words_.begin(), words_.end(), [](word_type w) { return w == 0; });
}


csint IndexSet::count() const
{
    csint n = 0;
    for (const auto& w : words_) {
        n += std::popcount(w);
    }
    return n;
}


void IndexSet::clear() { words_.clear(); }


IndexSet& IndexSet::operator|=(const IndexSet& other)
{
    if (other.words_.size() > words_.size()) {
        words_.resize(other.words_.size(), 0);
    }

    for (std::size_t k = 0; k < other.words_.size(); k++) {
        words_[k] |= other.words_[k];
    }

    return *this;
}


std::vector<csint> IndexSet::to_vector() const
{
    std::vector<csint> out;
    out.reserve(count());

    for (std::size_t k = 0; k < words_.size(); k++) {
        word_type w = words_[k];
        while (w) {
            csint b = std::countr_zero(w);
            out.push_back(static_cast<csint>(k) * word_bits + b);
            w &= w - 1;  // clear lowest set bit
        }
    }

    return out;
}


bool operator==(const IndexSet& a, const IndexSet& b)
{
    // Trailing zero words do not change the set
    std::size_t n = std::max(a.words_.size(), b.words_.size());
    for (std::size_t k = 0; k < n; k++) {
        IndexSet::word_type wa = (k < a.words_.size()) ? a.words_[k] : 0;
        IndexSet::word_type wb = (k < b.words_.size()) ? b.words_[k] : 0;
        if (wa != wb) {
            return false;
        }
    }
    return true;
}


IndexSet operator|(const IndexSet& a, const IndexSet& b)
{
    IndexSet c(a);
    c |= b;
    return c;
}


std::ostream& operator<<(std::ostream& os, const IndexSet& s)
{
    os << "{";
    auto v = s.to_vector();
    for (std::size_t k = 0; k < v.size(); k++) {
        os << v[k];
        if (k < v.size() - 1) {
            os << ", ";
        }
    }
    os << "}";
    return os;
}


}  // namespace sd

/*==============================================================================
 *============================================================================*/
