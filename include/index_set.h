//==============================================================================
//     File: index_set.h
//  Created: 2025-06-02 19:12
//
//  Description: A dynamic bitset of input indices, used as the dependency set
//    of a tracer.
//
//==============================================================================

#ifndef _SPARSEDIFF_INDEX_SET_H_
#define _SPARSEDIFF_INDEX_SET_H_

#include <cstdint>
#include <iostream>
#include <vector>

#include "types.h"

namespace sd {

class IndexSet
{
    using word_type = std::uint64_t;
    static constexpr csint word_bits = 64;

    std::vector<word_type> words_;  // bit i of word k is index 64*k + i

    public:
        IndexSet() = default;

        /** Create an empty set with room for indices `0..n-1`. */
        explicit IndexSet(csint n);

        /** Create the set `{i}`. */
        static IndexSet singleton(csint i);

        /** Add an index to the set. The set grows as needed. */
        IndexSet& insert(csint i);

        bool contains(csint i) const;
        bool empty() const;

        /** Return the number of indices in the set. */
        csint count() const;

        /** Remove all indices. */
        void clear();

        /** Union in place. O(words) time. */
        IndexSet& operator|=(const IndexSet& other);

        /** Return the indices in increasing order. */
        std::vector<csint> to_vector() const;

        friend bool operator==(const IndexSet& a, const IndexSet& b);
};


IndexSet operator|(const IndexSet& a, const IndexSet& b);

/** Print the set as `{i, j, ...}`. */
std::ostream& operator<<(std::ostream& os, const IndexSet& s);


}  // namespace sd

#endif  // _SPARSEDIFF_INDEX_SET_H_

//==============================================================================
//==============================================================================
