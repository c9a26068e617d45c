#pragma once

#include <cassert>
#include <cstdint>
#include <vector>

namespace patchwork {

// The myers algorithm uses bipolar array indexing for tracking k-values (-D..D).
// Index range is inclusive on both ends.
template <typename Type>
struct BipolarArray {
    int64_t min_;
    int64_t max_;
    std::vector<Type> arr_;

    BipolarArray(int64_t min, int64_t max)
        : min_(min), max_(max), arr_(static_cast<std::size_t>(max - min + 1) /* +1 for zero */, Type{}) {
        assert(max - min + 1 >= 0);
    }

    Type&
    operator[](int64_t index) {
        assert(contains(index));
        return arr_[static_cast<std::size_t>(index - min_)];
    }

    const Type&
    operator[](int64_t index) const {
        assert(contains(index));
        return arr_[static_cast<std::size_t>(index - min_)];
    }

    bool
    contains(int64_t index) const {
        return index >= min_ && index <= max_;
    }

    std::size_t
    size() const {
        return arr_.size();
    }

    // Copy of the sub-range [from, to]. Used to keep one frontier per D
    // without storing the full -max..max range each time.
    BipolarArray
    slice(int64_t from, int64_t to) const {
        assert(contains(from) && contains(to));
        BipolarArray result{from, to};
        for (int64_t k = from; k <= to; k++) {
            result[k] = (*this)[k];
        }
        return result;
    }
};

}  // namespace patchwork
