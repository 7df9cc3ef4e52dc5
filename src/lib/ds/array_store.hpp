#pragma once
#include <cassert>
#include <iterator>
#include <stdexcept>
#include <type_traits>
#include <vector>

namespace memocache {

// Mutable sequence of group elements. Query() aggregates a closed range by
// direct summation, without any caching.
template <typename G>
class ArrayStore {
   public:
    typedef G group_type;
    typedef typename G::value_type value_type;

    ArrayStore() {}

    explicit ArrayStore(size_t size) : data_(size, group_.unit()) {}

    template <typename I,
              std::enable_if_t<std::is_same<typename std::iterator_traits<I>::value_type,
                                            typename G::value_type>::value,
                               bool> = true>
    ArrayStore(I begin, I end) : data_(begin, end) {}

    value_type Query(size_t l, size_t r) const {
        CheckRange(l, r);
        return QueryImpl(l, r);
    }

    value_type At(size_t index) const {
        CheckIndex(index);
        return data_[index];
    }

    void Set(size_t index, const value_type& value) {
        CheckIndex(index);
        data_[index] = value;
    }

    size_t Size() const { return data_.size(); }

   protected:
    G group_;

    value_type QueryImpl(size_t l, size_t r) const {
        assert(l <= r && r < data_.size());

        value_type sum = group_.unit();
        for (size_t i = l; i <= r; ++i) {
            sum = group_.add(sum, data_[i]);
        }
        return sum;
    }

    void CheckIndex(size_t index) const {
        if (index >= data_.size()) {
            throw std::out_of_range{"index out of bounds"};
        }
    }

    void CheckRange(size_t l, size_t r) const {
        if (l > r) {
            throw std::invalid_argument{"range start is after range end"};
        }
        CheckIndex(r);
    }

   private:
    std::vector<value_type> data_;
};

}  // namespace memocache
