#pragma once

namespace memocache {

// Additive group used to aggregate ranges of an ArrayStore.
template <class T>
struct DefaultGroup {
    typedef T value_type;
    T unit() const { return {}; }

    T add(const T& a, const T& b) const { return a + b; }
};

}  // namespace memocache
