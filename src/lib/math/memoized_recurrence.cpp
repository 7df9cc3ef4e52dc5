#include "memoized_recurrence.hpp"

#include <limits>
#include <stdexcept>
#include <vector>

namespace memocache {

namespace {

uint64_t CheckedAdd(uint64_t a, uint64_t b) {
    if (a > std::numeric_limits<uint64_t>::max() - b) {
        throw std::overflow_error{"fibonacci value does not fit in 64 bits"};
    }
    return a + b;
}

void CheckDomain(int64_t n) {
    if (n < 0) {
        throw std::invalid_argument{"fibonacci is undefined for negative n"};
    }
}

}  // namespace

// Same cache traffic as the recursive definition (search n, evaluate n - 1,
// evaluate n - 2, insert n) but driven by an explicit work list, so the call
// stack depth does not grow with n.
uint64_t MemoizedRecurrence::Evaluate(int64_t n) {
    CheckDomain(n);

    struct Frame {
        int64_t n;
        int stage;
    };

    std::vector<Frame> pending{{n, 0}};
    std::vector<uint64_t> results;

    while (!pending.empty()) {
        const int64_t k = pending.back().n;
        switch (pending.back().stage) {
            case 0: {
                if (auto cached = cache_.Search(k)) {
                    results.push_back(*cached);
                    pending.pop_back();
                } else if (k < 2) {
                    cache_.Insert(k, static_cast<uint64_t>(k));
                    results.push_back(static_cast<uint64_t>(k));
                    pending.pop_back();
                } else {
                    pending.back().stage = 1;
                    pending.push_back({k - 1, 0});
                }
                break;
            }
            case 1:
                pending.back().stage = 2;
                pending.push_back({k - 2, 0});
                break;
            default: {
                const uint64_t b = results.back();
                results.pop_back();
                const uint64_t a = results.back();
                results.pop_back();

                const uint64_t value = CheckedAdd(a, b);
                cache_.Insert(k, value);
                results.push_back(value);
                pending.pop_back();
                break;
            }
        }
    }

    return results.back();
}

uint64_t FibonacciIterative(int64_t n) {
    CheckDomain(n);
    if (n < 2) return static_cast<uint64_t>(n);

    uint64_t a = 0, b = 1;
    for (int64_t i = 2; i <= n; ++i) {
        const uint64_t next = CheckedAdd(a, b);
        a = b;
        b = next;
    }
    return b;
}

}  // namespace memocache
