#pragma once
#include <cstdint>
#include <ostream>

namespace memocache {

struct CacheStats {
    uint64_t hits = 0;
    uint64_t misses = 0;
    uint64_t evictions = 0;
    uint64_t invalidations = 0;

    double HitRatio() const {
        const uint64_t lookups = hits + misses;
        return lookups ? static_cast<double>(hits) / lookups : 0.;
    }
};

inline std::ostream& operator<<(std::ostream& s, const CacheStats& stats) {
    return s << "hits=" << stats.hits << " misses=" << stats.misses
             << " evictions=" << stats.evictions << " invalidations=" << stats.invalidations;
}

}  // namespace memocache
