#ifndef PSYNC_COLOR_BOUNDEDSEARCH_H
#define PSYNC_COLOR_BOUNDEDSEARCH_H

namespace PSYNC::Color {
    constexpr int kDefaultSearchIterations = 20;

    /**
     * @brief Bisect for the largest k in [lo, hi] for which pred(k) holds
     *
     * pred(lo) is assumed true and pred(hi) is never evaluated directly; the
     * returned value is the last midpoint known to satisfy the predicate, or
     * lo when none did. The iteration count is fixed, so the work is bounded.
     */
    template <typename Predicate>
    double FindLargestSatisfying(double lo, double hi, Predicate &&pred,
                                 int iterations = kDefaultSearchIterations) {
        double low = lo;
        double high = hi;
        for (int i = 0; i < iterations; ++i) {
            const double mid = (low + high) / 2;
            if (pred(mid))
                low = mid;
            else
                high = mid;
        }
        return low;
    }
} // namespace PSYNC::Color

#endif // PSYNC_COLOR_BOUNDEDSEARCH_H
