#include "moving_average.hpp"

namespace mabt {

MovingAverage simpleMovingAverage(const std::vector<double>& closes, int window) {
    MovingAverage out(closes.size());
    if (window < 1) return out;
    const std::size_t w = static_cast<std::size_t>(window);

    // Each window is summed from scratch (no running-sum drift across the series).
    for (std::size_t i = w - 1; i < closes.size(); ++i) {
        double sum = 0;
        for (std::size_t k = i + 1 - w; k <= i; ++k) sum += closes[k];
        out[i] = sum / static_cast<double>(w);
    }
    return out;
}

MovingAverage simpleMovingAverage(const Series& series, int window) {
    return simpleMovingAverage(series.closes(), window);
}

} // namespace mabt
