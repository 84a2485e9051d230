#pragma once
#include <algorithm>
#include <vector>

namespace Jukebox {

// Returns a shuffled copy; the input order is left untouched.
template <typename T, typename Rng>
std::vector<T> shuffled(const std::vector<T>& items, Rng& rng) {
    std::vector<T> order(items);
    if (order.size() > 1) {
        std::shuffle(order.begin(), order.end(), rng);
    }
    return order;
}

} // namespace Jukebox
