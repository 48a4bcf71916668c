#pragma once

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <vector>

namespace WaterClock {

/**
 * Generic row-major 2D buffer. No bounds checking: callers that index with
 * computed offsets go through Grid, which owns the range checks.
 */
template <typename T>
struct GridBuffer {
    static constexpr int kMaxExtent = std::numeric_limits<int16_t>::max();

    int16_t width = 0;
    int16_t height = 0;
    std::vector<T> data;

    void resize(int w, int h, T default_value = T{})
    {
        width = static_cast<int16_t>(w);
        height = static_cast<int16_t>(h);
        data.assign(static_cast<size_t>(w) * h, default_value);
    }

    void clear(T value = T{}) { std::fill(data.begin(), data.end(), value); }

    bool contains(int x, int y) const { return x >= 0 && x < width && y >= 0 && y < height; }

    T at(int x, int y) const { return data[static_cast<size_t>(y) * width + x]; }

    T& at(int x, int y) { return data[static_cast<size_t>(y) * width + x]; }

    void set(int x, int y, T value) { data[static_cast<size_t>(y) * width + x] = value; }

    // Direct row access for tight loops.
    T* row(int y) { return &data[static_cast<size_t>(y) * width]; }

    const T* row(int y) const { return &data[static_cast<size_t>(y) * width]; }

    size_t size() const { return data.size(); }

    bool operator==(const GridBuffer& other) const
    {
        return width == other.width && height == other.height && data == other.data;
    }
};

} // namespace WaterClock
