#pragma once

#include <cstddef>
#include <vector>

#include "procgen/extent.h"

namespace procgen
{

template <glm::length_t N, typename T>
class Array
{
public:
    using Point = LatticePoint<N>;

    Array(const Extent<N>& extent, T fillValue)
        : extent_(extent),
          values_(static_cast<std::size_t>(extent.volume()), fillValue)
    {
    }

    [[nodiscard]] const Extent<N>& extent() const noexcept { return extent_; }

    // Linear index of a point inside the extent, x fastest.
    [[nodiscard]] std::size_t index(const Point& p) const noexcept
    {
        const Point local = p - extent_.minimum;
        std::size_t linear = 0;
        std::size_t stride = 1;
        for (glm::length_t i = 0; i < N; ++i)
        {
            linear += static_cast<std::size_t>(local[i]) * stride;
            stride *= static_cast<std::size_t>(extent_.shape[i]);
        }
        return linear;
    }

    [[nodiscard]] T get(const Point& p) const noexcept
    {
        return values_[index(p)];
    }

    T operator()(const Point& p) const noexcept
    {
        return get(p);
    }

    void set(const Point& p, T value) noexcept
    {
        values_[index(p)] = value;
    }

private:
    Extent<N> extent_;
    std::vector<T> values_;
};

template <typename T>
using Array2 = Array<2, T>;

template <typename T>
using Array3 = Array<3, T>;

} // namespace procgen
