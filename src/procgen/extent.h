#pragma once

#include <cstdint>

#include <glm/common.hpp>
#include <glm/vec2.hpp>
#include <glm/vec3.hpp>

namespace procgen
{

template <glm::length_t N>
using LatticePoint = glm::vec<N, int, glm::defaultp>;

// Minimum corner plus shape. The maximum corner is inclusive: max() == minimum + shape - 1.
template <glm::length_t N>
struct Extent
{
    using Point = LatticePoint<N>;

    Point minimum{0};
    Point shape{0};

    static Extent fromMinAndShape(const Point& minimum, const Point& shape) noexcept
    {
        return Extent{minimum, glm::max(shape, Point(0))};
    }

    static Extent fromMinAndMax(const Point& minimum, const Point& maximum) noexcept
    {
        return fromMinAndShape(minimum, maximum - minimum + Point(1));
    }

    [[nodiscard]] Point leastUpperBound() const noexcept
    {
        return minimum + shape;
    }

    [[nodiscard]] Point max() const noexcept
    {
        return leastUpperBound() - Point(1);
    }

    [[nodiscard]] bool isEmpty() const noexcept
    {
        for (glm::length_t i = 0; i < N; ++i)
        {
            if (shape[i] <= 0)
            {
                return true;
            }
        }
        return false;
    }

    [[nodiscard]] std::int64_t volume() const noexcept
    {
        std::int64_t result = 1;
        for (glm::length_t i = 0; i < N; ++i)
        {
            result *= static_cast<std::int64_t>(shape[i] > 0 ? shape[i] : 0);
        }
        return result;
    }

    [[nodiscard]] bool contains(const Point& p) const noexcept
    {
        const Point lub = leastUpperBound();
        for (glm::length_t i = 0; i < N; ++i)
        {
            if (p[i] < minimum[i] || p[i] >= lub[i])
            {
                return false;
            }
        }
        return true;
    }

    // Grows every face by amount. A negative amount shrinks, bottoming out at an empty extent.
    [[nodiscard]] Extent padded(int amount) const noexcept
    {
        return fromMinAndShape(minimum - Point(amount), shape + Point(2 * amount));
    }

    [[nodiscard]] Extent addToShape(const Point& delta) const noexcept
    {
        return fromMinAndShape(minimum, shape + delta);
    }

    [[nodiscard]] Extent intersection(const Extent& other) const noexcept
    {
        const Point newMin = glm::max(minimum, other.minimum);
        const Point newLub = glm::min(leastUpperBound(), other.leastUpperBound());
        return fromMinAndShape(newMin, newLub - newMin);
    }

    [[nodiscard]] bool containsExtent(const Extent& other) const noexcept
    {
        return other.isEmpty() || (contains(other.minimum) && contains(other.max()));
    }

    // Visits every point with x varying fastest, matching the layout of Array.
    template <typename Fn>
    void forEachPoint(Fn&& fn) const
    {
        if (isEmpty())
        {
            return;
        }

        const Point lub = leastUpperBound();
        if constexpr (N == 2)
        {
            for (int y = minimum.y; y < lub.y; ++y)
            {
                for (int x = minimum.x; x < lub.x; ++x)
                {
                    fn(Point(x, y));
                }
            }
        }
        else
        {
            static_assert(N == 3, "Extent only supports 2D and 3D lattices");
            for (int z = minimum.z; z < lub.z; ++z)
            {
                for (int y = minimum.y; y < lub.y; ++y)
                {
                    for (int x = minimum.x; x < lub.x; ++x)
                    {
                        fn(Point(x, y, z));
                    }
                }
            }
        }
    }

    bool operator==(const Extent& other) const noexcept
    {
        return minimum == other.minimum && shape == other.shape;
    }

    bool operator!=(const Extent& other) const noexcept
    {
        return !(*this == other);
    }
};

using Extent2i = Extent<2>;
using Extent3i = Extent<3>;

} // namespace procgen
