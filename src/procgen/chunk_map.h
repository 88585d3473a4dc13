#pragma once
// chunk_map.h
// Sparse chunked lattice storage with an ambient value for unwritten cells.

#include <algorithm>
#include <cstddef>
#include <sstream>
#include <stdexcept>
#include <unordered_map>
#include <vector>

#include "procgen/extent.h"

namespace procgen
{

inline int floorDiv(int value, int divisor) noexcept
{
    int quotient = value / divisor;
    int remainder = value % divisor;
    if ((remainder != 0) && ((remainder < 0) != (divisor < 0)))
    {
        --quotient;
    }
    return quotient;
}

template <glm::length_t N>
struct ChunkKeyHasher
{
    std::size_t operator()(const LatticePoint<N>& v) const noexcept
    {
        constexpr std::size_t kPrimes[3] = {73856093u, 19349663u, 83492791u};
        std::size_t hash = 0;
        for (glm::length_t i = 0; i < N; ++i)
        {
            hash ^= static_cast<std::size_t>(v[i]) * kPrimes[i];
        }
        return hash;
    }
};

// Chunks are keyed by their minimum corner and allocated on first write.
template <glm::length_t N, typename T>
class ChunkMap
{
public:
    using Point = LatticePoint<N>;

    ChunkMap(const Point& chunkShape, T ambientValue)
        : chunkShape_(chunkShape),
          ambientValue_(ambientValue)
    {
        for (glm::length_t i = 0; i < N; ++i)
        {
            if (chunkShape[i] <= 0)
            {
                std::ostringstream oss;
                oss << "Chunk shape component " << i << " must be positive (got " << chunkShape[i] << ")";
                throw std::invalid_argument(oss.str());
            }
        }

        chunkVolume_ = 1;
        for (glm::length_t i = 0; i < N; ++i)
        {
            chunkVolume_ *= static_cast<std::size_t>(chunkShape[i]);
        }
    }

    [[nodiscard]] const Point& chunkShape() const noexcept { return chunkShape_; }
    [[nodiscard]] T ambientValue() const noexcept { return ambientValue_; }
    [[nodiscard]] std::size_t chunkCount() const noexcept { return chunks_.size(); }

    [[nodiscard]] Point chunkKeyForPoint(const Point& p) const noexcept
    {
        Point key{0};
        for (glm::length_t i = 0; i < N; ++i)
        {
            key[i] = floorDiv(p[i], chunkShape_[i]) * chunkShape_[i];
        }
        return key;
    }

    [[nodiscard]] Extent<N> extentForChunkAtKey(const Point& key) const noexcept
    {
        return Extent<N>::fromMinAndShape(key, chunkShape_);
    }

    // Keys of every allocated chunk in lexicographic order, z (or y) most significant.
    [[nodiscard]] std::vector<Point> chunkKeys() const
    {
        std::vector<Point> keys;
        keys.reserve(chunks_.size());
        for (const auto& entry : chunks_)
        {
            keys.push_back(entry.first);
        }

        std::sort(keys.begin(), keys.end(), [](const Point& a, const Point& b) {
            for (glm::length_t i = N; i-- > 0;)
            {
                if (a[i] != b[i])
                {
                    return a[i] < b[i];
                }
            }
            return false;
        });
        return keys;
    }

    [[nodiscard]] const std::vector<T>* chunkAtKey(const Point& key) const noexcept
    {
        const auto it = chunks_.find(key);
        return it != chunks_.end() ? &it->second : nullptr;
    }

    [[nodiscard]] std::size_t localIndex(const Point& p, const Point& key) const noexcept
    {
        const Point local = p - key;
        std::size_t linear = 0;
        std::size_t stride = 1;
        for (glm::length_t i = 0; i < N; ++i)
        {
            linear += static_cast<std::size_t>(local[i]) * stride;
            stride *= static_cast<std::size_t>(chunkShape_[i]);
        }
        return linear;
    }

    [[nodiscard]] T get(const Point& p) const noexcept
    {
        const Point key = chunkKeyForPoint(p);
        const std::vector<T>* chunk = chunkAtKey(key);
        return chunk ? (*chunk)[localIndex(p, key)] : ambientValue_;
    }

    void set(const Point& p, T value)
    {
        const Point key = chunkKeyForPoint(p);
        auto it = chunks_.find(key);
        if (it == chunks_.end())
        {
            it = chunks_.emplace(key, std::vector<T>(chunkVolume_, ambientValue_)).first;
        }
        it->second[localIndex(p, key)] = value;
    }

    void clear() noexcept
    {
        chunks_.clear();
    }

private:
    Point chunkShape_;
    T ambientValue_;
    std::size_t chunkVolume_{0};
    std::unordered_map<Point, std::vector<T>, ChunkKeyHasher<N>> chunks_;
};

// Read handle for one sampling pass. Caches the chunk touched last; must not outlive the map
// or be used across writes to it.
template <glm::length_t N, typename T>
class ChunkMapReader
{
public:
    using Point = LatticePoint<N>;

    explicit ChunkMapReader(const ChunkMap<N, T>& map) noexcept
        : map_(map)
    {
    }

    [[nodiscard]] T get(const Point& p) const noexcept
    {
        const Point key = map_.chunkKeyForPoint(p);
        if (!hasCachedKey_ || key != cachedKey_)
        {
            cachedKey_ = key;
            cachedChunk_ = map_.chunkAtKey(key);
            hasCachedKey_ = true;
        }

        if (cachedChunk_ == nullptr)
        {
            return map_.ambientValue();
        }
        return (*cachedChunk_)[map_.localIndex(p, key)];
    }

    T operator()(const Point& p) const noexcept
    {
        return get(p);
    }

private:
    const ChunkMap<N, T>& map_;
    mutable Point cachedKey_{0};
    mutable const std::vector<T>* cachedChunk_{nullptr};
    mutable bool hasCachedKey_{false};
};

template <typename T>
using ChunkMap2 = ChunkMap<2, T>;

template <typename T>
using ChunkMap3 = ChunkMap<3, T>;

template <typename T>
using ChunkMapReader2 = ChunkMapReader<2, T>;

template <typename T>
using ChunkMapReader3 = ChunkMapReader<3, T>;

} // namespace procgen
