// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <cstddef>
#include <cstdint>
#include <random>
#include <stdexcept>
#include <string_view>
#include <vector>

namespace dball::engine {

// 64-bit FNV-1a; maps a match identifier onto the generator seed.
uint64_t fnv1a64(std::string_view s) noexcept;

// Seeded pseudo-random source for one match. std::mt19937_64's output sequence is fixed by the
// standard, and next() converts a draw without going through a (implementation-defined)
// distribution, so sequences are identical across platforms and standard libraries.
class DeterministicRng
{
public:
    explicit DeterministicRng(std::string_view seed) : seed_(fnv1a64(seed)), gen_(seed_) {}

    // Uniform double in [0, 1) built from the top 53 bits of one draw.
    double next() noexcept
    {
        ++draws_;
        return static_cast<double>(gen_() >> 11) * 0x1.0p-53;
    }

    // Uniformly chosen element; consumes exactly one draw.
    template <typename T>
    const T &choice(const std::vector<T> &items)
    {
        if (items.empty())
            throw std::out_of_range("DeterministicRng::choice on empty list");
        size_t idx = static_cast<size_t>(next() * static_cast<double>(items.size()));
        if (idx >= items.size())
            idx = items.size() - 1;
        return items[idx];
    }

    uint64_t seed() const noexcept { return seed_; }
    uint64_t draws() const noexcept { return draws_; }

private:
    uint64_t seed_;
    std::mt19937_64 gen_;
    uint64_t draws_{0};
};

} // namespace dball::engine
