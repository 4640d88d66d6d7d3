// SPDX-License-Identifier: Apache-2.0
#include "engine/rng.hpp"

namespace dball::engine {

uint64_t fnv1a64(std::string_view s) noexcept
{
    uint64_t h = 0xcbf29ce484222325ULL;
    for (char c : s) {
        h ^= static_cast<uint8_t>(c);
        h *= 0x100000001b3ULL;
    }
    return h;
}

} // namespace dball::engine
