/**
 * @file merkle.cpp
 * @brief Реализация Merkle root
 */

#include "merkle.hpp"
#include "../../crypto/sha256.hpp"

#include <array>
#include <cstring>

namespace qtc::core {

Hash256 merkle_hash(const Hash256& left, const Hash256& right) noexcept {
    std::array<uint8_t, 64> combined;
    std::memcpy(combined.data(), left.data(), 32);
    std::memcpy(combined.data() + 32, right.data(), 32);
    return crypto::sha256d(combined);
}

Hash256 compute_merkle_root(std::vector<Hash256> leaves) {
    if (leaves.empty()) {
        return Hash256{};
    }

    while (leaves.size() > 1) {
        if (leaves.size() % 2 != 0) {
            leaves.push_back(leaves.back());
        }

        // Следующий уровень пишется поверх текущего
        std::size_t next = 0;
        for (std::size_t i = 0; i < leaves.size(); i += 2) {
            leaves[next++] = merkle_hash(leaves[i], leaves[i + 1]);
        }
        leaves.resize(next);
    }

    return leaves[0];
}

} // namespace qtc::core
