// MINTGATE - Keccak-256 Hash Function
// Copyright (c) 2024 MINTGATE Developers
// MIT License
//
// Keccak-256 as used for account addresses and allowlist trees
// (original Keccak padding, not the FIPS 202 SHA3-256 variant).

#ifndef MINTGATE_CRYPTO_KECCAK_H
#define MINTGATE_CRYPTO_KECCAK_H

#include <mintgate/core/types.h>

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace mintgate {

/// Incremental Keccak-256 hasher
class Keccak256 {
public:
    /// Output size in bytes
    static constexpr size_t OUTPUT_SIZE = 32;

    /// Sponge rate in bytes (1600 - 2 * 256 bits)
    static constexpr size_t RATE = 136;

    Keccak256();

    /// Absorb data
    Keccak256& Write(const Byte* data, size_t len);

    /// Pad, permute and squeeze the digest. The hasher must be Reset()
    /// before it is reused.
    void Finalize(Byte hash[OUTPUT_SIZE]);

    /// Reset to the empty state
    Keccak256& Reset();

private:
    uint64_t state_[25];
    Byte buffer_[RATE];
    size_t bufferLen_;

    /// Absorb one full rate-sized block
    void AbsorbBlock(const Byte block[RATE]);
};

// ============================================================================
// Convenience Functions
// ============================================================================

/// Keccak-256 of a byte range
Hash256 Keccak256Hash(const Byte* data, size_t len);

inline Hash256 Keccak256Hash(const std::vector<Byte>& data) {
    return Keccak256Hash(data.data(), data.size());
}

/// Keccak-256 of a string's bytes
Hash256 Keccak256Hash(const std::string& str);

/// Apply the Keccak-f[1600] permutation in place
void KeccakF1600(uint64_t state[25]);

} // namespace mintgate

#endif // MINTGATE_CRYPTO_KECCAK_H
