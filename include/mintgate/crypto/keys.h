// MINTGATE - secp256k1 Keys and Address Derivation
// Copyright (c) 2024 MINTGATE Developers
// MIT License
//
// Derives participant addresses from secp256k1 private keys:
//   address = keccak256(X || Y)[12..32]
// where (X, Y) is the uncompressed public point. Curve arithmetic is
// delegated to OpenSSL.

#ifndef MINTGATE_CRYPTO_KEYS_H
#define MINTGATE_CRYPTO_KEYS_H

#include <mintgate/core/types.h>

#include <array>
#include <optional>
#include <string>

namespace mintgate {

/// Uncompressed public key size (0x04 || X || Y)
constexpr size_t UNCOMPRESSED_PUBKEY_SIZE = 65;

/// Private key size
constexpr size_t PRIVATE_KEY_SIZE = 32;

/// Uncompressed secp256k1 public key
class PublicKey {
public:
    PublicKey() { data_.fill(0); }
    explicit PublicKey(const std::array<Byte, UNCOMPRESSED_PUBKEY_SIZE>& data)
        : data_(data) {}

    /// True when the key carries the 0x04 uncompressed prefix
    bool IsValid() const { return data_[0] == 0x04; }

    const std::array<Byte, UNCOMPRESSED_PUBKEY_SIZE>& GetBytes() const { return data_; }

    /// Derive the account address
    Address GetAddress() const;

    std::string ToHex() const;

private:
    std::array<Byte, UNCOMPRESSED_PUBKEY_SIZE> data_;
};

/// secp256k1 private scalar
class PrivateKey {
public:
    /// Build from raw bytes; nullopt if the scalar is zero or not below the
    /// curve order
    static std::optional<PrivateKey> FromBytes(const Byte* data, size_t len);

    /// Parse hex (optional 0x prefix)
    static std::optional<PrivateKey> FromHex(const std::string& hex);

    /// Compute the public point; nullopt if OpenSSL fails
    std::optional<PublicKey> GetPublicKey() const;

    /// Shortcut for GetPublicKey()->GetAddress()
    std::optional<Address> GetAddress() const;

    ~PrivateKey();
    PrivateKey(const PrivateKey& other) = default;
    PrivateKey& operator=(const PrivateKey& other) = default;

private:
    PrivateKey() = default;
    std::array<Byte, PRIVATE_KEY_SIZE> secret_{};
};

} // namespace mintgate

#endif // MINTGATE_CRYPTO_KEYS_H
