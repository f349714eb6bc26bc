// MINTGATE - secp256k1 Keys Implementation
// Copyright (c) 2024 MINTGATE Developers
// MIT License

#include <mintgate/crypto/keys.h>
#include <mintgate/crypto/keccak.h>
#include <mintgate/core/hex.h>

#include <openssl/bn.h>
#include <openssl/crypto.h>
#include <openssl/ec.h>
#include <openssl/obj_mac.h>

#include <algorithm>
#include <stdexcept>
#include <vector>

namespace mintgate {

// ============================================================================
// PublicKey
// ============================================================================

Address PublicKey::GetAddress() const {
    // Hash X || Y without the 0x04 prefix, keep the low 20 bytes
    Hash256 digest = Keccak256Hash(data_.data() + 1, UNCOMPRESSED_PUBKEY_SIZE - 1);
    return Address(digest.data() + 12, 20);
}

std::string PublicKey::ToHex() const {
    return BytesToHex(data_.data(), data_.size());
}

// ============================================================================
// PrivateKey
// ============================================================================

PrivateKey::~PrivateKey() {
    OPENSSL_cleanse(secret_.data(), secret_.size());
}

std::optional<PrivateKey> PrivateKey::FromBytes(const Byte* data, size_t len) {
    if (data == nullptr || len != PRIVATE_KEY_SIZE) {
        return std::nullopt;
    }

    EC_GROUP* group = EC_GROUP_new_by_curve_name(NID_secp256k1);
    if (!group) {
        return std::nullopt;
    }

    BIGNUM* scalar = BN_bin2bn(data, static_cast<int>(len), nullptr);
    bool valid = scalar != nullptr &&
                 !BN_is_zero(scalar) &&
                 BN_cmp(scalar, EC_GROUP_get0_order(group)) < 0;

    BN_clear_free(scalar);
    EC_GROUP_free(group);

    if (!valid) {
        return std::nullopt;
    }

    PrivateKey key;
    std::copy(data, data + len, key.secret_.begin());
    return key;
}

std::optional<PrivateKey> PrivateKey::FromHex(const std::string& hex) {
    std::vector<Byte> bytes;
    try {
        bytes = HexToBytes(hex);
    } catch (const std::invalid_argument&) {
        return std::nullopt;
    }
    auto key = FromBytes(bytes.data(), bytes.size());
    OPENSSL_cleanse(bytes.data(), bytes.size());
    return key;
}

std::optional<PublicKey> PrivateKey::GetPublicKey() const {
    EC_GROUP* group = EC_GROUP_new_by_curve_name(NID_secp256k1);
    if (!group) {
        return std::nullopt;
    }

    BIGNUM* scalar = BN_bin2bn(secret_.data(), static_cast<int>(secret_.size()), nullptr);
    EC_POINT* point = EC_POINT_new(group);
    BN_CTX* ctx = BN_CTX_new();

    std::optional<PublicKey> result;
    if (scalar && point && ctx &&
        EC_POINT_mul(group, point, scalar, nullptr, nullptr, ctx) == 1) {
        std::array<Byte, UNCOMPRESSED_PUBKEY_SIZE> out{};
        size_t written = EC_POINT_point2oct(group, point, POINT_CONVERSION_UNCOMPRESSED,
                                            out.data(), out.size(), ctx);
        if (written == UNCOMPRESSED_PUBKEY_SIZE) {
            result = PublicKey(out);
        }
    }

    BN_CTX_free(ctx);
    EC_POINT_free(point);
    BN_clear_free(scalar);
    EC_GROUP_free(group);

    return result;
}

std::optional<Address> PrivateKey::GetAddress() const {
    auto pub = GetPublicKey();
    if (!pub) {
        return std::nullopt;
    }
    return pub->GetAddress();
}

} // namespace mintgate
