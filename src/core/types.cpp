// MINTGATE - Core Types Implementation
// Copyright (c) 2024 MINTGATE Developers
// MIT License

#include <mintgate/core/types.h>
#include <mintgate/core/hex.h>

#include <cctype>
#include <stdexcept>

namespace mintgate {

// ============================================================================
// BaseBlob Implementation
// ============================================================================

template<size_t BITS>
std::string BaseBlob<BITS>::ToHex() const {
    return BytesToHex(data_.data(), SIZE);
}

template<size_t BITS>
BaseBlob<BITS> BaseBlob<BITS>::FromHex(const std::string& hex) {
    std::vector<Byte> bytes = HexToBytes(hex);
    if (bytes.size() != SIZE) {
        throw std::invalid_argument("Invalid hex string length for " +
                                    std::to_string(SIZE) + "-byte value");
    }
    return BaseBlob(bytes.data(), bytes.size());
}

// Explicit template instantiations
template class BaseBlob<256>;
template class BaseBlob<160>;

std::optional<Address> ParseAddress(const std::string& str) {
    try {
        return Address::FromHex(str);
    } catch (const std::invalid_argument&) {
        return std::nullopt;
    }
}

std::optional<Hash256> ParseHash256(const std::string& str) {
    try {
        return Hash256::FromHex(str);
    } catch (const std::invalid_argument&) {
        return std::nullopt;
    }
}

// ============================================================================
// Amount Formatting
// ============================================================================

std::string FormatAmount(Amount amount) {
    std::string whole = std::to_string(amount / UNIT);
    std::string frac = std::to_string(amount % UNIT);
    frac.insert(0, AMOUNT_DECIMALS - frac.size(), '0');

    // Trim trailing zeros but keep at least one digit
    while (frac.size() > 1 && frac.back() == '0') {
        frac.pop_back();
    }
    return whole + "." + frac;
}

std::optional<Amount> ParseAmount(const std::string& str) {
    if (str.empty()) {
        return std::nullopt;
    }

    size_t dot = str.find('.');
    std::string wholePart = str.substr(0, dot);
    std::string fracPart = dot == std::string::npos ? "" : str.substr(dot + 1);

    if (wholePart.empty() && fracPart.empty()) {
        return std::nullopt;
    }
    if (fracPart.size() > static_cast<size_t>(AMOUNT_DECIMALS)) {
        return std::nullopt;
    }

    Amount whole = 0;
    for (char c : wholePart) {
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            return std::nullopt;
        }
        auto scaled = CheckedMul(whole, 10);
        if (!scaled) return std::nullopt;
        auto next = CheckedAdd(*scaled, static_cast<uint64_t>(c - '0'));
        if (!next) return std::nullopt;
        whole = *next;
    }

    Amount frac = 0;
    for (int i = 0; i < AMOUNT_DECIMALS; ++i) {
        frac *= 10;
        if (static_cast<size_t>(i) < fracPart.size()) {
            char c = fracPart[i];
            if (!std::isdigit(static_cast<unsigned char>(c))) {
                return std::nullopt;
            }
            frac += static_cast<Amount>(c - '0');
        }
    }

    auto base = CheckedMul(whole, UNIT);
    if (!base) {
        return std::nullopt;
    }
    return CheckedAdd(*base, frac);
}

} // namespace mintgate
