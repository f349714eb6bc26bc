// MINTGATE - Hex Encoding/Decoding Utilities
// Copyright (c) 2024 MINTGATE Developers
// MIT License

#ifndef MINTGATE_CORE_HEX_H
#define MINTGATE_CORE_HEX_H

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace mintgate {

/// Convert bytes to lowercase hex (no prefix)
std::string BytesToHex(const uint8_t* data, size_t len);
std::string BytesToHex(const std::vector<uint8_t>& data);

/// Convert hex to bytes. An optional "0x"/"0X" prefix is accepted.
/// @throws std::invalid_argument on odd length or non-hex characters
std::vector<uint8_t> HexToBytes(const std::string& hex);

/// Check if string is valid hex (prefix allowed, empty body rejected)
bool IsValidHex(const std::string& str);

/// Strip a leading "0x"/"0X" if present
std::string StripHexPrefix(const std::string& hex);

} // namespace mintgate

#endif // MINTGATE_CORE_HEX_H
