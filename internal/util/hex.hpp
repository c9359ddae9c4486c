#pragma once

#include <string>
#include <string_view>

namespace agentpay::util {

/*
  Hex, address and identifier helpers.

  Addresses:   "0x" + 40 lowercase hex chars (20 bytes)
  Bytes32:     "0x" + 64 lowercase hex chars (payment ids, nonces)

  All Normalize* functions throw InvalidArgument on malformed input.
*/

std::string HexEncode(std::string_view bytes);
std::string HexDecode(std::string_view hex);

std::string NormalizeAddress(std::string_view address);
bool        IsAddress(std::string_view address);
std::string ZeroAddress();
bool        IsZeroAddress(std::string_view address);

std::string NormalizeBytes32(std::string_view value, std::string_view what);
bool        IsBytes32Hex(std::string_view value);

// Bytes32 hex ids pass through (lowercased); any other non-empty string is
// replaced by the Keccak-256 digest of its bytes.
std::string NormalizePaymentId(std::string_view payment_id);

} // namespace agentpay::util
