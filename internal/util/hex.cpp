#include "hex.hpp"

#include "internal/util/errors.hpp"
#include "internal/util/keccak.hpp"

namespace agentpay::util {

namespace {

constexpr char kHex[] = "0123456789abcdef";

int HexNibble(char c) {
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return 10 + (c - 'a');
  if (c >= 'A' && c <= 'F') return 10 + (c - 'A');
  return -1;
}

std::string_view StripPrefix(std::string_view value) {
  if (value.size() >= 2 && value[0] == '0' && (value[1] == 'x' || value[1] == 'X')) {
    value.remove_prefix(2);
  }
  return value;
}

bool IsHexOfLength(std::string_view value, std::size_t hex_chars) {
  if (value.size() != hex_chars + 2 || value[0] != '0' || (value[1] != 'x' && value[1] != 'X')) {
    return false;
  }
  for (std::size_t i = 2; i < value.size(); ++i) {
    if (HexNibble(value[i]) < 0) return false;
  }
  return true;
}

std::string LowerWithPrefix(std::string_view value) {
  std::string out = "0x";
  out.reserve(value.size());
  for (std::size_t i = 2; i < value.size(); ++i) {
    out.push_back(kHex[HexNibble(value[i])]);
  }
  return out;
}

} // namespace

std::string HexEncode(std::string_view bytes) {
  std::string out;
  out.reserve(bytes.size() * 2);
  for (char c : bytes) {
    const auto b = static_cast<unsigned char>(c);
    out.push_back(kHex[b >> 4]);
    out.push_back(kHex[b & 0x0F]);
  }
  return out;
}

std::string HexDecode(std::string_view hex) {
  hex = StripPrefix(hex);
  if (hex.size() % 2 != 0) {
    throw InvalidArgument("hex string has odd length");
  }

  std::string out(hex.size() / 2, '\0');
  for (std::size_t i = 0; i < out.size(); ++i) {
    const int hi = HexNibble(hex[2 * i]);
    const int lo = HexNibble(hex[2 * i + 1]);
    if (hi < 0 || lo < 0) {
      throw InvalidArgument("invalid hex character in '" + std::string(hex) + "'");
    }
    out[i] = static_cast<char>((hi << 4) | lo);
  }
  return out;
}

std::string NormalizeAddress(std::string_view address) {
  if (!IsHexOfLength(address, 40)) {
    throw InvalidArgument("invalid address '" + std::string(address) + "': expected 0x + 40 hex chars");
  }
  return LowerWithPrefix(address);
}

bool IsAddress(std::string_view address) {
  return IsHexOfLength(address, 40);
}

std::string ZeroAddress() {
  return "0x" + std::string(40, '0');
}

bool IsZeroAddress(std::string_view address) {
  address = StripPrefix(address);
  if (address.empty()) return true;
  for (char c : address) {
    if (c != '0') return false;
  }
  return true;
}

bool IsBytes32Hex(std::string_view value) {
  return IsHexOfLength(value, 64);
}

std::string NormalizeBytes32(std::string_view value, std::string_view what) {
  if (!IsBytes32Hex(value)) {
    throw InvalidArgument("invalid " + std::string(what) + " '" + std::string(value) + "': expected 0x + 64 hex chars");
  }
  return LowerWithPrefix(value);
}

std::string NormalizePaymentId(std::string_view payment_id) {
  if (payment_id.empty()) {
    throw InvalidArgument("payment id must not be empty");
  }
  if (IsBytes32Hex(payment_id)) {
    return LowerWithPrefix(payment_id);
  }
  return "0x" + HexEncode(Keccak256(payment_id));
}

} // namespace agentpay::util
