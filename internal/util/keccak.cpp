#include "keccak.hpp"

#include <array>
#include <cstdint>

namespace agentpay::util {

namespace {

constexpr std::size_t kRateBytes   = 136;
constexpr std::size_t kDigestBytes = 32;

constexpr std::array<uint64_t, 24> kRoundConstants = {
    0x0000000000000001ULL, 0x0000000000008082ULL, 0x800000000000808aULL, 0x8000000080008000ULL,
    0x000000000000808bULL, 0x0000000080000001ULL, 0x8000000080008081ULL, 0x8000000000008009ULL,
    0x000000000000008aULL, 0x0000000000000088ULL, 0x0000000080008009ULL, 0x000000008000000aULL,
    0x000000008000808bULL, 0x800000000000008bULL, 0x8000000000008089ULL, 0x8000000000008003ULL,
    0x8000000000008002ULL, 0x8000000000000080ULL, 0x000000000000800aULL, 0x800000008000000aULL,
    0x8000000080008081ULL, 0x8000000000008080ULL, 0x0000000080000001ULL, 0x8000000080008008ULL,
};

constexpr std::array<int, 24> kRotations = {
    1, 3, 6, 10, 15, 21, 28, 36, 45, 55, 2, 14, 27, 41, 56, 8, 25, 43, 62, 18, 39, 61, 20, 44,
};

constexpr std::array<int, 24> kPiLanes = {
    10, 7, 11, 17, 18, 3, 5, 16, 8, 21, 24, 4, 15, 23, 19, 13, 12, 2, 20, 14, 22, 9, 6, 1,
};

uint64_t Rotl(uint64_t x, int n) {
  return (x << n) | (x >> (64 - n));
}

void KeccakF1600(std::array<uint64_t, 25>& st) {
  std::array<uint64_t, 5> bc{};
  for (uint64_t rc : kRoundConstants) {
    // theta
    for (int i = 0; i < 5; ++i) {
      bc[i] = st[i] ^ st[i + 5] ^ st[i + 10] ^ st[i + 15] ^ st[i + 20];
    }
    for (int i = 0; i < 5; ++i) {
      const uint64_t t = bc[(i + 4) % 5] ^ Rotl(bc[(i + 1) % 5], 1);
      for (int j = 0; j < 25; j += 5) st[j + i] ^= t;
    }

    // rho and pi
    uint64_t t = st[1];
    for (int i = 0; i < 24; ++i) {
      const int      j    = kPiLanes[i];
      const uint64_t next = st[j];
      st[j]               = Rotl(t, kRotations[i]);
      t                   = next;
    }

    // chi
    for (int j = 0; j < 25; j += 5) {
      for (int i = 0; i < 5; ++i) bc[i] = st[j + i];
      for (int i = 0; i < 5; ++i) {
        st[j + i] ^= (~bc[(i + 1) % 5]) & bc[(i + 2) % 5];
      }
    }

    // iota
    st[0] ^= rc;
  }
}

// Lanes are little-endian regardless of host byte order.
void AbsorbBlock(std::array<uint64_t, 25>& st, const unsigned char* block) {
  for (std::size_t lane = 0; lane < kRateBytes / 8; ++lane) {
    uint64_t v = 0;
    for (int b = 7; b >= 0; --b) {
      v = (v << 8) | block[lane * 8 + b];
    }
    st[lane] ^= v;
  }
  KeccakF1600(st);
}

} // namespace

std::string Keccak256(std::string_view data) {
  std::array<uint64_t, 25> st{};

  const auto* bytes     = reinterpret_cast<const unsigned char*>(data.data());
  std::size_t remaining = data.size();
  while (remaining >= kRateBytes) {
    AbsorbBlock(st, bytes);
    bytes += kRateBytes;
    remaining -= kRateBytes;
  }

  std::array<unsigned char, kRateBytes> last{};
  for (std::size_t i = 0; i < remaining; ++i) last[i] = bytes[i];
  last[remaining] ^= 0x01;
  last[kRateBytes - 1] ^= 0x80;
  AbsorbBlock(st, last.data());

  std::string out(kDigestBytes, '\0');
  for (std::size_t i = 0; i < kDigestBytes; ++i) {
    out[i] = static_cast<char>((st[i / 8] >> (8 * (i % 8))) & 0xFF);
  }
  return out;
}

} // namespace agentpay::util
