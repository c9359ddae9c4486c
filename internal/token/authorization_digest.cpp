#include "internal/token/authorization_digest.hpp"

#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/hmac.h>

#include <stdexcept>

#include "internal/util/hex.hpp"

namespace agentpay::token {

namespace {

constexpr std::string_view kDomainType = "Domain(string name,string version,uint256 chainId,address verifyingContract)";
constexpr std::string_view kTransferType =
    "TransferWithAuthorization(address from,address to,uint256 value,uint256 validAfter,uint256 validBefore,bytes32 nonce)";

void AppendU64(std::string& out, uint64_t value) {
  for (int shift = 56; shift >= 0; shift -= 8) {
    out.push_back(static_cast<char>((value >> shift) & 0xFF));
  }
}

void AppendAddress(std::string& out, const std::string& address) {
  out += util::HexDecode(util::NormalizeAddress(address));
}

} // namespace

std::string Sha256(std::string_view data) {
  unsigned char out[EVP_MAX_MD_SIZE];
  unsigned int  out_len = 0;
  if (EVP_Digest(data.data(), data.size(), out, &out_len, EVP_sha256(), nullptr) != 1) {
    throw std::runtime_error("EVP_Digest(sha256) failed");
  }
  return std::string(reinterpret_cast<const char*>(out), out_len);
}

std::string DomainSeparator(const Domain& domain) {
  std::string encoded;
  encoded += Sha256(kDomainType);
  encoded += Sha256(domain.name);
  encoded += Sha256(domain.version);
  AppendU64(encoded, domain.chain_id);
  AppendAddress(encoded, domain.verifying_contract);
  return Sha256(encoded);
}

std::string AuthorizationDigest(const Domain& domain, const TransferAuthorization& authorization) {
  std::string encoded;
  encoded += Sha256(kTransferType);
  AppendAddress(encoded, authorization.from);
  AppendAddress(encoded, authorization.to);
  AppendU64(encoded, authorization.value);
  AppendU64(encoded, authorization.valid_after);
  AppendU64(encoded, authorization.valid_before);
  encoded += util::HexDecode(util::NormalizeBytes32(authorization.nonce, "nonce"));

  std::string message("\x19\x01", 2);
  message += DomainSeparator(domain);
  message += Sha256(encoded);
  return Sha256(message);
}

std::string SignDigest(std::string_view signing_key, std::string_view digest) {
  unsigned char out[EVP_MAX_MD_SIZE];
  unsigned int  out_len = 0;
  if (HMAC(EVP_sha256(), signing_key.data(), static_cast<int>(signing_key.size()), reinterpret_cast<const unsigned char*>(digest.data()),
           digest.size(), out, &out_len) == nullptr) {
    throw std::runtime_error("HMAC(sha256) failed");
  }
  return std::string(reinterpret_cast<const char*>(out), out_len);
}

bool VerifyDigest(std::string_view signing_key, std::string_view digest, std::string_view signature) {
  const auto expected = SignDigest(signing_key, digest);
  return signature.size() == expected.size() && CRYPTO_memcmp(signature.data(), expected.data(), expected.size()) == 0;
}

std::string SignAuthorization(const Domain& domain, const TransferAuthorization& authorization, std::string_view signing_key) {
  return SignDigest(signing_key, AuthorizationDigest(domain, authorization));
}

} // namespace agentpay::token
