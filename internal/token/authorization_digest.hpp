#pragma once

#include <cstdint>
#include <string>
#include <string_view>

#include "internal/token/token_authorization.hpp"

namespace agentpay::token {

/*
  Domain-separated authorization digests.

    domainSeparator = SHA256(H("Domain(string name,string version,uint256 chainId,address verifyingContract)")
                             || H(name) || H(version) || be64(chainId) || verifyingContract[20])
    structHash      = SHA256(H("TransferWithAuthorization(address from,address to,uint256 value,uint256 validAfter,"
                               "uint256 validBefore,bytes32 nonce)")
                             || from[20] || to[20] || be64(value) || be64(validAfter) || be64(validBefore) || nonce[32])
    digest          = SHA256(0x19 0x01 || domainSeparator || structHash)

  Signatures are HMAC-SHA256(signing_key, digest). All values are raw bytes.
*/

struct Domain {
  std::string name;
  std::string version;
  uint64_t    chain_id = 0;
  std::string verifying_contract;
};

std::string Sha256(std::string_view data);

std::string DomainSeparator(const Domain& domain);

// Throws InvalidArgument on malformed addresses or nonce.
std::string AuthorizationDigest(const Domain& domain, const TransferAuthorization& authorization);

std::string SignDigest(std::string_view signing_key, std::string_view digest);

// Constant-time comparison.
bool VerifyDigest(std::string_view signing_key, std::string_view digest, std::string_view signature);

// Convenience for payers and tests: digest + HMAC in one step.
std::string SignAuthorization(const Domain& domain, const TransferAuthorization& authorization, std::string_view signing_key);

} // namespace agentpay::token
