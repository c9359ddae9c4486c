#pragma once

#include <string>
#include <string_view>

namespace agentpay::util {

/*
  Keccak-256 as used by Ethereum (original 0x01 padding, not the FIPS-202
  0x06 domain byte). OpenSSL exposes it only from 3.2 onward.

  Returns the raw 32-byte digest.
*/
std::string Keccak256(std::string_view data);

} // namespace agentpay::util
