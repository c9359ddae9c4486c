#pragma once

#include <string>

#include "config/config.pb.h"

namespace agentpay::config {

/*
  Loads RuntimeConfig from YAML.

  The document goes YAML -> protobuf Value -> JSON -> RuntimeConfig, so
  unknown keys fail the load. Unquoted integers and 0x-prefixed scalars
  travel as JSON strings: token amounts need all 64 bits and addresses
  must never become numbers.

  Scalars may reference the environment as ${NAME} or ${NAME:-default},
  which keeps principal tokens and signing keys out of the file. $${
  is a literal "${".
*/
class ConfigLoader {
 public:
  static agentpay::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);

  static agentpay::runtime::config::RuntimeConfig LoadFromYamlString(const std::string& yaml);

  // Throws std::runtime_error for an unset variable without a default.
  static std::string ExpandEnvironment(const std::string& text);
};

} // namespace agentpay::config
