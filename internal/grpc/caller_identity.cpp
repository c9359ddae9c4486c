#include "caller_identity.hpp"

#include <string>

#include "internal/util/errors.hpp"

namespace agentpay::grpc {

namespace {

constexpr std::string_view kAuthorizationHeader = "authorization";
constexpr std::string_view kBearerScheme        = "Bearer ";

} // namespace

std::string_view BearerToken(std::string_view header) {
  if (header.size() <= kBearerScheme.size() || header.substr(0, kBearerScheme.size()) != kBearerScheme) {
    throw util::Unauthenticated("authorization metadata must use the Bearer scheme");
  }
  auto token = header.substr(kBearerScheme.size());
  while (!token.empty() && token.front() == ' ') {
    token.remove_prefix(1);
  }
  if (token.empty()) {
    throw util::Unauthenticated("empty bearer token");
  }
  return token;
}

auth::Principal ResolveCaller(const ::grpc::ServerContext& context, const auth::AccessPolicy& access) {
  const auto& metadata = context.client_metadata();
  auto        it       = metadata.find(::grpc::string_ref(kAuthorizationHeader.data(), kAuthorizationHeader.size()));
  if (it == metadata.end()) {
    return auth::Principal::Anonymous();
  }

  const std::string_view header(it->second.data(), it->second.size());
  return access.Authenticate(BearerToken(header));
}

} // namespace agentpay::grpc
