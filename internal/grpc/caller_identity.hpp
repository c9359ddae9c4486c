#pragma once

#include <string_view>

#include <grpcpp/grpcpp.h>

#include "internal/auth/access_policy.hpp"

namespace agentpay::grpc {

// Token part of an "authorization: Bearer <token>" value.
// Throws Unauthenticated for any other scheme.
std::string_view BearerToken(std::string_view header);

// Resolves the calling principal from request metadata. No header means
// the anonymous principal.
auth::Principal ResolveCaller(const ::grpc::ServerContext& context, const auth::AccessPolicy& access);

} // namespace agentpay::grpc
