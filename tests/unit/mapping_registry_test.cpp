#include "internal/protocol/mapping_registry.hpp"

#include <cassert>
#include <iostream>
#include <set>
#include <string>

namespace {

using faultline::ErrorCode;
using faultline::ErrorKind;
namespace protocol = faultline::protocol;

void TestEveryKindResolvesToItsStatus() {
  for (auto kind : faultline::kAllErrorKinds) {
    const auto  code    = ErrorCode::FromKind(kind);
    const auto* mapping = protocol::MappingForCode(code.View());
    assert(mapping != nullptr && "every canonical code needs a registry entry");
    assert(mapping->kind == kind);
    assert(mapping->http_status == faultline::KindHttpStatus(kind));
  }
}

void TestEveryBuiltInCodeIsRegistered() {
  const std::string_view all_codes[] = {
      faultline::codes::kNotFound,     faultline::codes::kValidation,     faultline::codes::kConflict,
      faultline::codes::kUserAlreadyExists, faultline::codes::kUnauthorized, faultline::codes::kForbidden,
      faultline::codes::kNotImplemented, faultline::codes::kBadRequest,   faultline::codes::kRateLimited,
      faultline::codes::kInvalidJwt,   faultline::codes::kInternal,       faultline::codes::kDatabase,
      faultline::codes::kService,      faultline::codes::kConfig,         faultline::codes::kTimeout,
      faultline::codes::kNetwork,      faultline::codes::kDependencyUnavailable, faultline::codes::kSerialization,
      faultline::codes::kDeserialization, faultline::codes::kExternalApi, faultline::codes::kQueue,
      faultline::codes::kCache,
  };

  std::set<std::string_view> seen;
  for (auto code : all_codes) {
    const auto* mapping = protocol::MappingForCode(code);
    assert(mapping != nullptr);
    assert(mapping->code == code);
    seen.insert(code);
  }
  assert(seen.size() == protocol::kCodeMappings.size());
}

void TestProblemTypesAndGrpcCodes() {
  for (const auto& mapping : protocol::kCodeMappings) {
    assert(mapping.problem_type.substr(0, protocol::kProblemTypeBase.size()) == protocol::kProblemTypeBase);
    assert(mapping.grpc.value >= 0 && mapping.grpc.value <= 16);
    assert(!mapping.grpc.name.empty());
  }

  const auto* not_found = protocol::MappingForCode("NOT_FOUND");
  assert(not_found->http_status == 404);
  assert(not_found->grpc.name == "NOT_FOUND" && not_found->grpc.value == 5);
  assert(not_found->problem_type == "https://errors.faultline.dev/not-found");

  const auto* user_exists = protocol::MappingForCode("USER_ALREADY_EXISTS");
  assert(user_exists->kind == ErrorKind::kConflict);
  assert(user_exists->grpc.name == "ALREADY_EXISTS");

  assert(protocol::MappingForCode("TIMEOUT")->grpc.name == "DEADLINE_EXCEEDED");
  assert(protocol::MappingForCode("RATE_LIMITED")->grpc.value == 8);
  assert(protocol::MappingForCode("CACHE")->grpc.name == "UNAVAILABLE");
}

void TestUnknownCodeFallsBackToKind() {
  assert(protocol::MappingForCode("PAYMENT_DECLINED") == nullptr);
  assert(protocol::MappingForCode("") == nullptr);

  const auto& mapping = protocol::MappingFor(ErrorCode::Parse("PAYMENT_DECLINED"), ErrorKind::kBadRequest);
  assert(mapping.code == "BAD_REQUEST");
  assert(mapping.http_status == 400);

  const auto& exact = protocol::MappingFor(ErrorCode::Static(faultline::codes::kUserAlreadyExists), ErrorKind::kInternal);
  assert(exact.code == "USER_ALREADY_EXISTS");
}

} // namespace

int main() {
  TestEveryKindResolvesToItsStatus();
  TestEveryBuiltInCodeIsRegistered();
  TestProblemTypesAndGrpcCodes();
  TestUnknownCodeFallsBackToKind();

  std::cout << "faultline_unit_mapping_registry: pass\n";
  return 0;
}
