#include "internal/grpc/grpc_error.hpp"

#include <string>

#include "internal/protocol/mapping_registry.hpp"
#include "internal/protocol/problem_details.hpp"

namespace faultline::grpc {

::grpc::Status ToStatus(const Error& error) {
  const auto& mapping = protocol::MappingFor(error.Code(), error.Kind());
  const auto  problem = protocol::ProblemDetails::FromError(error);
  return {GrpcCodeFromInt(mapping.grpc.value), std::string(error.SafeMessage()), problem.ToJson()};
}

::grpc::Status ToStatus(const std::exception& e) {
  if (const auto* error = dynamic_cast<const Error*>(&e)) {
    return ToStatus(*error);
  }
  return {::grpc::StatusCode::INTERNAL, std::string(KindLabel(ErrorKind::kInternal))};
}

::grpc::StatusCode GrpcCodeFromInt(int value) {
  if (value < ::grpc::StatusCode::OK || value > ::grpc::StatusCode::UNAUTHENTICATED) {
    throw Error::Validation("invalid gRPC status code").WithField(field::I64("grpc_code", value));
  }
  return static_cast<::grpc::StatusCode>(value);
}

} // namespace faultline::grpc
