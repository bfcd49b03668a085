#pragma once

#include <exception>

#include <grpcpp/grpcpp.h>

#include "internal/error/error.hpp"

namespace faultline::grpc {

/*
  Converts error records into gRPC statuses.

  The status code comes from the code mapping, the message is the safe
  message and the error details carry the problem-details JSON.
*/
::grpc::Status ToStatus(const Error& error);

// Error records convert as above; any other exception becomes INTERNAL
// with the generic internal label so its text never reaches the peer.
::grpc::Status ToStatus(const std::exception& e);

// Throws a Validation error outside 0..16.
::grpc::StatusCode GrpcCodeFromInt(int value);

} // namespace faultline::grpc
