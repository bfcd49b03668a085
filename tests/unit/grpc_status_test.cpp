#include "internal/grpc/grpc_error.hpp"

#include <cassert>
#include <iostream>
#include <stdexcept>
#include <string>

#include <grpcpp/grpcpp.h>
#include <spdlog/spdlog.h>

namespace {

using faultline::Error;
using faultline::ErrorKind;

void TestNotFoundMapsToNotFound() {
  const auto status = faultline::grpc::ToStatus(Error::NotFound("record 7 missing"));
  assert(status.error_code() == ::grpc::StatusCode::NOT_FOUND);
  assert(status.error_message() == "record 7 missing");
  assert(status.error_details().find("\"type\":\"https://errors.faultline.dev/not-found\"") != std::string::npos);
}

void TestTimeoutMapsToDeadlineExceeded() {
  const auto status = faultline::grpc::ToStatus(Error::Timeout("upstream slow"));
  assert(status.error_code() == ::grpc::StatusCode::DEADLINE_EXCEEDED);
}

void TestRedactedMessageUsesLabel() {
  const auto status = faultline::grpc::ToStatus(Error::Forbidden("bob may not read /etc").Redactable());
  assert(status.error_code() == ::grpc::StatusCode::PERMISSION_DENIED);
  assert(status.error_message() == "Forbidden");
  assert(status.error_details().find("/etc") == std::string::npos);
}

void TestStdExceptionPaths() {
  try {
    throw Error::Conflict("duplicate");
  } catch (const std::exception& e) {
    assert(faultline::grpc::ToStatus(e).error_code() == ::grpc::StatusCode::ALREADY_EXISTS);
  }

  const auto internal = faultline::grpc::ToStatus(std::runtime_error("db password is hunter2"));
  assert(internal.error_code() == ::grpc::StatusCode::INTERNAL);
  assert(internal.error_message().find("hunter2") == std::string::npos);
}

void TestCustomCodeFallsBackToKind() {
  const Error error(faultline::ErrorCode::Parse("QUOTA_EXCEEDED"), ErrorKind::kRateLimited, std::nullopt);
  assert(faultline::grpc::ToStatus(error).error_code() == ::grpc::StatusCode::RESOURCE_EXHAUSTED);
}

void TestGrpcCodeFromInt() {
  assert(faultline::grpc::GrpcCodeFromInt(0) == ::grpc::StatusCode::OK);
  assert(faultline::grpc::GrpcCodeFromInt(16) == ::grpc::StatusCode::UNAUTHENTICATED);

  for (int bad : {-1, 17, 100}) {
    bool threw = false;
    try {
      (void)faultline::grpc::GrpcCodeFromInt(bad);
    } catch (const Error& e) {
      threw = e.Kind() == ErrorKind::kValidation;
    }
    assert(threw);
  }
}

} // namespace

int main() {
  spdlog::set_level(spdlog::level::off);

  TestNotFoundMapsToNotFound();
  TestTimeoutMapsToDeadlineExceeded();
  TestRedactedMessageUsesLabel();
  TestStdExceptionPaths();
  TestCustomCodeFallsBackToKind();
  TestGrpcCodeFromInt();

  std::cout << "faultline_unit_grpc_status: pass\n";
  return 0;
}
