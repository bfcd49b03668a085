#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include <google/protobuf/struct.pb.h>

#include "internal/error/error.hpp"
#include "internal/protocol/mapping_registry.hpp"

namespace faultline::protocol {

inline constexpr std::string_view kProblemJsonContentType = "application/problem+json";

/*
  RFC 7807 problem document for an error record.

  `type` and `grpc` come from the code mapping, `status` and `title` from
  the kind. A redacted message removes `detail`, `metadata` and `details`;
  otherwise metadata is sanitized per field.
*/
class ProblemDetails {
 public:
  // Dispatches pending telemetry for `error` before reading it.
  static ProblemDetails FromError(const Error& error);

  const std::string&                            Type() const noexcept { return type_; }
  const std::string&                            Title() const noexcept { return title_; }
  std::uint16_t                                 Status() const noexcept { return status_; }
  const std::optional<std::string>&             Detail() const noexcept { return detail_; }
  const std::string&                            Code() const noexcept { return code_; }
  const GrpcCode&                               Grpc() const noexcept { return grpc_; }
  const std::optional<google::protobuf::Struct>& GetMetadata() const noexcept { return metadata_; }
  const std::optional<google::protobuf::Value>& GetDetails() const noexcept { return details_; }
  const std::optional<std::uint64_t>&           RetryAfter() const noexcept { return retry_after_; }
  const std::optional<std::string>&             WwwAuthenticate() const noexcept { return www_authenticate_; }

  // application/problem+json body.
  std::string ToJson() const;

 private:
  ProblemDetails() = default;

  std::string                             type_;
  std::string                             title_;
  std::uint16_t                           status_{500};
  std::optional<std::string>              detail_;
  std::string                             code_;
  GrpcCode                                grpc_{};
  std::optional<google::protobuf::Struct> metadata_;
  std::optional<google::protobuf::Value>  details_;
  std::optional<std::uint64_t>            retry_after_;
  std::optional<std::string>              www_authenticate_;
};

} // namespace faultline::protocol
