#include "internal/protocol/problem_details.hpp"

#include "internal/error/redaction.hpp"
#include "internal/render/json.hpp"

namespace faultline::protocol {

namespace {

std::optional<google::protobuf::Struct> SanitizeMetadata(const faultline::Metadata& metadata) {
  google::protobuf::Struct out;
  for (const auto& field : metadata) {
    const std::string name(field.Name());
    switch (field.Redaction()) {
      case FieldRedaction::kNone:
        (*out.mutable_fields())[name] = render::FieldValueToJson(field.Value());
        break;
      case FieldRedaction::kRedact:
        (*out.mutable_fields())[name].set_string_value(std::string(redaction::kRedactedPlaceholder));
        break;
      case FieldRedaction::kHash:
      case FieldRedaction::kLast4:
        if (auto value = redaction::SanitizedValue(field)) {
          (*out.mutable_fields())[name].set_string_value(std::move(*value));
        }
        break;
    }
  }
  if (out.fields().empty()) {
    return std::nullopt;
  }
  return out;
}

} // namespace

ProblemDetails ProblemDetails::FromError(const Error& error) {
  error.EmitTelemetry();

  const auto& mapping = MappingFor(error.Code(), error.Kind());

  ProblemDetails problem;
  problem.type_   = std::string(mapping.problem_type);
  problem.title_  = std::string(KindLabel(error.Kind()));
  problem.status_ = KindHttpStatus(error.Kind());
  problem.code_   = error.Code().ToString();
  problem.grpc_   = mapping.grpc;

  if (!error.IsRedacted()) {
    problem.detail_   = std::string(error.RenderMessage());
    problem.metadata_ = SanitizeMetadata(error.GetMetadata());
    if (error.GetDetails()) {
      problem.details_ = render::DetailsToJson(*error.GetDetails());
    }
  }

  if (error.Retry()) {
    problem.retry_after_ = error.Retry()->after_seconds;
  }
  problem.www_authenticate_ = error.WwwAuthenticate();
  return problem;
}

std::string ProblemDetails::ToJson() const {
  google::protobuf::Struct document;
  render::SetString(&document, "type", type_);
  render::SetString(&document, "title", title_);
  render::SetNumber(&document, "status", status_);
  render::SetString(&document, "code", code_);

  auto* grpc = (*document.mutable_fields())["grpc"].mutable_struct_value();
  render::SetString(grpc, "name", grpc_.name);
  render::SetNumber(grpc, "value", grpc_.value);

  if (detail_) {
    render::SetString(&document, "detail", *detail_);
  }
  if (metadata_) {
    *(*document.mutable_fields())["metadata"].mutable_struct_value() = *metadata_;
  }
  if (details_) {
    (*document.mutable_fields())["details"] = *details_;
  }
  if (retry_after_) {
    render::SetNumber(&document, "retry_after", static_cast<double>(*retry_after_));
  }
  if (www_authenticate_) {
    render::SetString(&document, "www_authenticate", *www_authenticate_);
  }
  return render::ToJsonString(document);
}

} // namespace faultline::protocol
