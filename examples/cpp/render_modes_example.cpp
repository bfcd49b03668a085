#include <chrono>
#include <iostream>
#include <stdexcept>

#include "faultline/v1.hpp"
#include "internal/config/config_loader.hpp"
#include "internal/grpc/grpc_error.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"

namespace {

faultline::Error LookUpUser(std::string_view user_id) {
  try {
    throw std::runtime_error("connection reset by peer");
  } catch (const std::exception& e) {
    // Context attaches the caller location and the user id to the record.
    return faultline::Context(faultline::ErrorKind::kNotFound)
        .With(faultline::field::Str("user_id", std::string(user_id)))
        .With(faultline::field::Str("api_token", "tok-1234567890"))
        .With(faultline::field::Duration("elapsed", std::chrono::milliseconds(1500)))
        .With(faultline::field::Uuid("request_id", faultline::util::GenerateUUID()))
        .TrackCaller()
        .IntoError(e);
  }
}

} // namespace

// Optional argument: a YAML config, e.g. one enabling OTLP export.
int main(int argc, char** argv) {
  faultline::runtime::config::RuntimeConfig config;
  if (argc > 1) {
    try {
      config = faultline::config::ConfigLoader::LoadFromYaml(argv[1]);
    } catch (const std::exception& e) {
      std::cerr << e.what() << '\n';
      return 1;
    }
  }
  config.mutable_rendering()->set_color(faultline::runtime::config::COLOR_MODE_NEVER);

  faultline::observability::InitializeTracing(config);
  faultline::observability::InitializeMetrics(config);
  faultline::observability::InitializeLogging(config);
  faultline::render::ConfigureRendering(config);

  faultline::observability::SpanScope span("render_modes_example");

  auto error = LookUpUser("u-42")
                   .WithMessage("user u-42 does not exist")
                   .WithHint("check that the user was not deleted")
                   .WithSuggestionCommand("list known users", "faultlinectl list")
                   .WithDocsTitled("https://errors.faultline.dev/not-found", "Not found errors")
                   .WithRelatedCode("USER_ALREADY_EXISTS");
  span.RecordError(error);

  std::cout << "--- prod ---\n" << faultline::render::RenderProd(error) << "\n\n";
  std::cout << "--- staging ---\n" << faultline::render::RenderStaging(error) << "\n\n";
  std::cout << "--- local ---\n" << faultline::render::RenderLocal(error, false) << "\n";

  const auto problem = faultline::protocol::ProblemDetails::FromError(error);
  std::cout << "--- " << faultline::protocol::kProblemJsonContentType << " ---\n" << problem.ToJson() << "\n\n";

  const auto status = faultline::grpc::ToStatus(error);
  std::cout << "--- grpc ---\n" << status.error_code() << " " << status.error_message() << "\n";

  error.Log();

  faultline::observability::ShutdownLogging();
  faultline::observability::ShutdownMetrics();
  faultline::observability::ShutdownTracing();
  return 0;
}
