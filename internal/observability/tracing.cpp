#include "internal/observability/spans.hpp"

#include "internal/observability/logging.hpp"
#include "internal/util/time.hpp"

#ifdef ENABLE_OTEL

#include <opentelemetry/exporters/otlp/otlp_grpc_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_grpc_exporter_options.h>
#include <opentelemetry/exporters/otlp/otlp_http_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_http_exporter_options.h>
#include <opentelemetry/sdk/trace/batch_span_processor_factory.h>
#include <opentelemetry/sdk/trace/batch_span_processor_options.h>
#include <opentelemetry/sdk/trace/tracer_provider_factory.h>
#include <opentelemetry/trace/provider.h>

#include <utility>

#include "config/config.pb.h"
#include "internal/observability/otlp_export.hpp"

#endif

namespace powerscore::observability {

std::string_view StageName(Stage stage) {
  switch (stage) {
    case Stage::kRun:
      return "run";
    case Stage::kAggregate:
      return "aggregate";
    case Stage::kShrinkage:
      return "shrinkage";
    case Stage::kCohorts:
      return "cohort_stages";
    case Stage::kPredictive:
      break;
  }
  return "predictive";
}

#ifdef ENABLE_OTEL

namespace otlp      = opentelemetry::exporter::otlp;
namespace trace_api = opentelemetry::trace;
namespace sdktrace  = opentelemetry::sdk::trace;

namespace {
std::shared_ptr<sdktrace::TracerProvider>           g_provider;
opentelemetry::nostd::shared_ptr<trace_api::Tracer> g_tracer;
} // namespace

bool InitializeTracing(const powerscore::runtime::config::RuntimeConfig& config, const RunIdentity& run) {
  const auto& observability = config.observability();
  if (!observability.tracing_enabled()) {
    ShutdownTracing();
    return false;
  }

  const auto target = otlp_export::ResolveTarget(observability, "OTEL_EXPORTER_OTLP_TRACES_ENDPOINT", "/v1/traces");

  std::unique_ptr<sdktrace::SpanExporter> exporter;
  if (target.http) {
    otlp::OtlpHttpExporterOptions options;
    options.url = target.endpoint;
    exporter    = otlp::OtlpHttpExporterFactory::Create(options);
  } else {
    otlp::OtlpGrpcExporterOptions options;
    options.endpoint            = target.endpoint;
    options.use_ssl_credentials = false;
    exporter                    = otlp::OtlpGrpcExporterFactory::Create(options);
  }

  // one run emits a handful of stage spans; they are flushed at shutdown
  auto processor = sdktrace::BatchSpanProcessorFactory::Create(std::move(exporter), sdktrace::BatchSpanProcessorOptions{});
  auto provider  = sdktrace::TracerProviderFactory::Create(std::move(processor), otlp_export::RunResource(run));

  g_provider = std::shared_ptr<sdktrace::TracerProvider>(std::move(provider));
  trace_api::Provider::SetTracerProvider(opentelemetry::nostd::shared_ptr<trace_api::TracerProvider>(g_provider));
  g_tracer = g_provider->GetTracer(otlp_export::kScopeName, otlp_export::kScopeVersion);
  return static_cast<bool>(g_tracer);
}

void ShutdownTracing() {
  if (g_provider) {
    g_provider->ForceFlush();
    g_provider->Shutdown();
  }
  g_provider.reset();
  g_tracer = nullptr;
}

struct StageSpan::Impl {
  opentelemetry::nostd::shared_ptr<trace_api::Span> span;
  std::unique_ptr<trace_api::Scope>                 scope;
};

#endif

StageSpan::StageSpan(Stage stage) : stage_(stage), start_(std::chrono::steady_clock::now()) {
#ifdef ENABLE_OTEL
  impl_ = std::make_unique<Impl>();
  if (g_tracer) {
    impl_->span  = g_tracer->StartSpan("powerscore." + std::string(StageName(stage)));
    impl_->scope = std::make_unique<trace_api::Scope>(g_tracer->WithActiveSpan(impl_->span));
  }
#endif
}

StageSpan::~StageSpan() {
  const double ms = util::ElapsedMs(start_);
  Metrics::Instance().ObserveStageLatencyMs(stage_, ms);
  POWERSCORE_LOG_DEBUG("stage finished", {StringField("stage", StageName(stage_)), DoubleField("ms", ms)});

#ifdef ENABLE_OTEL
  if (impl_->span) {
    impl_->span->SetAttribute("powerscore.stage.ms", ms);
    impl_->span->End();
  }
#endif
}

void StageSpan::SetCount(std::string_view key, std::int64_t value) {
#ifdef ENABLE_OTEL
  if (impl_->span) {
    impl_->span->SetAttribute(std::string(key), value);
  }
#else
  (void)key;
  (void)value;
#endif
}

void StageSpan::SetFlag(std::string_view key, bool value) {
#ifdef ENABLE_OTEL
  if (impl_->span) {
    impl_->span->SetAttribute(std::string(key), value);
  }
#else
  (void)key;
  (void)value;
#endif
}

} // namespace powerscore::observability
