#include "internal/observability/spans.hpp"

#ifdef ENABLE_OTEL

#include <opentelemetry/common/attribute_value.h>
#include <opentelemetry/context/context.h>
#include <opentelemetry/exporters/otlp/otlp_grpc_metric_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_grpc_metric_exporter_options.h>
#include <opentelemetry/exporters/otlp/otlp_http_metric_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_http_metric_exporter_options.h>
#include <opentelemetry/metrics/provider.h>
#include <opentelemetry/sdk/metrics/export/periodic_exporting_metric_reader_factory.h>
#include <opentelemetry/sdk/metrics/meter_provider.h>

#include <chrono>
#include <memory>
#include <utility>

#include "config/config.pb.h"
#include "internal/observability/otlp_export.hpp"

namespace powerscore::observability {
namespace otlp        = opentelemetry::exporter::otlp;
namespace metrics_api = opentelemetry::metrics;
namespace sdkmetrics  = opentelemetry::sdk::metrics;

namespace {
using AttributePair = std::pair<opentelemetry::nostd::string_view, opentelemetry::common::AttributeValue>;
std::shared_ptr<sdkmetrics::MeterProvider> g_provider;

template <typename Instrument, typename Value, typename Attributes>
void AddWithAttributes(const opentelemetry::nostd::shared_ptr<Instrument>& instrument, Value value, Attributes&& attributes) {
  if constexpr (requires { instrument->Add(value, std::forward<Attributes>(attributes), opentelemetry::context::Context{}); }) {
    instrument->Add(value, std::forward<Attributes>(attributes), opentelemetry::context::Context{});
  } else {
    instrument->Add(value, std::forward<Attributes>(attributes));
  }
}

template <typename Instrument, typename Value, typename Attributes>
void RecordWithAttributes(const opentelemetry::nostd::shared_ptr<Instrument>& instrument, Value value, Attributes&& attributes) {
  if constexpr (requires { instrument->Record(value, std::forward<Attributes>(attributes), opentelemetry::context::Context{}); }) {
    instrument->Record(value, std::forward<Attributes>(attributes), opentelemetry::context::Context{});
  } else {
    instrument->Record(value, std::forward<Attributes>(attributes));
  }
}

} // namespace

struct Metrics::Impl {
  opentelemetry::nostd::shared_ptr<metrics_api::Meter> meter;

  opentelemetry::nostd::shared_ptr<metrics_api::Histogram<double>>      stage_latency_ms;
  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> batch_writes;
  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> rows_written;
  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> cache_lookups;
  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> teams_ranked;
};

bool InitializeMetrics(const powerscore::runtime::config::RuntimeConfig& config, const RunIdentity& run) {
  const auto& observability = config.observability();
  if (!observability.metrics_enabled()) {
    ShutdownMetrics();
    return false;
  }

  const auto target = otlp_export::ResolveTarget(observability, "OTEL_EXPORTER_OTLP_METRICS_ENDPOINT", "/v1/metrics");

  std::unique_ptr<sdkmetrics::PushMetricExporter> exporter;
  if (target.http) {
    otlp::OtlpHttpMetricExporterOptions options;
    options.url = target.endpoint;
    exporter    = otlp::OtlpHttpMetricExporterFactory::Create(options);
  } else {
    otlp::OtlpGrpcMetricExporterOptions options;
    options.endpoint            = target.endpoint;
    options.use_ssl_credentials = false;
    exporter                    = otlp::OtlpGrpcMetricExporterFactory::Create(options);
  }

  // a run is short; ShutdownMetrics exports whatever the last interval missed
  sdkmetrics::PeriodicExportingMetricReaderOptions reader_options;
  reader_options.export_interval_millis = std::chrono::milliseconds(
      observability.metrics_export_interval_ms() > 0 ? observability.metrics_export_interval_ms() : 1000);
  auto reader = sdkmetrics::PeriodicExportingMetricReaderFactory::Create(std::move(exporter), reader_options);

  g_provider = std::make_shared<sdkmetrics::MeterProvider>(std::unique_ptr<sdkmetrics::ViewRegistry>(new sdkmetrics::ViewRegistry()),
                                                           otlp_export::RunResource(run));
  g_provider->AddMetricReader(std::move(reader));

  metrics_api::Provider::SetMeterProvider(opentelemetry::nostd::shared_ptr<metrics_api::MeterProvider>(g_provider));
  return true;
}

void ShutdownMetrics() {
  if (g_provider) {
    g_provider->ForceFlush();
    g_provider->Shutdown();
  }
  g_provider.reset();
}

Metrics::Metrics() : impl_(std::make_unique<Impl>()) {
  auto provider = metrics_api::Provider::GetMeterProvider();
  impl_->meter  = provider->GetMeter(otlp_export::kScopeName, otlp_export::kScopeVersion);

  impl_->stage_latency_ms = impl_->meter->CreateDoubleHistogram("powerscore.stage.latency_ms", "Engine stage latency in milliseconds", "ms");
  impl_->batch_writes     = impl_->meter->CreateUInt64Counter("powerscore.writer.batches", "Batches written or failed", "1");
  impl_->rows_written     = impl_->meter->CreateUInt64Counter("powerscore.writer.rows", "Rows written or failed", "1");
  impl_->cache_lookups    = impl_->meter->CreateUInt64Counter("powerscore.cache.lookups", "Result cache lookups", "1");
  impl_->teams_ranked     = impl_->meter->CreateUInt64Counter("powerscore.teams.ranked", "Teams assigned a cohort rank", "1");
}

Metrics& Metrics::Instance() {
  static Metrics instance;
  return instance;
}

void Metrics::ObserveStageLatencyMs(Stage stage, double latency_ms) {
  if (!impl_ || !impl_->stage_latency_ms) {
    return;
  }
  const std::initializer_list<AttributePair> attributes = {{"stage", StageName(stage).data()}};
  RecordWithAttributes(impl_->stage_latency_ms, latency_ms, attributes);
}

void Metrics::RecordBatchWrite(std::string_view table, bool success, std::uint64_t rows) {
  if (!impl_ || !impl_->batch_writes) {
    return;
  }
  const std::initializer_list<AttributePair> attributes = {{"table", std::string(table)}, {"success", success}};
  AddWithAttributes(impl_->batch_writes, static_cast<std::uint64_t>(1), attributes);
  AddWithAttributes(impl_->rows_written, rows, attributes);
}

void Metrics::RecordCacheLookup(bool hit) {
  if (!impl_ || !impl_->cache_lookups) {
    return;
  }
  const std::initializer_list<AttributePair> attributes = {{"hit", hit}};
  AddWithAttributes(impl_->cache_lookups, static_cast<std::uint64_t>(1), attributes);
}

void Metrics::RecordTeamsRanked(std::uint64_t teams) {
  if (!impl_ || !impl_->teams_ranked) {
    return;
  }
  AddWithAttributes(impl_->teams_ranked, teams, std::initializer_list<AttributePair>{});
}

} // namespace powerscore::observability

#endif
