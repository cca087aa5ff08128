#pragma once

#ifdef ENABLE_OTEL

#include <opentelemetry/sdk/resource/resource.h>

#include <cstdlib>
#include <string>

#include "config/config.pb.h"
#include "internal/observability/spans.hpp"

namespace powerscore::observability::otlp_export {

inline constexpr const char* kScopeName    = "powerscore";
inline constexpr const char* kScopeVersion = "0.1.0";

struct Target {
  std::string endpoint;
  bool        http = false;
};

// Config endpoint first, then the signal's OTEL_* variable, then the
// generic one, then a collector on localhost.
inline Target ResolveTarget(const powerscore::runtime::config::ObservabilityConfig& config, const char* signal_env,
                            const char* http_path) {
  Target target;
  target.http = config.transport() == powerscore::runtime::config::OTLP_TRANSPORT_HTTP;

  if (!config.otlp_endpoint().empty()) {
    target.endpoint = config.otlp_endpoint();
  } else if (const char* endpoint = std::getenv(signal_env)) {
    target.endpoint = endpoint;
  } else if (const char* endpoint = std::getenv("OTEL_EXPORTER_OTLP_ENDPOINT")) {
    target.endpoint = endpoint;
  } else {
    target.endpoint = target.http ? std::string("http://localhost:4318") + http_path : "localhost:4317";
  }
  return target;
}

inline opentelemetry::sdk::resource::Resource RunResource(const RunIdentity& run) {
  opentelemetry::sdk::resource::ResourceAttributes attrs;
  attrs.SetAttribute("service.name", "powerscore-engine");
  attrs.SetAttribute("powerscore.run.today", run.today);
  attrs.SetAttribute("powerscore.run.force_rebuild", run.force_rebuild);
  return opentelemetry::sdk::resource::Resource::Create(attrs);
}

} // namespace powerscore::observability::otlp_export

#endif
