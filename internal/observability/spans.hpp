#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

namespace powerscore::runtime::config {
class RuntimeConfig;
}

namespace powerscore::observability {

// Stamped on the exported resource so every span and metric point of a
// run can be told apart from the previous day's.
struct RunIdentity {
  std::string today; // YYYY-MM-DD
  bool        force_rebuild = false;
};

// OTLP export for one engine run, driven by the observability block of
// the config. Each returns false when the block leaves it disabled.
// Shutdown flushes what the run produced.
bool InitializeTracing(const powerscore::runtime::config::RuntimeConfig& config, const RunIdentity& run);
bool InitializeMetrics(const powerscore::runtime::config::RuntimeConfig& config, const RunIdentity& run);
void ShutdownTracing();
void ShutdownMetrics();

enum class Stage {
  kRun,
  kAggregate,
  kShrinkage,
  kCohorts,
  kPredictive,
};

std::string_view StageName(Stage stage);

/*
  StageSpan

  Scope of one engine stage. Opens a "powerscore.<stage>" span when a
  tracer is installed; on destruction records the stage latency
  histogram and a debug line with the elapsed time.
*/
class StageSpan {
 public:
  explicit StageSpan(Stage stage);
  ~StageSpan();

  StageSpan(const StageSpan&)            = delete;
  StageSpan& operator=(const StageSpan&) = delete;

  void SetCount(std::string_view key, std::int64_t value);
  void SetFlag(std::string_view key, bool value);

 private:
  Stage                                 stage_;
  std::chrono::steady_clock::time_point start_;
#ifdef ENABLE_OTEL
  struct Impl;
  std::unique_ptr<Impl> impl_;
#endif
};

class Metrics {
 public:
  static Metrics& Instance();

  void ObserveStageLatencyMs(Stage stage, double latency_ms);
  void RecordBatchWrite(std::string_view table, bool success, std::uint64_t rows);
  void RecordCacheLookup(bool hit);
  void RecordTeamsRanked(std::uint64_t teams);

 private:
  Metrics();
#ifdef ENABLE_OTEL
  struct Impl;
  std::unique_ptr<Impl> impl_;
#endif
};

#ifndef ENABLE_OTEL
inline bool InitializeTracing(const powerscore::runtime::config::RuntimeConfig&, const RunIdentity&) {
  return false;
}

inline bool InitializeMetrics(const powerscore::runtime::config::RuntimeConfig&, const RunIdentity&) {
  return false;
}

inline void ShutdownTracing() {
}

inline void ShutdownMetrics() {
}

inline Metrics::Metrics() {
}

inline Metrics& Metrics::Instance() {
  static Metrics instance;
  return instance;
}

inline void Metrics::ObserveStageLatencyMs(Stage, double) {
}

inline void Metrics::RecordBatchWrite(std::string_view, bool, std::uint64_t) {
}

inline void Metrics::RecordCacheLookup(bool) {
}

inline void Metrics::RecordTeamsRanked(std::uint64_t) {
}
#endif

} // namespace powerscore::observability
