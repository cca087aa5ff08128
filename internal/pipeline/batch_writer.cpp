#include "batch_writer.hpp"

#include <cmath>
#include <thread>

#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"

namespace powerscore::pipeline {

BatchWriter::BatchWriter(db::Repository& repo, WriterSettings settings, Sleeper sleeper)
    : repo_(repo), settings_(settings), sleeper_(std::move(sleeper)) {
  if (!sleeper_) {
    sleeper_ = [](std::chrono::milliseconds d) { std::this_thread::sleep_for(d); };
  }
}

std::chrono::milliseconds BatchWriter::BackoffFor(int attempt) const {
  const double ms     = static_cast<double>(settings_.initial_backoff_ms) * std::pow(settings_.backoff_multiplier, attempt);
  const double capped = std::min(ms, static_cast<double>(settings_.max_backoff_ms));
  return std::chrono::milliseconds(static_cast<std::int64_t>(capped));
}

std::string BatchWriter::TryChunk(const std::function<db::Result(db::Transaction&)>& body) {
  std::unique_ptr<db::Transaction> tx;
  try {
    tx          = repo_.Begin();
    auto result = tx->Finish(body(*tx));
    return result ? std::string() : result.Describe();
  } catch (const std::exception& e) {
    if (tx && !tx->IsFinished()) {
      try {
        tx->Rollback();
      } catch (const std::exception& rollback_error) {
        POWERSCORE_LOG_WARN("rollback after failed batch also failed",
                            {observability::StringField("error", rollback_error.what())});
      }
    }
    return e.what();
  }
}

void BatchWriter::LogRetry(const std::string& table, int attempt, const std::string& error) const {
  POWERSCORE_LOG_WARN("batch write failed, retrying",
                      {observability::StringField("table", table), observability::IntField("attempt", attempt),
                       observability::IntField("backoff_ms", BackoffFor(attempt - 1).count()), observability::StringField("error", error)});
}

void BatchWriter::Record(BatchWriteSummary& summary, std::size_t rows, bool ok, const std::string& error) const {
  ++summary.batches_total;
  observability::Metrics::Instance().RecordBatchWrite(summary.table, ok, rows);

  if (ok) {
    ++summary.batches_written;
    summary.rows_written += rows;
    return;
  }

  ++summary.batches_failed;
  summary.rows_failed += rows;
  summary.errors.push_back(error);
  POWERSCORE_LOG_ERROR("batch write failed, skipping batch",
                       {observability::StringField("table", summary.table),
                        observability::IntField("batch", static_cast<std::int64_t>(summary.batches_total)),
                        observability::IntField("rows", static_cast<std::int64_t>(rows)),
                        observability::IntField("attempts", settings_.max_retries + 1), observability::StringField("error", error)});
}

} // namespace powerscore::pipeline
