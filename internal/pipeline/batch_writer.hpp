#pragma once

#include <algorithm>
#include <chrono>
#include <cstddef>
#include <exception>
#include <functional>
#include <string>
#include <string_view>
#include <type_traits>
#include <vector>

#include "internal/db/api/repository.hpp"

namespace powerscore::pipeline {

struct WriterSettings {
  int    batch_size         = 500;
  int    max_retries        = 3;
  int    initial_backoff_ms = 100;
  double backoff_multiplier = 2.0;
  int    max_backoff_ms     = 5000;
};

struct BatchWriteSummary {
  std::string table;

  std::size_t batches_total   = 0;
  std::size_t batches_written = 0;
  std::size_t batches_failed  = 0;
  std::size_t rows_written    = 0;
  std::size_t rows_failed     = 0;

  // Last error of each failed batch, in batch order.
  std::vector<std::string> errors;

  bool Ok() const {
    return batches_failed == 0;
  }
};

using Sleeper = std::function<void(std::chrono::milliseconds)>;

/*
  BatchWriter

  Writes rows in chunks of batch_size, one transaction per chunk.
  A chunk that fails (bad Result, or a backend exception) is rolled
  back and retried after an exponential backoff. A chunk that still
  fails after max_retries is logged, counted and skipped; the
  remaining chunks are still written.
*/
class BatchWriter {
 public:
  BatchWriter(db::Repository& repo, WriterSettings settings, Sleeper sleeper = {});

  template <typename Row>
  using Upsert = std::function<db::Result(db::Repository&, db::Transaction&, const Row&)>;

  template <typename Row>
  BatchWriteSummary Write(std::string_view table, const std::vector<Row>& rows, const std::type_identity_t<Upsert<Row>>& upsert);

  std::chrono::milliseconds BackoffFor(int attempt) const;

 private:
  // Runs one chunk once. Returns an empty string on success.
  std::string TryChunk(const std::function<db::Result(db::Transaction&)>& body);

  void LogRetry(const std::string& table, int attempt, const std::string& error) const;
  void Record(BatchWriteSummary& summary, std::size_t rows, bool ok, const std::string& error) const;

  db::Repository& repo_;
  WriterSettings  settings_;
  Sleeper         sleeper_;
};

template <typename Row>
BatchWriteSummary BatchWriter::Write(std::string_view table, const std::vector<Row>& rows,
                                     const std::type_identity_t<Upsert<Row>>& upsert) {
  BatchWriteSummary summary;
  summary.table = std::string(table);

  const auto batch = static_cast<std::size_t>(std::max(1, settings_.batch_size));
  for (std::size_t begin = 0; begin < rows.size(); begin += batch) {
    const std::size_t end = std::min(rows.size(), begin + batch);

    auto body = [&](db::Transaction& tx) -> db::Result {
      for (std::size_t i = begin; i < end; ++i) {
        auto result = upsert(repo_, tx, rows[i]);
        if (!result) return result;
      }
      return db::Result::Ok();
    };

    std::string error;
    for (int attempt = 0;; ++attempt) {
      error = TryChunk(body);
      if (error.empty() || attempt >= settings_.max_retries) break;
      LogRetry(summary.table, attempt + 1, error);
      sleeper_(BackoffFor(attempt));
    }
    Record(summary, end - begin, error.empty(), error);
  }
  return summary;
}

} // namespace powerscore::pipeline
