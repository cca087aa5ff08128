#pragma once

#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/model/game_record.hpp"
#include "internal/pipeline/rating_engine.hpp"
#include "internal/rating/connectivity.hpp"
#include "internal/util/date.hpp"
#include "powerscore/v1/rating.pb.h"

namespace google::protobuf {
class Message;
}

namespace powerscore::pipeline {

/*
  ResultCache

  Stores the post-Power engine output (teams plus the capped game set
  the ML layer needs) as a RatingTable protobuf in rating_cache.

  The key fingerprints everything the cached stages depend on, so a
  hit can skip straight to the predictive layer. The predictive
  output itself is never stored.
*/
class ResultCache {
 public:
  ResultCache(db::Repository& repo, bool enabled);

  bool Enabled() const {
    return enabled_;
  }

  // The directory is part of the key: schedule connectivity reads state codes.
  static std::string ComputeKey(const std::vector<model::GameRecord>& window_games, const rating::TeamDirectory& directory,
                                int window_days, const std::string& provider_filter, util::Date today,
                                const std::string& rating_config_bytes);

  // Miss on absence, on a disabled cache and on an unreadable payload.
  std::optional<EngineOutput> Lookup(const std::string& key);

  db::Result Store(const std::string& key, const EngineOutput& output);

  static powerscore::v1::RatingTable ToProto(const std::string& key, const EngineOutput& output);
  static EngineOutput                FromProto(const powerscore::v1::RatingTable& table);

  // Map-order-stable serialization, for hashing config messages.
  static std::string DeterministicBytes(const google::protobuf::Message& message);

 private:
  db::Repository& repo_;
  bool            enabled_;
};

} // namespace powerscore::pipeline
