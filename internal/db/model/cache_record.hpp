#pragma once

#include <cstdint>
#include <string>

namespace powerscore::db::model {

/*
  Serialized engine output keyed by an input fingerprint.
  payload is an opaque protobuf byte string.
*/
struct CacheRecord {
  std::string   cache_key;
  std::uint64_t created_at_ms = 0;
  std::string   payload;
};

} // namespace powerscore::db::model
