#pragma once

#include <cstdint>
#include <string>

#include "internal/model/staging_location.hpp"

namespace relay::db::model {

/*
  Persistent row for a payload held in staging.

  The row exists from receipt until the staged copy is retired. Its
  deliveries are removed with it.
*/

struct PayloadRecord {
  std::string payload_key; // "<subsystem>/<filename>"

  std::string subsystem;
  std::string filename;
  std::string run_identifier;

  uint64_t size_bytes     = 0;
  uint64_t received_at_ms = 0;

  relay::model::StagingLocation location = relay::model::StagingLocation::kIncoming;

  // set once some destination failed terminally
  bool flagged = false;
};

}
