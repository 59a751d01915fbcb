#pragma once

#include <cstdint>
#include <string>
#include <string_view>

#include "internal/util/time.hpp"

namespace relay::model {

enum class DeliveryState : std::uint8_t {
  kPending   = 1,
  kInFlight  = 2,
  kDelivered = 3,
  kFailed    = 4,
};

constexpr std::string_view ToString(DeliveryState state) {
  switch (state) {
    case DeliveryState::kPending:
      return "pending";
    case DeliveryState::kInFlight:
      return "in_flight";
    case DeliveryState::kDelivered:
      return "delivered";
    case DeliveryState::kFailed:
      return "failed";
  }
  return "unknown";
}

/*
  Delivery progress of one payload towards one destination.

  attempt_count counts failed attempts only. Once terminal the pair is never
  attempted again automatically.
*/
struct DeliveryRecord {
  std::string payload_key;
  std::string destination;

  DeliveryState state         = DeliveryState::kPending;
  std::uint32_t attempt_count = 0;
  bool          terminal      = false;
  std::string   last_error;

  util::TimePoint updated_at{};
};

inline bool IsRetryable(const DeliveryRecord& record, std::uint32_t retry_limit) {
  if (record.terminal) {
    return false;
  }
  if (record.state == DeliveryState::kPending) {
    return true;
  }
  return record.state == DeliveryState::kFailed && record.attempt_count < retry_limit;
}

} // namespace relay::model
