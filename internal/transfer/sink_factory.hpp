#pragma once

#include <chrono>
#include <vector>

#include "internal/model/destination.hpp"
#include "internal/transfer/destination_sink.hpp"

namespace relay::transfer {

/*
  One sink per configured destination, same order.

  attempt_timeout also bounds each remote request where the transport
  takes a timeout. Throws util::ConfigError when a storage-grid destination is configured
  but the Arrow layer was not built in.
*/
std::vector<DestinationSinkPtr> BuildSinks(const std::vector<model::Destination>& destinations, std::chrono::milliseconds attempt_timeout);

} // namespace relay::transfer
