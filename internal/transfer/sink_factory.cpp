#include "internal/transfer/sink_factory.hpp"

#include <type_traits>

#include "internal/transfer/filesystem_sink.hpp"
#include "internal/util/errors.hpp"
#if RELAY_WITH_ARROW
#include "internal/transfer/storage_grid_sink.hpp"
#endif

namespace relay::transfer {

std::vector<DestinationSinkPtr> BuildSinks(const std::vector<model::Destination>& destinations, std::chrono::milliseconds attempt_timeout) {
  std::vector<DestinationSinkPtr> sinks;
  sinks.reserve(destinations.size());

  for (const auto& destination : destinations) {
    sinks.push_back(std::visit(
        [&](const auto& site) -> DestinationSinkPtr {
          using Site = std::decay_t<decltype(site)>;
          if constexpr (std::is_same_v<Site, model::FilesystemSite>) {
            return std::make_shared<FilesystemSink>(site);
          } else {
#if RELAY_WITH_ARROW
            return std::make_shared<StorageGridSink>(site, attempt_timeout);
#else
            throw util::ConfigError("storage-grid destination requested but not enabled at build time: " + site.name);
#endif
          }
        },
        destination));
  }
  return sinks;
}

} // namespace relay::transfer
