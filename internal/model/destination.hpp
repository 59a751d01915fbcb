#pragma once

#include <string>
#include <variant>

namespace relay::model {

// Plain directory tree, local or network-mounted.
struct FilesystemSite {
  std::string name;
  std::string path;
};

// Long-term storage reached through a filesystem URI (EOS mount, s3://, hdfs://, ...).
struct StorageGridSite {
  std::string name;
  std::string spec;
};

using Destination = std::variant<FilesystemSite, StorageGridSite>;

inline const std::string& DestinationName(const Destination& destination) {
  return std::visit([](const auto& site) -> const std::string& { return site.name; }, destination);
}

} // namespace relay::model
