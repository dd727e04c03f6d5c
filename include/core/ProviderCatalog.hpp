#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "common/Types.hpp"

namespace dnsc::common {

void to_json(nlohmann::json& j, const DnsProvider& dp);
void from_json(const nlohmann::json& j, DnsProvider& dp);

}  // namespace dnsc::common

namespace dnsc::core {

/// Immutable, ordered list of DNS providers offered by the menu.
/// Class abbreviation: pc
class ProviderCatalog {
 public:
  explicit ProviderCatalog(std::vector<common::DnsProvider> vProviders);

  /// Cloudflare, Google, Quad9, OpenDNS, in that order.
  static ProviderCatalog builtin();

  /// Parse a JSON array of provider objects.
  /// Throws ValidationError on an empty array or malformed entry.
  static ProviderCatalog fromJson(const nlohmann::json& jCatalog);

  /// Throws CatalogError when the file cannot be read or is not JSON.
  static ProviderCatalog fromFile(const std::string& sPath);

  const std::vector<common::DnsProvider>& providers() const { return _vProviders; }
  const common::DnsProvider& at(std::size_t nIndex) const;
  std::size_t size() const { return _vProviders.size(); }

  /// Menu labels, "<name> - <description>".
  std::vector<std::string> labels() const;

 private:
  std::vector<common::DnsProvider> _vProviders;
};

}  // namespace dnsc::core
