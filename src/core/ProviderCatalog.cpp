#include "core/ProviderCatalog.hpp"

#include "common/Errors.hpp"
#include "common/Logger.hpp"

#include <fstream>
#include <stdexcept>
#include <utility>

namespace dnsc::common {

void to_json(nlohmann::json& j, const DnsProvider& dp) {
  j = nlohmann::json{{"name", dp.sName},
                     {"primary_dns", dp.sPrimaryDns},
                     {"secondary_dns", dp.sSecondaryDns},
                     {"description", dp.sDescription}};
}

void from_json(const nlohmann::json& j, DnsProvider& dp) {
  j.at("name").get_to(dp.sName);
  j.at("primary_dns").get_to(dp.sPrimaryDns);
  j.at("secondary_dns").get_to(dp.sSecondaryDns);
  // description is optional
  dp.sDescription = j.value("description", std::string{});
}

}  // namespace dnsc::common

namespace dnsc::core {

ProviderCatalog::ProviderCatalog(std::vector<common::DnsProvider> vProviders)
    : _vProviders(std::move(vProviders)) {}

ProviderCatalog ProviderCatalog::builtin() {
  return ProviderCatalog({
      {"Cloudflare", "1.1.1.1", "1.0.0.1", "Fast and privacy-focused DNS"},
      {"Google", "8.8.8.8", "8.8.4.4", "Reliable Google DNS"},
      {"Quad9", "9.9.9.9", "149.112.112.112", "Security-focused DNS"},
      {"OpenDNS", "208.67.222.222", "208.67.220.220", "Family-safe DNS"},
  });
}

ProviderCatalog ProviderCatalog::fromJson(const nlohmann::json& jCatalog) {
  if (!jCatalog.is_array()) {
    throw common::ValidationError("catalog_not_array",
                                  "Provider catalog must be a JSON array");
  }
  if (jCatalog.empty()) {
    throw common::ValidationError("catalog_empty",
                                  "Provider catalog must contain at least one provider");
  }

  std::vector<common::DnsProvider> vProviders;
  vProviders.reserve(jCatalog.size());
  for (std::size_t i = 0; i < jCatalog.size(); ++i) {
    common::DnsProvider dp;
    try {
      jCatalog.at(i).get_to(dp);
    } catch (const nlohmann::json::exception& ex) {
      throw common::ValidationError(
          "catalog_bad_entry",
          "Provider entry " + std::to_string(i) + " is malformed: " + ex.what());
    }
    if (dp.sName.empty() || dp.sPrimaryDns.empty()) {
      throw common::ValidationError(
          "catalog_bad_entry",
          "Provider entry " + std::to_string(i) + " needs a name and a primary_dns");
    }
    vProviders.push_back(std::move(dp));
  }
  return ProviderCatalog(std::move(vProviders));
}

ProviderCatalog ProviderCatalog::fromFile(const std::string& sPath) {
  std::ifstream ifs(sPath);
  if (!ifs.is_open()) {
    throw common::CatalogError("catalog_unreadable",
                               "Cannot open provider catalog: " + sPath);
  }

  nlohmann::json jCatalog;
  try {
    jCatalog = nlohmann::json::parse(ifs);
  } catch (const nlohmann::json::parse_error& ex) {
    throw common::CatalogError("catalog_parse_failed",
                               "Cannot parse provider catalog " + sPath + ": " + ex.what());
  }

  auto pcCatalog = fromJson(jCatalog);
  common::Logger::get()->info("Loaded {} providers from {}", pcCatalog.size(), sPath);
  return pcCatalog;
}

const common::DnsProvider& ProviderCatalog::at(std::size_t nIndex) const {
  if (nIndex >= _vProviders.size()) {
    throw std::out_of_range("Provider index " + std::to_string(nIndex) + " out of range");
  }
  return _vProviders[nIndex];
}

std::vector<std::string> ProviderCatalog::labels() const {
  std::vector<std::string> vLabels;
  vLabels.reserve(_vProviders.size());
  for (const auto& dp : _vProviders) {
    vLabels.push_back(dp.sName + " - " + dp.sDescription);
  }
  return vLabels;
}

}  // namespace dnsc::core
