#include "settle/config/config_loader.hpp"

#include "settle/domain/errors.hpp"

#include <fstream>
#include <iostream>

namespace settle {

namespace {

template <typename T>
void readOptional(const nlohmann::json& doc, const char* key, T& field) {
  auto it = doc.find(key);
  if (it != doc.end()) {
    it->get_to(field);
  }
}

void validate(const domain::EscrowConfig& cfg) {
  if (cfg.admin.empty()) {
    throw ValidationError("admin must not be empty");
  }
  if (cfg.max_transfers_per_settlement == 0) {
    throw ValidationError("max_transfers_per_settlement must be positive");
  }
  if (cfg.default_timeout_ms <= 0 ||
      cfg.default_timeout_ms > cfg.max_timeout_ms) {
    throw ValidationError("default_timeout_ms must be in (0, max_timeout_ms]");
  }
  if (cfg.min_confidence_score < 0 || cfg.min_confidence_score > 100) {
    throw ValidationError("min_confidence_score must be in [0, 100]");
  }
  if (cfg.max_price_staleness_ms < 0 || cfg.max_price_clock_skew_ms < 0 ||
      cfg.max_twap_deviation_bps < 0) {
    throw ValidationError("price thresholds must not be negative");
  }
  if (cfg.min_price > cfg.max_price) {
    throw ValidationError("min_price must not exceed max_price");
  }
}

}  // namespace

domain::EscrowConfig configFromJson(const nlohmann::json& doc) {
  if (!doc.is_object()) {
    throw ValidationError("Configuration must be a JSON object");
  }

  domain::EscrowConfig cfg;
  try {
    readOptional(doc, "admin", cfg.admin);
    readOptional(doc, "authorized_disputers", cfg.authorized_disputers);
    readOptional(doc, "max_transfers_per_settlement",
                 cfg.max_transfers_per_settlement);
    readOptional(doc, "default_timeout_ms", cfg.default_timeout_ms);
    readOptional(doc, "max_timeout_ms", cfg.max_timeout_ms);
    readOptional(doc, "min_confidence_score", cfg.min_confidence_score);
    readOptional(doc, "max_price_staleness_ms", cfg.max_price_staleness_ms);
    readOptional(doc, "max_price_clock_skew_ms", cfg.max_price_clock_skew_ms);
    readOptional(doc, "max_twap_deviation_bps", cfg.max_twap_deviation_bps);
    readOptional(doc, "min_price", cfg.min_price);
    readOptional(doc, "max_price", cfg.max_price);
    readOptional(doc, "snapshot_path", cfg.snapshot_path);
    readOptional(doc, "ipc_cmd_endpoint", cfg.ipc_cmd_endpoint);
    readOptional(doc, "ipc_pub_endpoint", cfg.ipc_pub_endpoint);
    readOptional(doc, "price_feed_endpoint", cfg.price_feed_endpoint);
  } catch (const nlohmann::json::exception& e) {
    throw ValidationError(std::string("Bad configuration value: ") + e.what());
  }

  validate(cfg);
  return cfg;
}

domain::EscrowConfig loadConfig(const std::string& path) {
  std::ifstream in(path);
  if (!in) {
    throw ValidationError("Cannot open config file " + path);
  }

  nlohmann::json doc;
  try {
    doc = nlohmann::json::parse(in);
  } catch (const nlohmann::json::parse_error& e) {
    throw ValidationError("Malformed config file " + path + ": " + e.what());
  }

  domain::EscrowConfig cfg = configFromJson(doc);
  std::cout << "[Config] loaded " << path << " (admin=" << cfg.admin
            << ", disputers=" << cfg.authorized_disputers.size() << ")\n";
  return cfg;
}

}  // namespace settle
