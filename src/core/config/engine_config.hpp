#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "core/model/types.hpp"

namespace stride {

struct EngineConfig {
  std::string data_dir;
  std::int64_t default_daily_goal = 10000;
  std::vector<std::string> provider_precedence = {"health_store", "watch_motion", "phone_motion",
                                                  "cloud_sync"};
  ShieldPolicy shield_policy{};
  ReconcilePolicy reconcile_policy{};
  Tier tier = Tier::Free;
  std::string observations_file;
};

// Reads `key=value` lines into config. A missing file keeps the defaults.
Result load_engine_config(std::string_view path, EngineConfig& config);

std::string consumption_order_to_string(ConsumptionOrder order);
bool consumption_order_from_string(std::string_view text, ConsumptionOrder& out);
std::string tier_to_string(Tier tier);
bool tier_from_string(std::string_view text, Tier& out);

}  // namespace stride
