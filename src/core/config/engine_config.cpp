#include "core/config/engine_config.hpp"

#include <filesystem>
#include <fstream>
#include <unordered_map>

#include "core/util/canonical.hpp"

namespace stride {
namespace {

Result invalid_value(std::string_view key, std::string_view value) {
  return Result::failure(ErrorKind::InvalidArgument, "Config value for '" + std::string{key} +
                                                         "' is invalid: '" + std::string{value} +
                                                         "'.");
}

bool parse_positive(std::string_view text, std::int64_t& out) {
  std::int64_t value = 0;
  if (!util::parse_int64(text, value) || value <= 0) {
    return false;
  }
  out = value;
  return true;
}

}  // namespace

std::string consumption_order_to_string(ConsumptionOrder order) {
  return order == ConsumptionOrder::RecurringFirst ? "recurring_first" : "purchased_first";
}

bool consumption_order_from_string(std::string_view text, ConsumptionOrder& out) {
  const std::string lowered = util::lowercase_copy(util::trim_copy(text));
  if (lowered == "purchased_first") {
    out = ConsumptionOrder::PurchasedFirst;
    return true;
  }
  if (lowered == "recurring_first") {
    out = ConsumptionOrder::RecurringFirst;
    return true;
  }
  return false;
}

std::string tier_to_string(Tier tier) {
  return tier == Tier::Pro ? "pro" : "free";
}

bool tier_from_string(std::string_view text, Tier& out) {
  const std::string lowered = util::lowercase_copy(util::trim_copy(text));
  if (lowered == "free") {
    out = Tier::Free;
    return true;
  }
  if (lowered == "pro") {
    out = Tier::Pro;
    return true;
  }
  return false;
}

Result load_engine_config(std::string_view path, EngineConfig& config) {
  std::ifstream in{std::filesystem::path{std::string{path}}};
  if (!in) {
    return Result::success("Config file not found, defaults kept.");
  }

  std::unordered_map<std::string, std::string> fields;
  std::string line;
  while (std::getline(in, line)) {
    const std::string trimmed = util::trim_copy(line);
    if (trimmed.empty() || trimmed.front() == '#') {
      continue;
    }

    const auto split = trimmed.find('=');
    if (split == std::string::npos) {
      continue;
    }

    fields[util::trim_copy(trimmed.substr(0, split))] = util::trim_copy(trimmed.substr(split + 1));
  }

  EngineConfig parsed = config;
  for (const auto& [key, value] : fields) {
    std::int64_t number = 0;
    if (key == "data_dir") {
      parsed.data_dir = value;
    } else if (key == "observations_file") {
      parsed.observations_file = value;
    } else if (key == "default_daily_goal") {
      if (!parse_positive(value, number)) {
        return invalid_value(key, value);
      }
      parsed.default_daily_goal = number;
    } else if (key == "provider_precedence") {
      auto providers = util::split_csv(value);
      if (providers.empty()) {
        return invalid_value(key, value);
      }
      for (auto& provider : providers) {
        provider = util::lowercase_copy(provider);
      }
      parsed.provider_precedence = std::move(providers);
    } else if (key == "consumption_order") {
      if (!consumption_order_from_string(value, parsed.shield_policy.consumption_order)) {
        return invalid_value(key, value);
      }
    } else if (key == "repair_lookback_days") {
      if (!parse_positive(value, number) || number > 366) {
        return invalid_value(key, value);
      }
      parsed.shield_policy.repair_lookback_days = static_cast<int>(number);
    } else if (key == "auto_deploy_missed_days") {
      if (!util::parse_bool(value, parsed.shield_policy.auto_deploy_missed_days)) {
        return invalid_value(key, value);
      }
    } else if (key == "reconcile_min_interval_seconds") {
      if (!util::parse_int64(value, number) || number < 0) {
        return invalid_value(key, value);
      }
      parsed.reconcile_policy.min_interval_seconds = number;
    } else if (key == "reconcile_foreground_min_interval_seconds") {
      if (!util::parse_int64(value, number) || number < 0) {
        return invalid_value(key, value);
      }
      parsed.reconcile_policy.foreground_min_interval_seconds = number;
    } else if (key == "reconcile_max_window_days") {
      if (!parse_positive(value, number) || number > 3660) {
        return invalid_value(key, value);
      }
      parsed.reconcile_policy.max_window_days = static_cast<int>(number);
    } else if (key == "tier") {
      if (!tier_from_string(value, parsed.tier)) {
        return invalid_value(key, value);
      }
    }
  }

  config = std::move(parsed);
  return Result::success("Config loaded.");
}

}  // namespace stride
