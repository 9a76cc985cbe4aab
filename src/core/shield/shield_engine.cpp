#include "core/shield/shield_engine.hpp"

#include <algorithm>
#include <string>
#include <utility>

#include "core/util/calendar.hpp"

namespace stride::shield {

TierAllowance allowance_for(Tier tier) {
  if (tier == Tier::Pro) {
    return TierAllowance{Tier::Pro, 8, 4, 365};
  }
  return TierAllowance{Tier::Free, 2, 2, 30};
}

bool grant_recurring(ShieldInventory& inventory, GrantPeriod period, const TierAllowance& allowance) {
  if (inventory.last_refill_period && *inventory.last_refill_period == period) {
    return false;
  }

  const std::int64_t bank_max = std::max<std::int64_t>(allowance.bank_max, 0);
  if (!inventory.last_refill_period) {
    inventory.recurring_available = bank_max;
  } else {
    inventory.recurring_available =
        std::min(bank_max, inventory.recurring_available + allowance.recurring_amount);
  }
  inventory.used_this_period = 0;
  inventory.last_refill_period = period;
  return true;
}

bool refill_check(ShieldInventory& inventory, CivilDay today, const TierAllowance& allowance) {
  return grant_recurring(inventory, calendar::period_of(today), allowance);
}

Result purchase(ShieldInventory& inventory, std::int64_t count) {
  if (count <= 0) {
    return Result::failure(ErrorKind::InvalidArgument, "Purchase count must be positive.");
  }
  inventory.purchased_available += count;
  inventory.purchased_lifetime += count;
  return Result::success("Added " + std::to_string(count) + " purchased shield(s).");
}

Result consume(ShieldInventory& inventory, ConsumptionOrder order) {
  if (inventory.total_available() <= 0) {
    return Result::failure(ErrorKind::InsufficientShields, "No shields available.");
  }

  std::int64_t* first = &inventory.purchased_available;
  std::int64_t* second = &inventory.recurring_available;
  if (order == ConsumptionOrder::RecurringFirst) {
    std::swap(first, second);
  }
  if (*first > 0) {
    --*first;
  } else {
    --*second;
  }
  ++inventory.used_this_period;
  ++inventory.total_used_lifetime;
  return Result::success("Shield consumed.");
}

Result check_repair_eligibility(CivilDay day, CivilDay today, const std::optional<DailyLog>& log,
                                int lookback_days) {
  const int age = calendar::days_between(day, today);
  if (age < 1) {
    return Result::failure(ErrorKind::RepairIneligible, "Today and future days cannot be repaired.");
  }
  if (age > lookback_days) {
    return Result::failure(ErrorKind::RepairIneligible,
                           "Day is outside the " + std::to_string(lookback_days) +
                               "-day repair window.");
  }
  if (log && log->goal_met) {
    return Result::failure(ErrorKind::RepairIneligible, "Goal was already met on that day.");
  }
  if (log && log->shield_used) {
    return Result::failure(ErrorKind::RepairIneligible, "Day is already protected by a shield.");
  }
  if (log && log->repair_declined) {
    return Result::failure(ErrorKind::RepairIneligible, "Repair of that day was already declined.");
  }
  return Result::success();
}

bool can_buy_more(const ShieldInventory& inventory, const TierAllowance& allowance) {
  return inventory.total_available() < allowance.bank_max;
}

CivilDay next_refill_day(CivilDay today) {
  return calendar::first_day_of_next_month(today);
}

}  // namespace stride::shield
