#pragma once

#include <cstdint>
#include <optional>

#include "core/model/types.hpp"

namespace stride::shield {

TierAllowance allowance_for(Tier tier);

// Issues the recurring grant for `period` once. The first grant ever fills the bank.
// Returns false when the period was already granted.
bool grant_recurring(ShieldInventory& inventory, GrantPeriod period, const TierAllowance& allowance);
bool refill_check(ShieldInventory& inventory, CivilDay today, const TierAllowance& allowance);

Result purchase(ShieldInventory& inventory, std::int64_t count);
Result consume(ShieldInventory& inventory, ConsumptionOrder order);

Result check_repair_eligibility(CivilDay day, CivilDay today, const std::optional<DailyLog>& log,
                                int lookback_days);

bool can_buy_more(const ShieldInventory& inventory, const TierAllowance& allowance);
CivilDay next_refill_day(CivilDay today);

}  // namespace stride::shield
