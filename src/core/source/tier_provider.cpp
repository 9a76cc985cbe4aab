#include "core/source/tier_provider.hpp"

#include "core/shield/shield_engine.hpp"

namespace stride {

StaticTierProvider::StaticTierProvider(Tier tier) : tier_(tier) {}

void StaticTierProvider::set_tier(Tier tier) {
  std::lock_guard lock(mutex_);
  tier_ = tier;
}

TierAllowance StaticTierProvider::allowance() const {
  std::lock_guard lock(mutex_);
  return shield::allowance_for(tier_);
}

}  // namespace stride
