#pragma once

#include <mutex>

#include "core/model/types.hpp"

namespace stride {

class ITierProvider {
public:
  virtual ~ITierProvider() = default;

  [[nodiscard]] virtual TierAllowance allowance() const = 0;
};

class StaticTierProvider final : public ITierProvider {
public:
  explicit StaticTierProvider(Tier tier = Tier::Free);

  void set_tier(Tier tier);
  [[nodiscard]] TierAllowance allowance() const override;

private:
  mutable std::mutex mutex_;
  Tier tier_;
};

}  // namespace stride
