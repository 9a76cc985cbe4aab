#pragma once

#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <string_view>
#include <vector>

#include "core/model/types.hpp"

namespace stride {

std::string_view aggregate_name(AggregateKind kind);

// "Aggregate X changed" channel. Listeners run on the publishing thread after the
// service has released its locks, so they may call back into the service.
class ChangeFeed {
public:
  using Listener = std::function<void(const ChangeEvent&)>;

  std::uint64_t subscribe(Listener listener);
  bool unsubscribe(std::uint64_t id);
  void publish(const std::vector<ChangeEvent>& events) const;

  [[nodiscard]] std::size_t listener_count() const;

private:
  mutable std::mutex mutex_;
  std::uint64_t next_id_ = 1;
  std::map<std::uint64_t, Listener> listeners_;
};

}  // namespace stride
