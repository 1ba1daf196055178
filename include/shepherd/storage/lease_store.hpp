#pragma once

#include "shepherd/core/error.hpp"
#include "shepherd/util/clock.hpp"

#include <chrono>
#include <string>
#include <string_view>

namespace shepherd {

struct Lease {
  std::string name;
  std::string holder;
  TimePoint renewed_at{};
  TimePoint expires_at{};
};

class LeaseStore {
public:
  virtual ~LeaseStore() = default;

  // Acquires or renews `name` for `holder`. Returns false while another
  // holder's lease is unexpired.
  [[nodiscard]] virtual auto try_acquire(std::string_view name,
                                         std::string_view holder,
                                         std::chrono::milliseconds duration,
                                         TimePoint now) -> Result<bool> = 0;

  // No-op unless `holder` owns the lease.
  [[nodiscard]] virtual auto release(std::string_view name,
                                     std::string_view holder)
      -> Result<void> = 0;

  [[nodiscard]] virtual auto get_lease(std::string_view name)
      -> Result<Lease> = 0;
};

}  // namespace shepherd
