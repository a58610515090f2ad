#pragma once

#include <atomic>
#include <string>

#include "internal/util/errors.hpp"

namespace masterplan::runtime {

/*
  Cooperative cancellation flag shared between a job and whoever may
  cancel it. Checked at stage and tile-level boundaries only.
*/
class CancellationToken {
 public:
  void Cancel() {
    cancelled_.store(true, std::memory_order_release);
  }

  bool IsCancelled() const {
    return cancelled_.load(std::memory_order_acquire);
  }

  void ThrowIfCancelled(const std::string& where) const {
    if (IsCancelled()) {
      throw util::Cancelled("cancelled during " + where);
    }
  }

 private:
  std::atomic<bool> cancelled_{false};
};

} // namespace masterplan::runtime
