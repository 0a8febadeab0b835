#include "core/cancel_token.h"

#include <utility>

namespace tw::core {

void CancelToken::request_cancel() noexcept {
  std::vector<Callback> hooks;
  {
    std::lock_guard<std::mutex> lock(cb_mutex_);
    bool expected = false;
    if (!canceled_.compare_exchange_strong(expected, true,
                                           std::memory_order_acq_rel)) {
      return;
    }
    hooks.swap(callbacks_);
  }
  // Hooks are noexcept by contract: they run from a noexcept context.
  for (auto &cb : hooks) {
    if (cb) {
      cb();
    }
  }
}

bool CancelToken::is_canceled() const noexcept {
  return canceled_.load(std::memory_order_acquire);
}

void CancelToken::on_cancel(Callback cb) {
  {
    std::lock_guard<std::mutex> lock(cb_mutex_);
    if (!canceled_.load(std::memory_order_acquire)) {
      callbacks_.push_back(std::move(cb));
      return;
    }
  }
  if (cb) {
    cb();
  }
}

std::shared_ptr<CancelToken> CancelToken::create() {
  return std::make_shared<CancelToken>();
}

} // namespace tw::core
