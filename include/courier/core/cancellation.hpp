#pragma once

#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>

namespace courier {

/**
 * Cancellation token shared between a caller and the requests it started.
 * cancel() runs every registered callback once, on the cancelling thread.
 */
class Cancellation {
 public:
  using Callback = std::function<void()>;

  static std::shared_ptr<Cancellation> create() {
    return std::make_shared<Cancellation>();
  }

  void cancel();

  bool cancelled() const;

  // Runs the callback right away if already cancelled; returns 0 in that case
  uint64_t on_cancel(Callback callback);

  void remove(uint64_t id);

 private:
  mutable std::mutex mutex_;
  bool cancelled_ = false;
  uint64_t next_id_ = 1;
  std::map<uint64_t, Callback> callbacks_;
};

}  // namespace courier
