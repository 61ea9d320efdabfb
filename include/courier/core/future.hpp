#pragma once

#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <utility>
#include <vector>

namespace courier {

namespace detail {

// One-shot result cell shared by a Promise and its Futures
template <typename T>
struct SharedCell {
  std::mutex mutex;
  std::condition_variable cv;
  bool fulfilled = false;
  std::optional<T> value;
  std::vector<std::function<void(const T&)>> continuations;
};

}  // namespace detail

template <typename T>
class Promise;

// Read side of a single-assignment cell.
// Either block with get()/wait_for(), or register continuations with then().
// A continuation registered after fulfilment runs immediately on the caller's thread.
template <typename T>
class Future {
 public:
  Future() = default;

  bool valid() const {
    return cell_ != nullptr;
  }

  bool ready() const {
    std::lock_guard<std::mutex> lock(cell_->mutex);
    return cell_->fulfilled;
  }

  void wait() const {
    std::unique_lock<std::mutex> lock(cell_->mutex);
    cell_->cv.wait(lock, [this] { return cell_->fulfilled; });
  }

  template <typename Rep, typename Period>
  bool wait_for(const std::chrono::duration<Rep, Period>& timeout) const {
    std::unique_lock<std::mutex> lock(cell_->mutex);
    return cell_->cv.wait_for(lock, timeout, [this] { return cell_->fulfilled; });
  }

  // Blocks until fulfilled
  T get() const {
    std::unique_lock<std::mutex> lock(cell_->mutex);
    cell_->cv.wait(lock, [this] { return cell_->fulfilled; });
    return *cell_->value;
  }

  void then(std::function<void(const T&)> continuation) const {
    std::unique_lock<std::mutex> lock(cell_->mutex);
    if (!cell_->fulfilled) {
      cell_->continuations.push_back(std::move(continuation));
      return;
    }
    lock.unlock();
    // The value is never modified after fulfilment
    continuation(*cell_->value);
  }

 private:
  friend class Promise<T>;

  explicit Future(std::shared_ptr<detail::SharedCell<T>> cell) : cell_(std::move(cell)) {}

  std::shared_ptr<detail::SharedCell<T>> cell_;
};

// Write side. set_value() succeeds at most once.
template <typename T>
class Promise {
 public:
  Promise() : cell_(std::make_shared<detail::SharedCell<T>>()) {}

  Future<T> get_future() const {
    return Future<T>(cell_);
  }

  bool fulfilled() const {
    std::lock_guard<std::mutex> lock(cell_->mutex);
    return cell_->fulfilled;
  }

  // Returns false (and drops the value) when the cell already holds a result
  bool set_value(T value) {
    std::vector<std::function<void(const T&)>> to_call;
    {
      std::lock_guard<std::mutex> lock(cell_->mutex);
      if (cell_->fulfilled) {
        return false;
      }
      cell_->value.emplace(std::move(value));
      cell_->fulfilled = true;
      to_call.swap(cell_->continuations);
    }
    cell_->cv.notify_all();

    // Run continuations outside the lock
    for (auto& continuation : to_call) {
      continuation(*cell_->value);
    }
    return true;
  }

 private:
  std::shared_ptr<detail::SharedCell<T>> cell_;
};

template <typename T>
Future<T> make_ready_future(T value) {
  Promise<T> promise;
  promise.set_value(std::move(value));
  return promise.get_future();
}

}  // namespace courier
