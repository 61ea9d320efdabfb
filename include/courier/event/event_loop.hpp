#pragma once

#include <asio.hpp>
#include <atomic>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>
#include <vector>

namespace courier {

// io_context driven by a small fixed pool of threads
class EventLoop {
 public:
  explicit EventLoop(size_t threads = 2);

  ~EventLoop();

  EventLoop(const EventLoop&) = delete;
  EventLoop& operator=(const EventLoop&) = delete;

  // Idempotent
  void start();

  // Drops the work guard, stops the context and joins the threads.
  // Called from a loop thread, that thread is detached instead; it keeps the context alive
  // until its run() returns, so the loop may be destroyed from one of its own handlers.
  void stop();

  bool running() const {
    return running_.load();
  }

  asio::io_context& context() {
    return *io_ctx_;
  }

  size_t thread_count() const {
    return thread_count_;
  }

  // True when called from one of the loop's threads
  bool in_loop_thread() const;

 private:
  std::shared_ptr<asio::io_context> io_ctx_;
  size_t thread_count_;
  std::optional<asio::executor_work_guard<asio::io_context::executor_type>> work_;
  std::vector<std::thread> threads_;
  std::mutex mutex_;
  std::atomic<bool> running_{false};
};

}  // namespace courier
