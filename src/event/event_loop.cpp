#include "courier/event/event_loop.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>

namespace courier {

EventLoop::EventLoop(size_t threads)
    : io_ctx_(std::make_shared<asio::io_context>(static_cast<int>(std::max<size_t>(threads, 1)))),
      thread_count_(std::max<size_t>(threads, 1)) {}

EventLoop::~EventLoop() {
  stop();
}

void EventLoop::start() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (running_) return;

  io_ctx_->restart();
  work_.emplace(asio::make_work_guard(*io_ctx_));
  for (size_t i = 0; i < thread_count_; ++i) {
    threads_.emplace_back([io_ctx = io_ctx_] {
      try {
        io_ctx->run();
      } catch (const std::exception& e) {
        spdlog::error("event loop thread terminated: {}", e.what());
      }
    });
  }
  running_ = true;
  spdlog::debug("event loop started with {} thread(s)", thread_count_);
}

void EventLoop::stop() {
  std::vector<std::thread> threads;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!running_) return;
    running_ = false;
    work_.reset();
    io_ctx_->stop();
    threads.swap(threads_);
  }

  for (auto& thread : threads) {
    if (thread.get_id() == std::this_thread::get_id()) {
      // Cannot join ourselves; the thread's own reference keeps the context alive
      thread.detach();
      spdlog::debug("event loop stopped from its own thread, detaching it");
    } else if (thread.joinable()) {
      thread.join();
    }
  }
  spdlog::debug("event loop stopped");
}

bool EventLoop::in_loop_thread() const {
  return io_ctx_->get_executor().running_in_this_thread();
}

}  // namespace courier
