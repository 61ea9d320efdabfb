#include "courier/http/response.hpp"

namespace courier::http {

bool BodyStream::read(std::string& chunk) {
  std::unique_lock<std::mutex> lock(mutex_);
  cv_.wait(lock, [this] { return !chunks_.empty() || finished_ || error_; });
  if (chunks_.empty()) {
    return false;
  }
  chunk = std::move(chunks_.front());
  chunks_.pop_front();
  return true;
}

std::string BodyStream::read_all() {
  std::string result;
  std::string chunk;
  while (read(chunk)) {
    result += chunk;
  }
  return result;
}

void BodyStream::on_data(ChunkCallback on_chunk, EndCallback on_end) {
  std::deque<std::string> buffered;
  bool ended = false;
  std::optional<Error> error;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    buffered.swap(chunks_);
    ended = finished_ || error_.has_value();
    error = error_;
    on_chunk_ = on_chunk;
    on_end_ = on_end;
  }

  for (const auto& chunk : buffered) {
    on_chunk(chunk);
  }
  if (ended && on_end) {
    on_end(error);
  }
}

bool BodyStream::finished() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return finished_;
}

std::optional<Error> BodyStream::error() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return error_;
}

void BodyStream::cancel() {
  std::function<void()> canceller;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (finished_ || error_) return;
    canceller.swap(canceller_);
  }
  fail(make_error(ErrorKind::CancelledError, "body stream cancelled"));
  if (canceller) canceller();
}

void BodyStream::set_canceller(std::function<void()> canceller) {
  std::lock_guard<std::mutex> lock(mutex_);
  canceller_ = std::move(canceller);
}

void BodyStream::push(std::string chunk) {
  ChunkCallback callback;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (finished_ || error_) return;
    if (!on_chunk_) {
      chunks_.push_back(std::move(chunk));
      cv_.notify_all();
      return;
    }
    callback = on_chunk_;
  }
  callback(chunk);
}

void BodyStream::finish() {
  EndCallback callback;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (finished_ || error_) return;
    finished_ = true;
    callback = on_end_;
    canceller_ = nullptr;
  }
  cv_.notify_all();
  if (callback) callback(std::nullopt);
}

void BodyStream::fail(Error error) {
  EndCallback callback;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (finished_ || error_) return;
    error_ = error;
    callback = on_end_;
    canceller_ = nullptr;
  }
  cv_.notify_all();
  if (callback) callback(error);
}

}  // namespace courier::http
