#include "expiry_worker.hpp"

#include <stdexcept>

#include "internal/core/token_store.hpp"
#include "internal/observability/logging.hpp"

namespace streamgate::expiry {

ExpiryWorker::ExpiryWorker(std::shared_ptr<streamgate::core::TokenStore> store, std::chrono::milliseconds interval)
    : store_(std::move(store)), interval_(interval) {
  if (!store_) {
    throw std::invalid_argument("ExpiryWorker: store is required");
  }
  if (interval_.count() <= 0) {
    throw std::invalid_argument("ExpiryWorker: interval must be positive");
  }
}

ExpiryWorker::~ExpiryWorker() {
  Stop();
}

void ExpiryWorker::Start() {
  std::lock_guard lock(mutex_);
  if (thread_.joinable()) {
    return;
  }
  stopping_ = false;
  thread_   = std::thread(&ExpiryWorker::Run, this);
}

void ExpiryWorker::Stop() {
  {
    std::lock_guard lock(mutex_);
    stopping_ = true;
  }
  cv_.notify_all();
  if (thread_.joinable()) {
    thread_.join();
  }
}

void ExpiryWorker::Run() {
  std::unique_lock lock(mutex_);
  while (!cv_.wait_for(lock, interval_, [this] { return stopping_; })) {
    lock.unlock();
    try {
      store_->PurgeExpired();
    } catch (const std::exception& e) {
      STREAMGATE_LOG_ERROR("expiry sweep failed", {observability::StringField("error", e.what())});
    }
    lock.lock();
  }
}

} // namespace streamgate::expiry
