#pragma once

#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <thread>

namespace streamgate::core {
class TokenStore;
}

namespace streamgate::expiry {

/*
  Background worker that removes expired references.

  Sweeps every `interval`; Stop() wakes it immediately.
*/
class ExpiryWorker {
 public:
  ExpiryWorker(std::shared_ptr<streamgate::core::TokenStore> store, std::chrono::milliseconds interval);
  ~ExpiryWorker();

  void Start();
  void Stop();

 private:
  void Run();

  std::shared_ptr<streamgate::core::TokenStore> store_;
  std::chrono::milliseconds                     interval_;

  std::thread             thread_;
  std::mutex              mutex_;
  std::condition_variable cv_;
  bool                    stopping_ = false;
};

} // namespace streamgate::expiry
