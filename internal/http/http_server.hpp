#pragma once

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/strand.hpp>
#include <boost/asio/thread_pool.hpp>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

namespace streamgate::http {

class StreamHandler;
class HttpSession;

/*
  Asynchronous HTTP/1.1 front end.

  Accept, request reads and socket writes run on an io_context driven by
  `worker_threads` threads; each connection is a session on its own strand.
  Work that may block on the origin (opening a stream, pulling the next
  chunk) runs on a separate pool of `stream_threads` and hands its result
  back to the session's strand. A connection waiting on its client
  occupies no thread.

  Request heads must arrive within `read_timeout`, and every body write
  must complete within it, or the connection is closed.
*/
class HttpServer {
 public:
  struct Options {
    std::string               bind_address   = "0.0.0.0";
    uint16_t                  port           = 8080;
    uint32_t                  worker_threads = 8;
    uint32_t                  stream_threads = 32;
    std::chrono::milliseconds read_timeout{15000};
  };

  HttpServer(Options options, std::shared_ptr<StreamHandler> handler);
  ~HttpServer();

  HttpServer(const HttpServer&)            = delete;
  HttpServer& operator=(const HttpServer&) = delete;

  void Start();
  void Stop();

  // Bound port; valid after Start().
  uint16_t Port() const;

 private:
  friend class HttpSession;

  void DoAccept();
  void OnAccept(const boost::system::error_code& ec, boost::asio::ip::tcp::socket socket);
  void Forget(uint64_t id);

  Options                        options_;
  std::shared_ptr<StreamHandler> handler_;

  boost::asio::io_context                                                   io_;
  std::optional<boost::asio::executor_work_guard<boost::asio::io_context::executor_type>> work_;
  boost::asio::ip::tcp::acceptor                                            acceptor_;
  std::vector<std::thread>                                                  io_threads_;
  std::unique_ptr<boost::asio::thread_pool>                                 blocking_;
  std::atomic<bool>                                                         running_{false};
  uint16_t                                                                  port_ = 0;

  std::mutex                                                   live_mutex_;
  std::unordered_map<uint64_t, std::weak_ptr<HttpSession>>     live_;
  uint64_t                                                     next_id_ = 0;
};

} // namespace streamgate::http
