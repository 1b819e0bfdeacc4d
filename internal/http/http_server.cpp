#include "http_server.hpp"

#include <boost/asio/dispatch.hpp>
#include <boost/asio/ip/address.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/write.hpp>
#include <boost/beast/core/bind_handler.hpp>
#include <boost/beast/core/error.hpp>
#include <boost/beast/core/flat_buffer.hpp>
#include <boost/beast/core/tcp_stream.hpp>
#include <boost/beast/http.hpp>

#include <stdexcept>

#include "internal/http/stream_handler.hpp"
#include "internal/observability/logging.hpp"

namespace streamgate::http {

namespace beast = boost::beast;
namespace bhttp = boost::beast::http;
namespace net   = boost::asio;
using tcp       = boost::asio::ip::tcp;

/*
  One client connection. Every member is touched only on the session's
  strand, except that a pull running on the blocking pool reads `reply_`
  and Close() may cancel its body from the strand meanwhile.
*/
class HttpSession : public std::enable_shared_from_this<HttpSession> {
 public:
  HttpSession(HttpServer& server, uint64_t id, tcp::socket socket) : server_(server), id_(id), stream_(std::move(socket)) {
  }

  void Start() {
    net::dispatch(stream_.get_executor(), beast::bind_front_handler(&HttpSession::DoRead, shared_from_this()));
  }

  void Close() {
    net::post(stream_.get_executor(), [self = shared_from_this()] { self->Shutdown(); });
  }

 private:
  void DoRead() {
    req_    = {};
    reply_.reset();
    serializer_.reset();
    stream_.expires_after(server_.options_.read_timeout);
    bhttp::async_read(stream_, buffer_, req_, beast::bind_front_handler(&HttpSession::OnRead, shared_from_this()));
  }

  void OnRead(beast::error_code ec, std::size_t) {
    if (closed_) {
      return;
    }
    if (ec == bhttp::error::end_of_stream) {
      Shutdown();
      return;
    }
    if (ec == beast::error::timeout) {
      STREAMGATE_LOG_DEBUG("http read timed out", {observability::UintField("connection", id_)});
      Shutdown();
      return;
    }
    if (ec) {
      STREAMGATE_LOG_DEBUG("http read failed", {observability::StringField("error", ec.message())});
      Shutdown();
      return;
    }

    stream_.expires_never();
    net::post(*server_.blocking_, [self = shared_from_this()] {
      auto reply = self->server_.handler_->Handle(self->req_);
      net::post(self->stream_.get_executor(), [self, reply = std::move(reply)]() mutable { self->OnReply(std::move(reply)); });
    });
  }

  void OnReply(StreamHandler::Reply reply) {
    if (closed_) {
      if (reply.body) reply.body->Cancel();
      return;
    }

    reply_ = std::move(reply);
    stream_.expires_after(server_.options_.read_timeout);
    if (!reply_->header_only) {
      bhttp::async_write(stream_, reply_->message, beast::bind_front_handler(&HttpSession::OnMessageWritten, shared_from_this()));
      return;
    }
    serializer_.emplace(reply_->message);
    bhttp::async_write_header(stream_, *serializer_, beast::bind_front_handler(&HttpSession::OnHeaderWritten, shared_from_this()));
  }

  void OnMessageWritten(beast::error_code ec, std::size_t) {
    if (ec || !reply_->message.keep_alive()) {
      Shutdown();
      return;
    }
    DoRead();
  }

  void OnHeaderWritten(beast::error_code ec, std::size_t) {
    if (ec) {
      if (reply_->body) {
        STREAMGATE_LOG_INFO("client disconnected before body", {observability::StringField("token", reply_->token)});
      }
      Shutdown();
      return;
    }
    if (!reply_->body) {
      if (reply_->message.keep_alive()) {
        DoRead();
      } else {
        Shutdown();
      }
      return;
    }
    PullNext();
  }

  // Next() blocks on the origin, so it never runs on the strand.
  void PullNext() {
    stream_.expires_never();
    net::post(*server_.blocking_, [self = shared_from_this()] {
      std::optional<std::string> piece;
      std::string                error;
      try {
        piece = self->reply_->body->Next();
      } catch (const std::exception& e) {
        error = e.what();
      }
      net::post(self->stream_.get_executor(), [self, piece = std::move(piece), error = std::move(error)]() mutable {
        self->OnPiece(std::move(piece), error);
      });
    });
  }

  void OnPiece(std::optional<std::string> piece, const std::string& error) {
    if (closed_) {
      return;
    }
    if (!error.empty()) {
      // Headers are already on the wire; the short body is all the client gets.
      STREAMGATE_LOG_WARN("origin failed mid-stream", {observability::StringField("token", reply_->token), observability::StringField("error", error)});
      Shutdown();
      return;
    }

    stream_.expires_after(server_.options_.read_timeout);
    if (!piece) {
      if (reply_->message.chunked()) {
        net::async_write(stream_, bhttp::make_chunk_last(), beast::bind_front_handler(&HttpSession::OnBodyDone, shared_from_this()));
      } else {
        Shutdown();
      }
      return;
    }

    piece_ = std::move(*piece);
    if (reply_->message.chunked()) {
      net::async_write(stream_, bhttp::make_chunk(net::buffer(piece_)), beast::bind_front_handler(&HttpSession::OnPieceWritten, shared_from_this()));
    } else {
      net::async_write(stream_, net::buffer(piece_), beast::bind_front_handler(&HttpSession::OnPieceWritten, shared_from_this()));
    }
  }

  void OnPieceWritten(beast::error_code ec, std::size_t) {
    if (closed_) {
      return;
    }
    if (ec) {
      STREAMGATE_LOG_INFO("client disconnected mid-stream", {observability::StringField("token", reply_->token),
                                                              observability::UintField("sent", reply_->body->Emitted()),
                                                              observability::StringField("error", ec.message())});
      Shutdown();
      return;
    }
    PullNext();
  }

  void OnBodyDone(beast::error_code, std::size_t) {
    Shutdown();
  }

  void Shutdown() {
    if (closed_) {
      return;
    }
    closed_ = true;
    if (reply_ && reply_->body) {
      reply_->body->Cancel();
    }

    beast::error_code ec;
    stream_.socket().shutdown(tcp::socket::shutdown_send, ec);
    stream_.close();
    server_.Forget(id_);
  }

  HttpServer&       server_;
  uint64_t          id_;
  beast::tcp_stream stream_;

  beast::flat_buffer                                             buffer_;
  StreamHandler::Request                                         req_;
  std::optional<StreamHandler::Reply>                            reply_;
  std::optional<bhttp::response_serializer<bhttp::string_body>> serializer_;
  std::string                                                    piece_;
  bool                                                           closed_ = false;
};

HttpServer::HttpServer(Options options, std::shared_ptr<StreamHandler> handler)
    : options_(std::move(options)), handler_(std::move(handler)), acceptor_(net::make_strand(io_)) {
  if (!handler_) {
    throw std::invalid_argument("HttpServer: handler is required");
  }
  if (options_.worker_threads == 0 || options_.stream_threads == 0) {
    throw std::invalid_argument("HttpServer: worker_threads and stream_threads must be positive");
  }
  if (options_.read_timeout.count() <= 0) {
    throw std::invalid_argument("HttpServer: read_timeout must be positive");
  }
}

HttpServer::~HttpServer() {
  Stop();
}

void HttpServer::Start() {
  if (running_.exchange(true)) {
    return;
  }

  const tcp::endpoint endpoint{net::ip::make_address(options_.bind_address), options_.port};
  acceptor_.open(endpoint.protocol());
  acceptor_.set_option(net::socket_base::reuse_address(true));
  acceptor_.bind(endpoint);
  acceptor_.listen(net::socket_base::max_listen_connections);
  port_ = acceptor_.local_endpoint().port();

  io_.restart();
  work_.emplace(net::make_work_guard(io_));
  blocking_ = std::make_unique<net::thread_pool>(options_.stream_threads);

  DoAccept();
  for (uint32_t i = 0; i < options_.worker_threads; ++i) {
    io_threads_.emplace_back([this] { io_.run(); });
  }

  STREAMGATE_LOG_INFO("http listening", {observability::StringField("address", options_.bind_address), observability::UintField("port", port_),
                                         observability::UintField("workers", options_.worker_threads),
                                         observability::UintField("stream_threads", options_.stream_threads)});
}

void HttpServer::Stop() {
  if (!running_.exchange(false)) {
    return;
  }

  net::post(acceptor_.get_executor(), [this] {
    boost::system::error_code ec;
    acceptor_.close(ec);
  });

  std::vector<std::shared_ptr<HttpSession>> sessions;
  {
    std::lock_guard lock(live_mutex_);
    for (auto& [id, weak] : live_) {
      if (auto session = weak.lock()) sessions.push_back(std::move(session));
    }
  }
  for (auto& session : sessions) {
    session->Close();
  }
  sessions.clear();

  // Closed sessions cancel their bodies, which unblocks any pull in flight.
  blocking_->join();
  work_.reset();
  for (auto& thread : io_threads_) {
    thread.join();
  }
  io_threads_.clear();
  blocking_.reset();

  STREAMGATE_LOG_INFO("http stopped");
}

uint16_t HttpServer::Port() const {
  return port_;
}

void HttpServer::DoAccept() {
  acceptor_.async_accept(net::make_strand(io_), [this](const boost::system::error_code& ec, tcp::socket socket) { OnAccept(ec, std::move(socket)); });
}

void HttpServer::OnAccept(const boost::system::error_code& ec, tcp::socket socket) {
  if (!running_.load() || ec == net::error::operation_aborted) {
    return;
  }
  if (ec) {
    STREAMGATE_LOG_WARN("http accept failed", {observability::StringField("error", ec.message())});
    DoAccept();
    return;
  }

  std::shared_ptr<HttpSession> session;
  {
    std::lock_guard lock(live_mutex_);
    const auto      id = next_id_++;
    session            = std::make_shared<HttpSession>(*this, id, std::move(socket));
    live_.emplace(id, session);
  }
  session->Start();
  if (!running_.load()) {
    // Stop() took its snapshot of live sessions before this one registered.
    session->Close();
    return;
  }
  DoAccept();
}

void HttpServer::Forget(uint64_t id) {
  std::lock_guard lock(live_mutex_);
  live_.erase(id);
}

} // namespace streamgate::http
