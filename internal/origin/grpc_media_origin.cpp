#include "grpc_media_origin.hpp"

#include <grpcpp/client_context.h>
#include <grpcpp/support/sync_stream.h>

#include <atomic>
#include <charconv>
#include <stdexcept>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace streamgate::origin {

namespace {

constexpr const char* kRetryAfterKey = "retry-after";

std::optional<std::chrono::seconds> RetryAfter(const ::grpc::ClientContext& ctx) {
  const auto& trailers = ctx.GetServerTrailingMetadata();
  const auto  it       = trailers.find(kRetryAfterKey);
  if (it == trailers.end()) {
    return std::nullopt;
  }
  int64_t    seconds = 0;
  const auto value   = it->second;
  auto [ptr, ec]     = std::from_chars(value.data(), value.data() + value.size(), seconds);
  if (ec != std::errc() || seconds < 0) {
    return std::nullopt;
  }
  return std::chrono::seconds(seconds);
}

bool IsTransient(::grpc::StatusCode code) {
  return code == ::grpc::StatusCode::RESOURCE_EXHAUSTED || code == ::grpc::StatusCode::UNAVAILABLE;
}

[[noreturn]] void ThrowStatus(const ::grpc::Status& status, const ::grpc::ClientContext& ctx, const char* op) {
  const std::string message = std::string(op) + ": " + status.error_message();
  if (IsTransient(status.error_code())) {
    throw util::OriginUnavailable(message, RetryAfter(ctx));
  }
  throw std::runtime_error(message);
}

class GrpcChunkSource final : public ChunkSource {
 public:
  GrpcChunkSource(streamgate::v1::MediaOriginService::Stub& stub, const streamgate::v1::DownloadRequest& request) {
    reader_ = stub.Download(&ctx_, request);
  }

  ~GrpcChunkSource() override {
    if (finished_) {
      return;
    }
    ctx_.TryCancel();
    streamgate::v1::DownloadChunk discard;
    while (reader_->Read(&discard)) {
    }
    // CANCELLED is the expected outcome here.
    (void)reader_->Finish();
  }

  std::optional<std::string> Next() override {
    if (finished_) {
      return std::nullopt;
    }

    streamgate::v1::DownloadChunk chunk;
    if (reader_->Read(&chunk)) {
      return std::move(*chunk.mutable_data());
    }

    finished_         = true;
    const auto status = reader_->Finish();
    if (status.ok() || cancelled_.load()) {
      return std::nullopt;
    }
    ThrowStatus(status, ctx_, "origin download");
  }

  void Cancel() override {
    if (!cancelled_.exchange(true)) {
      ctx_.TryCancel();
    }
  }

 private:
  ::grpc::ClientContext                                           ctx_;
  std::unique_ptr<::grpc::ClientReader<streamgate::v1::DownloadChunk>> reader_;
  std::atomic<bool>                                             cancelled_{false};
  bool                                                          finished_ = false;
};

} // namespace

GrpcMediaOrigin::GrpcMediaOrigin(std::shared_ptr<::grpc::Channel> channel, uint64_t chunk_size, std::chrono::milliseconds resolve_timeout)
    : stub_(streamgate::v1::MediaOriginService::NewStub(channel)), chunk_size_(chunk_size), resolve_timeout_(resolve_timeout) {
  if (chunk_size_ == 0) {
    throw std::invalid_argument("GrpcMediaOrigin: chunk size must be non-zero");
  }
}

std::optional<std::string> GrpcMediaOrigin::Resolve(int64_t chat_id, int64_t message_id) {
  streamgate::v1::ResolveRequest request;
  request.set_chat_id(chat_id);
  request.set_message_id(message_id);

  streamgate::v1::ResolveResponse response;
  ::grpc::ClientContext             ctx;
  if (resolve_timeout_.count() > 0) {
    ctx.set_deadline(std::chrono::system_clock::now() + resolve_timeout_);
  }

  const auto status = stub_->Resolve(&ctx, request, &response);
  if (!status.ok()) {
    // Resolution is best-effort; the stored locator is the fallback.
    STREAMGATE_LOG_WARN("origin resolve failed", {observability::IntField("chat_id", chat_id), observability::IntField("message_id", message_id),
                                                  observability::StringField("error", status.error_message())});
    return std::nullopt;
  }
  if (!response.found() || response.file_id().empty()) {
    return std::nullopt;
  }
  return response.file_id();
}

std::unique_ptr<ChunkSource> GrpcMediaOrigin::OpenChunkedDownload(const std::string& locator, uint64_t offset_bytes,
                                                                  std::optional<uint64_t> limit_bytes) {
  if (offset_bytes % chunk_size_ != 0) {
    throw util::InvalidArgument("origin offset must be chunk aligned");
  }

  streamgate::v1::DownloadRequest request;
  request.set_file_id(locator);
  request.set_offset_bytes(offset_bytes);
  if (limit_bytes) {
    request.set_limit_bytes(*limit_bytes);
  }
  return std::make_unique<GrpcChunkSource>(*stub_, request);
}

} // namespace streamgate::origin
