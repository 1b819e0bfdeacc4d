#pragma once

#include <grpcpp/channel.h>

#include <chrono>
#include <memory>

#include "internal/origin/media_origin.hpp"
#include "streamgate/v1/origin_service.grpc.pb.h"

namespace streamgate::origin {

// MediaOrigin backed by a remote streamgate.v1.MediaOriginService.
class GrpcMediaOrigin final : public MediaOrigin {
 public:
  GrpcMediaOrigin(std::shared_ptr<::grpc::Channel> channel, uint64_t chunk_size, std::chrono::milliseconds resolve_timeout);

  std::optional<std::string> Resolve(int64_t chat_id, int64_t message_id) override;

  std::unique_ptr<ChunkSource> OpenChunkedDownload(const std::string& locator, uint64_t offset_bytes,
                                                   std::optional<uint64_t> limit_bytes) override;

  uint64_t ChunkSize() const override {
    return chunk_size_;
  }

 private:
  std::unique_ptr<streamgate::v1::MediaOriginService::Stub> stub_;
  uint64_t                                                  chunk_size_;
  std::chrono::milliseconds                                 resolve_timeout_;
};

} // namespace streamgate::origin
