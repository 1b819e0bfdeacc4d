#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <optional>
#include <string>

#include "internal/core/stream_orchestrator.hpp"
#include "internal/core/token_store.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "tests/unit/fake_origin.hpp"

namespace {

using namespace streamgate::v1;
using streamgate::core::HeaderList;
using streamgate::core::StreamOrchestrator;
using streamgate::core::StreamResponse;
using streamgate::core::TokenStore;
using streamgate::testing::Bytes;
using streamgate::testing::FakeOrigin;
using streamgate::util::ErrorKind;

struct Fixture {
  std::shared_ptr<TokenStore>         store;
  std::shared_ptr<FakeOrigin>         origin;
  std::shared_ptr<StreamOrchestrator> orchestrator;
};

Fixture MakeFixture(uint64_t object_size, uint64_t origin_chunk, bool allow_premium = true) {
  Fixture f;
  f.store  = std::make_shared<TokenStore>(std::make_shared<streamgate::db::memory::MemoryRepository>(), streamgate::core::TokenStoreOptions{});
  f.origin = std::make_shared<FakeOrigin>(object_size, origin_chunk);

  StreamOrchestrator::Options options;
  options.output_chunk_size       = 256;
  options.allow_premium_streaming = allow_premium;
  f.orchestrator                  = std::make_shared<StreamOrchestrator>(f.store, f.origin, options);
  return f;
}

MediaReference Reference(std::optional<uint64_t> size) {
  MediaReference ref;
  ref.mutable_primary_locator()->set_chat_id(-100);
  ref.mutable_primary_locator()->set_message_id(1);
  ref.set_fallback_locator("stored-file-id");
  ref.set_mime_type("video/mp4");
  if (size) ref.set_size_bytes(*size);
  return ref;
}

std::optional<std::string> Header(const HeaderList& headers, const std::string& name) {
  for (const auto& [key, value] : headers) {
    if (key == name) return value;
  }
  return std::nullopt;
}

std::string ReadBody(StreamResponse& response) {
  std::string body;
  while (auto piece = response.body->Next()) {
    assert(piece->size() <= 256);
    body += *piece;
  }
  return body;
}

void TestFullResponseWithKnownSize() {
  auto f = MakeFixture(1000, 300);
  f.store->Put("tok", Reference(1000), std::nullopt);

  auto response = f.orchestrator->OpenStream("tok", std::nullopt);
  assert(!response.error);
  assert(response.status == 200);
  assert(Header(response.headers, "Accept-Ranges") == "bytes");
  assert(Header(response.headers, "Content-Type") == "video/mp4");
  assert(Header(response.headers, "Content-Length") == "1000");
  assert(!Header(response.headers, "Content-Range").has_value());
  assert(response.tier == ACCESS_TIER_NORMAL);

  assert(ReadBody(response) == Bytes(0, 1000));
  assert(f.origin->Opens()[0].locator == "fresh:-100:1");
}

void TestPartialResponse() {
  auto f = MakeFixture(1000, 300);
  f.store->Put("tok", Reference(1000), std::nullopt);

  auto response = f.orchestrator->OpenStream("tok", std::string_view("bytes=500-"));
  assert(response.status == 206);
  assert(Header(response.headers, "Content-Range") == "bytes 500-999/1000");
  assert(Header(response.headers, "Content-Length") == "500");
  assert(ReadBody(response) == Bytes(500, 500));

  const auto opens = f.origin->Opens();
  assert(opens.size() == 1);
  assert(opens[0].offset_bytes == 300);
  assert(opens[0].limit_bytes == 900u);
}

void TestUnknownSizeStreamsWithoutLength() {
  auto f = MakeFixture(777, 100);
  f.store->Put("tok", Reference(std::nullopt), std::nullopt);

  auto response = f.orchestrator->OpenStream("tok", std::nullopt);
  assert(response.status == 200);
  assert(!Header(response.headers, "Content-Length").has_value());
  assert(!Header(response.headers, "Content-Range").has_value());
  assert(ReadBody(response) == Bytes(0, 777));

  auto ranged = f.orchestrator->OpenStream("tok", std::string_view("bytes=0-10"));
  assert(ranged.status == 416);
  assert(ranged.error == ErrorKind::kRangeNotSatisfiable);
}

void TestDefaultContentType() {
  auto f   = MakeFixture(10, 10);
  auto ref = Reference(10);
  ref.clear_mime_type();
  f.store->Put("tok", ref, std::nullopt);

  auto response = f.orchestrator->OpenStream("tok", std::nullopt);
  assert(Header(response.headers, "Content-Type") == "application/octet-stream");
}

void TestMissingTokenIsNotFound() {
  auto f        = MakeFixture(10, 10);
  auto response = f.orchestrator->OpenStream("nope", std::nullopt);
  assert(response.error == ErrorKind::kNotFound);
  assert(response.status == 404);
  assert(!response.body);
  assert(f.origin->Opens().empty());
}

void TestUnsatisfiableRange() {
  auto f = MakeFixture(1000, 300);
  f.store->Put("tok", Reference(1000), std::nullopt);

  auto response = f.orchestrator->OpenStream("tok", std::string_view("bytes=1000-"));
  assert(response.status == 416);
  assert(Header(response.headers, "Content-Range") == "bytes */1000");
  assert(!response.body);

  assert(f.orchestrator->OpenStream("tok", std::string_view("pages=1-2")).status == 416);
}

void TestFallbackLocator() {
  auto f = MakeFixture(100, 100);
  f.store->Put("tok", Reference(100), std::nullopt);

  f.origin->resolvable = false;
  auto stale           = f.orchestrator->OpenStream("tok", std::nullopt);
  assert(stale.status == 200);
  assert(f.origin->Opens().back().locator == "stored-file-id");

  f.origin->resolvable     = true;
  f.origin->resolve_throws = true;
  auto limited             = f.orchestrator->OpenStream("tok", std::nullopt);
  assert(limited.status == 200);
  assert(f.origin->Opens().back().locator == "stored-file-id");
}

void TestNoUsableLocatorIsNotFound() {
  auto f   = MakeFixture(100, 100);
  auto ref = Reference(100);
  ref.clear_fallback_locator();
  f.store->Put("tok", ref, std::nullopt);
  f.origin->resolvable = false;

  auto response = f.orchestrator->OpenStream("tok", std::nullopt);
  assert(response.error == ErrorKind::kNotFound);
  assert(response.status == 404);
}

void TestRateLimitedOriginIsUnavailable() {
  auto f = MakeFixture(1000, 300);
  f.store->Put("tok", Reference(1000), std::nullopt);
  f.origin->rate_limited = true;

  auto response = f.orchestrator->OpenStream("tok", std::string_view("bytes=0-99"));
  assert(response.error == ErrorKind::kOriginUnavailable);
  assert(response.status == 503);
  assert(response.retry_after == std::chrono::seconds(7));
  assert(!response.body);
}

void TestHeadRequestOpensNoSession() {
  auto f = MakeFixture(1000, 300);
  f.store->Put("tok", Reference(1000), std::nullopt);

  auto response = f.orchestrator->OpenStream("tok", std::string_view("bytes=0-9"), false);
  assert(response.status == 206);
  assert(Header(response.headers, "Content-Length") == "10");
  assert(!response.body);
  assert(f.origin->Opens().empty());
}

void TestPremiumStreamingGate() {
  auto ref = Reference(100);
  ref.set_access_tier(ACCESS_TIER_PREMIUM);

  auto allowed = MakeFixture(100, 100, true);
  allowed.store->Put("tok", ref, std::nullopt);
  auto ok = allowed.orchestrator->OpenStream("tok", std::nullopt);
  assert(ok.status == 200);
  assert(ok.tier == ACCESS_TIER_PREMIUM);

  auto denied = MakeFixture(100, 100, false);
  denied.store->Put("tok", ref, std::nullopt);
  auto refused = denied.orchestrator->OpenStream("tok", std::nullopt);
  assert(refused.error == ErrorKind::kAccessDenied);
  assert(refused.status == 403);
  assert(denied.origin->Opens().empty());
}

void TestHttpStatusMapping() {
  using streamgate::core::HttpStatusFor;
  assert(HttpStatusFor(ErrorKind::kNotFound) == 404);
  assert(HttpStatusFor(ErrorKind::kRangeNotSatisfiable) == 416);
  assert(HttpStatusFor(ErrorKind::kOriginUnavailable) == 503);
  assert(HttpStatusFor(ErrorKind::kInsufficientBalance) == 403);
  assert(HttpStatusFor(ErrorKind::kOriginTruncated) == 500);
}

} // namespace

int main() {
  TestFullResponseWithKnownSize();
  TestPartialResponse();
  TestUnknownSizeStreamsWithoutLength();
  TestDefaultContentType();
  TestMissingTokenIsNotFound();
  TestUnsatisfiableRange();
  TestFallbackLocator();
  TestNoUsableLocatorIsNotFound();
  TestRateLimitedOriginIsUnavailable();
  TestHeadRequestOpensNoSession();
  TestPremiumStreamingGate();
  TestHttpStatusMapping();

  std::cout << "streamgate_unit_stream_orchestrator: pass\n";
  return 0;
}
