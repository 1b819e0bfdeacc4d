#include "internal/config/config_loader.hpp"

#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>

namespace {

using streamgate::config::ConfigLoader;

std::filesystem::path WriteYaml(const std::string& test_name, const std::string& yaml_content) {
  const auto base_dir = std::filesystem::temp_directory_path() / "streamgate_config_loader_tests";
  std::filesystem::create_directories(base_dir);

  const auto    file_path = base_dir / (test_name + ".yaml");
  std::ofstream out(file_path);
  out << yaml_content;
  out.close();

  return file_path;
}

bool Rejects(const std::string& yaml) {
  try {
    (void)ConfigLoader::LoadFromString(yaml);
  } catch (const std::runtime_error&) {
    return true;
  }
  return false;
}

void TestMinimalConfigGetsDefaults() {
  const auto yaml_path = WriteYaml("minimal",
                                   R"(origin:
  target: "127.0.0.1:50061"
)");

  auto config = ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.server().bind_address() == "0.0.0.0:50051");
  assert(config.http().port() == 8080);
  assert(config.http().worker_threads() == 8);
  assert(config.http().output_chunk_size_bytes() == 524288);
  assert(config.http().allow_premium_streaming());
  assert(config.http().stream_threads() == 32);
  assert(config.http().read_timeout().seconds() == 15);
  assert(config.database().has_memory());
  assert(config.origin().chunk_size_bytes() == 1048576);
  assert(config.origin().resolve_timeout().seconds() == 5);
  assert(config.tokens().ttl().seconds() == 86400);
  assert(config.tokens().history_limit() == 200);
  assert(config.ledger().credit_cost() == 1);
  assert(config.ledger().default_price_per_credit_minor() == 35);
  assert(config.ledger().pending_submission_ttl().seconds() == 1800);
  assert(config.logging().level() == "info");
}

void TestExplicitValuesAreKept() {
  auto config = ConfigLoader::LoadFromString(R"(http:
  port: 9090
  output_chunk_size_bytes: 262144
  allow_premium_streaming: false
  stream_threads: 4
  read_timeout: "3s"
database:
  postgres:
    connection_uri: "postgresql://localhost/streamgate"
origin:
  target: "origin:50061"
  resolve_timeout: "2s"
tokens:
  ttl: "3600s"
  history_limit: 50
ledger:
  credit_cost: 3
logging:
  level: "debug"
)");

  assert(config.http().port() == 9090);
  assert(config.http().output_chunk_size_bytes() == 262144);
  assert(!config.http().allow_premium_streaming());
  assert(config.http().stream_threads() == 4);
  assert(config.http().read_timeout().seconds() == 3);
  assert(config.database().postgres().connection_uri() == "postgresql://localhost/streamgate");
  assert(config.database().postgres().max_connections() == 4);
  assert(config.origin().resolve_timeout().seconds() == 2);
  assert(config.tokens().ttl().seconds() == 3600);
  assert(config.tokens().history_limit() == 50);
  assert(config.ledger().credit_cost() == 3);
  assert(config.logging().level() == "debug");
}

void TestQuotedScalarsStayStrings() {
  auto config = ConfigLoader::LoadFromString(R"(database:
  sqlite:
    path: "12345"
origin:
  target: "C:\\origin\\\"quoted\""
)");

  assert(config.database().sqlite().path() == "12345");
  assert(config.origin().target() == "C:\\origin\\\"quoted\"");
}

void TestUnknownFieldsAreRejected() {
  bool threw = Rejects(R"(origin:
  target: "127.0.0.1:50061"
unknown_field: 123
)");

  assert(threw && "ConfigLoader must reject unknown fields.");
}

void TestOutOfRangeValuesAreRejected() {
  assert(Rejects(""));  // origin.target is required
  assert(Rejects(R"(origin:
  target: "o:1"
http:
  output_chunk_size_bytes: 1024
)"));
  assert(Rejects(R"(origin:
  target: "o:1"
http:
  port: 70000
)"));
  assert(Rejects(R"(origin:
  target: "o:1"
http:
  read_timeout: "0s"
)"));
  assert(Rejects(R"(origin:
  target: "o:1"
http:
  stream_threads: 5000
)"));
  assert(Rejects(R"(origin:
  target: "o:1"
tokens:
  history_limit: 20000
)"));
  assert(Rejects(R"(origin:
  target: "o:1"
database:
  sqlite:
    path: ""
)"));
  assert(Rejects(R"(origin:
  target: "o:1"
ledger:
  credit_cost: -1
)"));
  assert(Rejects(R"(origin:
  target: "o:1"
logging:
  level: "loud"
)"));
}

void TestMissingFileFails() {
  bool threw = false;
  try {
    (void)ConfigLoader::LoadFromYaml("/nonexistent/streamgate.yaml");
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestMinimalConfigGetsDefaults();
  TestExplicitValuesAreKept();
  TestQuotedScalarsStayStrings();
  TestUnknownFieldsAreRejected();
  TestOutOfRangeValuesAreRejected();
  TestMissingFileFails();

  std::cout << "streamgate_unit_config_loader: pass\n";
  return 0;
}
