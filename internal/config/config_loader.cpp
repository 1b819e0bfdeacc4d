#include "config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <stdexcept>

namespace streamgate::config {

using streamgate::runtime::config::RuntimeConfig;

namespace {

constexpr uint64_t kDefaultOutputChunkSize = 524288;
constexpr uint64_t kMinOutputChunkSize     = 262144;
constexpr uint64_t kMaxOutputChunkSize     = 1048576;
constexpr uint64_t kDefaultOriginChunkSize = 1048576;
constexpr int64_t  kDefaultTokenTtlSeconds = 86400;
constexpr uint32_t kDefaultHistoryLimit    = 200;
constexpr uint32_t kMaxHistoryLimit        = 10000;
constexpr uint32_t kMaxWorkerThreads       = 1024;

void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value);

void SetScalarValue(const YAML::Node& node, google::protobuf::Value* value) {
  const std::string& scalar_value = node.Scalar();

  // quoted scalars stay strings
  if (node.Tag() == "!") {
    value->set_string_value(scalar_value);
    return;
  }

  // detect numeric / bool
  if (scalar_value == "true" || scalar_value == "false") {
    value->set_bool_value(scalar_value == "true");
    return;
  }

  char*        endptr        = nullptr;
  const double numeric_value = strtod(scalar_value.c_str(), &endptr);
  if (!scalar_value.empty() && endptr && *endptr == '\0') {
    value->set_number_value(numeric_value);
    return;
  }

  value->set_string_value(scalar_value);
}

void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value) {
  switch (node.Type()) {
    case YAML::NodeType::Null:
      value->set_null_value(google::protobuf::NullValue::NULL_VALUE);
      break;

    case YAML::NodeType::Scalar:
      SetScalarValue(node, value);
      break;

    case YAML::NodeType::Sequence: {
      auto* list_value = value->mutable_list_value();
      for (size_t i = 0; i < node.size(); ++i) {
        YamlToProtoValue(node[i], list_value->add_values());
      }
      break;
    }

    case YAML::NodeType::Map: {
      auto* struct_value = value->mutable_struct_value();
      for (auto it : node) {
        YamlToProtoValue(it.second, &(*struct_value->mutable_fields())[it.first.Scalar()]);
      }
      break;
    }

    default:
      throw std::runtime_error("Unsupported YAML node");
  }
}

RuntimeConfig Parse(const YAML::Node& yaml) {
  google::protobuf::Value json_value;
  if (yaml.IsNull()) {
    json_value.mutable_struct_value();
  } else {
    YamlToProtoValue(yaml, &json_value);
  }

  std::string json;
  auto        to_json_status = google::protobuf::util::MessageToJsonString(json_value, &json);
  if (!to_json_status.ok()) {
    throw std::runtime_error("Failed to serialize YAML to JSON: " + std::string(to_json_status.message()));
  }

  RuntimeConfig config;

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = false;

  auto status = google::protobuf::util::JsonStringToMessage(json, &config, options);

  if (!status.ok()) {
    throw std::runtime_error("Invalid configuration: " + std::string(status.message()));
  }

  ConfigLoader::ApplyDefaults(config);
  ConfigLoader::Validate(config);
  return config;
}

void Require(bool condition, const std::string& message) {
  if (!condition) {
    throw std::runtime_error("Invalid configuration: " + message);
  }
}

} // namespace

// ------------------------------------------------------------
// Public loader
// ------------------------------------------------------------

RuntimeConfig ConfigLoader::LoadFromYaml(const std::string& path) {
  YAML::Node yaml;
  try {
    yaml = YAML::LoadFile(path);
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to load YAML config: " + std::string(e.what()));
  }
  return Parse(yaml);
}

RuntimeConfig ConfigLoader::LoadFromString(const std::string& text) {
  YAML::Node yaml;
  try {
    yaml = YAML::Load(text);
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to parse YAML config: " + std::string(e.what()));
  }
  return Parse(yaml);
}

void ConfigLoader::ApplyDefaults(RuntimeConfig& config) {
  auto* server = config.mutable_server();
  if (server->bind_address().empty()) server->set_bind_address("0.0.0.0:50051");

  auto* http = config.mutable_http();
  if (http->bind_address().empty()) http->set_bind_address("0.0.0.0");
  if (http->port() == 0) http->set_port(8080);
  if (http->worker_threads() == 0) http->set_worker_threads(8);
  if (http->output_chunk_size_bytes() == 0) http->set_output_chunk_size_bytes(kDefaultOutputChunkSize);
  if (!http->has_allow_premium_streaming()) http->set_allow_premium_streaming(true);
  if (http->stream_threads() == 0) http->set_stream_threads(32);
  if (!http->has_read_timeout()) http->mutable_read_timeout()->set_seconds(15);

  if (config.database().backend_case() == streamgate::runtime::config::DatabaseConfig::BACKEND_NOT_SET) {
    config.mutable_database()->mutable_memory();
  }
  if (config.database().has_postgres() && config.database().postgres().max_connections() == 0) {
    config.mutable_database()->mutable_postgres()->set_max_connections(4);
  }

  auto* origin = config.mutable_origin();
  if (origin->chunk_size_bytes() == 0) origin->set_chunk_size_bytes(kDefaultOriginChunkSize);
  if (!origin->has_resolve_timeout()) origin->mutable_resolve_timeout()->set_seconds(5);

  auto* tokens = config.mutable_tokens();
  if (!tokens->has_ttl()) tokens->mutable_ttl()->set_seconds(kDefaultTokenTtlSeconds);
  if (tokens->history_limit() == 0) tokens->set_history_limit(kDefaultHistoryLimit);
  if (!tokens->has_expiry_sweep_interval()) tokens->mutable_expiry_sweep_interval()->set_seconds(60);

  auto* ledger = config.mutable_ledger();
  if (ledger->credit_cost() == 0) ledger->set_credit_cost(1);
  if (ledger->default_price_per_credit_minor() == 0) ledger->set_default_price_per_credit_minor(35);
  if (!ledger->has_pending_submission_ttl()) ledger->mutable_pending_submission_ttl()->set_seconds(1800);

  auto* logging = config.mutable_logging();
  if (logging->level().empty()) logging->set_level("info");
}

void ConfigLoader::Validate(const RuntimeConfig& config) {
  const auto& http = config.http();
  Require(http.port() <= 65535, "http.port must be at most 65535");
  Require(http.worker_threads() >= 1 && http.worker_threads() <= kMaxWorkerThreads, "http.worker_threads must be between 1 and 1024");
  Require(http.output_chunk_size_bytes() >= kMinOutputChunkSize && http.output_chunk_size_bytes() <= kMaxOutputChunkSize,
          "http.output_chunk_size_bytes must be between 262144 and 1048576");
  Require(http.stream_threads() >= 1 && http.stream_threads() <= kMaxWorkerThreads, "http.stream_threads must be between 1 and 1024");
  Require(http.read_timeout().seconds() > 0, "http.read_timeout must be at least one second");

  const auto& database = config.database();
  if (database.has_sqlite()) {
    Require(!database.sqlite().path().empty(), "database.sqlite.path is required");
  }
  if (database.has_postgres()) {
    Require(!database.postgres().connection_uri().empty(), "database.postgres.connection_uri is required");
  }

  const auto& origin = config.origin();
  Require(!origin.target().empty(), "origin.target is required");
  Require(origin.chunk_size_bytes() > 0, "origin.chunk_size_bytes must be positive");
  Require(origin.resolve_timeout().seconds() >= 0, "origin.resolve_timeout must not be negative");

  const auto& tokens = config.tokens();
  Require(tokens.history_limit() <= kMaxHistoryLimit, "tokens.history_limit must be at most 10000");
  Require(tokens.expiry_sweep_interval().seconds() > 0, "tokens.expiry_sweep_interval must be positive");

  const auto& ledger = config.ledger();
  Require(ledger.credit_cost() >= 0, "ledger.credit_cost must not be negative");
  Require(ledger.default_price_per_credit_minor() > 0, "ledger.default_price_per_credit_minor must be positive");
  Require(ledger.pending_submission_ttl().seconds() > 0, "ledger.pending_submission_ttl must be positive");

  const auto& level = config.logging().level();
  Require(level == "trace" || level == "debug" || level == "info" || level == "warn" || level == "error" || level == "critical" || level == "off",
          "logging.level '" + level + "' is not a known level");
}

} // namespace streamgate::config
