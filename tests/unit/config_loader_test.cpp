#include "internal/config/config_loader.hpp"

#include <cassert>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>

#include "internal/observability/otlp_config.hpp"
#include "internal/util/time.hpp"

namespace {

using flowstead::config::ConfigLoader;
using flowstead::util::FromProto;
using flowstead::util::Millis;

std::filesystem::path WriteYaml(const std::string& test_name, const std::string& yaml_content) {
  const auto base_dir = std::filesystem::temp_directory_path() / "flowstead_config_loader_tests";
  std::filesystem::create_directories(base_dir);

  const auto    file_path = base_dir / (test_name + ".yaml");
  std::ofstream out(file_path);
  out << yaml_content;
  out.close();

  return file_path;
}

template <typename Error>
bool Rejects(const std::string& yaml) {
  try {
    ConfigLoader::LoadFromYamlString(yaml);
  } catch (const Error&) {
    return true;
  }
  return false;
}

void TestEmptyDocumentGetsDefaults() {
  auto config = ConfigLoader::LoadFromYamlString("");
  assert(config.server().bind_address() == "0.0.0.0:7233");
  assert(config.database().has_memory());
  assert(config.engine().decision_threads() == 4);
  assert(FromProto(config.engine().run_lock_ttl()) == Millis(30000));
  assert(FromProto(config.engine().sweep_interval()) == Millis(1000));
  assert(FromProto(config.engine().default_start_to_close_timeout()) == Millis(60000));
  assert(FromProto(config.engine().engine_retry_initial()) == Millis(100));
  assert(FromProto(config.engine().engine_retry_max()) == Millis(10000));
  assert(config.engine().list_page_size() == 100);
  assert(config.workers().threads() == 2);
  assert(FromProto(config.workers().poll_timeout()) == Millis(1000));
  assert(config.logging().level() == "info");
}

void TestFileOverridesDefaults() {
  const auto path = WriteYaml("overrides", R"(server:
  bind_address: "127.0.0.1:9000"
database:
  sqlite:
    path: "/var/lib/flowstead/history.db"
    wal_mode: true
engine:
  instance_id: "engine-a"
  decision_threads: 8
  run_lock_ttl: "0.5s"
workers:
  task_queues: ["default", "gpu"]
logging:
  level: debug
)");

  auto config = ConfigLoader::LoadFromYaml(path.string());
  assert(config.server().bind_address() == "127.0.0.1:9000");
  assert(config.database().has_sqlite());
  assert(config.database().sqlite().path() == "/var/lib/flowstead/history.db");
  assert(config.database().sqlite().wal_mode());
  assert(config.engine().instance_id() == "engine-a");
  assert(config.engine().decision_threads() == 8);
  assert(FromProto(config.engine().run_lock_ttl()) == Millis(500));
  // Untouched fields still get defaults.
  assert(FromProto(config.engine().sweep_interval()) == Millis(1000));
  assert(config.workers().task_queues_size() == 2);
  assert(config.workers().task_queues(1) == "gpu");
  assert(config.logging().level() == "debug");
}

void TestQuotedScalarsStayStrings() {
  auto config = ConfigLoader::LoadFromYamlString(R"(engine:
  instance_id: "0042"
)");
  assert(config.engine().instance_id() == "0042");

  auto escaped = ConfigLoader::LoadFromYamlString(R"(database:
  sqlite:
    path: "C:\\flowstead\\\"quoted\"\\db.sqlite"
)");
  assert(escaped.database().sqlite().path() == "C:\\flowstead\\\"quoted\"\\db.sqlite");
}

void TestUnknownFieldsAreRejected() {
  assert(Rejects<std::runtime_error>("unknown_field: 123\n"));
  assert(Rejects<std::runtime_error>("engine:\n  decision_thread: 2\n"));
}

void TestInvalidValuesAreRejected() {
  assert(Rejects<std::invalid_argument>("engine:\n  run_lock_ttl: \"0s\"\n"));
  assert(Rejects<std::invalid_argument>("engine:\n  engine_retry_initial: \"20s\"\n  engine_retry_max: \"5s\"\n"));
  assert(Rejects<std::invalid_argument>("database:\n  sqlite:\n    wal_mode: true\n"));
  assert(Rejects<std::invalid_argument>("database:\n  postgres:\n    max_connections: 4\n"));
  assert(Rejects<std::invalid_argument>("logging:\n  level: verbose\n"));
}

void TestMissingFileIsReported() {
  bool threw = false;
  try {
    ConfigLoader::LoadFromYaml("/nonexistent/flowstead/config.yaml");
  } catch (const std::runtime_error& e) {
    threw = std::string(e.what()).find("Failed to load YAML config") != std::string::npos;
  }
  assert(threw);
}

} // namespace

void TestOtlpSettingsFollowConfig() {
  using flowstead::observability::OtlpTransport;
  using flowstead::observability::ResolveEndpoint;
  using flowstead::observability::ToOtlpConfig;

  auto config = ConfigLoader::LoadFromYamlString(R"(engine:
  instance_id: "engine-west-1"
observability:
  tracing_enabled: true
  otlp_endpoint: "http://collector:4318/v1/traces"
  transport: OTLP_TRANSPORT_HTTP
)");
  auto otlp = ToOtlpConfig(config);
  assert(otlp.transport == OtlpTransport::kHttpProtobuf);
  assert(otlp.instance_id == "engine-west-1");
  assert(ResolveEndpoint(otlp, "traces") == "http://collector:4318/v1/traces");

  auto defaults = ToOtlpConfig(ConfigLoader::LoadFromYamlString(""));
  assert(defaults.transport == OtlpTransport::kGrpc);
  assert(defaults.endpoint.empty());

  // Collector defaults apply only when the environment names no endpoint.
  if (!std::getenv("OTEL_EXPORTER_OTLP_ENDPOINT") && !std::getenv("OTEL_EXPORTER_OTLP_METRICS_ENDPOINT")) {
    assert(ResolveEndpoint(defaults, "metrics") == "localhost:4317");
    defaults.transport = OtlpTransport::kHttpProtobuf;
    assert(ResolveEndpoint(defaults, "metrics") == "http://localhost:4318/v1/metrics");
  }
}

int main() {
  TestEmptyDocumentGetsDefaults();
  TestFileOverridesDefaults();
  TestQuotedScalarsStayStrings();
  TestUnknownFieldsAreRejected();
  TestInvalidValuesAreRejected();
  TestMissingFileIsReported();
  TestOtlpSettingsFollowConfig();

  std::cout << "config_loader_test: pass\n";
  return 0;
}
