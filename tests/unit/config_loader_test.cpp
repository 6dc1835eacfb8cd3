#include "internal/config/config_loader.hpp"

#include <cassert>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>

#include "internal/util/time.hpp"

namespace {

std::filesystem::path WriteYaml(const std::string& test_name, const std::string& yaml_content) {
  const auto base_dir = std::filesystem::temp_directory_path() / "labelq_config_loader_tests";
  std::filesystem::create_directories(base_dir);

  const auto    file_path = base_dir / (test_name + ".yaml");
  std::ofstream out(file_path);
  out << yaml_content;
  out.close();

  return file_path;
}

bool Rejects(const std::string& yaml) {
  try {
    (void)labelq::config::ConfigLoader::LoadFromYamlString(yaml);
  } catch (const std::runtime_error&) {
    return true;
  }
  return false;
}

void TestFullConfigFromFile() {
  const auto yaml_path = WriteYaml("full",
                                   R"(server:
  bind_address: "127.0.0.1:6000"
database:
  sqlite:
    path: "/tmp/labelq.db"
leases:
  reservation_timeout: "90s"
  release_on_shutdown: false
images:
  directory: "/srv/images"
  extensions: [png]
  url_prefix: "/img"
  rescan_on_next: true
categories:
  - id: hands
    name: Hands
    labels:
      - id: ok
        name: Looks fine
        shortcut: "1"
      - id: extra finger
        shortcut: "2"
validation:
  strict_taxonomy: true
logging:
  level: debug
observability:
  metrics_enabled: true
  transport: OTLP_TRANSPORT_HTTP
  otlp_endpoint: "http://collector:4318/v1/metrics"
)");

  auto config = labelq::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.server().bind_address() == "127.0.0.1:6000");
  assert(config.database().has_sqlite());
  assert(config.database().sqlite().path() == "/tmp/labelq.db");
  assert(config.database().sqlite().wal_mode());
  assert(config.database().sqlite().busy_timeout_ms() == 5000);
  assert(labelq::util::FromProto(config.leases().reservation_timeout()) == std::chrono::seconds(90));
  assert(config.leases().release_on_startup());
  assert(!config.leases().release_on_shutdown());
  assert(config.images().directory() == "/srv/images");
  assert(config.images().extensions_size() == 1);
  assert(config.images().url_prefix() == "/img");
  assert(config.images().rescan_on_next());
  assert(config.categories_size() == 1);
  assert(config.categories(0).name() == "Hands");
  assert(config.categories(0).labels(0).shortcut() == "1");
  // label name falls back to the id
  assert(config.categories(0).labels(1).name() == "extra finger");
  assert(config.validation().strict_taxonomy());
  assert(config.logging().level() == "debug");
  assert(config.observability().metrics_enabled());
  assert(!config.observability().tracing_enabled());
  assert(config.observability().transport() == labelq::runtime::config::OTLP_TRANSPORT_HTTP);
  assert(config.observability().otlp_endpoint() == "http://collector:4318/v1/metrics");
  assert(config.observability().service_name() == "labelq");
}

void TestDefaultsForEmptyDocument() {
  auto config = labelq::config::ConfigLoader::LoadFromYamlString("");
  assert(config.server().bind_address() == "0.0.0.0:50051");
  assert(!config.database().has_sqlite() && !config.database().has_postgres());
  assert(labelq::util::FromProto(config.leases().reservation_timeout()) == std::chrono::seconds(300));
  assert(config.leases().release_on_startup());
  assert(config.leases().release_on_shutdown());
  assert(config.images().directory().empty());
  assert(config.images().extensions_size() == 6);
  assert(config.images().url_prefix() == "/images/");
  assert(!config.images().rescan_on_next());
  assert(!config.validation().strict_taxonomy());
  assert(!config.observability().tracing_enabled());
  assert(!config.observability().metrics_enabled());
  assert(config.observability().metrics_interval_ms() == 1000);
}

void TestScalarEscapingForQuotedAndBackslashValues() {
  auto config = labelq::config::ConfigLoader::LoadFromYamlString(R"(database:
  sqlite:
    path: "C:\\labelq\\\"quoted\"\\db.sqlite"
    wal_mode: false
)");
  assert(config.database().sqlite().path() == "C:\\labelq\\\"quoted\"\\db.sqlite");
  assert(!config.database().sqlite().wal_mode());
}

void TestQuotedNumbersStayStrings() {
  auto config = labelq::config::ConfigLoader::LoadFromYamlString(R"(categories:
  - id: "7"
    labels:
      - id: "1"
        shortcut: "1"
)");
  assert(config.categories(0).id() == "7");
  assert(config.categories(0).labels(0).id() == "1");
  assert(config.categories(0).labels(0).shortcut() == "1");
}

void TestUnknownFieldsAreRejected() {
  assert(Rejects(R"(server:
  bind_address: "0.0.0.0:50051"
unknown_field: 123
)") && "ConfigLoader must reject unknown fields.");
}

void TestInvalidValuesAreRejected() {
  assert(Rejects("leases:\n  reservation_timeout: \"-5s\"\n"));
  assert(Rejects("leases:\n  reservation_timeout: \"soon\"\n"));
  assert(Rejects("categories:\n  - id: a\n  - id: a\n"));
  assert(Rejects("categories:\n  - id: a\n    labels:\n      - id: x\n      - id: x\n"));
  assert(Rejects("database:\n  sqlite:\n    wal_mode: true\n"));
  assert(Rejects("- just\n- a\n- list\n"));
}

void TestMissingFileIsRejected() {
  bool threw = false;
  try {
    (void)labelq::config::ConfigLoader::LoadFromYaml("/nonexistent/labelq/config.yaml");
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestFullConfigFromFile();
  TestDefaultsForEmptyDocument();
  TestScalarEscapingForQuotedAndBackslashValues();
  TestQuotedNumbersStayStrings();
  TestUnknownFieldsAreRejected();
  TestInvalidValuesAreRejected();
  TestMissingFileIsRejected();

  std::cout << "labelq_unit_config_loader: pass\n";
  return 0;
}
