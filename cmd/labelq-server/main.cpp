#include <chrono>
#include <csignal>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/lease/lease_manager.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/runtime/server.hpp"
#include "internal/store/item_store.hpp"

using labelq::factory::Build;
using labelq::runtime::Server;

static volatile std::sig_atomic_t g_running = 1;

void HandleSignal(int) {
  g_running = 0;
}

int main(int argc, char** argv) {
  std::string config_path;
  if (argc == 2) {
    config_path = argv[1];
  } else if (argc == 3 && std::string(argv[1]) == "--config") {
    config_path = argv[2];
  } else {
    std::cerr << "Usage: labelq-server <config.yaml> OR labelq-server --config <config.yaml>" << std::endl;
    return 1;
  }

  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    auto config = labelq::config::ConfigLoader::LoadFromYaml(config_path);

    labelq::observability::InitializeLogging(config);
    labelq::observability::InitializeTracing(config);
    labelq::observability::InitializeMetrics(config);

    // ------------------------------------------------------------
    // Build application (dependency graph)
    // ------------------------------------------------------------
    auto app = Build(config);

    std::weak_ptr<labelq::store::ItemStore> gauge_store = app.context.store;
    labelq::observability::Metrics::Instance().SetItemCountsSource([gauge_store] {
      auto store = gauge_store.lock();
      return store ? store->Counts() : labelq::model::ItemCounts{};
    });

    // ------------------------------------------------------------
    // Start server
    // ------------------------------------------------------------
    Server server(config.server().bind_address(), app.queue_service, app.admin_service);

    // Register signal handlers before starting server to avoid race window.
    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    server.Start();
    LABELQ_LOG_INFO("labelq started", {labelq::observability::StringField("bind_address", config.server().bind_address()),
                                       labelq::observability::IntField("lease_ms", app.context.leases->LeaseDuration().count()),
                                       labelq::observability::BoolField("strict_taxonomy", app.context.strict_taxonomy)});

    while (g_running) std::this_thread::sleep_for(std::chrono::seconds(1));

    LABELQ_LOG_INFO("Shutting down labelq");

    server.Stop();
    if (config.leases().release_on_shutdown()) {
      labelq::factory::ReleaseReservations(app, "shutdown");
    }
    labelq::observability::Metrics::Instance().SetItemCountsSource(nullptr);
    labelq::observability::ShutdownMetrics();
    labelq::observability::ShutdownTracing();
    labelq::observability::ShutdownLogging();
  } catch (const std::exception& e) {
    LABELQ_LOG_ERROR("Fatal error", {labelq::observability::StringField("error", e.what())});
    labelq::observability::Metrics::Instance().SetItemCountsSource(nullptr);
    labelq::observability::ShutdownMetrics();
    labelq::observability::ShutdownTracing();
    labelq::observability::ShutdownLogging();
    return 2;
  }

  return 0;
}
