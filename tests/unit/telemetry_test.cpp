// Built only with LABELQ_ENABLE_OTEL: checks what the services hand to the
// OpenTelemetry SDK, using an in-memory span exporter and a pull reader.

#include <opentelemetry/exporters/memory/in_memory_span_exporter.h>
#include <opentelemetry/metrics/provider.h>
#include <opentelemetry/sdk/common/attribute_utils.h>
#include <opentelemetry/sdk/metrics/data/metric_data.h>
#include <opentelemetry/sdk/metrics/data/point_data.h>
#include <opentelemetry/sdk/metrics/export/metric_producer.h>
#include <opentelemetry/sdk/metrics/instruments.h>
#include <opentelemetry/sdk/metrics/meter_provider.h>
#include <opentelemetry/sdk/metrics/metric_reader.h>
#include <opentelemetry/sdk/trace/simple_processor.h>
#include <opentelemetry/sdk/trace/span_data.h>
#include <opentelemetry/sdk/trace/tracer_provider.h>
#include <opentelemetry/trace/provider.h>

#include <cassert>
#include <chrono>
#include <functional>
#include <iostream>
#include <map>
#include <memory>
#include <string>
#include <vector>

#include "config/config.pb.h"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/lease/lease_manager.hpp"
#include "internal/observability/spans.hpp"
#include "internal/service/admin_service.hpp"
#include "internal/service/queue_service.hpp"
#include "internal/store/item_store.hpp"
#include "internal/taxonomy/taxonomy.hpp"
#include "internal/util/errors.hpp"
#include "tests/support/fake_clock.hpp"

namespace {

namespace nostd      = opentelemetry::nostd;
namespace sdkmetrics = opentelemetry::sdk::metrics;
namespace sdktrace   = opentelemetry::sdk::trace;
namespace memory     = opentelemetry::exporter::memory;

using namespace labelq::queue::v1;
using labelq::testing::FakeClock;

class CollectingReader : public sdkmetrics::MetricReader {
 public:
  sdkmetrics::AggregationTemporality GetAggregationTemporality(sdkmetrics::InstrumentType) const noexcept override {
    return sdkmetrics::AggregationTemporality::kCumulative;
  }

 private:
  bool OnForceFlush(std::chrono::microseconds) noexcept override {
    return true;
  }

  bool OnShutdown(std::chrono::microseconds) noexcept override {
    return true;
  }
};

struct Point {
  std::string                        metric;
  std::map<std::string, std::string> attributes;
  int64_t                            value = 0;
};

std::string AttributeText(const opentelemetry::sdk::common::OwnedAttributeValue& value) {
  if (nostd::holds_alternative<std::string>(value)) return nostd::get<std::string>(value);
  if (nostd::holds_alternative<bool>(value)) return nostd::get<bool>(value) ? "true" : "false";
  return "";
}

int64_t PointValue(const sdkmetrics::PointType& data) {
  if (nostd::holds_alternative<sdkmetrics::SumPointData>(data)) {
    const auto& sum = nostd::get<sdkmetrics::SumPointData>(data);
    return nostd::holds_alternative<int64_t>(sum.value_) ? nostd::get<int64_t>(sum.value_) : 0;
  }
  if (nostd::holds_alternative<sdkmetrics::LastValuePointData>(data)) {
    const auto& last = nostd::get<sdkmetrics::LastValuePointData>(data);
    return nostd::holds_alternative<int64_t>(last.value_) ? nostd::get<int64_t>(last.value_) : 0;
  }
  if (nostd::holds_alternative<sdkmetrics::HistogramPointData>(data)) {
    return static_cast<int64_t>(nostd::get<sdkmetrics::HistogramPointData>(data).count_);
  }
  return 0;
}

std::vector<Point> Collect(CollectingReader& reader) {
  std::vector<Point> points;
  reader.Collect([&](sdkmetrics::ResourceMetrics& resource_metrics) {
    for (const auto& scope : resource_metrics.scope_metric_data_) {
      for (const auto& metric : scope.metric_data_) {
        for (const auto& point : metric.point_data_attr_) {
          Point p;
          p.metric = metric.instrument_descriptor.name_;
          for (const auto& [key, value] : point.attributes) p.attributes[key] = AttributeText(value);
          p.value = PointValue(point.point_data);
          points.push_back(std::move(p));
        }
      }
    }
    return true;
  });
  return points;
}

int64_t ValueOf(const std::vector<Point>& points, const std::string& metric, const std::map<std::string, std::string>& attributes) {
  for (const auto& p : points) {
    if (p.metric == metric && p.attributes == attributes) return p.value;
  }
  return -1;
}

} // namespace

int main() {
  auto exporter  = std::make_unique<memory::InMemorySpanExporter>();
  auto span_data = exporter->GetData();
  auto tracer_provider =
      std::make_shared<sdktrace::TracerProvider>(std::make_unique<sdktrace::SimpleSpanProcessor>(std::move(exporter)));
  opentelemetry::trace::Provider::SetTracerProvider(nostd::shared_ptr<opentelemetry::trace::TracerProvider>(tracer_provider));

  auto reader         = std::make_shared<CollectingReader>();
  auto meter_provider = std::make_shared<sdkmetrics::MeterProvider>();
  meter_provider->AddMetricReader(reader);
  opentelemetry::metrics::Provider::SetMeterProvider(nostd::shared_ptr<opentelemetry::metrics::MeterProvider>(meter_provider));

  FakeClock                       clock;
  labelq::service::ServiceContext ctx;
  ctx.store    = std::make_shared<labelq::store::ItemStore>(std::make_shared<labelq::db::memory::MemoryRepository>(), clock.Fn());
  ctx.leases   = std::make_shared<labelq::lease::LeaseManager>(ctx.store, std::chrono::seconds(300));
  ctx.taxonomy = std::make_shared<const labelq::taxonomy::Taxonomy>(labelq::runtime::config::RuntimeConfig{});
  labelq::service::QueueService queue(ctx);
  labelq::service::AdminService admin(ctx);

  for (const char* name : {"a.png", "b.png", "c.png"}) ctx.store->UpsertIfAbsent(name);
  auto store = ctx.store;
  labelq::observability::Metrics::Instance().SetItemCountsSource([store] { return store->Counts(); });

  auto lease = queue.Next(NextRequest{});
  assert(lease.status() == NextResponse::STATUS_ASSIGNED);

  SubmitRequest submit;
  submit.set_item_id(lease.item().id());
  submit.set_reservation_token("forged");
  (*submit.mutable_labels()->mutable_categories())["hands"].add_values("ok");
  bool rejected = false;
  try {
    queue.Submit(submit);
  } catch (const labelq::util::ReservationInvalid&) {
    rejected = true;
  }
  assert(rejected);

  submit.set_reservation_token(lease.reservation_token());
  queue.Submit(submit);
  admin.Stats(StatsRequest{});

  const auto points = Collect(*reader);
  assert(ValueOf(points, "labelq.request.count", {{"route", "QueueService.Next"}, {"success", "true"}}) == 1);
  assert(ValueOf(points, "labelq.request.count", {{"route", "QueueService.Submit"}, {"success", "false"}}) == 1);
  assert(ValueOf(points, "labelq.request.count", {{"route", "QueueService.Submit"}, {"success", "true"}}) == 1);
  assert(ValueOf(points, "labelq.request.count", {{"route", "AdminService.Stats"}, {"success", "true"}}) == 1);
  assert(ValueOf(points, "labelq.request.latency_ms", {{"route", "QueueService.Submit"}}) == 2);
  assert(ValueOf(points, "labelq.lease.issued", {}) == 1);
  assert(ValueOf(points, "labelq.reservation.rejected", {{"reason", "token_mismatch"}}) == 1);
  assert(ValueOf(points, "labelq.items", {{"state", "pending"}}) == 2);
  assert(ValueOf(points, "labelq.items", {{"state", "done"}}) == 1);
  assert(ValueOf(points, "labelq.items", {{"state", "total"}}) == 3);

  int  submit_spans = 0;
  int  failed_spans = 0;
  bool saw_next     = false;
  for (const auto& span : span_data->GetSpans()) {
    const std::string name(span->GetName());
    if (name == "QueueService.Next") saw_next = true;
    if (name == "QueueService.Submit") {
      ++submit_spans;
      if (span->GetStatus() == opentelemetry::trace::StatusCode::kError) ++failed_spans;
    }
  }
  assert(saw_next);
  assert(submit_spans == 2);
  assert(failed_spans == 1);

  labelq::observability::Metrics::Instance().SetItemCountsSource(nullptr);

  std::cout << "labelq_unit_telemetry: pass\n";
  return 0;
}
