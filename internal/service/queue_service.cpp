#include "queue_service.hpp"

#include <stdexcept>

#include "internal/discovery/image_scanner.hpp"
#include "internal/lease/lease_manager.hpp"
#include "internal/model/labels_codec.hpp"
#include "internal/store/item_store.hpp"
#include "internal/taxonomy/taxonomy.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"
#include "observe_rpc.hpp"

namespace labelq::service {

using namespace labelq::queue::v1;

namespace {

void RequireReservation(uint64_t item_id, const std::string& token, const char* operation) {
  if (item_id == 0) {
    throw labelq::util::ValidationError(std::string(operation) + ": item_id is required");
  }
  if (token.empty()) {
    throw labelq::util::ValidationError(std::string(operation) + ": reservation_token is required");
  }
}

std::string JoinReference(const std::string& prefix, const std::string& name) {
  if (prefix.empty() || prefix.back() == '/') return prefix + name;
  return prefix + "/" + name;
}

} // namespace

QueueService::QueueService(ServiceContext ctx) : ctx_(std::move(ctx)) {
  if (!ctx_.store || !ctx_.leases) throw std::invalid_argument("queue service: store and lease manager are required");
  if (!ctx_.taxonomy) ctx_.taxonomy = std::make_shared<labelq::taxonomy::Taxonomy>();
}

NextResponse QueueService::Next(const NextRequest&) {
  return ObserveRpc("QueueService.Next", [&] {
    if (ctx_.scanner && ctx_.rescan_on_next) {
      ctx_.scanner->Scan();
    }

    NextResponse resp;
    auto         lease = ctx_.leases->Acquire();
    if (!lease.has_value()) {
      resp.set_status(NextResponse::STATUS_EMPTY);
      return resp;
    }

    resp.set_status(NextResponse::STATUS_ASSIGNED);
    auto* view = resp.mutable_item();
    view->set_id(lease->item.id);
    view->set_name(lease->item.name);
    view->set_reference(JoinReference(ctx_.url_prefix, lease->item.name));
    resp.set_reservation_token(lease->token);
    resp.set_expires_at_ms(labelq::util::ToUnixMillis(lease->expires_at));
    return resp;
  });
}

SubmitResponse QueueService::Submit(const SubmitRequest& req) {
  return ObserveRpc("QueueService.Submit", [&] {
    RequireReservation(req.item_id(), req.reservation_token(), "submit");

    const auto labels = labelq::model::FromProto(req.labels());
    if (!labelq::model::HasSelection(labels)) {
      throw labelq::util::ValidationError("submit: select at least one label, or skip the item");
    }
    if (ctx_.strict_taxonomy) {
      ctx_.taxonomy->Validate(labels);
    }

    ctx_.leases->ValidateAndFinish(req.item_id(), req.reservation_token(), labels, false);
    return SubmitResponse{};
  });
}

SkipResponse QueueService::Skip(const SkipRequest& req) {
  return ObserveRpc("QueueService.Skip", [&] {
    RequireReservation(req.item_id(), req.reservation_token(), "skip");
    ctx_.leases->ValidateAndFinish(req.item_id(), req.reservation_token(), {}, true);
    return SkipResponse{};
  });
}

ReleaseResponse QueueService::Release(const ReleaseRequest& req) {
  return ObserveRpc("QueueService.Release", [&] {
    RequireReservation(req.item_id(), req.reservation_token(), "release");
    ctx_.leases->Release(req.item_id(), req.reservation_token());
    return ReleaseResponse{};
  });
}

ProgressResponse QueueService::Progress(const ProgressRequest&) {
  return ObserveRpc("QueueService.Progress", [&] {
    const auto counts = ctx_.store->Counts();

    ProgressResponse resp;
    resp.set_completed(counts.done);
    resp.set_total(counts.pending + counts.reserved_live + counts.done);
    return resp;
  });
}

GetTaxonomyResponse QueueService::GetTaxonomy(const GetTaxonomyRequest&) {
  return ObserveRpc("QueueService.GetTaxonomy", [&] {
    GetTaxonomyResponse resp;
    for (const auto& category : ctx_.taxonomy->Categories()) {
      *resp.add_categories() = category;
    }
    return resp;
  });
}

}
