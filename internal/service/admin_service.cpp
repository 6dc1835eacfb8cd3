#include "admin_service.hpp"

#include <algorithm>
#include <stdexcept>

#include "internal/model/labels_codec.hpp"
#include "internal/store/item_store.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"
#include "observe_rpc.hpp"

namespace labelq::service {

using namespace labelq::queue::v1;

namespace {

constexpr uint32_t kDefaultListLimit = 100;
constexpr uint32_t kMaxListLimit     = 1000;

ItemStatus ToProto(labelq::model::ItemState state) {
  switch (state) {
    case labelq::model::ItemState::kPending:
      return ITEM_STATUS_PENDING;
    case labelq::model::ItemState::kReserved:
      return ITEM_STATUS_RESERVED;
    case labelq::model::ItemState::kDone:
      return ITEM_STATUS_DONE;
  }
  return ITEM_STATUS_UNSPECIFIED;
}

std::optional<labelq::model::ItemState> FromProto(ItemStatus status) {
  switch (status) {
    case ITEM_STATUS_PENDING:
      return labelq::model::ItemState::kPending;
    case ITEM_STATUS_RESERVED:
      return labelq::model::ItemState::kReserved;
    case ITEM_STATUS_DONE:
      return labelq::model::ItemState::kDone;
    default:
      return std::nullopt;
  }
}

// Reservation tokens stay server-side; only the deadline is reported.
// A reservation past its deadline is reported as pending, matching Stats.
ItemRecord ToRecord(const labelq::model::Item& item, labelq::util::TimePoint now) {
  const bool live_reservation = item.reservation.has_value() && item.reservation->expires_at > now;

  ItemRecord record;
  record.set_id(item.id);
  record.set_name(item.name);
  if (item.state == labelq::model::ItemState::kReserved && !live_reservation) {
    record.set_status(ITEM_STATUS_PENDING);
  } else {
    record.set_status(ToProto(item.state));
  }
  *record.mutable_labels() = labelq::model::ToProto(item.labels);
  record.set_skipped(item.skipped);
  if (live_reservation) {
    record.set_reserved_until_ms(labelq::util::ToUnixMillis(item.reservation->expires_at));
  }
  record.set_updated_at_ms(labelq::util::ToUnixMillis(item.updated_at));
  return record;
}

} // namespace

AdminService::AdminService(ServiceContext ctx) : ctx_(std::move(ctx)) {
  if (!ctx_.store) throw std::invalid_argument("admin service: store is required");
}

StatsResponse AdminService::Stats(const StatsRequest&) {
  return ObserveRpc("AdminService.Stats", [&] {
    const auto counts = ctx_.store->Counts();

    StatsResponse resp;
    resp.set_pending(counts.pending);
    resp.set_reserved_live(counts.reserved_live);
    resp.set_done(counts.done);
    resp.set_skipped(counts.skipped);
    resp.set_total(counts.total);
    return resp;
  });
}

ListItemsResponse AdminService::ListItems(const ListItemsRequest& req) {
  return ObserveRpc("AdminService.ListItems", [&] {
    labelq::db::ItemFilter filter;
    filter.state       = FromProto(req.status());
    filter.page.limit  = req.limit() == 0 ? kDefaultListLimit : std::min(req.limit(), kMaxListLimit);
    filter.page.offset = req.offset();

    const auto now = ctx_.store->Now();

    ListItemsResponse resp;
    for (const auto& item : ctx_.store->List(filter)) {
      *resp.add_records() = ToRecord(item, now);
    }
    return resp;
  });
}

GetItemResponse AdminService::GetItem(const GetItemRequest& req) {
  return ObserveRpc("AdminService.GetItem", [&] {
    if (req.id() == 0) throw labelq::util::ValidationError("get item: id is required");

    auto item = ctx_.store->Get(req.id());
    if (!item.has_value()) throw labelq::util::NotFound("get item: no item with id " + std::to_string(req.id()));

    GetItemResponse resp;
    *resp.mutable_record() = ToRecord(*item, ctx_.store->Now());
    return resp;
  });
}

}
