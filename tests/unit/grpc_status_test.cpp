#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>

#include <grpcpp/grpcpp.h>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/grpc/admin_server.hpp"
#include "internal/grpc/grpc_error.hpp"
#include "internal/grpc/queue_server.hpp"
#include "internal/lease/lease_manager.hpp"
#include "internal/runtime/server.hpp"
#include "internal/service/admin_service.hpp"
#include "internal/service/queue_service.hpp"
#include "internal/store/item_store.hpp"
#include "internal/taxonomy/taxonomy.hpp"
#include "internal/util/errors.hpp"
#include "labelq/queue/v1/queue_service.grpc.pb.h"
#include "tests/support/fake_clock.hpp"

namespace {

using namespace labelq::queue::v1;
using labelq::util::ReservationInvalid;

struct Fixture {
  labelq::testing::FakeClock                      clock;
  labelq::service::ServiceContext                 ctx;
  std::shared_ptr<labelq::service::QueueService>  queue;
  std::shared_ptr<labelq::service::AdminService>  admin;

  Fixture() {
    ctx.store    = std::make_shared<labelq::store::ItemStore>(std::make_shared<labelq::db::memory::MemoryRepository>(), clock.Fn());
    ctx.leases   = std::make_shared<labelq::lease::LeaseManager>(ctx.store, std::chrono::seconds(300));
    ctx.taxonomy = std::make_shared<const labelq::taxonomy::Taxonomy>();
    queue        = std::make_shared<labelq::service::QueueService>(ctx);
    admin        = std::make_shared<labelq::service::AdminService>(ctx);
  }
};

void TestErrorMapping() {
  using labelq::grpc::ToStatus;
  assert(ToStatus(labelq::util::ValidationError("x")).error_code() == ::grpc::StatusCode::INVALID_ARGUMENT);
  assert(ToStatus(ReservationInvalid(ReservationInvalid::Reason::kExpired, "x")).error_code() == ::grpc::StatusCode::ABORTED);
  assert(ToStatus(labelq::util::NotFound("x")).error_code() == ::grpc::StatusCode::NOT_FOUND);
  assert(ToStatus(labelq::util::InvalidState("x")).error_code() == ::grpc::StatusCode::FAILED_PRECONDITION);
  assert(ToStatus(labelq::util::StoreBusy("x")).error_code() == ::grpc::StatusCode::UNAVAILABLE);
  assert(ToStatus(std::runtime_error("boom")).error_code() == ::grpc::StatusCode::INTERNAL);
  assert(ToStatus(labelq::util::ValidationError("bad item")).error_message() == "bad item");
}

void TestAdaptersReturnStatusCodes() {
  Fixture                    f;
  labelq::grpc::QueueServer  queue(f.queue);
  labelq::grpc::AdminServer  admin(f.admin);
  f.ctx.store->UpsertIfAbsent("a.png");

  NextResponse next;
  assert(queue.Next(nullptr, &NextRequest::default_instance(), &next).ok());
  assert(next.status() == NextResponse::STATUS_ASSIGNED);

  SubmitRequest  submit;
  SubmitResponse submit_resp;
  submit.set_item_id(next.item().id());
  submit.set_reservation_token(next.reservation_token());
  assert(queue.Submit(nullptr, &submit, &submit_resp).error_code() == ::grpc::StatusCode::INVALID_ARGUMENT);

  (*submit.mutable_labels()->mutable_categories())["hands"].add_values("ok");
  submit.set_reservation_token("forged");
  assert(queue.Submit(nullptr, &submit, &submit_resp).error_code() == ::grpc::StatusCode::ABORTED);

  submit.set_reservation_token(next.reservation_token());
  assert(queue.Submit(nullptr, &submit, &submit_resp).ok());
  assert(queue.Submit(nullptr, &submit, &submit_resp).error_code() == ::grpc::StatusCode::ABORTED);

  GetItemRequest  get;
  GetItemResponse get_resp;
  get.set_id(4242);
  assert(admin.GetItem(nullptr, &get, &get_resp).error_code() == ::grpc::StatusCode::NOT_FOUND);

  ProgressResponse progress;
  assert(queue.Progress(nullptr, &ProgressRequest::default_instance(), &progress).ok());
  assert(progress.completed() == 1 && progress.total() == 1);
}

void TestServerRoundTripOverChannel() {
  Fixture f;
  f.ctx.store->UpsertIfAbsent("a.png");

  labelq::runtime::Server server("127.0.0.1:0", f.queue, f.admin);
  server.Start();
  assert(server.Port() > 0);

  auto channel = ::grpc::CreateChannel("127.0.0.1:" + std::to_string(server.Port()), ::grpc::InsecureChannelCredentials());
  auto stub    = LabelQueueService::NewStub(channel);

  NextResponse next;
  {
    ::grpc::ClientContext ctx;
    assert(stub->Next(&ctx, NextRequest{}, &next).ok());
  }
  assert(next.status() == NextResponse::STATUS_ASSIGNED);

  SkipRequest  skip;
  SkipResponse skip_resp;
  skip.set_item_id(next.item().id());
  skip.set_reservation_token("forged");
  {
    ::grpc::ClientContext ctx;
    assert(stub->Skip(&ctx, skip, &skip_resp).error_code() == ::grpc::StatusCode::ABORTED);
  }
  skip.set_reservation_token(next.reservation_token());
  {
    ::grpc::ClientContext ctx;
    assert(stub->Skip(&ctx, skip, &skip_resp).ok());
  }

  server.Stop();
}

} // namespace

int main() {
  TestErrorMapping();
  TestAdaptersReturnStatusCodes();
  TestServerRoundTripOverChannel();

  std::cout << "labelq_unit_grpc_status: pass\n";
  return 0;
}
