#pragma once

#include "labelq/queue/v1.hpp"
#include "service_context.hpp"

namespace labelq::service {

/*
  Request-facing queue operations.

  Next never blocks: it either assigns an item or reports the queue empty.
  Submit/Skip/Release throw util::ValidationError for malformed requests
  and util::ReservationInvalid when the token is not the live reservation.
*/
class QueueService {
public:
  explicit QueueService(ServiceContext ctx);

  labelq::queue::v1::NextResponse Next(const labelq::queue::v1::NextRequest& req);

  labelq::queue::v1::SubmitResponse Submit(const labelq::queue::v1::SubmitRequest& req);

  labelq::queue::v1::SkipResponse Skip(const labelq::queue::v1::SkipRequest& req);

  labelq::queue::v1::ReleaseResponse Release(const labelq::queue::v1::ReleaseRequest& req);

  labelq::queue::v1::ProgressResponse Progress(const labelq::queue::v1::ProgressRequest& req);

  labelq::queue::v1::GetTaxonomyResponse GetTaxonomy(const labelq::queue::v1::GetTaxonomyRequest& req);

private:
  ServiceContext ctx_;
};

}
