#pragma once

#include <memory>
#include <grpcpp/grpcpp.h>

#include "labelq/queue/v1/queue_service.grpc.pb.h"
#include "internal/service/queue_service.hpp"

namespace labelq::grpc {

class QueueServer final : public labelq::queue::v1::LabelQueueService::Service {
public:
  explicit QueueServer(std::shared_ptr<labelq::service::QueueService> svc);

  ::grpc::Status Next(::grpc::ServerContext*,
                    const labelq::queue::v1::NextRequest*,
                    labelq::queue::v1::NextResponse*) override;

  ::grpc::Status Submit(::grpc::ServerContext*,
                      const labelq::queue::v1::SubmitRequest*,
                      labelq::queue::v1::SubmitResponse*) override;

  ::grpc::Status Skip(::grpc::ServerContext*,
                    const labelq::queue::v1::SkipRequest*,
                    labelq::queue::v1::SkipResponse*) override;

  ::grpc::Status Release(::grpc::ServerContext*,
                       const labelq::queue::v1::ReleaseRequest*,
                       labelq::queue::v1::ReleaseResponse*) override;

  ::grpc::Status Progress(::grpc::ServerContext*,
                        const labelq::queue::v1::ProgressRequest*,
                        labelq::queue::v1::ProgressResponse*) override;

  ::grpc::Status GetTaxonomy(::grpc::ServerContext*,
                           const labelq::queue::v1::GetTaxonomyRequest*,
                           labelq::queue::v1::GetTaxonomyResponse*) override;

private:
  std::shared_ptr<labelq::service::QueueService> service_;
};

}
