#pragma once

#include <memory>
#include <grpcpp/grpcpp.h>

#include "labelq/queue/v1/admin_service.grpc.pb.h"
#include "internal/service/admin_service.hpp"

namespace labelq::grpc {

class AdminServer final : public labelq::queue::v1::LabelAdminService::Service {
public:
  explicit AdminServer(std::shared_ptr<labelq::service::AdminService> svc);

  ::grpc::Status Stats(::grpc::ServerContext*,
                     const labelq::queue::v1::StatsRequest*,
                     labelq::queue::v1::StatsResponse*) override;

  ::grpc::Status ListItems(::grpc::ServerContext*,
                         const labelq::queue::v1::ListItemsRequest*,
                         labelq::queue::v1::ListItemsResponse*) override;

  ::grpc::Status GetItem(::grpc::ServerContext*,
                       const labelq::queue::v1::GetItemRequest*,
                       labelq::queue::v1::GetItemResponse*) override;

private:
  std::shared_ptr<labelq::service::AdminService> service_;
};

}
