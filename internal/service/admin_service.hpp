#pragma once

#include "labelq/queue/v1.hpp"
#include "service_context.hpp"

namespace labelq::service {

class AdminService {
public:
  explicit AdminService(ServiceContext ctx);

  labelq::queue::v1::StatsResponse
  Stats(const labelq::queue::v1::StatsRequest& req);

  labelq::queue::v1::ListItemsResponse
  ListItems(const labelq::queue::v1::ListItemsRequest& req);

  labelq::queue::v1::GetItemResponse
  GetItem(const labelq::queue::v1::GetItemRequest& req);

private:
  ServiceContext ctx_;
};

}
