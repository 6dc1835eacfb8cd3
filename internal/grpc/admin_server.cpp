#include "admin_server.hpp"

#include "grpc_error.hpp"

namespace labelq::grpc {

using namespace labelq::queue::v1;

AdminServer::AdminServer(std::shared_ptr<labelq::service::AdminService> svc) : service_(std::move(svc)) {
}

::grpc::Status AdminServer::Stats(::grpc::ServerContext*, const StatsRequest* req, StatsResponse* resp) {
  try {
    *resp = service_->Stats(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status AdminServer::ListItems(::grpc::ServerContext*, const ListItemsRequest* req, ListItemsResponse* resp) {
  try {
    *resp = service_->ListItems(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status AdminServer::GetItem(::grpc::ServerContext*, const GetItemRequest* req, GetItemResponse* resp) {
  try {
    *resp = service_->GetItem(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

} // namespace labelq::grpc
