#include "queue_server.hpp"

#include "grpc_error.hpp"

namespace labelq::grpc {

using namespace labelq::queue::v1;

QueueServer::QueueServer(std::shared_ptr<labelq::service::QueueService> svc) : service_(std::move(svc)) {
}

::grpc::Status QueueServer::Next(::grpc::ServerContext*, const NextRequest* req, NextResponse* resp) {
  try {
    *resp = service_->Next(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status QueueServer::Submit(::grpc::ServerContext*, const SubmitRequest* req, SubmitResponse* resp) {
  try {
    *resp = service_->Submit(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status QueueServer::Skip(::grpc::ServerContext*, const SkipRequest* req, SkipResponse* resp) {
  try {
    *resp = service_->Skip(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status QueueServer::Release(::grpc::ServerContext*, const ReleaseRequest* req, ReleaseResponse* resp) {
  try {
    *resp = service_->Release(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status QueueServer::Progress(::grpc::ServerContext*, const ProgressRequest* req, ProgressResponse* resp) {
  try {
    *resp = service_->Progress(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status QueueServer::GetTaxonomy(::grpc::ServerContext*, const GetTaxonomyRequest* req, GetTaxonomyResponse* resp) {
  try {
    *resp = service_->GetTaxonomy(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

} // namespace labelq::grpc
