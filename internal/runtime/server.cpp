#include "server.hpp"

#include <stdexcept>

// gRPC service implementations (transport adapters)
#include "internal/grpc/admin_server.hpp"
#include "internal/grpc/queue_server.hpp"
#include "internal/observability/logging.hpp"

namespace labelq::runtime {

Server::Server(std::string bind_address, std::shared_ptr<labelq::service::QueueService> queue,
               std::shared_ptr<labelq::service::AdminService> admin)
    : bind_address_(std::move(bind_address)) {
  services_.push_back(std::make_unique<labelq::grpc::QueueServer>(std::move(queue)));
  services_.push_back(std::make_unique<labelq::grpc::AdminServer>(std::move(admin)));
}

Server::~Server() {
  Stop();
}

void Server::Start() {
  ::grpc::ServerBuilder builder;

  builder.AddListeningPort(bind_address_, ::grpc::InsecureServerCredentials(), &selected_port_);

  // Register gRPC services (thin adapters)
  for (auto& service : services_) {
    builder.RegisterService(service.get());
  }

  grpc_server_ = builder.BuildAndStart();

  if (!grpc_server_) {
    throw std::runtime_error("Failed to start gRPC server on " + bind_address_);
  }

  LABELQ_LOG_INFO("labelq listening", {labelq::observability::StringField("bind_address", bind_address_),
                                       labelq::observability::IntField("port", selected_port_)});
}

void Server::Wait() {
  if (grpc_server_)
    grpc_server_->Wait();
}

void Server::Stop() {
  if (grpc_server_) {
    grpc_server_->Shutdown();
    grpc_server_.reset();
  }
}

} // namespace labelq::runtime
