#pragma once

#include <memory>
#include <string>
#include <vector>

#include <grpcpp/grpcpp.h>
#include <grpcpp/impl/service_type.h>

namespace labelq::service {
class QueueService;
class AdminService;
}

namespace labelq::runtime {

class Server {
public:
  Server(std::string bind_address, std::shared_ptr<labelq::service::QueueService> queue,
         std::shared_ptr<labelq::service::AdminService> admin);
  ~Server();

  Server(const Server&) = delete;
  Server& operator=(const Server&) = delete;

  void Start();
  void Wait();
  void Stop();

  // Port actually bound; differs from the configured one when it was 0.
  int Port() const { return selected_port_; }

private:
  std::string bind_address_;
  std::vector<std::unique_ptr<::grpc::Service>> services_;
  std::unique_ptr<::grpc::Server> grpc_server_;
  int selected_port_ = 0;
};

} // namespace labelq::runtime
