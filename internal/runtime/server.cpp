#include "server.hpp"

#include <stdexcept>

#include "internal/observability/logging.hpp"

namespace speechmaker::runtime {

Server::Server(std::string bind_address, std::vector<std::unique_ptr<::grpc::Service>> services)
    : bind_address_(std::move(bind_address)), services_(std::move(services)) {
}

Server::~Server() {
  Stop();
}

void Server::Start() {
  ::grpc::ServerBuilder builder;

  int selected_port = 0;
  builder.AddListeningPort(bind_address_, ::grpc::InsecureServerCredentials(), &selected_port);

  for (const auto& service : services_) {
    builder.RegisterService(service.get());
  }

  grpc_server_ = builder.BuildAndStart();

  if (!grpc_server_ || selected_port == 0) {
    grpc_server_.reset();
    throw std::runtime_error("Failed to start gRPC server on " + bind_address_);
  }

  SPEECHMAKER_LOG_INFO("gRPC server listening", {observability::StringField("bind_address", bind_address_),
                                                 observability::IntField("port", selected_port)});
}

void Server::Wait() {
  if (grpc_server_) grpc_server_->Wait();
}

void Server::Stop() {
  if (grpc_server_) {
    grpc_server_->Shutdown();
    grpc_server_.reset();
  }
}

} // namespace speechmaker::runtime
