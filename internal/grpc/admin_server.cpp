#include "admin_server.hpp"

#include "grpc_error.hpp"

namespace chunkscribe::grpc {

AdminServer::AdminServer(std::shared_ptr<chunkscribe::service::AdminService> svc) : service_(std::move(svc)) {
}

::grpc::Status AdminServer::Stats(::grpc::ServerContext*, const chunkscribe::admin::v1::StatsRequest* req, chunkscribe::admin::v1::StatsResponse* resp) {
  try {
    *resp = service_->Stats(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status AdminServer::RunMaintenance(::grpc::ServerContext*, const chunkscribe::admin::v1::RunMaintenanceRequest* req, chunkscribe::admin::v1::RunMaintenanceResponse* resp) {
  try {
    *resp = service_->RunMaintenance(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

} // namespace chunkscribe::grpc
