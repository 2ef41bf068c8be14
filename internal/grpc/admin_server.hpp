#pragma once

#include <grpcpp/grpcpp.h>

#include <memory>

#include "chunkscribe/services/v1/admin_service.grpc.pb.h"
#include "internal/service/admin_service.hpp"

namespace chunkscribe::grpc {

class AdminServer final : public chunkscribe::services::v1::AdminService::Service {
 public:
  explicit AdminServer(std::shared_ptr<chunkscribe::service::AdminService> svc);

  ::grpc::Status Stats(::grpc::ServerContext*, const chunkscribe::admin::v1::StatsRequest*, chunkscribe::admin::v1::StatsResponse*) override;

  ::grpc::Status RunMaintenance(::grpc::ServerContext*, const chunkscribe::admin::v1::RunMaintenanceRequest*, chunkscribe::admin::v1::RunMaintenanceResponse*) override;

 private:
  std::shared_ptr<chunkscribe::service::AdminService> service_;
};

} // namespace chunkscribe::grpc
