#pragma once

#include "chunkscribe/admin/v1/stats.pb.h"
#include "service_context.hpp"

namespace chunkscribe::service {

class AdminService {
 public:
  explicit AdminService(ServiceContext ctx);

  chunkscribe::admin::v1::StatsResponse Stats(const chunkscribe::admin::v1::StatsRequest& req);

  chunkscribe::admin::v1::RunMaintenanceResponse RunMaintenance(const chunkscribe::admin::v1::RunMaintenanceRequest& req);

 private:
  ServiceContext ctx_;
};

} // namespace chunkscribe::service
