#pragma once

#include "service_context.hpp"
#include "tasktree/v1/index_service.pb.h"

namespace tasktree::service {

class IndexService {
 public:
  explicit IndexService(ServiceContext ctx);

  tasktree::v1::IndexTaskResponse IndexTask(const tasktree::v1::IndexTaskRequest& req);

  tasktree::v1::ResetCollectionResponse ResetCollection(const tasktree::v1::ResetCollectionRequest& req);

  tasktree::v1::SearchResponse Search(const tasktree::v1::SearchRequest& req);

  tasktree::v1::GetCollectionHealthResponse GetCollectionHealth(const tasktree::v1::GetCollectionHealthRequest& req);

 private:
  ServiceContext ctx_;
};

} // namespace tasktree::service
