#include "tree_server.hpp"

#include "grpc_error.hpp"

namespace tasktree::grpc {

using namespace tasktree::v1;

TreeServer::TreeServer(std::shared_ptr<tasktree::service::TreeService> svc) : service_(std::move(svc)) {
}

::grpc::Status TreeServer::GetChildren(::grpc::ServerContext*, const GetChildrenRequest* req, GetChildrenResponse* resp) {
  try {
    *resp = service_->GetChildren(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status TreeServer::GetParent(::grpc::ServerContext*, const GetParentRequest* req, GetParentResponse* resp) {
  try {
    *resp = service_->GetParent(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status TreeServer::GetTree(::grpc::ServerContext*, const GetTreeRequest* req, GetTreeResponse* resp) {
  try {
    *resp = service_->GetTree(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status TreeServer::GetResolutionStats(::grpc::ServerContext*, const GetResolutionStatsRequest* req, GetResolutionStatsResponse* resp) {
  try {
    *resp = service_->GetResolutionStats(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

} // namespace tasktree::grpc
