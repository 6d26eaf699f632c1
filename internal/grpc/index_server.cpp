#include "index_server.hpp"

#include "grpc_error.hpp"

namespace tasktree::grpc {

using namespace tasktree::v1;

IndexServer::IndexServer(std::shared_ptr<tasktree::service::IndexService> svc) : service_(std::move(svc)) {
}

::grpc::Status IndexServer::IndexTask(::grpc::ServerContext*, const IndexTaskRequest* req, IndexTaskResponse* resp) {
  try {
    *resp = service_->IndexTask(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status IndexServer::ResetCollection(::grpc::ServerContext*, const ResetCollectionRequest* req, ResetCollectionResponse* resp) {
  try {
    *resp = service_->ResetCollection(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status IndexServer::Search(::grpc::ServerContext*, const SearchRequest* req, SearchResponse* resp) {
  try {
    *resp = service_->Search(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status IndexServer::GetCollectionHealth(::grpc::ServerContext*, const GetCollectionHealthRequest* req, GetCollectionHealthResponse* resp) {
  try {
    *resp = service_->GetCollectionHealth(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

} // namespace tasktree::grpc
