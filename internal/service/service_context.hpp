#pragma once

#include <memory>

namespace tasktree::skeleton {
class SkeletonCache;
}
namespace tasktree::hierarchy {
class HierarchyResolver;
}
namespace tasktree::indexing {
class IndexingPipeline;
}
namespace tasktree::health {
class CollectionHealthMonitor;
}

namespace tasktree::service {

/*
  Dependency container shared by all services.
*/
struct ServiceContext {
  std::shared_ptr<tasktree::skeleton::SkeletonCache>         skeletons;
  std::shared_ptr<tasktree::hierarchy::HierarchyResolver>    resolver;
  std::shared_ptr<tasktree::indexing::IndexingPipeline>      pipeline;
  std::shared_ptr<tasktree::health::CollectionHealthMonitor> health;
};

} // namespace tasktree::service
