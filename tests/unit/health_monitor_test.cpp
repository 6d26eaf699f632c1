#include "internal/health/collection_health_monitor.hpp"

#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "internal/indexing/memory_vector_store.hpp"
#include "internal/util/errors.hpp"

namespace {

using namespace std::chrono_literals;
using tasktree::health::CollectionHealthMonitor;
using tasktree::indexing::MemoryVectorStore;
using tasktree::indexing::Point;

std::vector<Point> MakePoints(std::size_t n, std::size_t dims) {
  std::vector<Point> points;
  for (std::size_t i = 0; i < n; ++i) {
    Point p;
    p.id = "point-" + std::to_string(i);
    p.vector.assign(dims, 0.5f);
    points.push_back(std::move(p));
  }
  return points;
}

template <typename Pred>
bool WaitFor(Pred pred, std::chrono::milliseconds budget = 2000ms) {
  const auto deadline = std::chrono::steady_clock::now() + budget;
  while (std::chrono::steady_clock::now() < deadline) {
    if (pred()) return true;
    std::this_thread::sleep_for(2ms);
  }
  return pred();
}

void TestMissingCollection() {
  auto                    store = std::make_shared<MemoryVectorStore>();
  CollectionHealthMonitor monitor(store, "tasks");

  const auto status = monitor.GetCollectionStatus();
  assert(!status.exists);
  assert(status.count == 0);

  bool threw = false;
  try {
    (void)monitor.CheckCollectionHealth();
  } catch (const tasktree::util::NotFound&) {
    threw = true;
  }
  assert(threw);
}

void TestHealthReflectsStore() {
  auto store = std::make_shared<MemoryVectorStore>();
  store->CreateCollection("tasks", 4);
  assert(store->Upsert("tasks", MakePoints(3, 4)));

  CollectionHealthMonitor monitor(store, "tasks");

  const auto status = monitor.GetCollectionStatus();
  assert(status.exists);
  assert(status.count == 3);

  const auto health = monitor.CheckCollectionHealth();
  assert(health.status == "green");
  assert(health.point_count == 3);
  assert(health.segment_count == 1);
  assert(health.optimizer_status == "ok");
}

void TestPollerCountsFailuresAndKeepsGoing() {
  auto                    store = std::make_shared<MemoryVectorStore>();
  CollectionHealthMonitor monitor(store, "tasks");

  monitor.Start(5ms);
  assert(monitor.Running());

  assert(WaitFor([&] { return monitor.FailedPollCount() >= 2; }));
  assert(!monitor.LastHealth().has_value());

  store->CreateCollection("tasks", 4);
  assert(store->Upsert("tasks", MakePoints(2, 4)));

  assert(WaitFor([&] { return monitor.LastHealth().has_value(); }));
  assert(monitor.LastHealth()->point_count == 2);
  assert(monitor.PollCount() > monitor.FailedPollCount());

  monitor.Stop();
  assert(!monitor.Running());

  const auto polls = monitor.PollCount();
  std::this_thread::sleep_for(20ms);
  assert(monitor.PollCount() == polls);
}

void TestStartIsIdempotentAndStopWakesPoller() {
  auto store = std::make_shared<MemoryVectorStore>();
  store->CreateCollection("tasks", 4);

  CollectionHealthMonitor monitor(store, "tasks");
  monitor.Start(1h);
  monitor.Start(1h);

  // First poll runs right away, not after the interval.
  assert(WaitFor([&] { return monitor.PollCount() == 1; }));

  const auto before = std::chrono::steady_clock::now();
  monitor.Stop();
  assert(std::chrono::steady_clock::now() - before < 1s);
  assert(monitor.PollCount() == 1);
  assert(monitor.FailedPollCount() == 0);
}

} // namespace

int main() {
  TestMissingCollection();
  TestHealthReflectsStore();
  TestPollerCountsFailuresAndKeepsGoing();
  TestStartIsIdempotentAndStopWakesPoller();

  std::cout << "tasktree_unit_health_monitor: pass\n";
  return 0;
}
