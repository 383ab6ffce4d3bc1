#include "internal/cache/favorite_loader.hpp"
#include "internal/cache/favorite_manager.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/runtime/event_loop.hpp"
#include "internal/runtime/worker_pool.hpp"

#include <algorithm>
#include <cassert>
#include <chrono>
#include <condition_variable>
#include <iostream>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

namespace {

using favorites::cache::ChangeSink;
using favorites::cache::FavoriteIdCache;
using favorites::cache::FavoriteLoader;
using favorites::cache::FavoriteManager;
using favorites::cache::LocalItemManager;
using favorites::cache::MutationFailure;
using favorites::cache::SyncScheduler;
using favorites::db::ErrorCode;
using favorites::db::Result;
using favorites::db::ResultSet;
using favorites::db::SavedItemRepository;
using favorites::db::memory::MemoryRepository;
using favorites::model::ChangeKind;
using favorites::model::ChangeToken;
using favorites::model::SavedItem;
using favorites::runtime::EventLoop;
using favorites::runtime::Executor;
using favorites::runtime::Task;
using favorites::runtime::WorkerPool;

// Counts store access and can be told to fail writes.
class InstrumentedRepository final : public SavedItemRepository {
 public:
  std::unique_ptr<ResultSet> QueryAll() override {
    ++queries;
    return inner_.QueryAll();
  }

  std::unique_ptr<ResultSet> QueryByTitle(const std::string& substr) override {
    ++queries;
    return inner_.QueryByTitle(substr);
  }

  Result Insert(const SavedItem& item) override {
    ++writes;
    if (fail_writes) {
      return Result::Err(ErrorCode::IOError, "disk full");
    }
    return inner_.Insert(item);
  }

  Result DeleteById(const std::string& id, std::size_t& deleted) override {
    ++writes;
    if (id == fail_delete_id) {
      return Result::Err(ErrorCode::Busy, "database is locked");
    }
    return inner_.DeleteById(id, deleted);
  }

  Result DeleteByTitle(const std::string& substr, std::size_t& deleted) override {
    ++writes;
    return inner_.DeleteByTitle(substr, deleted);
  }

  Result DeleteAll(std::size_t& deleted) override {
    ++writes;
    return inner_.DeleteAll(deleted);
  }

  int         queries     = 0;
  int         writes      = 0;
  bool        fail_writes = false;
  std::string fail_delete_id;

 private:
  MemoryRepository inner_;
};

class RecordingChangeSink final : public ChangeSink {
 public:
  void SetValue(const ChangeToken& token) override {
    tokens.push_back(token);
  }

  void OnMutationFailed(const MutationFailure& failure) override {
    failures.push_back(failure);
  }

  std::vector<ChangeToken>     tokens;
  std::vector<MutationFailure> failures;
};

class CountingObserver final : public LocalItemManager::Observer {
 public:
  void OnChanged() override {
    ++changes;
  }

  int changes = 0;
};

class RecordingSync final : public SyncScheduler {
 public:
  void ScheduleSync(const std::string& item_id) override {
    scheduled.push_back(item_id);
    if (fail) {
      throw std::runtime_error("sync unavailable");
    }
  }

  std::vector<std::string> scheduled;
  bool                     fail = false;
};

// Title queries block until Open(); signals when one is waiting.
class GatedRepository final : public SavedItemRepository {
 public:
  std::unique_ptr<ResultSet> QueryAll() override {
    return inner_.QueryAll();
  }

  std::unique_ptr<ResultSet> QueryByTitle(const std::string& substr) override {
    std::unique_lock lock(mutex_);
    waiting_ = true;
    cv_.notify_all();
    cv_.wait(lock, [this] { return open_; });
    return inner_.QueryByTitle(substr);
  }

  Result Insert(const SavedItem& item) override {
    return inner_.Insert(item);
  }

  Result DeleteById(const std::string& id, std::size_t& deleted) override {
    return inner_.DeleteById(id, deleted);
  }

  Result DeleteByTitle(const std::string& substr, std::size_t& deleted) override {
    return inner_.DeleteByTitle(substr, deleted);
  }

  Result DeleteAll(std::size_t& deleted) override {
    return inner_.DeleteAll(deleted);
  }

  void WaitUntilQueryBlocked() {
    std::unique_lock lock(mutex_);
    cv_.wait(lock, [this] { return waiting_; });
  }

  void Open() {
    std::scoped_lock lock(mutex_);
    open_ = true;
    cv_.notify_all();
  }

 private:
  MemoryRepository        inner_;
  std::mutex              mutex_;
  std::condition_variable cv_;
  bool                    waiting_ = false;
  bool                    open_    = false;
};

// Runs posted tasks only when asked, newest first.
class ReversingExecutor final : public Executor {
 public:
  void Post(Task task) override {
    tasks_.push_back(std::move(task));
  }

  void PostDelayed(Task task, std::chrono::milliseconds) override {
    tasks_.push_back(std::move(task));
  }

  void RunAllReversed() {
    auto tasks = std::move(tasks_);
    tasks_.clear();
    std::reverse(tasks.begin(), tasks.end());
    for (auto& task : tasks) {
      task();
    }
  }

 private:
  std::vector<Task> tasks_;
};

struct Fixture {
  std::shared_ptr<InstrumentedRepository> repository = std::make_shared<InstrumentedRepository>();
  std::shared_ptr<FavoriteIdCache>        ids        = std::make_shared<FavoriteIdCache>();
  std::shared_ptr<RecordingChangeSink>    changes    = std::make_shared<RecordingChangeSink>();
  std::shared_ptr<RecordingSync>          sync       = std::make_shared<RecordingSync>();
  std::shared_ptr<EventLoop>              io         = std::make_shared<EventLoop>();
  std::shared_ptr<EventLoop>              main       = std::make_shared<EventLoop>();
  std::shared_ptr<FavoriteManager>        manager =
      std::make_shared<FavoriteManager>(repository, ids, changes, sync, io, main);

  // Drains both contexts until neither has work left.
  std::size_t Pump() {
    std::size_t total = 0;
    while (true) {
      const auto ran = io->RunUntilIdle() + main->RunUntilIdle();
      if (ran == 0) {
        return total;
      }
      total += ran;
    }
  }
};

SavedItem MakeItem(const std::string& id, const std::string& title, std::int64_t saved_at) {
  return SavedItem{id, "http://example.com/" + id, title, saved_at};
}

void TestAddThenAttachWithMatchingFilterListsItem() {
  Fixture f;
  f.manager->Add(MakeItem("1", "Rust in production", 10));
  f.Pump();

  assert(f.changes->tokens.size() == 1);
  assert(f.changes->tokens[0].kind == ChangeKind::kAdded);
  assert(f.changes->tokens[0].Path() == "favorites://saved/add/1");
  assert(f.manager->IsFavorite("1"));

  auto observer = std::make_shared<CountingObserver>();
  f.manager->Attach(observer, "rust");
  f.Pump();

  assert(observer->changes == 1);
  assert(f.manager->Size() == 1);
  auto item = f.manager->ItemAt(0);
  assert(item.has_value());
  assert(item->id == "1");
  assert(!f.manager->ItemAt(1).has_value());
}

void TestRemoveReloadsWithoutItem() {
  Fixture f;
  f.manager->Add(MakeItem("1", "first", 10));
  f.manager->Add(MakeItem("2", "second", 20));
  f.Pump();

  auto observer = std::make_shared<CountingObserver>();
  f.manager->Attach(observer, std::nullopt);
  f.Pump();
  assert(f.manager->Size() == 2);
  assert(f.manager->ItemAt(0)->id == "2");

  f.manager->Remove("2");
  f.Pump();

  assert(observer->changes == 2);
  assert(f.manager->Size() == 1);
  assert(f.manager->ItemAt(0)->id == "1");
  assert(!f.manager->IsFavorite("2"));
  assert(f.changes->tokens.back().Path() == "favorites://saved/remove/2");
}

void TestIsFavoriteEmptyIdSkipsStore() {
  Fixture f;
  const int before = f.repository->queries;

  assert(!f.manager->IsFavorite(""));
  assert(!f.manager->IsFavorite("unknown"));
  assert(f.repository->queries == before);
}

void TestRemoveManyEmptyIsNoOp() {
  Fixture f;
  auto    observer = std::make_shared<CountingObserver>();
  f.manager->Attach(observer, std::nullopt);
  f.Pump();
  assert(observer->changes == 1);

  f.manager->RemoveMany({});
  f.manager->Remove("");
  assert(f.Pump() == 0);

  assert(observer->changes == 1);
  assert(f.changes->tokens.empty());
  assert(f.repository->writes == 0);
}

void TestRemoveManyPublishesOneTokenPerIdAndOneReload() {
  Fixture f;
  f.manager->Add(MakeItem("1", "a", 1));
  f.manager->Add(MakeItem("2", "b", 2));
  f.Pump();

  auto observer = std::make_shared<CountingObserver>();
  f.manager->Attach(observer, std::nullopt);
  f.Pump();
  f.changes->tokens.clear();

  f.manager->RemoveMany({"1", "2"});
  f.Pump();

  assert(f.changes->tokens.size() == 2);
  assert(f.changes->tokens[0].Path() == "favorites://saved/remove/1");
  assert(f.changes->tokens[1].Path() == "favorites://saved/remove/2");
  assert(observer->changes == 2);
  assert(f.manager->Size() == 0);
}

void TestDetachDiscardsLateLoadResult() {
  Fixture f;
  f.manager->Add(MakeItem("1", "a", 1));
  f.Pump();

  auto observer = std::make_shared<CountingObserver>();
  f.manager->Attach(observer, std::nullopt);

  // Query finished in the background, delivery still queued on main.
  f.io->RunUntilIdle();
  f.manager->Detach();
  f.main->RunUntilIdle();

  assert(!f.manager->HasCursor());
  assert(f.manager->Size() == 0);
  assert(!f.manager->ItemAt(0).has_value());
  assert(observer->changes == 0);
}

void TestReAttachDiscardsPreviousLoader() {
  Fixture f;
  f.manager->Add(MakeItem("1", "rust", 1));
  f.manager->Add(MakeItem("2", "go", 2));
  f.Pump();

  auto first  = std::make_shared<CountingObserver>();
  auto second = std::make_shared<CountingObserver>();
  f.manager->Attach(first, "rust");
  f.manager->Attach(second, "go");
  f.Pump();

  assert(first->changes == 0);
  assert(second->changes == 1);
  assert(f.manager->Size() == 1);
  assert(f.manager->ItemAt(0)->id == "2");
}

void TestMutationReloadTargetsCurrentLoader() {
  Fixture f;
  auto    old_observer = std::make_shared<CountingObserver>();
  f.manager->Attach(old_observer, std::nullopt);
  f.Pump();
  assert(old_observer->changes == 1);

  f.manager->Add(MakeItem("1", "a", 1));
  f.io->RunUntilIdle();  // insert done, completion queued on main

  auto new_observer = std::make_shared<CountingObserver>();
  f.manager->Detach();
  f.manager->Attach(new_observer, std::nullopt);
  f.Pump();

  assert(old_observer->changes == 1);
  assert(new_observer->changes == 2);
  assert(f.manager->Size() == 1);
}

void TestClearWithFilterReportsDeletedCountAndEvictsIds() {
  Fixture f;
  f.manager->Add(MakeItem("1", "Rust one", 1));
  f.manager->Add(MakeItem("2", "rust two", 2));
  f.manager->Add(MakeItem("3", "Go", 3));
  f.Pump();
  f.changes->tokens.clear();

  f.manager->Clear("rust");
  f.Pump();

  assert(f.changes->tokens.size() == 1);
  assert(f.changes->tokens[0].kind == ChangeKind::kCleared);
  assert(f.changes->tokens[0].deleted_count == 2u);
  assert(!f.manager->IsFavorite("1"));
  assert(!f.manager->IsFavorite("2"));
  assert(f.manager->IsFavorite("3"));

  f.manager->Clear(std::nullopt);
  f.Pump();
  assert(f.changes->tokens.back().deleted_count == 1u);
  assert(f.ids->Size() == 0);
}

void TestFailedMutationReportsFailureWithoutReload() {
  Fixture f;
  auto    observer = std::make_shared<CountingObserver>();
  f.manager->Attach(observer, std::nullopt);
  f.Pump();

  f.repository->fail_writes = true;
  f.manager->Add(MakeItem("1", "a", 1));
  f.Pump();

  assert(f.changes->tokens.empty());
  assert(f.changes->failures.size() == 1);
  assert(f.changes->failures[0].kind == ChangeKind::kAdded);
  assert(f.changes->failures[0].item_ids == std::vector<std::string>{"1"});
  assert(f.changes->failures[0].message.find("disk full") != std::string::npos);
  assert(observer->changes == 1);
  assert(!f.manager->IsFavorite("1"));
}

void TestPartialRemoveReloadsCommittedPart() {
  Fixture f;
  f.manager->Add(MakeItem("a", "a", 1));
  f.manager->Add(MakeItem("b", "b", 2));
  f.manager->Add(MakeItem("c", "c", 3));
  f.Pump();

  auto observer = std::make_shared<CountingObserver>();
  f.manager->Attach(observer, std::nullopt);
  f.Pump();
  assert(f.manager->Size() == 3);
  f.changes->tokens.clear();

  f.repository->fail_delete_id = "b";
  f.manager->RemoveMany({"a", "b"});
  f.Pump();

  // "a" is gone from the store, so the listing must follow.
  assert(observer->changes == 2);
  assert(f.manager->Size() == 2);
  assert(f.manager->ItemAt(0)->id == "c");
  assert(f.manager->ItemAt(1)->id == "b");
  assert(!f.manager->IsFavorite("a"));
  assert(f.manager->IsFavorite("b"));

  assert(f.changes->tokens.size() == 1);
  assert(f.changes->tokens[0].Path() == "favorites://saved/remove/a");
  assert(f.changes->failures.size() == 1);
  assert(f.changes->failures[0].kind == ChangeKind::kRemoved);
  assert(f.changes->failures[0].item_ids == std::vector<std::string>{"b"});
  assert(f.changes->failures[0].message.find("database is locked") != std::string::npos);
}

void TestClearKeepsIdSavedConcurrently() {
  auto repository = std::make_shared<GatedRepository>();
  auto ids        = std::make_shared<FavoriteIdCache>();
  auto changes    = std::make_shared<RecordingChangeSink>();
  auto io         = std::make_shared<WorkerPool>(2);
  auto main       = std::make_shared<EventLoop>();
  auto manager    = std::make_shared<FavoriteManager>(repository, ids, changes, nullptr, io, main);

  assert(repository->Insert(MakeItem("old", "old news", 1)));
  manager->HydrateIdCache();
  io->Start();

  manager->Clear("old");
  repository->WaitUntilQueryBlocked();

  // Lands on the second worker while the clear is in flight.
  manager->Add(MakeItem("new", "fresh", 2));
  std::this_thread::sleep_for(std::chrono::milliseconds(20));
  repository->Open();

  assert(main->RunUntil([&] { return changes->tokens.size() == 2; }, std::chrono::seconds(5)));
  io->Stop();

  assert(changes->failures.empty());
  assert(manager->IsFavorite("new"));
  assert(!manager->IsFavorite("old"));

  std::size_t deleted = 0;
  assert(repository->DeleteById("new", deleted));
  assert(deleted == 1);
}

void TestAddSchedulesSyncAndToleratesItsFailure() {
  Fixture f;
  f.sync->fail = true;
  f.manager->Add(MakeItem("7", "a", 1));
  f.Pump();

  assert(f.sync->scheduled == std::vector<std::string>{"7"});
  assert(f.changes->tokens.size() == 1);
}

void TestAddRejectsEmptyId() {
  Fixture f;
  bool    threw = false;
  try {
    f.manager->Add(SavedItem{"", "http://x", "x", 0});
  } catch (const std::invalid_argument&) {
    threw = true;
  }
  assert(threw);
  assert(f.Pump() == 0);
}

void TestHydrateIdCacheReadsStore() {
  Fixture f;
  assert(f.repository->Insert(MakeItem("a", "a", 1)));
  assert(f.repository->Insert(MakeItem("b", "b", 2)));

  f.manager->HydrateIdCache();
  assert(f.manager->IsFavorite("a"));
  assert(f.manager->IsFavorite("b"));
  assert(f.ids->Size() == 2);
}

void TestLoaderLatestRequestWinsWhenQueriesFinishOutOfOrder() {
  auto repository = std::make_shared<InstrumentedRepository>();
  auto io         = std::make_shared<ReversingExecutor>();
  auto main       = std::make_shared<EventLoop>();

  std::vector<std::size_t> published;
  auto loader = std::make_shared<FavoriteLoader>(
      std::nullopt, std::make_shared<CountingObserver>(), repository, io, main,
      [&](const FavoriteLoader&, std::unique_ptr<ResultSet> results) { published.push_back(results ? results->Count() : 0); });

  loader->Load();
  assert(repository->Insert(MakeItem("1", "a", 1)));
  loader->Load();

  // The second query runs first; the first result then arrives stale.
  io->RunAllReversed();
  main->RunUntilIdle();

  assert(published.size() == 1);
  assert(published[0] == 1);
  assert(loader->RequestedSequence() == 2);
}

} // namespace

int main() {
  TestAddThenAttachWithMatchingFilterListsItem();
  TestRemoveReloadsWithoutItem();
  TestIsFavoriteEmptyIdSkipsStore();
  TestRemoveManyEmptyIsNoOp();
  TestRemoveManyPublishesOneTokenPerIdAndOneReload();
  TestDetachDiscardsLateLoadResult();
  TestReAttachDiscardsPreviousLoader();
  TestMutationReloadTargetsCurrentLoader();
  TestClearWithFilterReportsDeletedCountAndEvictsIds();
  TestFailedMutationReportsFailureWithoutReload();
  TestPartialRemoveReloadsCommittedPart();
  TestClearKeepsIdSavedConcurrently();
  TestAddSchedulesSyncAndToleratesItsFailure();
  TestAddRejectsEmptyId();
  TestHydrateIdCacheReadsStore();
  TestLoaderLatestRequestWinsWhenQueriesFinishOutOfOrder();

  std::cout << "favorites_unit_favorite_manager: pass\n";
  return 0;
}
