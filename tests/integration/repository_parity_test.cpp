#include <cassert>
#include <cstdlib>
#include <filesystem>
#include <functional>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/db/model/item_record.hpp"

#if LABELQ_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#endif

#if LABELQ_DB_POSTGRES
#include <pqxx/pqxx>

#include "internal/db/postgres/pg_pool.hpp"
#include "internal/db/postgres/pg_repository.hpp"
#endif

namespace {

using labelq::db::ItemFilter;
using labelq::db::Repository;
using labelq::db::memory::MemoryRepository;
using labelq::db::model::ItemRecord;
using labelq::model::ItemState;

constexpr uint64_t kNow = 1'700'000'000'000ULL;

struct BackendFactory {
  std::string                                  name;
  std::function<std::shared_ptr<Repository>()> make_repository; // empty store
  std::function<std::shared_ptr<Repository>()> reopen;          // same store, new handle; null if not durable
  std::function<void()>                        cleanup;
};

ItemRecord Insert(Repository& repo, const std::string& name) {
  auto tx = repo.Begin();
  auto r  = repo.InsertItemIfAbsent(*tx, name, kNow);
  assert(r);
  auto record = repo.GetItemByName(*tx, name);
  assert(record.has_value());
  tx->Commit();
  return *record;
}

ItemRecord Reserve(Repository& repo, uint64_t id, const std::string& token, uint64_t expires_at_ms) {
  auto tx     = repo.Begin();
  auto record = repo.GetItem(*tx, id);
  assert(record.has_value());
  record->state             = ItemState::kReserved;
  record->reservation_token = token;
  record->reserved_at_ms    = kNow;
  record->expires_at_ms     = expires_at_ms;
  record->updated_at_ms     = kNow;
  auto r                    = repo.UpdateItem(*tx, *record);
  assert(r);
  tx->Commit();
  return *record;
}

void VerifyInsertIsIdempotent(Repository& repo) {
  const auto a = Insert(repo, "a.png");
  const auto b = Insert(repo, "b.png");
  const auto again = Insert(repo, "a.png");

  assert(a.id != 0);
  assert(b.id > a.id);
  assert(again.id == a.id);
  assert(a.state == ItemState::kPending);
  assert(!a.skipped);
  assert(a.reservation_token.empty());
  assert(a.updated_at_ms == kNow);

  auto tx    = repo.Begin();
  auto names = repo.ListNames(*tx);
  assert(names.size() == 2);
  assert(!repo.GetItem(*tx, b.id + 1000).has_value());
  assert(!repo.GetItemByName(*tx, "missing.png").has_value());
}

void VerifyEligibilityAndUpdate(Repository& repo) {
  const auto a = Insert(repo, "a.png");
  const auto b = Insert(repo, "b.png");

  {
    auto tx   = repo.Begin();
    auto next = repo.FindNextEligible(*tx, kNow);
    assert(next.has_value() && next->id == a.id);
  }

  Reserve(repo, a.id, "tok-a", kNow + 1000);
  {
    auto tx   = repo.Begin();
    auto next = repo.FindNextEligible(*tx, kNow);
    assert(next.has_value() && next->id == b.id);

    auto reserved = repo.GetItem(*tx, a.id);
    assert(reserved->state == ItemState::kReserved);
    assert(reserved->reservation_token == "tok-a");
    assert(reserved->expires_at_ms == kNow + 1000);

    // at its deadline the reservation no longer blocks
    auto later = repo.FindNextEligible(*tx, kNow + 1000);
    assert(later.has_value() && later->id == a.id);
  }

  {
    auto tx     = repo.Begin();
    auto record = repo.GetItem(*tx, a.id);
    record->state             = ItemState::kDone;
    record->labels_json       = R"({"hands":["disfigured hand"]})";
    record->reservation_token.clear();
    record->reserved_at_ms = 0;
    record->expires_at_ms  = 0;
    auto r                 = repo.UpdateItem(*tx, *record);
    assert(r);
    tx->Commit();
  }
  {
    auto tx   = repo.Begin();
    auto done = repo.GetItem(*tx, a.id);
    assert(done->state == ItemState::kDone);
    assert(done->reservation_token.empty());
    assert(done->expires_at_ms == 0);
    assert(done->labels_json.find("disfigured hand") != std::string::npos);
    assert(repo.FindNextEligible(*tx, kNow + 5000)->id == b.id);
  }

  ItemRecord ghost;
  ghost.id    = b.id + 1000;
  ghost.name  = "ghost.png";
  ghost.state = ItemState::kDone;
  auto tx     = repo.Begin();
  auto r      = repo.UpdateItem(*tx, ghost);
  assert(!r);
  assert(r.code == labelq::db::ErrorCode::NotFound);
}

void VerifyRollbackBehavior(Repository& repo) {
  const auto a = Insert(repo, "a.png");
  {
    auto tx = repo.Begin();
    repo.InsertItemIfAbsent(*tx, "rolled-back.png", kNow);
    auto record = repo.GetItem(*tx, a.id);
    record->state             = ItemState::kReserved;
    record->reservation_token = "tok";
    record->expires_at_ms     = kNow + 1000;
    repo.UpdateItem(*tx, *record);

    // a transaction reads its own writes
    assert(repo.GetItemByName(*tx, "rolled-back.png").has_value());
    tx->Rollback();
  }
  {
    // destructor without commit rolls back as well
    auto tx = repo.Begin();
    repo.InsertItemIfAbsent(*tx, "dropped.png", kNow);
  }

  auto tx = repo.Begin();
  assert(!repo.GetItemByName(*tx, "rolled-back.png").has_value());
  assert(!repo.GetItemByName(*tx, "dropped.png").has_value());
  assert(repo.GetItem(*tx, a.id)->state == ItemState::kPending);
}

void VerifyCountsAndReleaseAll(Repository& repo) {
  std::vector<ItemRecord> items;
  for (const char* name : {"a", "b", "c", "d"}) items.push_back(Insert(repo, name));

  Reserve(repo, items[0].id, "t0", kNow + 10);
  Reserve(repo, items[1].id, "t1", kNow + 1000);
  {
    auto tx     = repo.Begin();
    auto record = repo.GetItem(*tx, items[2].id);
    record->state   = ItemState::kDone;
    record->skipped = true;
    repo.UpdateItem(*tx, *record);
    tx->Commit();
  }

  {
    auto tx     = repo.Begin();
    auto counts = repo.CountItems(*tx, kNow + 10);
    assert(counts.pending == 2); // d, and a whose reservation has lapsed
    assert(counts.reserved_live == 1);
    assert(counts.done == 1);
    assert(counts.skipped == 1);
    assert(counts.total == 4);
  }

  {
    auto     tx       = repo.Begin();
    uint64_t released = 0;
    auto     r        = repo.ReleaseAllReservations(*tx, kNow + 20, &released);
    assert(r);
    assert(released == 2);
    tx->Commit();
  }

  auto tx = repo.Begin();
  for (const auto& item : {items[0], items[1]}) {
    auto record = repo.GetItem(*tx, item.id);
    assert(record->state == ItemState::kPending);
    assert(record->reservation_token.empty());
    assert(record->expires_at_ms == 0);
    assert(record->updated_at_ms == kNow + 20);
  }
  assert(repo.GetItem(*tx, items[2].id)->state == ItemState::kDone);
}

void VerifyListFilter(Repository& repo) {
  std::vector<ItemRecord> items;
  for (const char* name : {"a", "b", "c", "d", "e"}) items.push_back(Insert(repo, name));
  Reserve(repo, items[1].id, "t", kNow + 1000);

  auto tx = repo.Begin();

  ItemFilter all;
  auto       listed = repo.ListItems(*tx, all);
  assert(listed.size() == 5);
  for (size_t i = 1; i < listed.size(); ++i) assert(listed[i - 1].id < listed[i].id);

  ItemFilter page;
  page.page.limit  = 2;
  page.page.offset = 2;
  listed           = repo.ListItems(*tx, page);
  assert(listed.size() == 2);
  assert(listed[0].name == "c");
  assert(listed[1].name == "d");

  ItemFilter reserved;
  reserved.state = ItemState::kReserved;
  listed         = repo.ListItems(*tx, reserved);
  assert(listed.size() == 1);
  assert(listed[0].id == items[1].id);

  ItemFilter pending;
  pending.state = ItemState::kPending;
  pending.now_ms = kNow;
  assert(repo.ListItems(*tx, pending).size() == 4);

  // at the deadline the reservation lists as pending
  pending.now_ms  = kNow + 1000;
  reserved.now_ms = kNow + 1000;
  assert(repo.ListItems(*tx, pending).size() == 5);
  assert(repo.ListItems(*tx, reserved).empty());
}

void VerifyRestartDurability(BackendFactory& backend) {
  if (!backend.reopen) {
    std::cout << "  restart durability not applicable: " << backend.name << "\n";
    return;
  }

  uint64_t id = 0;
  {
    auto repo = backend.make_repository();
    id        = Insert(*repo, "durable.png").id;
    Reserve(*repo, id, "tok-durable", kNow + 1000);
  }

  auto repo   = backend.reopen();
  auto tx     = repo->Begin();
  auto record = repo->GetItem(*tx, id);
  assert(record.has_value());
  assert(record->name == "durable.png");
  assert(record->state == ItemState::kReserved);
  assert(record->reservation_token == "tok-durable");
  assert(record->expires_at_ms == kNow + 1000);
}

BackendFactory MakeMemoryFactory() {
  return BackendFactory{
      .name            = "memory",
      .make_repository = [] { return std::make_shared<MemoryRepository>(); },
      .reopen          = nullptr,
      .cleanup         = [] {},
  };
}

#if LABELQ_DB_SQLITE
BackendFactory MakeSqliteFactory() {
  const auto db_path = std::filesystem::temp_directory_path() / "labelq_repository_parity.db";

  auto open = [db_path]() -> std::shared_ptr<Repository> {
    auto db = std::make_shared<labelq::db::sqlite::SqliteDB>(db_path.string());
    labelq::db::sqlite::SqliteRepository::BootstrapSchema(*db);
    return std::make_shared<labelq::db::sqlite::SqliteRepository>(std::move(db));
  };
  auto wipe = [db_path] {
    for (const auto* suffix : {"", "-wal", "-shm"}) std::filesystem::remove(db_path.string() + suffix);
  };

  return BackendFactory{
      .name            = "sqlite",
      .make_repository = [open, wipe] {
        wipe();
        return open();
      },
      .reopen  = open,
      .cleanup = wipe,
  };
}
#endif

#if LABELQ_DB_POSTGRES
BackendFactory MakePostgresFactory() {
  const char* uri = std::getenv("LABELQ_TEST_POSTGRES_URI");
  if (uri == nullptr || std::string(uri).empty()) {
    throw std::runtime_error("LABELQ_TEST_POSTGRES_URI is not set");
  }

  auto conninfo = std::string(uri);
  auto open     = [conninfo]() -> std::shared_ptr<Repository> {
    labelq::db::postgres::PgRepository::BootstrapSchema(conninfo);
    return std::make_shared<labelq::db::postgres::PgRepository>(std::make_shared<labelq::db::postgres::PgPool>(conninfo));
  };
  auto truncate = [conninfo] {
    pqxx::connection conn(conninfo);
    pqxx::work       tx(conn);
    tx.exec("TRUNCATE items RESTART IDENTITY;");
    tx.commit();
  };

  return BackendFactory{
      .name            = "postgres",
      .make_repository = [open, truncate] {
        auto repo = open();
        truncate();
        return repo;
      },
      .reopen  = open,
      .cleanup = truncate,
  };
}
#endif

void RunBackendSuite(BackendFactory& backend) {
  std::cout << "running backend suite: " << backend.name << "\n";

  VerifyInsertIsIdempotent(*backend.make_repository());
  VerifyEligibilityAndUpdate(*backend.make_repository());
  VerifyRollbackBehavior(*backend.make_repository());
  VerifyCountsAndReleaseAll(*backend.make_repository());
  VerifyListFilter(*backend.make_repository());
  VerifyRestartDurability(backend);

  backend.cleanup();
}

} // namespace

int main() {
  std::vector<BackendFactory> backends;
  backends.push_back(MakeMemoryFactory());

#if LABELQ_DB_SQLITE
  backends.push_back(MakeSqliteFactory());
#endif

#if LABELQ_DB_POSTGRES
  try {
    backends.push_back(MakePostgresFactory());
  } catch (const std::exception& ex) {
    std::cout << "skipping postgres integration suite: " << ex.what() << "\n";
  }
#endif

  for (auto& backend : backends) {
    RunBackendSuite(backend);
  }

  std::cout << "labelq_integration_repository_parity: pass\n";
  return 0;
}
