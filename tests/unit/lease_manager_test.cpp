#include "internal/lease/lease_manager.hpp"

#include <algorithm>
#include <atomic>
#include <cassert>
#include <chrono>
#include <functional>
#include <iostream>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <thread>
#include <vector>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/util/errors.hpp"
#include "tests/support/fake_clock.hpp"

namespace {

using labelq::lease::LeaseManager;
using labelq::store::ItemStore;
using labelq::testing::FakeClock;
using labelq::util::ReservationInvalid;

constexpr auto kLease = std::chrono::seconds(300);

struct Fixture {
  FakeClock                  clock;
  std::shared_ptr<ItemStore> store;
  std::shared_ptr<LeaseManager> leases;

  explicit Fixture(std::chrono::milliseconds lease = kLease) {
    store  = std::make_shared<ItemStore>(std::make_shared<labelq::db::memory::MemoryRepository>(), clock.Fn());
    leases = std::make_shared<LeaseManager>(store, lease);
  }
};

std::optional<ReservationInvalid::Reason> Rejection(const std::function<void()>& fn) {
  try {
    fn();
  } catch (const ReservationInvalid& e) {
    return e.reason();
  }
  return std::nullopt;
}

void TestAcquireOnEmptyStore() {
  Fixture f;
  assert(!f.leases->Acquire().has_value());
}

void TestLeaseCarriesItemTokenAndExpiry() {
  Fixture f;
  const auto item = f.store->UpsertIfAbsent("a.png");

  auto lease = f.leases->Acquire();
  assert(lease.has_value());
  assert(lease->item.id == item.id);
  assert(lease->item.name == "a.png");
  assert(!lease->token.empty());
  assert(lease->item.reservation->token == lease->token);
  assert(labelq::util::ToUnixMillis(lease->expires_at) == f.clock.NowMs() + 300'000);
  assert(f.leases->LeaseDuration() == kLease);
}

void TestTokensAreUnique() {
  Fixture f;
  std::set<std::string> tokens;
  for (int i = 0; i < 50; ++i) f.store->UpsertIfAbsent("img-" + std::to_string(i));
  for (int i = 0; i < 50; ++i) {
    auto lease = f.leases->Acquire();
    assert(lease.has_value());
    // salt.sequence.uuid
    assert(std::count(lease->token.begin(), lease->token.end(), '.') == 2);
    tokens.insert(lease->token);
  }
  assert(tokens.size() == 50);
}

void TestMutualExclusionUnderConcurrentAcquire() {
  Fixture    f;
  const int  kItems   = 10;
  const int  kClients = 32;
  for (int i = 0; i < kItems; ++i) f.store->UpsertIfAbsent("img-" + std::to_string(i));

  std::mutex            mu;
  std::vector<uint64_t> assigned;
  std::atomic<int>      empty{0};

  std::vector<std::thread> clients;
  for (int i = 0; i < kClients; ++i) {
    clients.emplace_back([&] {
      auto lease = f.leases->Acquire();
      if (!lease.has_value()) {
        ++empty;
        return;
      }
      std::lock_guard lock(mu);
      assigned.push_back(lease->item.id);
    });
  }
  for (auto& t : clients) t.join();

  assert(assigned.size() == static_cast<size_t>(kItems));
  assert(std::set<uint64_t>(assigned.begin(), assigned.end()).size() == assigned.size());
  assert(empty.load() == kClients - kItems);
}

void TestExpiredLeaseIsReissuedWithDifferentToken() {
  Fixture f;
  const auto item = f.store->UpsertIfAbsent("a.png");

  auto first = f.leases->Acquire();
  assert(first.has_value());
  assert(!f.leases->Acquire().has_value());

  f.clock.Advance(kLease + std::chrono::seconds(1));
  auto second = f.leases->Acquire();
  assert(second.has_value());
  assert(second->item.id == item.id);
  assert(second->token != first->token);

  auto reason = Rejection([&] { f.leases->ValidateAndFinish(item.id, first->token, {{"c", {"l"}}}, false); });
  assert(reason == ReservationInvalid::Reason::kTokenMismatch);

  f.leases->ValidateAndFinish(item.id, second->token, {{"c", {"l"}}}, false);
}

void TestExpiredTokenIsRejectedBeforeReissue() {
  Fixture f;
  f.store->UpsertIfAbsent("a.png");

  auto lease = f.leases->Acquire();
  f.clock.Advance(kLease);
  auto reason = Rejection([&] { f.leases->ValidateAndFinish(lease->item.id, lease->token, {}, true); });
  assert(reason == ReservationInvalid::Reason::kExpired);
}

void TestTokenIsSingleUse() {
  Fixture f;
  f.store->UpsertIfAbsent("a.png");

  auto lease = f.leases->Acquire();
  f.leases->ValidateAndFinish(lease->item.id, lease->token, {{"c", {"l"}}}, false);

  auto again = Rejection([&] { f.leases->ValidateAndFinish(lease->item.id, lease->token, {{"c", {"l"}}}, false); });
  assert(again == ReservationInvalid::Reason::kAlreadyDone);

  auto skip = Rejection([&] { f.leases->ValidateAndFinish(lease->item.id, lease->token, {}, true); });
  assert(skip == ReservationInvalid::Reason::kAlreadyDone);

  auto release = Rejection([&] { f.leases->Release(lease->item.id, lease->token); });
  assert(release == ReservationInvalid::Reason::kAlreadyDone);
}

void TestUnknownItemIsReservationInvalid() {
  Fixture f;
  auto reason = Rejection([&] { f.leases->ValidateAndFinish(42, "tok", {{"c", {"l"}}}, false); });
  assert(reason == ReservationInvalid::Reason::kNoSuchItem);
}

void TestConcurrentSubmitAndSkipExactlyOneWins() {
  for (int round = 0; round < 20; ++round) {
    Fixture f;
    f.store->UpsertIfAbsent("a.png");
    auto lease = f.leases->Acquire();

    std::atomic<int>  wins{0};
    std::atomic<int>  rejections{0};
    std::atomic<bool> go{false};

    auto attempt = [&](bool skipped) {
      while (!go.load()) std::this_thread::yield();
      try {
        f.leases->ValidateAndFinish(lease->item.id, lease->token, skipped ? labelq::model::Labels{} : labelq::model::Labels{{"c", {"l"}}},
                                    skipped);
        ++wins;
      } catch (const ReservationInvalid&) {
        ++rejections;
      }
    };

    std::thread submit(attempt, false);
    std::thread skip(attempt, true);
    go = true;
    submit.join();
    skip.join();

    assert(wins.load() == 1);
    assert(rejections.load() == 1);

    auto item = f.store->Get(lease->item.id);
    assert(item->state == labelq::model::ItemState::kDone);
    assert(item->skipped == item->labels.empty());
  }
}

void TestVoluntaryRelease() {
  Fixture f;
  f.store->UpsertIfAbsent("a.png");

  auto lease = f.leases->Acquire();
  f.leases->Release(lease->item.id, lease->token);

  auto next = f.leases->Acquire();
  assert(next.has_value());
  assert(next->item.id == lease->item.id);
  assert(next->token != lease->token);
}

void TestZeroDurationLeaseIsNeverLive() {
  Fixture f(std::chrono::milliseconds(0));
  f.store->UpsertIfAbsent("a.png");

  auto lease = f.leases->Acquire();
  assert(lease.has_value());
  auto reason = Rejection([&] { f.leases->ValidateAndFinish(lease->item.id, lease->token, {}, true); });
  assert(reason == ReservationInvalid::Reason::kExpired);
}

} // namespace

int main() {
  TestAcquireOnEmptyStore();
  TestLeaseCarriesItemTokenAndExpiry();
  TestTokensAreUnique();
  TestMutualExclusionUnderConcurrentAcquire();
  TestExpiredLeaseIsReissuedWithDifferentToken();
  TestExpiredTokenIsRejectedBeforeReissue();
  TestTokenIsSingleUse();
  TestUnknownItemIsReservationInvalid();
  TestConcurrentSubmitAndSkipExactlyOneWins();
  TestVoluntaryRelease();
  TestZeroDurationLeaseIsNeverLive();

  std::cout << "labelq_unit_lease_manager: pass\n";
  return 0;
}
