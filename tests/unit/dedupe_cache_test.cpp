#include "internal/dedupe/dedupe_cache.hpp"

#include <cassert>
#include <chrono>
#include <iostream>
#include <thread>

namespace {

using chatrelay::dedupe::DedupeCache;
using namespace std::chrono_literals;

void TestSecondSightingWithinWindowIsDuplicate() {
  DedupeCache cache(10min, 1min);
  const auto  now = chatrelay::util::Now();

  assert(!cache.Seen("m1", now));
  assert(cache.Seen("m1", now + 1s));
  assert(!cache.Seen("m2", now + 1s));
  assert(cache.Size() == 2);
}

void TestDuplicateDoesNotRefreshTimestamp() {
  DedupeCache cache(10s, 1min);
  const auto  t0 = chatrelay::util::Now();

  assert(!cache.Seen("m1", t0));
  assert(cache.Seen("m1", t0 + 8s));
  // measured from the first sighting, not the duplicate
  assert(!cache.Seen("m1", t0 + 11s));
}

void TestEmptyIdIsNeverDuplicate() {
  DedupeCache cache(10s, 1min);
  assert(!cache.Seen(""));
  assert(!cache.Seen(""));
  assert(cache.Size() == 0);
}

void TestSweepRemovesExpiredEntries() {
  DedupeCache cache(10s, 1min);
  const auto  t0 = chatrelay::util::Now();

  cache.Seen("old", t0);
  cache.Seen("new", t0 + 9s);

  assert(cache.Sweep(t0 + 15s) == 1);
  assert(cache.Size() == 1);
  assert(cache.Seen("new", t0 + 15s));
}

void TestBackgroundSweeperStops() {
  DedupeCache cache(20ms, 10ms);
  cache.Seen("m1");
  cache.StartSweeper();

  const auto until = std::chrono::steady_clock::now() + 2s;
  while (cache.Size() > 0 && std::chrono::steady_clock::now() < until) {
    std::this_thread::sleep_for(5ms);
  }
  assert(cache.Size() == 0);
  cache.Stop();
}

} // namespace

int main() {
  TestSecondSightingWithinWindowIsDuplicate();
  TestDuplicateDoesNotRefreshTimestamp();
  TestEmptyIdIsNeverDuplicate();
  TestSweepRemovesExpiredEntries();
  TestBackgroundSweeperStops();

  std::cout << "chatrelay_unit_dedupe_cache: pass\n";
  return 0;
}
