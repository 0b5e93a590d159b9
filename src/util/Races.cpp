#include "util/Races.hpp"

#include <atomic>

namespace dmclean::util {

static std::atomic<int> g_vanished{0};
static std::atomic<int> g_busy{0};

static std::atomic<int>& counter(RaceKind kind) {
  return kind == RaceKind::Vanished ? g_vanished : g_busy;
}

void note_race(RaceKind kind) {
  counter(kind).fetch_add(1, std::memory_order_relaxed);
}

int race_count(RaceKind kind) {
  return counter(kind).load(std::memory_order_relaxed);
}

void reset_races() {
  g_vanished.store(0, std::memory_order_relaxed);
  g_busy.store(0, std::memory_order_relaxed);
}

} // namespace dmclean::util
