// Process-wide counters for kernel races observed during a run
#pragma once

namespace dmclean::util {

// Vanished: a device disappeared between two queries or before a removal.
// Busy: the kernel reported EBUSY for a device we expected to be free.
enum class RaceKind { Vanished, Busy };

void note_race(RaceKind kind);

[[nodiscard]] int race_count(RaceKind kind);

void reset_races();

} // namespace dmclean::util
