#pragma once
#include <string>
#include <vector>

namespace dmclean::model {

enum class Outcome {
  Removed,               // target removed
  SkippedMissing,        // target did not exist
  SkippedBusy,           // target still open; retry later
  SkippedOriginPresent,  // snapshot whose origin still exists
  DeferredLiveSnapshot   // origin kept because a snapshot is still open
};

enum class TeardownError {
  None,
  NotBlockDevice,
  UnrecognizedName,
  RemoveFailed
};

struct TeardownReport {
  std::string target;
  Outcome outcome{Outcome::SkippedMissing};
  TeardownError error{TeardownError::None};
  std::string message;                        // human-readable detail for errors
  std::vector<std::string> removed;           // in removal order, target and siblings
  std::vector<std::string> released;          // dependencies released
  std::vector<std::string> release_failures;  // dependencies left behind
  std::vector<std::string> unresolved;        // removed devices whose dependencies could not be read

  [[nodiscard]] bool ok() const { return error == TeardownError::None; }
  [[nodiscard]] bool mutated() const { return !removed.empty() || !released.empty(); }
};

[[nodiscard]] const char* to_string(Outcome o);
[[nodiscard]] const char* to_string(TeardownError e);

} // namespace dmclean::model
