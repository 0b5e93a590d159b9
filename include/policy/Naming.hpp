// Device naming convention: the only link between an origin and its snapshots.
//
//   <dir>/mapper/origin-<X>          origin
//   <dir>/mapper/snapshot-<X>-<N>    snapshot of origin-<X>
//
// Pure string logic. No kernel access, and every function accepts any input.
#pragma once
#include "model/Device.hpp"
#include <string>

namespace dmclean::policy {

[[nodiscard]] auto classify(const std::string& path) -> model::Classification;

// True iff candidate is a snapshot whose paired origin is exactly origin_path.
[[nodiscard]] bool is_sibling_of(const std::string& origin_path, const std::string& candidate);

// /dev/loop* -> Loop; /dev/dm-* and */mapper/<name> -> Dm; anything else -> Other.
[[nodiscard]] auto node_class(const std::string& path) -> model::NodeClass;

} // namespace dmclean::policy
