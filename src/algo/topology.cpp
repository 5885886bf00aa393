//
// Project FFTrim - Copyright 2026 SNU Compbio Lab.
// SPDX-License-Identifier: Apache-2.0
//

#include "fftrim/algo/topology.h"

#include <vector>

#include <absl/algorithm/container.h>
#include <absl/container/flat_hash_set.h>
#include <absl/log/absl_log.h>
#include <absl/types/span.h>

#include "fftrim/core/interaction.h"

namespace fftrim {
std::vector<TypeTuple> unique_interactions(absl::Span<const TypeTuple> tuples,
                                           InteractionKind kind) {
  const absl::Span<const Ordering> orders = equivalent_orderings(kind);

  std::vector<TypeTuple> ret;
  absl::flat_hash_set<TypeTuple> seen;

  for (const TypeTuple &tuple: tuples) {
    const bool duplicate = absl::c_any_of(orders, [&](const Ordering &order) {
      return seen.contains(permute(tuple, order));
    });
    if (duplicate)
      continue;

    seen.insert(tuple);
    ret.push_back(tuple);
  }

  ABSL_LOG(INFO) << ret.size() << " unique " << kind << " interactions out of "
                 << tuples.size();
  return ret;
}
}  // namespace fftrim
