//
// Project FFTrim - Copyright 2026 SNU Compbio Lab.
// SPDX-License-Identifier: Apache-2.0
//

#include "fftrim/algo/matcher.h"

#include <string>
#include <vector>

#include <absl/container/flat_hash_set.h>
#include <absl/log/absl_check.h>
#include <absl/log/absl_log.h>
#include <absl/strings/str_join.h>
#include <absl/types/span.h>

#include "fftrim/algo/atomtypes.h"
#include "fftrim/algo/schema.h"
#include "fftrim/core/interaction.h"

namespace fftrim {
bool schema_matches(const RecordSchema &schema, const TypeTuple &types,
                    const Ordering &order, const AtomTypeTable &table) {
  ABSL_DCHECK(schema.arity() == types.size());

  for (int i = 0; i < schema.arity(); ++i) {
    const std::string &type = types[order[i]];

    if (schema.constraint(i) == Constraint::kType) {
      if (schema.value(i) != type)
        return false;
      continue;
    }

    const std::string *type_class = table.class_of(type);
    if (type_class == nullptr || schema.value(i) != *type_class)
      return false;
  }

  return true;
}

namespace {
int find_match(absl::Span<const CandidateRecord> candidates,
               const AtomTypeTable &table, const TypeTuple &types,
               absl::Span<const Ordering> orders) {
  for (int i = 0; i < candidates.size(); ++i) {
    for (const Ordering &order: orders) {
      if (schema_matches(candidates[i].schema, types, order, table))
        return i;
    }
  }

  return -1;
}
}  // namespace

MatchResult match_parameters(absl::Span<const CandidateRecord> candidates,
                             const AtomTypeTable &table,
                             absl::Span<const TypeTuple> interactions,
                             InteractionKind kind) {
  const absl::Span<const Ordering> orders = equivalent_orderings(kind);

  MatchResult result;
  result.assignment.reserve(interactions.size());

  absl::flat_hash_set<int> emitted;
  for (const TypeTuple &types: interactions) {
    const int idx = find_match(candidates, table, types, orders);
    result.assignment.push_back(idx);

    if (idx < 0) {
      ABSL_LOG(INFO) << "No " << kind << " parameters found for ("
                     << absl::StrJoin(types, ", ") << ")";
      result.unmatched.push_back(types);
      continue;
    }

    if (emitted.insert(idx).second)
      result.matched.push_back(idx);
  }

  return result;
}
}  // namespace fftrim
