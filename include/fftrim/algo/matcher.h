//
// Project FFTrim - Copyright 2026 SNU Compbio Lab.
// SPDX-License-Identifier: Apache-2.0
//
#ifndef FFTRIM_ALGO_MATCHER_H_
#define FFTRIM_ALGO_MATCHER_H_

//! @cond
#include <vector>

#include <absl/types/span.h>
//! @endcond

#include "fftrim/algo/atomtypes.h"
#include "fftrim/algo/schema.h"
#include "fftrim/core/interaction.h"

namespace fftrim {
/**
 * @brief Test whether a parameter record matches an interaction under the
 *        given atom ordering.
 * @param schema The schema of the parameter record.
 * @param types The atom types of the interaction, in structural order.
 * @param order The atom ordering applied to \p types.
 * @param table The atom type table.
 * @return Whether every position matches: class-constrained positions are
 *         compared against the resolved class of the atom type, and
 *         type-constrained positions against the atom type itself. An atom
 *         type with unresolved class never matches a class-constrained
 *         position.
 */
extern bool schema_matches(const RecordSchema &schema, const TypeTuple &types,
                           const Ordering &order, const AtomTypeTable &table);

struct MatchResult {
  // Positions of the matched records within the candidates, in the order they
  // were first matched. Each record appears at most once.
  std::vector<int> matched;
  // Position of the record matched by each interaction, or -1.
  std::vector<int> assignment;
  // Interactions without any matching record.
  std::vector<TypeTuple> unmatched;
};

/**
 * @brief Find the parameter record of each interaction.
 * @param candidates The candidate records, sorted by priority (see
 *        prioritize_candidates()).
 * @param table The atom type table.
 * @param interactions The unique interactions (see unique_interactions()).
 * @param kind The interaction kind.
 * @return The match result.
 *
 * For each interaction, the candidates are tried in order, each under all
 * equivalent orderings of the kind. The first match wins, so a more specific
 * record always takes precedence over a less specific one that matches the
 * same interaction.
 */
extern MatchResult
match_parameters(absl::Span<const CandidateRecord> candidates,
                 const AtomTypeTable &table,
                 absl::Span<const TypeTuple> interactions,
                 InteractionKind kind);
}  // namespace fftrim

#endif /* FFTRIM_ALGO_MATCHER_H_ */
