//
// Project FFTrim - Copyright 2026 SNU Compbio Lab.
// SPDX-License-Identifier: Apache-2.0
//
#ifndef FFTRIM_ALGO_TOPOLOGY_H_
#define FFTRIM_ALGO_TOPOLOGY_H_

//! @cond
#include <vector>

#include <absl/types/span.h>
//! @endcond

#include "fftrim/core/interaction.h"
#include "fftrim/core/structure.h"

namespace fftrim {
/**
 * @brief Remove symmetry-equivalent duplicates from a list of interactions.
 * @param tuples The atom types of each interaction, in structural order.
 * @param kind The interaction kind.
 * @return The unique interactions, in the order of first occurrence.
 *
 * An interaction is kept only if none of its equivalent orderings (see
 * equivalent_orderings()) was kept before. The first occurrence is the
 * representative of its equivalence class, so applying this function to its
 * own result returns the same list.
 */
extern std::vector<TypeTuple>
unique_interactions(absl::Span<const TypeTuple> tuples, InteractionKind kind);

/**
 * @brief Unique interactions of a structure.
 * @param structure A typed structure.
 * @param kind The interaction kind.
 * @return The unique interactions, in the order of first occurrence.
 */
inline std::vector<TypeTuple>
unique_interactions(const TypedStructure &structure, InteractionKind kind) {
  return unique_interactions(structure.type_tuples(kind), kind);
}
}  // namespace fftrim

#endif /* FFTRIM_ALGO_TOPOLOGY_H_ */
