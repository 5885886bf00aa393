//
// Project FFTrim - Copyright 2026 SNU Compbio Lab.
// SPDX-License-Identifier: Apache-2.0
//

#ifndef FFTRIM_CORE_INTERACTION_H_
#define FFTRIM_CORE_INTERACTION_H_

//! @cond
#include <array>
#include <ostream>
#include <string>
#include <string_view>

#include <absl/container/inlined_vector.h>
#include <absl/log/absl_check.h>
#include <absl/types/span.h>
//! @endcond

namespace fftrim {
/**
 * @brief The bonded interaction kinds handled by the trimmer.
 *
 * kProper is the four-body chain (i-j-k-l), kImproper is the four-body star
 * about the central atom, which is always stored at the first position.
 */
enum class InteractionKind : int {
  kBond = 0,
  kAngle = 1,
  kProper = 2,
  kImproper = 3,
};

constexpr int kNumInteractionKinds = 4;

constexpr InteractionKind kInteractionKinds[] = {
  InteractionKind::kBond,
  InteractionKind::kAngle,
  InteractionKind::kProper,
  InteractionKind::kImproper,
};

constexpr int kind_index(InteractionKind kind) {
  return static_cast<int>(kind);
}

/**
 * @brief Number of atoms participating in an interaction of the given kind.
 */
constexpr int interaction_arity(InteractionKind kind) {
  switch (kind) {
  case InteractionKind::kBond:
    return 2;
  case InteractionKind::kAngle:
    return 3;
  case InteractionKind::kProper:
  case InteractionKind::kImproper:
    return 4;
  }

  return 0;
}

/**
 * @brief Element tag of the parameter records of the given kind in a force
 *        field document ("Bond", "Angle", "Proper", "Improper").
 */
extern std::string_view interaction_tag(InteractionKind kind);

std::ostream &operator<<(std::ostream &os, InteractionKind kind);

/**
 * @brief An atom ordering; only the first interaction_arity() entries are
 *        meaningful.
 */
using Ordering = std::array<int, 4>;

/**
 * @brief The orderings under which two interactions of the given kind are
 *        considered the same.
 *
 * The identity ordering is always the first element. Two-, three- and
 * four-body chain interactions are equivalent under reversal; four-body star
 * interactions are equivalent under any permutation of the three peripheral
 * atoms with the central atom fixed.
 */
extern absl::Span<const Ordering> equivalent_orderings(InteractionKind kind);

/**
 * @brief Atom types of one structural interaction, in structural order.
 */
using TypeTuple = absl::InlinedVector<std::string, 4>;

inline TypeTuple permute(const TypeTuple &tuple, const Ordering &order) {
  TypeTuple ret;
  for (int i = 0; i < tuple.size(); ++i) {
    ABSL_DCHECK_LT(order[i], static_cast<int>(tuple.size()));
    ret.push_back(tuple[order[i]]);
  }
  return ret;
}

std::ostream &operator<<(std::ostream &os, const TypeTuple &tuple);
}  // namespace fftrim

#endif /* FFTRIM_CORE_INTERACTION_H_ */
